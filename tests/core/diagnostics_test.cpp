/**
 * @file diagnostics_test.cpp
 * @brief Unit tests for the validation policy helpers
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmwire/core/diagnostics.hpp>

#include <string>
#include <vector>

using namespace dcmwire;
using namespace dcmwire::core;

TEST_CASE("enforce_policy", "[diagnostics]") {
    std::vector<std::string> warnings;
    warning_handler handler = [&warnings](const std::string& message) {
        warnings.push_back(message);
    };

    SECTION("ignore continues silently") {
        auto result = enforce_policy(validation_mode::ignore, handler,
                                     error_codes::invalid_vr, "bad VR");
        CHECK(result.is_ok());
        CHECK(warnings.empty());
    }

    SECTION("warn continues and reports") {
        auto result = enforce_policy(validation_mode::warn, handler,
                                     error_codes::invalid_vr, "bad VR");
        CHECK(result.is_ok());
        CHECK(warnings == std::vector<std::string>{"bad VR"});
    }

    SECTION("raise returns the error") {
        auto result = enforce_policy(validation_mode::raise, handler,
                                     error_codes::invalid_vr, "bad VR");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_vr);
        CHECK(result.error().message == "bad VR");
        CHECK(warnings.empty());
    }

    SECTION("no handler") {
        CHECK(enforce_policy(validation_mode::warn, {}, error_codes::decode_error, "x").is_ok());
    }
}

TEST_CASE("report_warning", "[diagnostics]") {
    int calls = 0;
    report_warning([&calls](const std::string&) { ++calls; }, "first");
    report_warning({}, "second");
    CHECK(calls == 1);
}
