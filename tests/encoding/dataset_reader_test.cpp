/**
 * @file dataset_reader_test.cpp
 * @brief Unit tests for dataset and sequence assembly
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dcmwire/core/dicom_tag_constants.hpp>
#include <dcmwire/encoding/dataset_reader.hpp>

#include "fixtures/stream_builder.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace dcmwire;
using namespace dcmwire::core;
using namespace dcmwire::encoding;
using dcmwire::testing::stream_builder;
using dcmwire::testing::us_value;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr std::string_view uid_1_2{"1.2\0", 4};
constexpr std::string_view uid_1_3{"1.3\0", 4};

read_options capturing(std::vector<std::string>& warnings,
                       validation_mode mode = validation_mode::warn) {
    read_options options;
    options.validation = mode;
    options.on_warning = [&warnings](const std::string& w) { warnings.push_back(w); };
    return options;
}

/// One explicit VR item body holding a SOP Class UID
std::vector<uint8_t> explicit_item_body(std::string_view uid) {
    stream_builder body;
    body.explicit_string(tags::sop_class_uid, "UI", uid);
    return body.bytes();
}

}  // namespace

// ============================================================================
// Datasets
// ============================================================================

TEST_CASE("dataset_reader reads a flat dataset", "[encoding][dataset]") {
    stream_builder builder;
    builder.explicit_string(tags::modality, "CS", "CT")
        .explicit_string(tags::patient_id, "LO", "ID01")
        .explicit_element(tags::rows, "US", us_value(256));

    memory_source source{builder.bytes()};
    read_options options;

    SECTION("everything") {
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().size() == 3);
        CHECK(dataset.value().get_string(tags::patient_id) == "ID01");
        CHECK(dataset.value().get_numeric<uint16_t>(tags::rows) == uint16_t{256});
        CHECK_FALSE(dataset.value().encoding().is_implicit_vr);
        CHECK(dataset.value().encoding().character_sets == std::vector<std::string>{"ISO_IR 6"});
    }

    SECTION("bounded by a byte length") {
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    uint64_t{10}, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().size() == 1);
        CHECK(source.tell() == 10);
    }

    SECTION("ended by a stop predicate") {
        auto dataset = dataset_reader::read_dataset(
            source, false, byte_order::little_endian, std::nullopt, options,
            [](dicom_tag tag, std::optional<vr_type>, uint32_t) { return tag == tags::rows; });
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().size() == 2);
        CHECK_FALSE(dataset.value().contains(tags::rows));
    }
}

TEST_CASE("dataset_reader VR encoding detection", "[encoding][dataset]") {
    std::vector<std::string> warnings;

    stream_builder explicit_stream;
    explicit_stream.explicit_string(tags::modality, "CS", "CT");

    stream_builder implicit_stream;
    implicit_stream.implicit_string(tags::modality, "MR");

    SECTION("explicit data where implicit was expected") {
        auto options = capturing(warnings);
        memory_source source{explicit_stream.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get_string(tags::modality) == "CT");
        CHECK_FALSE(dataset.value().encoding().is_implicit_vr);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings.front() ==
              "Expected implicit VR, but found explicit VR - using explicit VR for reading");
    }

    SECTION("implicit data where explicit was expected") {
        auto options = capturing(warnings);
        memory_source source{implicit_stream.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get_string(tags::modality) == "MR");
        CHECK(dataset.value().encoding().is_implicit_vr);
        REQUIRE(warnings.size() == 1);
        CHECK_THAT(warnings.front(), ContainsSubstring("Expected explicit VR"));
    }

    SECTION("raise mode") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{explicit_stream.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_err());
        CHECK(dataset.error().code == error_codes::invalid_dicom_file);
    }

    SECTION("ignore mode") {
        auto options = capturing(warnings, validation_mode::ignore);
        memory_source source{explicit_stream.bytes()};
        auto detected = dataset_reader::detect_implicit_vr(source, true, byte_order::little_endian,
                                                           {}, false, options);
        REQUIRE(detected.is_ok());
        CHECK_FALSE(detected.value());
        CHECK(warnings.empty());
        CHECK(source.tell() == 0);
    }

    SECTION("a stop predicate matching the first element silences the check") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{explicit_stream.bytes()};
        auto detected = dataset_reader::detect_implicit_vr(
            source, true, byte_order::little_endian,
            [](dicom_tag tag, std::optional<vr_type>, uint32_t) { return tag == tags::modality; },
            false, options);
        REQUIRE(detected.is_ok());
        CHECK_FALSE(detected.value());
    }

    SECTION("items of an implicit sequence stay implicit") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{explicit_stream.bytes()};
        auto detected = dataset_reader::detect_implicit_vr(source, true, byte_order::little_endian,
                                                           {}, true, options);
        REQUIRE(detected.is_ok());
        CHECK(detected.value());
    }
}

TEST_CASE("dataset_reader duplicate elements", "[encoding][dataset]") {
    std::vector<std::string> warnings;
    stream_builder builder;
    builder.implicit_string(tags::modality, "CT").implicit_string(tags::modality, "MR");

    SECTION("warn keeps the later value") {
        auto options = capturing(warnings);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get_string(tags::modality) == "MR");
        REQUIRE(warnings.size() == 1);
        CHECK_THAT(warnings.front(), ContainsSubstring("Duplicate element (0008,0060) 'Modality'"));
    }

    SECTION("raise") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_err());
        CHECK(dataset.error().code == error_codes::decode_error);
    }
}

// ============================================================================
// Sequences
// ============================================================================

TEST_CASE("dataset_reader sequences", "[encoding][dataset]") {
    read_options options;

    SECTION("defined length sequence and items") {
        const auto first = explicit_item_body(uid_1_2);
        const auto second = explicit_item_body(uid_1_3);
        const auto item_bytes = static_cast<uint32_t>(first.size() + second.size() + 16);

        stream_builder builder;
        builder.explicit_header(tags::referenced_image_sequence, "SQ", item_bytes)
            .item(static_cast<uint32_t>(first.size()))
            .raw(first)
            .item(static_cast<uint32_t>(second.size()))
            .raw(second)
            .explicit_string(tags::patient_id, "LO", "ID01");

        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());

        const auto* sequence = dataset.value().get(tags::referenced_image_sequence);
        REQUIRE(sequence != nullptr);
        CHECK(sequence->is_sequence());
        CHECK(sequence->declared_length() == item_bytes);
        REQUIRE(sequence->sequence_items().size() == 2);
        CHECK(sequence->sequence_items()[0].get_string(tags::sop_class_uid) == "1.2");
        CHECK(sequence->sequence_items()[1].get_string(tags::sop_class_uid) == "1.3");
        CHECK(dataset.value().get_string(tags::patient_id) == "ID01");
    }

    SECTION("undefined length sequence and items") {
        stream_builder builder;
        builder.explicit_header(tags::referenced_image_sequence, "SQ", 0xFFFFFFFF)
            .item()
            .explicit_string(tags::sop_class_uid, "UI", uid_1_2)
            .item_delimiter()
            .item()
            .item_delimiter()
            .sequence_delimiter()
            .explicit_string(tags::patient_id, "LO", "ID01");

        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());

        const auto* sequence = dataset.value().get(tags::referenced_image_sequence);
        REQUIRE(sequence != nullptr);
        CHECK(sequence->is_undefined_length());
        REQUIRE(sequence->sequence_items().size() == 2);
        CHECK(sequence->sequence_items()[0].size() == 1);
        CHECK(sequence->sequence_items()[1].empty());
        CHECK(dataset.value().get_string(tags::patient_id) == "ID01");
    }

    SECTION("empty sequence") {
        stream_builder builder;
        builder.explicit_header(tags::referenced_image_sequence, "SQ", 0)
            .explicit_string(tags::patient_id, "LO", "ID01");

        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get(tags::referenced_image_sequence)->sequence_items().empty());
        CHECK(dataset.value().size() == 2);
    }

    SECTION("implicit items inside an explicit sequence") {
        stream_builder builder;
        builder.explicit_header(tags::referenced_image_sequence, "SQ", 0xFFFFFFFF)
            .item()
            .implicit_string(tags::sop_class_uid, uid_1_2)
            .item_delimiter()
            .sequence_delimiter();

        std::vector<std::string> warnings;
        auto capture = capturing(warnings);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, capture);
        REQUIRE(dataset.is_ok());
        const auto& item = dataset.value().get(tags::referenced_image_sequence)->sequence_items()[0];
        CHECK(item.encoding().is_implicit_vr);
        CHECK(item.get_string(tags::sop_class_uid) == "1.2");
        CHECK(warnings.empty());
    }

    SECTION("read_sequence_item at the delimiter") {
        stream_builder builder;
        builder.sequence_delimiter();
        memory_source source{builder.bytes()};
        auto item = dataset_reader::read_sequence_item(source, true, byte_order::little_endian,
                                                       options, {"ISO_IR 6"});
        REQUIRE(item.is_ok());
        CHECK_FALSE(item.value().has_value());
        CHECK(source.at_end());
    }
}

TEST_CASE("dataset_reader sequence item tags", "[encoding][dataset]") {
    stream_builder body;
    body.implicit_string(tags::sop_class_uid, uid_1_2);

    stream_builder builder;
    builder.implicit_header(tags::referenced_image_sequence,
                            static_cast<uint32_t>(body.size() + 8))
        .implicit_header(dicom_tag{0xFFFE, 0xE001}, static_cast<uint32_t>(body.size()))
        .raw(body.bytes());

    std::vector<std::string> warnings;

    SECTION("warn reads the item anyway") {
        auto options = capturing(warnings);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        const auto* sequence = dataset.value().get(tags::referenced_image_sequence);
        REQUIRE(sequence->sequence_items().size() == 1);
        CHECK(sequence->sequence_items()[0].get_string(tags::sop_class_uid) == "1.2");
        REQUIRE(warnings.size() == 1);
        CHECK(warnings.front() ==
              "Expected sequence item with tag (FFFE,E000) at position 0x8, found (FFFE,E001)");
    }

    SECTION("ignore reads the item silently") {
        auto options = capturing(warnings, validation_mode::ignore);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get(tags::referenced_image_sequence)->sequence_items().size() == 1);
        CHECK(warnings.empty());
    }

    SECTION("raise fails") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, true, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_err());
        CHECK(dataset.error().code == error_codes::invalid_sequence);
    }
}

TEST_CASE("dataset_reader unterminated sequence", "[encoding][dataset]") {
    stream_builder builder;
    builder.explicit_header(tags::referenced_image_sequence, "SQ", 0xFFFFFFFF)
        .item()
        .explicit_string(tags::sop_class_uid, "UI", uid_1_2)
        .item_delimiter();

    std::vector<std::string> warnings;

    SECTION("warn keeps the items read") {
        auto options = capturing(warnings);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_ok());
        CHECK(dataset.value().get(tags::referenced_image_sequence)->sequence_items().size() == 1);
        REQUIRE(warnings.size() == 1);
        CHECK_THAT(warnings.front(), ContainsSubstring("before the Sequence Delimitation Item"));
    }

    SECTION("raise") {
        auto options = capturing(warnings, validation_mode::raise);
        memory_source source{builder.bytes()};
        auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                    std::nullopt, options);
        REQUIRE(dataset.is_err());
        CHECK(dataset.error().code == error_codes::insufficient_data);
    }
}

// ============================================================================
// Character sets
// ============================================================================

TEST_CASE("dataset_reader character set inheritance", "[encoding][dataset]") {
    stream_builder own_charset;
    own_charset.explicit_string(tags::specific_character_set, "CS", "ISO_IR 192")
        .explicit_string(tags::sop_class_uid, "UI", uid_1_3);

    stream_builder builder;
    builder.explicit_string(tags::specific_character_set, "CS", "ISO_IR 100")
        .explicit_header(tags::referenced_image_sequence, "SQ", 0xFFFFFFFF)
        .item()
        .explicit_string(tags::sop_class_uid, "UI", uid_1_2)
        .item_delimiter()
        .item(static_cast<uint32_t>(own_charset.size()))
        .raw(own_charset.bytes())
        .sequence_delimiter();

    memory_source source{builder.bytes()};
    read_options options;
    auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                std::nullopt, options);
    REQUIRE(dataset.is_ok());
    CHECK(dataset.value().encoding().character_sets ==
          std::vector<std::string>{"ISO_IR 100"});

    const auto& items = dataset.value().get(tags::referenced_image_sequence)->sequence_items();
    REQUIRE(items.size() == 2);
    CHECK(items[0].encoding().character_sets == std::vector<std::string>{"ISO_IR 100"});
    CHECK(items[1].encoding().character_sets == std::vector<std::string>{"ISO_IR 192"});
}

// ============================================================================
// Deferred elements
// ============================================================================

TEST_CASE("dataset_reader deferred elements", "[encoding][dataset]") {
    stream_builder builder;
    builder.explicit_string(tags::modality, "CS", "CT")
        .explicit_string(tags::patient_id, "LO", "LONGVALUE1");

    memory_source source{builder.bytes()};
    read_options options;
    options.defer_size = 4;

    auto dataset = dataset_reader::read_dataset(source, false, byte_order::little_endian,
                                                std::nullopt, options);
    REQUIRE(dataset.is_ok());
    const auto* placeholder = dataset.value().get(tags::patient_id);
    REQUIRE(placeholder != nullptr);
    REQUIRE(placeholder->is_deferred());

    SECTION("the value is read on request") {
        auto element = dataset_reader::read_deferred_element(
            source, *placeholder, dataset.value().encoding(), options);
        REQUIRE(element.is_ok());
        CHECK_FALSE(element.value().is_deferred());
        CHECK(element.value().as_string().value() == "LONGVALUE1");
    }

    SECTION("loaded elements are returned unchanged") {
        auto element = dataset_reader::read_deferred_element(
            source, *dataset.value().get(tags::modality), dataset.value().encoding(), options);
        REQUIRE(element.is_ok());
        CHECK(element.value().as_string().value() == "CT");
    }

    SECTION("a VR that no longer matches") {
        auto stale = dicom_element::deferred(tags::patient_id, vr_type::SH, 10,
                                             placeholder->value_offset(), 8);
        auto element = dataset_reader::read_deferred_element(source, stale,
                                                             dataset.value().encoding(), options);
        REQUIRE(element.is_err());
        CHECK(element.error().code == error_codes::vr_mismatch);
    }

    SECTION("a tag that no longer matches") {
        auto stale = dicom_element::deferred(tags::patient_name, vr_type::LO, 10,
                                             placeholder->value_offset(), 8);
        auto element = dataset_reader::read_deferred_element(source, stale,
                                                             dataset.value().encoding(), options);
        REQUIRE(element.is_err());
        CHECK(element.error().code == error_codes::deferred_read_error);
    }
}
