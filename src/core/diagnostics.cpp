/**
 * @file diagnostics.cpp
 * @brief Implementation of the validation policy helpers
 */

#include "dcmwire/core/diagnostics.hpp"

#include "dcmwire/integration/logger_adapter.hpp"

namespace dcmwire::core {

using integration::logger_adapter;

void report_warning(const warning_handler& handler, const std::string& message) {
    logger_adapter::warn("{}", message);
    if (handler) {
        handler(message);
    }
}

auto enforce_policy(validation_mode mode,
                    const warning_handler& handler,
                    int code,
                    const std::string& message) -> VoidResult {
    switch (mode) {
        case validation_mode::ignore:
            logger_adapter::debug("Ignored: {}", message);
            return ok();
        case validation_mode::warn:
            report_warning(handler, message);
            return ok();
        case validation_mode::raise:
            return dcmwire_void_error(code, message);
    }
    return ok();
}

}  // namespace dcmwire::core
