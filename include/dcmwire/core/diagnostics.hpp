/**
 * @file diagnostics.hpp
 * @brief Validation policy and warning reporting shared by all readers
 */

#pragma once

#include "dcmwire/core/result.hpp"

#include <functional>
#include <string>

namespace dcmwire::core {

/**
 * @brief How a reader reacts to a malformed or non-conformant stream.
 */
enum class validation_mode {
    ignore,  ///< Continue silently (debug log only)
    warn,    ///< Continue and report a warning
    raise    ///< Stop and return the error
};

/**
 * @brief Callback receiving every warning emitted during one operation.
 */
using warning_handler = std::function<void(const std::string&)>;

/**
 * @brief Report a warning through the logger and the optional handler.
 */
void report_warning(const warning_handler& handler, const std::string& message);

/**
 * @brief Apply a validation policy to one problem.
 *
 * @param mode How to react
 * @param handler Receives the message in warn mode
 * @param code Error code returned in raise mode
 * @param message Description of the problem
 * @return ok() unless mode is raise
 */
[[nodiscard]] auto enforce_policy(validation_mode mode,
                                  const warning_handler& handler,
                                  int code,
                                  const std::string& message) -> VoidResult;

}  // namespace dcmwire::core
