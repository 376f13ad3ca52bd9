/**
 * @file result.hpp
 * @brief common_system Result types as used across dcmwire
 *
 * Every fallible dcmwire operation returns Result<T> or VoidResult; the
 * error_info carries one of the codes below and module "dcmwire".
 */

#pragma once

#include <kcenon/common/error/error_codes.h>
#include <kcenon/common/patterns/result.h>

#include <string>

namespace dcmwire {

template <typename T>
using Result = kcenon::common::Result<T>;

using VoidResult = kcenon::common::VoidResult;

using error_info = kcenon::common::error_info;

using kcenon::common::make_error;
using kcenon::common::ok;

/**
 * @namespace error_codes
 * @brief Codes in the range -700 to -799, grouped by the layer that raises them
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int dcmwire_base = -700;

    // File container and meta group
    constexpr int file_not_found = dcmwire_base - 0;
    constexpr int file_read_error = dcmwire_base - 1;
    constexpr int file_write_error = dcmwire_base - 2;
    constexpr int invalid_dicom_file = dcmwire_base - 3;
    constexpr int missing_dicm_prefix = dcmwire_base - 4;
    constexpr int unsupported_transfer_syntax = dcmwire_base - 5;

    // Element values and deferred loading
    constexpr int element_not_found = dcmwire_base - 20;
    constexpr int value_conversion_error = dcmwire_base - 21;
    constexpr int invalid_vr = dcmwire_base - 22;
    constexpr int data_size_mismatch = dcmwire_base - 23;
    constexpr int vr_mismatch = dcmwire_base - 24;
    constexpr int deferred_read_error = dcmwire_base - 25;

    // Stream reader and dataset writer
    constexpr int insufficient_data = dcmwire_base - 40;
    constexpr int invalid_sequence = dcmwire_base - 41;
    constexpr int decode_error = dcmwire_base - 42;
    constexpr int encode_error = dcmwire_base - 43;
    constexpr int compression_error = dcmwire_base - 44;
    constexpr int decompression_error = dcmwire_base - 45;
    constexpr int codec_not_supported = dcmwire_base - 46;

    // Encapsulated pixel data framing
    constexpr int invalid_offset_table = dcmwire_base - 60;
    constexpr int invalid_fragment = dcmwire_base - 61;
    constexpr int frame_boundaries_indeterminate = dcmwire_base - 62;
    constexpr int frame_index_out_of_range = dcmwire_base - 63;
    constexpr int offset_table_overflow = dcmwire_base - 64;
    constexpr int invalid_fragment_count = dcmwire_base - 65;
    constexpr int insufficient_fragments = dcmwire_base - 66;

    // Codec registry and plugins
    constexpr int missing_pixel_metadata = dcmwire_base - 80;
    constexpr int invalid_pixel_metadata = dcmwire_base - 81;
    constexpr int plugin_unavailable = dcmwire_base - 82;
    constexpr int plugin_not_found = dcmwire_base - 83;
    constexpr int no_plugins_available = dcmwire_base - 84;
    constexpr int all_plugins_failed = dcmwire_base - 85;
    constexpr int rle_segment_limit = dcmwire_base - 86;
    constexpr int unsupported_bit_depth = dcmwire_base - 87;
    constexpr int frame_size_mismatch = dcmwire_base - 88;
}  // namespace error_codes

/**
 * @brief Error result tagged with module "dcmwire"
 *
 * @p details usually names the tag, frame or plugin involved.
 */
template <typename T>
inline Result<T> dcmwire_error(int code, const std::string& message,
                               const std::string& details = "") {
    return details.empty() ? make_error<T>(code, message, "dcmwire")
                           : make_error<T>(code, message, "dcmwire", details);
}

inline VoidResult dcmwire_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    return details.empty() ? VoidResult(error_info{code, message, "dcmwire"})
                           : VoidResult(error_info{code, message, "dcmwire", details});
}

}  // namespace dcmwire
