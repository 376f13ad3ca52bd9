/**
 * @file read_options.hpp
 * @brief Options controlling how datasets are read from a byte stream
 */

#ifndef DCMWIRE_ENCODING_READ_OPTIONS_HPP
#define DCMWIRE_ENCODING_READ_OPTIONS_HPP

#include "dcmwire/core/diagnostics.hpp"
#include "dcmwire/core/dicom_tag.hpp"
#include "dcmwire/encoding/vr_type.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Predicate evaluated on each element header before its value is read.
 *
 * Arguments are the tag, the VR (absent for implicit VR elements) and the
 * declared length. Returning true stops reading and rewinds the source to
 * the start of the element header.
 */
using stop_predicate =
    std::function<bool(core::dicom_tag, std::optional<vr_type>, uint32_t)>;

/**
 * @brief Resolves the VR of an implicit VR element.
 *
 * Returning std::nullopt leaves the element without a VR.
 */
using vr_resolver = std::function<std::optional<vr_type>(core::dicom_tag)>;

/**
 * @brief Per-call reader configuration.
 */
struct read_options {
    /// Reaction to malformed or non-conformant data
    core::validation_mode validation{core::validation_mode::warn};

    /// Values with a defined length above this are not loaded
    std::optional<uint32_t> defer_size;

    /// Receives every warning emitted while reading
    core::warning_handler on_warning;

    /// VR lookup for implicit VR elements, the tag dictionary if empty
    vr_resolver resolve_vr;

    /// Character sets in effect when the top-level dataset has no (0008,0005)
    std::vector<std::string> default_character_sets{"ISO_IR 6"};
};

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_READ_OPTIONS_HPP
