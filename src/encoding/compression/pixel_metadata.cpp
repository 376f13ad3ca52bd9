/**
 * @file pixel_metadata.cpp
 * @brief Implementation of pixel module attribute validation
 */

#include "dcmwire/encoding/compression/pixel_metadata.hpp"

#include "dcmwire/core/dicom_dataset.hpp"
#include "dcmwire/core/dicom_tag_constants.hpp"
#include "dcmwire/core/tag_dictionary.hpp"

#include <charconv>
#include <vector>

namespace dcmwire::encoding::compression {

namespace {

std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\0')) {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\0')) {
        str.remove_suffix(1);
    }
    return str;
}

std::optional<uint32_t> read_us(const core::dicom_dataset& dataset, core::dicom_tag tag) {
    auto value = dataset.get_numeric<uint16_t>(tag);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

/// Number of Frames is an IS value
std::optional<uint32_t> read_is(const core::dicom_dataset& dataset, core::dicom_tag tag) {
    if (!dataset.contains(tag)) {
        return std::nullopt;
    }
    const auto text = dataset.get_string(tag);
    const auto trimmed = trim(text);
    uint32_t value = 0;
    const auto* first = trimmed.data();
    const auto* last = trimmed.data() + trimmed.size();
    if (first != last && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string_view to_string(photometric_interpretation pi) noexcept {
    switch (pi) {
        case photometric_interpretation::monochrome1: return "MONOCHROME1";
        case photometric_interpretation::monochrome2: return "MONOCHROME2";
        case photometric_interpretation::palette_color: return "PALETTE COLOR";
        case photometric_interpretation::rgb: return "RGB";
        case photometric_interpretation::ycbcr_full: return "YBR_FULL";
        case photometric_interpretation::ycbcr_full_422: return "YBR_FULL_422";
        case photometric_interpretation::ycbcr_ict: return "YBR_ICT";
        case photometric_interpretation::ycbcr_rct: return "YBR_RCT";
        case photometric_interpretation::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

photometric_interpretation parse_photometric_interpretation(std::string_view str) noexcept {
    const auto value = trim(str);
    if (value == "MONOCHROME1") return photometric_interpretation::monochrome1;
    if (value == "MONOCHROME2") return photometric_interpretation::monochrome2;
    if (value == "PALETTE COLOR") return photometric_interpretation::palette_color;
    if (value == "RGB") return photometric_interpretation::rgb;
    if (value == "YBR_FULL") return photometric_interpretation::ycbcr_full;
    if (value == "YBR_FULL_422") return photometric_interpretation::ycbcr_full_422;
    if (value == "YBR_ICT") return photometric_interpretation::ycbcr_ict;
    if (value == "YBR_RCT") return photometric_interpretation::ycbcr_rct;
    return photometric_interpretation::unknown;
}

pixel_attributes pixel_attributes::from_dataset(const core::dicom_dataset& dataset) {
    namespace tags = core::tags;

    pixel_attributes attrs;
    attrs.rows = read_us(dataset, tags::rows);
    attrs.columns = read_us(dataset, tags::columns);
    attrs.samples_per_pixel = read_us(dataset, tags::samples_per_pixel);
    attrs.bits_allocated = read_us(dataset, tags::bits_allocated);
    attrs.bits_stored = read_us(dataset, tags::bits_stored);
    attrs.pixel_representation = read_us(dataset, tags::pixel_representation);
    attrs.planar_configuration = read_us(dataset, tags::planar_configuration);
    attrs.number_of_frames = read_is(dataset, tags::number_of_frames);
    if (dataset.contains(tags::photometric_interpretation)) {
        attrs.photometric_interpretation =
            std::string{trim(dataset.get_string(tags::photometric_interpretation))};
    }
    return attrs;
}

pixel_attributes pixel_attributes::from_params(const image_params& params) {
    pixel_attributes attrs;
    attrs.rows = params.rows;
    attrs.columns = params.columns;
    attrs.samples_per_pixel = params.samples_per_pixel;
    attrs.bits_allocated = params.bits_allocated;
    attrs.bits_stored = params.bits_stored;
    attrs.pixel_representation = params.pixel_representation;
    attrs.planar_configuration = params.planar_configuration;
    attrs.number_of_frames = params.number_of_frames;
    attrs.photometric_interpretation = std::string{to_string(params.photometric)};
    return attrs;
}

dcmwire::Result<image_params> validate_pixel_attributes(const pixel_attributes& attrs) {
    namespace tags = core::tags;
    const auto& dictionary = core::tag_dictionary::instance();

    std::vector<core::dicom_tag> missing;
    if (!attrs.rows) missing.push_back(tags::rows);
    if (!attrs.columns) missing.push_back(tags::columns);
    if (!attrs.samples_per_pixel) missing.push_back(tags::samples_per_pixel);
    if (!attrs.bits_allocated) missing.push_back(tags::bits_allocated);
    if (!attrs.bits_stored) missing.push_back(tags::bits_stored);
    if (!attrs.pixel_representation) missing.push_back(tags::pixel_representation);
    if (!attrs.photometric_interpretation) missing.push_back(tags::photometric_interpretation);
    if (attrs.samples_per_pixel && *attrs.samples_per_pixel > 1 &&
        !attrs.planar_configuration) {
        missing.push_back(tags::planar_configuration);
    }

    if (!missing.empty()) {
        std::string message =
            "Unable to process the pixel data as the following required elements "
            "are missing:";
        for (const auto& tag : missing) {
            message += "\n  " + dictionary.describe(tag);
        }
        return dcmwire::dcmwire_error<image_params>(
            dcmwire::error_codes::missing_pixel_metadata, message);
    }

    auto invalid = [&](core::dicom_tag tag, uint32_t value, std::string_view allowed) {
        return dcmwire::dcmwire_error<image_params>(
            dcmwire::error_codes::invalid_pixel_metadata,
            "A " + dictionary.describe(tag) + " value of '" + std::to_string(value) +
                "' is invalid, it must be " + std::string{allowed});
    };

    if (*attrs.rows < 1 || *attrs.rows > 65535) {
        return invalid(tags::rows, *attrs.rows, "in the range (1, 65535)");
    }
    if (*attrs.columns < 1 || *attrs.columns > 65535) {
        return invalid(tags::columns, *attrs.columns, "in the range (1, 65535)");
    }
    if (*attrs.samples_per_pixel != 1 && *attrs.samples_per_pixel != 3) {
        return invalid(tags::samples_per_pixel, *attrs.samples_per_pixel, "1 or 3");
    }
    const auto bits_allocated = *attrs.bits_allocated;
    if (bits_allocated == 0 || bits_allocated > 64 ||
        (bits_allocated != 1 && bits_allocated % 8 != 0)) {
        return invalid(tags::bits_allocated, bits_allocated,
                       "1 or a multiple of 8 no greater than 64");
    }
    if (*attrs.bits_stored < 1 || *attrs.bits_stored > bits_allocated) {
        return invalid(tags::bits_stored, *attrs.bits_stored,
                       "in the range (1, " + std::to_string(bits_allocated) + ")");
    }
    if (*attrs.pixel_representation > 1) {
        return invalid(tags::pixel_representation, *attrs.pixel_representation, "0 or 1");
    }

    uint32_t planar = 0;
    if (*attrs.samples_per_pixel > 1) {
        planar = *attrs.planar_configuration;
        if (planar > 1) {
            return invalid(tags::planar_configuration, planar, "0 or 1");
        }
    }

    const uint32_t frames = attrs.number_of_frames.value_or(1);
    if (frames < 1) {
        return invalid(tags::number_of_frames, frames, "greater than 0");
    }

    const auto photometric =
        parse_photometric_interpretation(*attrs.photometric_interpretation);
    if (photometric == photometric_interpretation::unknown) {
        return dcmwire::dcmwire_error<image_params>(
            dcmwire::error_codes::invalid_pixel_metadata,
            "Unknown " + dictionary.describe(tags::photometric_interpretation) +
                " value '" + *attrs.photometric_interpretation + "'");
    }

    image_params params;
    params.rows = static_cast<uint16_t>(*attrs.rows);
    params.columns = static_cast<uint16_t>(*attrs.columns);
    params.samples_per_pixel = static_cast<uint16_t>(*attrs.samples_per_pixel);
    params.bits_allocated = static_cast<uint16_t>(bits_allocated);
    params.bits_stored = static_cast<uint16_t>(*attrs.bits_stored);
    params.pixel_representation = static_cast<uint16_t>(*attrs.pixel_representation);
    params.planar_configuration = static_cast<uint16_t>(planar);
    params.photometric = photometric;
    params.number_of_frames = frames;
    return dcmwire::ok(params);
}

}  // namespace dcmwire::encoding::compression
