/**
 * @file pixel_metadata.hpp
 * @brief Image Pixel Module attributes needed to decode or encode frames
 *
 * @see DICOM PS3.3 Section C.7.6.3 - Image Pixel Module
 */

#ifndef DCMWIRE_ENCODING_COMPRESSION_PIXEL_METADATA_HPP
#define DCMWIRE_ENCODING_COMPRESSION_PIXEL_METADATA_HPP

#include "dcmwire/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dcmwire::core {
class dicom_dataset;
}

namespace dcmwire::encoding::compression {

/**
 * @brief Photometric interpretation of pixel data.
 *
 * @see DICOM PS3.3 Section C.7.6.3.1.2
 */
enum class photometric_interpretation {
    monochrome1,     ///< Minimum pixel value displayed as white
    monochrome2,     ///< Minimum pixel value displayed as black
    palette_color,   ///< Palette color lookup table
    rgb,             ///< Red, Green, Blue color model
    ycbcr_full,      ///< YBR_FULL
    ycbcr_full_422,  ///< YBR_FULL_422
    ycbcr_ict,       ///< YBR_ICT (JPEG 2000 irreversible)
    ycbcr_rct,       ///< YBR_RCT (JPEG 2000 reversible)
    unknown          ///< Not a defined term
};

[[nodiscard]] std::string_view to_string(photometric_interpretation pi) noexcept;

/**
 * @brief Parses a (0028,0004) value, trailing padding allowed.
 */
[[nodiscard]] photometric_interpretation parse_photometric_interpretation(
    std::string_view str) noexcept;

/**
 * @brief Validated parameters describing one frame of pixel data.
 *
 * Decoded frames are always pixel interleaved (planar configuration 0)
 * and little endian.
 */
struct image_params {
    /// Rows (0028,0010)
    uint16_t rows{0};

    /// Columns (0028,0011)
    uint16_t columns{0};

    /// Samples per Pixel (0028,0002), 1 or 3
    uint16_t samples_per_pixel{1};

    /// Bits Allocated (0028,0100), 1 or a multiple of 8
    uint16_t bits_allocated{8};

    /// Bits Stored (0028,0101)
    uint16_t bits_stored{8};

    /// Pixel Representation (0028,0103), 0 unsigned, 1 signed
    uint16_t pixel_representation{0};

    /// Planar Configuration (0028,0006), 0 interleaved, 1 separate planes
    uint16_t planar_configuration{0};

    photometric_interpretation photometric{photometric_interpretation::monochrome2};

    /// Number of Frames (0028,0008)
    uint32_t number_of_frames{1};

    /**
     * @brief Bytes used by one sample, 0 for bit-packed (1-bit) data.
     */
    [[nodiscard]] std::size_t bytes_per_sample() const noexcept {
        return bits_allocated == 1 ? 0 : bits_allocated / 8u;
    }

    [[nodiscard]] std::size_t pixels_per_frame() const noexcept {
        return static_cast<std::size_t>(rows) * columns;
    }

    /**
     * @brief Size of one native frame in bytes (bit-packed data rounded up).
     */
    [[nodiscard]] std::size_t frame_size_bytes() const noexcept {
        const auto samples = pixels_per_frame() * samples_per_pixel;
        if (bits_allocated == 1) {
            return (samples + 7) / 8;
        }
        return samples * bytes_per_sample();
    }

    [[nodiscard]] bool is_signed() const noexcept {
        return pixel_representation == 1;
    }
};

/**
 * @brief Pixel module attributes as found in a dataset, each optional.
 */
struct pixel_attributes {
    std::optional<uint32_t> rows;
    std::optional<uint32_t> columns;
    std::optional<uint32_t> samples_per_pixel;
    std::optional<uint32_t> bits_allocated;
    std::optional<uint32_t> bits_stored;
    std::optional<uint32_t> pixel_representation;
    std::optional<uint32_t> planar_configuration;
    std::optional<uint32_t> number_of_frames;
    std::optional<std::string> photometric_interpretation;

    /**
     * @brief Collect the attributes present in a dataset.
     *
     * Unreadable values are treated as absent.
     */
    [[nodiscard]] static pixel_attributes from_dataset(const core::dicom_dataset& dataset);

    /**
     * @brief Describe already validated parameters.
     */
    [[nodiscard]] static pixel_attributes from_params(const image_params& params);
};

/**
 * @brief Check that the attributes describe decodable pixel data.
 *
 * Every missing required attribute is listed in a single
 * missing_pixel_metadata error. Values out of range fail with
 * invalid_pixel_metadata. An absent number of frames means 1; Planar
 * Configuration is only required when Samples per Pixel is above 1.
 */
[[nodiscard]] dcmwire::Result<image_params> validate_pixel_attributes(
    const pixel_attributes& attributes);

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_PIXEL_METADATA_HPP
