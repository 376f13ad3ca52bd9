#ifndef DCMWIRE_ENCODING_COMPRESSION_RLE_CODEC_HPP
#define DCMWIRE_ENCODING_COMPRESSION_RLE_CODEC_HPP

#include "dcmwire/encoding/compression/codec_plugin.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dcmwire::encoding::compression {

/// Maximum number of RLE segments allowed by DICOM
inline constexpr std::size_t rle_max_segments = 15;

/// RLE header size (64 bytes: segment count and 15 offsets)
inline constexpr std::size_t rle_header_size = 64;

/**
 * @brief DICOM RLE Lossless codec without external dependencies.
 *
 * Implements Transfer Syntax 1.2.840.10008.1.2.5. Each byte of each
 * sample forms its own segment, most significant byte first, and every
 * row of a segment is PackBits encoded on its own.
 *
 * Supported Features:
 * - Any Bits Allocated that is a multiple of 8, up to 15 segments
 * - Signed and unsigned data (the codec is byte oriented)
 * - Planar configuration 1 input when encoding
 *
 * @see DICOM PS3.5 Annex G - RLE Lossless Compression
 */
class rle_codec final : public codec_plugin {
public:
    static constexpr std::string_view plugin_name = "native";

    [[nodiscard]] std::string_view name() const noexcept override { return plugin_name; }

    [[nodiscard]] bool supports(const transfer_syntax& syntax) const noexcept override;

    [[nodiscard]] bool can_encode(const transfer_syntax& syntax) const noexcept override;

    [[nodiscard]] codec_result decode(std::span<const uint8_t> frame,
                                      const image_params& params,
                                      const core::warning_handler& on_warning) const override;

    [[nodiscard]] codec_result encode(std::span<const uint8_t> pixel_data,
                                      const image_params& params,
                                      const compression_options& options) const override;
};

/// @name Building Blocks
/// @{

/**
 * @brief PackBits encode one row of one segment, appending to out.
 *
 * Single bytes are gathered into literal runs (control n-1) of at most
 * 128 bytes. Runs of equal bytes are replicate runs (control 257-n) split
 * into chunks of 128; a trailing chunk of one byte becomes a literal.
 */
void rle_encode_row(std::span<const uint8_t> row, std::vector<uint8_t>& out);

/**
 * @brief Encode one segment row by row, padded to even length.
 */
[[nodiscard]] std::vector<uint8_t> rle_encode_segment(std::span<const uint8_t> segment,
                                                      std::size_t columns);

/**
 * @brief Expand one PackBits segment.
 *
 * Control 128 is a no-op. Truncated input yields whatever was decoded;
 * the caller checks the length.
 */
[[nodiscard]] std::vector<uint8_t> rle_decode_segment(std::span<const uint8_t> segment);

/**
 * @brief Parse the 64-byte header into segment offsets.
 */
[[nodiscard]] dcmwire::Result<std::vector<uint32_t>> rle_parse_header(
    std::span<const uint8_t> header);

/**
 * @brief Encode one native frame (little endian samples).
 */
[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> rle_encode_frame(
    std::span<const uint8_t> pixel_data, const image_params& params);

/**
 * @brief Decode one RLE frame to pixel interleaved little endian samples.
 */
[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> rle_decode_frame(
    std::span<const uint8_t> frame, const image_params& params,
    const core::warning_handler& on_warning = {});

/// @}

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_RLE_CODEC_HPP
