#ifndef DCMWIRE_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP
#define DCMWIRE_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP

#include "dcmwire/encoding/compression/codec_plugin.hpp"

namespace dcmwire::encoding::compression {

/**
 * @brief JPEG Baseline and 8-bit Extended codec backed by libjpeg.
 *
 * Decodes Transfer Syntaxes 1.2.840.10008.1.2.4.50 and .51 (8-bit data
 * only) and encodes 1.2.840.10008.1.2.4.50.
 *
 * Supported Features:
 * - 8-bit grayscale images
 * - 8-bit three sample images, decoded to RGB
 * - Quality settings from 1-100 when encoding
 *
 * @see DICOM PS3.5 Annex A.4.1 - JPEG Image Compression
 * @see ITU-T T.81 - JPEG specification
 */
class jpeg_baseline_codec final : public codec_plugin {
public:
    static constexpr std::string_view plugin_name = "libjpeg";

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

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_JPEG_BASELINE_CODEC_HPP
