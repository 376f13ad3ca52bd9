#ifndef DCMWIRE_ENCODING_COMPRESSION_JPEG_LS_CODEC_HPP
#define DCMWIRE_ENCODING_COMPRESSION_JPEG_LS_CODEC_HPP

#include "dcmwire/encoding/compression/codec_plugin.hpp"

namespace dcmwire::encoding::compression {

/// Largest NEAR value accepted for near-lossless encoding
inline constexpr int jpeg_ls_max_near = 255;

/**
 * @brief JPEG-LS codec backed by CharLS.
 *
 * Decodes and encodes Transfer Syntaxes 1.2.840.10008.1.2.4.80
 * (lossless) and 1.2.840.10008.1.2.4.81 (near-lossless). CharLS reports
 * errors as exceptions; they are converted to error results here.
 *
 * @see DICOM PS3.5 Annex A.4.3 - JPEG-LS Image Compression
 * @see ISO/IEC 14495-1 - JPEG-LS specification
 */
class jpeg_ls_codec final : public codec_plugin {
public:
    static constexpr std::string_view plugin_name = "charls";

    [[nodiscard]] std::string_view name() const noexcept override { return plugin_name; }

    [[nodiscard]] bool supports(const transfer_syntax& syntax) const noexcept override;

    [[nodiscard]] bool can_encode(const transfer_syntax& syntax) const noexcept override;

    [[nodiscard]] std::vector<std::string> missing_dependencies() const override;

    [[nodiscard]] codec_result decode(std::span<const uint8_t> frame,
                                      const image_params& params,
                                      const core::warning_handler& on_warning) const override;

    /**
     * @brief Encode a frame; options.near_lossless 0 (or lossless) gives
     *        lossless output.
     */
    [[nodiscard]] codec_result encode(std::span<const uint8_t> pixel_data,
                                      const image_params& params,
                                      const compression_options& options) const override;
};

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_JPEG_LS_CODEC_HPP
