#ifndef DCMWIRE_ENCODING_COMPRESSION_JPEG2000_CODEC_HPP
#define DCMWIRE_ENCODING_COMPRESSION_JPEG2000_CODEC_HPP

#include "dcmwire/encoding/compression/codec_plugin.hpp"

namespace dcmwire::encoding::compression {

/**
 * @brief JPEG 2000 decoder backed by OpenJPEG.
 *
 * Decodes Transfer Syntaxes 1.2.840.10008.1.2.4.90 (lossless only) and
 * 1.2.840.10008.1.2.4.91. Both raw codestreams and JP2 wrapped data are
 * accepted. Without OpenJPEG at build time the plugin stays registered
 * but reports the library as a missing dependency.
 *
 * @see DICOM PS3.5 Annex A.4.4 - JPEG 2000 Image Compression
 */
class jpeg2000_codec final : public codec_plugin {
public:
    static constexpr std::string_view plugin_name = "openjpeg";

    [[nodiscard]] std::string_view name() const noexcept override { return plugin_name; }

    [[nodiscard]] bool supports(const transfer_syntax& syntax) const noexcept override;

    [[nodiscard]] std::vector<std::string> missing_dependencies() const override;

    [[nodiscard]] codec_result decode(std::span<const uint8_t> frame,
                                      const image_params& params,
                                      const core::warning_handler& on_warning) const override;
};

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_JPEG2000_CODEC_HPP
