#ifndef DCMWIRE_ENCODING_COMPRESSION_CODEC_PLUGIN_HPP
#define DCMWIRE_ENCODING_COMPRESSION_CODEC_PLUGIN_HPP

#include "dcmwire/core/diagnostics.hpp"
#include "dcmwire/core/result.hpp"
#include "dcmwire/encoding/compression/pixel_metadata.hpp"
#include "dcmwire/encoding/transfer_syntax.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dcmwire::encoding::compression {

/**
 * @brief Compression settings for encoding plugins.
 *
 * Quality is codec-specific:
 * - JPEG: 1-100, higher is better quality (larger file)
 * - JPEG-LS: near_lossless 0 means lossless
 */
struct compression_options {
    /// Quality setting (1-100 for JPEG)
    int quality{75};

    /// Request lossless output where the syntax allows both
    bool lossless{true};

    /// Maximum per-sample error for JPEG-LS near-lossless (0 = lossless)
    int near_lossless{0};
};

/**
 * @brief Successful result of a decode or encode call.
 */
struct compression_result {
    /// Processed pixel data
    std::vector<uint8_t> data;

    /// Parameters of the produced data (bits allocated may differ from the input)
    image_params output_params;
};

using codec_result = dcmwire::Result<compression_result>;

/**
 * @brief A decoder (and optionally encoder) for one family of transfer syntaxes.
 *
 * Plugins are registered with a codec_registry under a unique name. A
 * plugin whose third-party library was not built reports the missing
 * pieces through missing_dependencies() and is skipped during dispatch.
 *
 * Decoded output is one frame, pixel interleaved (planar configuration 0)
 * and little endian. Plugins may throw; the registry converts exceptions
 * into failures of that plugin.
 *
 * @see DICOM PS3.5 Section 8.2 - Native and Encapsulated Pixel Data
 */
class codec_plugin {
public:
    virtual ~codec_plugin() = default;

    /// @name Plugin Information
    /// @{

    /**
     * @brief Unique plugin name used to pin dispatch.
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Checks if the plugin decodes the given transfer syntax.
     */
    [[nodiscard]] virtual bool supports(const transfer_syntax& syntax) const noexcept = 0;

    /**
     * @brief Checks if the plugin can also encode the given transfer syntax.
     */
    [[nodiscard]] virtual bool can_encode(const transfer_syntax& /*syntax*/) const noexcept {
        return false;
    }

    /**
     * @brief Libraries the plugin needs but were not available at build time.
     */
    [[nodiscard]] virtual std::vector<std::string> missing_dependencies() const {
        return {};
    }

    [[nodiscard]] bool is_available() const { return missing_dependencies().empty(); }

    /// @}

    /// @name Operations
    /// @{

    /**
     * @brief Decode one encoded frame.
     *
     * @param frame The encoded frame
     * @param params Validated parameters of the frame
     * @param on_warning Receives non-fatal problems found in the frame
     */
    [[nodiscard]] virtual codec_result decode(
        std::span<const uint8_t> frame,
        const image_params& params,
        const core::warning_handler& on_warning) const = 0;

    /**
     * @brief Encode one native frame.
     *
     * The input uses the planar configuration in params.
     */
    [[nodiscard]] virtual codec_result encode(
        std::span<const uint8_t> /*pixel_data*/,
        const image_params& /*params*/,
        const compression_options& /*options*/) const {
        return dcmwire::dcmwire_error<compression_result>(
            dcmwire::error_codes::codec_not_supported,
            "The '" + std::string{name()} + "' plugin does not support encoding");
    }

    /// @}

protected:
    codec_plugin() = default;
    codec_plugin(const codec_plugin&) = default;
    codec_plugin& operator=(const codec_plugin&) = default;
    codec_plugin(codec_plugin&&) = default;
    codec_plugin& operator=(codec_plugin&&) = default;
};

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_CODEC_PLUGIN_HPP
