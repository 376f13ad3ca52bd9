#ifndef DCMWIRE_ENCODING_COMPRESSION_FRAME_CODEC_HPP
#define DCMWIRE_ENCODING_COMPRESSION_FRAME_CODEC_HPP

#include "dcmwire/encoding/byte_source.hpp"
#include "dcmwire/encoding/compression/codec_registry.hpp"
#include "dcmwire/encoding/compression/pixel_metadata.hpp"
#include "dcmwire/encoding/encapsulation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dcmwire::encoding::compression {

/**
 * @brief Settings for one decoding session.
 */
struct decode_options {
    /// Use only this plugin
    std::optional<std::string> plugin;

    /// Extended Offset Table of the pixel data, if present
    std::optional<extended_offset_table> extended_offsets;

    /// Receives framing, plugin and codec warnings
    core::warning_handler on_warning;
};

struct decoded_frame {
    std::vector<uint8_t> data;
    image_params params;
    std::string plugin;
};

/**
 * @brief All frames of a pixel data value, concatenated.
 */
struct decoded_pixels {
    std::vector<uint8_t> data;

    /// Describes the output; bits allocated and number of frames may differ
    /// from the dataset
    image_params params;
};

/**
 * @brief Decodes the frames of one encapsulated Pixel Data value.
 *
 * The source must be positioned at the start of the encapsulated value
 * (the Basic Offset Table item) when the decoder is created. Pixel
 * metadata is validated once, up front.
 *
 * The plugin that decoded the previous frame is tried first for the next
 * one. If it fails, the remaining plugins are tried in registration order
 * and a change of plugin is reported as a warning.
 *
 * @code
 * auto registry = codec_registry::with_default_plugins();
 * auto decoder = frame_decoder::create(registry, transfer_syntax::rle_lossless,
 *                                      pixel_attributes::from_dataset(ds), source);
 * auto pixels = decoder.value().decode_all();
 * @endcode
 */
class frame_decoder {
public:
    [[nodiscard]] static dcmwire::Result<frame_decoder> create(
        const codec_registry& registry,
        const transfer_syntax& syntax,
        const pixel_attributes& attributes,
        byte_source& source,
        decode_options options = {});

    /**
     * @brief Decode the frame with the given index.
     */
    [[nodiscard]] dcmwire::Result<decoded_frame> decode_frame(std::size_t index);

    /**
     * @brief Decode the next frame in stream order.
     * @return std::nullopt after the last frame
     */
    [[nodiscard]] dcmwire::Result<std::optional<decoded_frame>> next();

    /**
     * @brief Decode every frame.
     *
     * Frames decoded to a narrower Bits Allocated than the widest frame
     * are widened (sign extended for signed data). Frames found beyond
     * Number of Frames are appended with a warning.
     */
    [[nodiscard]] dcmwire::Result<decoded_pixels> decode_all();

    [[nodiscard]] const image_params& params() const noexcept { return params_; }

    /// Name of the plugin that decoded the most recent frame
    [[nodiscard]] const std::string& last_plugin() const noexcept { return last_plugin_; }

private:
    frame_decoder(const codec_registry& registry,
                  transfer_syntax syntax,
                  image_params params,
                  byte_source& source,
                  decode_options options);

    [[nodiscard]] frame_options framing() const;

    [[nodiscard]] dcmwire::Result<decoded_frame> decode_bytes(std::span<const uint8_t> frame,
                                                              std::size_t index);

    const codec_registry* registry_;
    transfer_syntax syntax_;
    image_params params_;
    byte_source* source_;
    decode_options options_;
    uint64_t start_;
    std::optional<frame_iterator> iterator_;
    std::size_t next_index_{0};
    std::string last_plugin_;
};

/**
 * @brief Widen little endian samples to a larger Bits Allocated.
 */
[[nodiscard]] std::vector<uint8_t> widen_samples(std::span<const uint8_t> data,
                                                 uint16_t from_bits,
                                                 uint16_t to_bits,
                                                 bool is_signed);

/**
 * @brief Encodes native frames one at a time through the registry.
 *
 * Mirrors frame_decoder: the attributes are validated once, the plugin
 * that encoded the previous frame is tried first, and a change of plugin
 * between frames is reported as a warning.
 */
class frame_encoder {
public:
    [[nodiscard]] static dcmwire::Result<frame_encoder> create(
        const codec_registry& registry,
        const transfer_syntax& syntax,
        const pixel_attributes& attributes,
        compression_options options = {},
        std::optional<std::string> plugin = std::nullopt,
        core::warning_handler on_warning = {});

    /**
     * @brief Encode one frame of exactly params().frame_size_bytes() bytes.
     */
    [[nodiscard]] dcmwire::Result<std::vector<uint8_t>> encode_frame(
        std::span<const uint8_t> frame, std::size_t index);

    [[nodiscard]] const image_params& params() const noexcept { return params_; }

    /// Name of the plugin that encoded the most recent frame
    [[nodiscard]] const std::string& last_plugin() const noexcept { return last_plugin_; }

private:
    frame_encoder(const codec_registry& registry,
                  transfer_syntax syntax,
                  image_params params,
                  compression_options options,
                  std::optional<std::string> plugin,
                  core::warning_handler on_warning);

    const codec_registry* registry_;
    transfer_syntax syntax_;
    image_params params_;
    compression_options options_;
    std::optional<std::string> plugin_;
    core::warning_handler on_warning_;
    std::string last_plugin_;
};

/**
 * @brief Encode every frame of native pixel data through the registry.
 *
 * @param pixel_data Number of Frames native frames back to back
 * @return One encoded frame per input frame, ready for encapsulate()
 */
[[nodiscard]] dcmwire::Result<std::vector<std::vector<uint8_t>>> encode_frames(
    const codec_registry& registry,
    const transfer_syntax& syntax,
    std::span<const uint8_t> pixel_data,
    const pixel_attributes& attributes,
    const compression_options& options = {},
    std::optional<std::string_view> plugin = std::nullopt,
    const core::warning_handler& on_warning = {});

}  // namespace dcmwire::encoding::compression

#endif  // DCMWIRE_ENCODING_COMPRESSION_FRAME_CODEC_HPP
