#include "dcmwire/encoding/compression/frame_codec.hpp"

#include "dcmwire/compat/format.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

#include <algorithm>

namespace dcmwire::encoding::compression {

using integration::logger_adapter;

namespace {

// The plugin that handled the previous frame goes first
void prefer_plugin(std::vector<const codec_plugin*>& plugins, const std::string& name) {
    if (name.empty()) {
        return;
    }
    auto it = std::find_if(plugins.begin(), plugins.end(),
                           [&](const codec_plugin* p) { return p->name() == name; });
    if (it != plugins.end()) {
        std::rotate(plugins.begin(), it, it + 1);
    }
}

void report_plugin_change(const core::warning_handler& on_warning,
                          std::string_view role,
                          const std::string& previous,
                          const std::string& current) {
    if (previous.empty() || previous == current) {
        return;
    }
    core::report_warning(
        on_warning,
        "The " + std::string{role} + " plugin has changed from '" + previous + "' to '" +
            current + "' during the " + std::string{role} +
            " process - you may get inconsistent inter-frame results, consider pinning the '" +
            current + "' plugin instead");
}

std::optional<std::string_view> pinned_name(const std::optional<std::string>& plugin) {
    if (plugin) {
        return std::string_view{*plugin};
    }
    return std::nullopt;
}

}  // namespace

frame_decoder::frame_decoder(const codec_registry& registry,
                             transfer_syntax syntax,
                             image_params params,
                             byte_source& source,
                             decode_options options)
    : registry_(&registry),
      syntax_(std::move(syntax)),
      params_(params),
      source_(&source),
      options_(std::move(options)),
      start_(source.tell()) {}

dcmwire::Result<frame_decoder> frame_decoder::create(const codec_registry& registry,
                                                     const transfer_syntax& syntax,
                                                     const pixel_attributes& attributes,
                                                     byte_source& source,
                                                     decode_options options) {
    if (!syntax.is_encapsulated()) {
        return dcmwire::dcmwire_error<frame_decoder>(
            dcmwire::error_codes::codec_not_supported,
            "'" + std::string{syntax.name()} + "' is not a compressed transfer syntax");
    }

    auto params = validate_pixel_attributes(attributes);
    if (params.is_err()) {
        return dcmwire::Result<frame_decoder>::err(params.error());
    }

    auto selected = registry.select_plugins(syntax, pinned_name(options.plugin));
    if (selected.is_err()) {
        return dcmwire::Result<frame_decoder>::err(selected.error());
    }

    return dcmwire::ok(
        frame_decoder{registry, syntax, params.value(), source, std::move(options)});
}

frame_options frame_decoder::framing() const {
    frame_options framing;
    framing.number_of_frames = params_.number_of_frames;
    framing.extended_offsets = options_.extended_offsets;
    framing.on_warning = options_.on_warning;
    return framing;
}

dcmwire::Result<decoded_frame> frame_decoder::decode_bytes(std::span<const uint8_t> frame,
                                                           std::size_t index) {
    auto selected = registry_->select_plugins(syntax_, pinned_name(options_.plugin));
    if (selected.is_err()) {
        return dcmwire::Result<decoded_frame>::err(selected.error());
    }

    auto plugins = std::move(selected.value());
    prefer_plugin(plugins, last_plugin_);

    auto result = codec_registry::decode_with(plugins, frame, params_, options_.on_warning);
    if (result.is_err()) {
        return dcmwire::Result<decoded_frame>::err(result.error());
    }

    auto& dispatched = result.value();
    report_plugin_change(options_.on_warning, "decoding", last_plugin_, dispatched.plugin);
    last_plugin_ = dispatched.plugin;

    const auto expected = dispatched.output.output_params.frame_size_bytes();
    const auto actual = dispatched.output.data.size();
    if (actual != expected) {
        return dcmwire::dcmwire_error<decoded_frame>(
            dcmwire::error_codes::frame_size_mismatch,
            compat::format("Unexpected number of bytes in the decoded frame with index {} "
                           "({} bytes actual vs {} expected)",
                           index, actual, expected));
    }

    logger_adapter::trace("Decoded frame {} with '{}' ({} bytes)", index, dispatched.plugin,
                          actual);
    return dcmwire::ok(decoded_frame{std::move(dispatched.output.data),
                                     dispatched.output.output_params,
                                     std::move(dispatched.plugin)});
}

dcmwire::Result<decoded_frame> frame_decoder::decode_frame(std::size_t index) {
    const auto position = source_->tell();
    source_->seek(start_);
    auto frame = get_frame(*source_, index, framing());
    source_->seek(position);
    if (frame.is_err()) {
        return dcmwire::Result<decoded_frame>::err(frame.error());
    }
    return decode_bytes(frame.value(), index);
}

dcmwire::Result<std::optional<decoded_frame>> frame_decoder::next() {
    using next_result = dcmwire::Result<std::optional<decoded_frame>>;

    if (!iterator_) {
        source_->seek(start_);
        auto created = frame_iterator::create(*source_, framing());
        if (created.is_err()) {
            return next_result::err(created.error());
        }
        iterator_.emplace(std::move(created.value()));
    }

    auto frame = iterator_->next();
    if (frame.is_err()) {
        return next_result::err(frame.error());
    }
    if (!frame.value()) {
        return dcmwire::ok(std::optional<decoded_frame>{});
    }

    auto decoded = decode_bytes(*frame.value(), next_index_);
    if (decoded.is_err()) {
        return next_result::err(decoded.error());
    }
    ++next_index_;
    return dcmwire::ok(std::optional<decoded_frame>{std::move(decoded.value())});
}

dcmwire::Result<decoded_pixels> frame_decoder::decode_all() {
    iterator_.reset();
    next_index_ = 0;

    std::vector<decoded_frame> frames;
    while (true) {
        auto frame = next();
        if (frame.is_err()) {
            return dcmwire::Result<decoded_pixels>::err(frame.error());
        }
        if (!frame.value()) {
            break;
        }
        if (frames.size() >= params_.number_of_frames &&
            frame.value()->data.size() != frames.front().data.size()) {
            continue;
        }
        frames.push_back(std::move(*frame.value()));
    }

    if (frames.size() < params_.number_of_frames) {
        return dcmwire::dcmwire_error<decoded_pixels>(
            dcmwire::error_codes::insufficient_fragments,
            compat::format("There is insufficient pixel data to contain {} frames, only {} "
                           "were found",
                           params_.number_of_frames, frames.size()));
    }
    if (frames.size() > params_.number_of_frames) {
        core::report_warning(options_.on_warning,
                             "More frames have been found in the encapsulated pixel data "
                             "than expected from the supplied number of frames");
    }

    uint16_t widest = 0;
    uint16_t bits_stored = 0;
    for (const auto& frame : frames) {
        widest = std::max(widest, frame.params.bits_allocated);
        bits_stored = std::max(bits_stored, frame.params.bits_stored);
    }

    decoded_pixels pixels;
    pixels.params = frames.front().params;
    pixels.params.bits_allocated = widest;
    pixels.params.bits_stored = bits_stored;
    pixels.params.number_of_frames = static_cast<uint32_t>(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto& frame = frames[i];
        if (frame.params.bits_allocated == widest) {
            pixels.data.insert(pixels.data.end(), frame.data.begin(), frame.data.end());
            continue;
        }
        logger_adapter::debug("Widening frame {} from {} to {} bits allocated", i,
                              frame.params.bits_allocated, widest);
        auto widened = widen_samples(frame.data, frame.params.bits_allocated, widest,
                                     frame.params.is_signed());
        pixels.data.insert(pixels.data.end(), widened.begin(), widened.end());
    }
    return dcmwire::ok(std::move(pixels));
}

std::vector<uint8_t> widen_samples(std::span<const uint8_t> data,
                                   uint16_t from_bits,
                                   uint16_t to_bits,
                                   bool is_signed) {
    const std::size_t from = from_bits / 8u;
    const std::size_t to = to_bits / 8u;
    if (from == 0 || to <= from) {
        return {data.begin(), data.end()};
    }

    const std::size_t samples = data.size() / from;
    std::vector<uint8_t> out(samples * to, 0);
    for (std::size_t s = 0; s < samples; ++s) {
        const auto* src = data.data() + s * from;
        auto* dst = out.data() + s * to;
        std::copy_n(src, from, dst);
        if (is_signed && (src[from - 1] & 0x80) != 0) {
            std::fill(dst + from, dst + to, static_cast<uint8_t>(0xFF));
        }
    }
    return out;
}

// ============================================================================
// Encoding
// ============================================================================

frame_encoder::frame_encoder(const codec_registry& registry,
                             transfer_syntax syntax,
                             image_params params,
                             compression_options options,
                             std::optional<std::string> plugin,
                             core::warning_handler on_warning)
    : registry_(&registry),
      syntax_(std::move(syntax)),
      params_(params),
      options_(options),
      plugin_(std::move(plugin)),
      on_warning_(std::move(on_warning)) {}

dcmwire::Result<frame_encoder> frame_encoder::create(const codec_registry& registry,
                                                     const transfer_syntax& syntax,
                                                     const pixel_attributes& attributes,
                                                     compression_options options,
                                                     std::optional<std::string> plugin,
                                                     core::warning_handler on_warning) {
    auto params = validate_pixel_attributes(attributes);
    if (params.is_err()) {
        return dcmwire::Result<frame_encoder>::err(params.error());
    }

    auto selected = registry.select_plugins(syntax, pinned_name(plugin), true);
    if (selected.is_err()) {
        return dcmwire::Result<frame_encoder>::err(selected.error());
    }

    return dcmwire::ok(frame_encoder{registry, syntax, params.value(), options,
                                     std::move(plugin), std::move(on_warning)});
}

dcmwire::Result<std::vector<uint8_t>> frame_encoder::encode_frame(
    std::span<const uint8_t> frame, std::size_t index) {
    using encoded_result = dcmwire::Result<std::vector<uint8_t>>;

    const auto expected = params_.frame_size_bytes();
    if (frame.size() != expected) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::frame_size_mismatch,
            compat::format("Frame {} is {} bytes long, but {} bytes were expected", index,
                           frame.size(), expected));
    }

    auto selected = registry_->select_plugins(syntax_, pinned_name(plugin_), true);
    if (selected.is_err()) {
        return encoded_result::err(selected.error());
    }

    auto plugins = std::move(selected.value());
    prefer_plugin(plugins, last_plugin_);

    auto result = codec_registry::encode_with(plugins, frame, params_, options_);
    if (result.is_err()) {
        return encoded_result::err(result.error());
    }

    auto& dispatched = result.value();
    report_plugin_change(on_warning_, "encoding", last_plugin_, dispatched.plugin);
    last_plugin_ = dispatched.plugin;

    logger_adapter::trace("Encoded frame {} with '{}' ({} bytes)", index, dispatched.plugin,
                          dispatched.output.data.size());
    return dcmwire::ok(std::move(dispatched.output.data));
}

dcmwire::Result<std::vector<std::vector<uint8_t>>> encode_frames(
    const codec_registry& registry,
    const transfer_syntax& syntax,
    std::span<const uint8_t> pixel_data,
    const pixel_attributes& attributes,
    const compression_options& options,
    std::optional<std::string_view> plugin,
    const core::warning_handler& on_warning) {
    using frames_result = dcmwire::Result<std::vector<std::vector<uint8_t>>>;

    std::optional<std::string> pinned;
    if (plugin) {
        pinned = std::string{*plugin};
    }
    auto encoder = frame_encoder::create(registry, syntax, attributes, options,
                                         std::move(pinned), on_warning);
    if (encoder.is_err()) {
        return frames_result::err(encoder.error());
    }
    const auto& params = encoder.value().params();

    const std::size_t frame_size = params.frame_size_bytes();
    const std::size_t expected = frame_size * params.number_of_frames;
    if (pixel_data.size() < expected) {
        return dcmwire::dcmwire_error<std::vector<std::vector<uint8_t>>>(
            dcmwire::error_codes::frame_size_mismatch,
            compat::format("The pixel data is {} bytes long, but {} frames of {} bytes were "
                           "expected",
                           pixel_data.size(), params.number_of_frames, frame_size));
    }

    std::vector<std::vector<uint8_t>> encoded;
    encoded.reserve(params.number_of_frames);
    for (uint32_t i = 0; i < params.number_of_frames; ++i) {
        auto frame = pixel_data.subspan(static_cast<std::size_t>(i) * frame_size, frame_size);
        auto result = encoder.value().encode_frame(frame, i);
        if (result.is_err()) {
            return frames_result::err(result.error());
        }
        encoded.push_back(std::move(result.value()));
    }
    return dcmwire::ok(std::move(encoded));
}

}  // namespace dcmwire::encoding::compression
