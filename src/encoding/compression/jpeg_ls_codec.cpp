#include "dcmwire/encoding/compression/jpeg_ls_codec.hpp"
#include <dcmwire/core/result.hpp>

#include <algorithm>
#include <stdexcept>

#ifdef DCMWIRE_WITH_CHARLS
#include <charls/charls.h>
#endif

namespace dcmwire::encoding::compression {

namespace {

#ifdef DCMWIRE_WITH_CHARLS

codec_result make_error(int code, const std::string& message) {
    return dcmwire::dcmwire_error<compression_result>(code, message);
}

[[nodiscard]] charls::interleave_mode get_interleave_mode(const image_params& params) {
    if (params.samples_per_pixel == 1) {
        return charls::interleave_mode::none;
    }
    return params.planar_configuration == 0 ? charls::interleave_mode::sample
                                            : charls::interleave_mode::none;
}

#endif  // DCMWIRE_WITH_CHARLS

#ifndef DCMWIRE_WITH_CHARLS

codec_result not_available() {
    return dcmwire::dcmwire_error<compression_result>(
        dcmwire::error_codes::plugin_unavailable,
        "JPEG-LS codec not available: CharLS library not found at build time");
}

#endif  // DCMWIRE_WITH_CHARLS

}  // namespace

bool jpeg_ls_codec::supports(const transfer_syntax& syntax) const noexcept {
    return syntax == transfer_syntax::jpeg_ls_lossless ||
           syntax == transfer_syntax::jpeg_ls_near_lossless;
}

bool jpeg_ls_codec::can_encode(const transfer_syntax& syntax) const noexcept {
    return supports(syntax);
}

std::vector<std::string> jpeg_ls_codec::missing_dependencies() const {
#ifdef DCMWIRE_WITH_CHARLS
    return {};
#else
    return {"CharLS"};
#endif
}

codec_result jpeg_ls_codec::decode(std::span<const uint8_t> frame,
                                   const image_params& params,
                                   const core::warning_handler& /*on_warning*/) const {
#ifndef DCMWIRE_WITH_CHARLS
    (void)frame;
    (void)params;
    return not_available();
#else
    if (frame.empty()) {
        return make_error(dcmwire::error_codes::decompression_error, "Empty compressed data");
    }

    try {
        charls::jpegls_decoder decoder;
        decoder.source(frame);
        decoder.read_header();

        const charls::frame_info& info = decoder.frame_info();
        if (info.width != params.columns || info.height != params.rows) {
            return make_error(dcmwire::error_codes::decompression_error,
                              "Image size mismatch: expected " + std::to_string(params.columns) +
                                  "x" + std::to_string(params.rows) + ", got " +
                                  std::to_string(info.width) + "x" + std::to_string(info.height));
        }
        if (info.component_count != static_cast<int32_t>(params.samples_per_pixel)) {
            return make_error(dcmwire::error_codes::decompression_error,
                              "Samples per pixel mismatch: expected " +
                                  std::to_string(params.samples_per_pixel) + ", got " +
                                  std::to_string(info.component_count));
        }

        std::vector<uint8_t> destination(decoder.destination_size());
        decoder.decode(destination);

        image_params output_params = params;
        // Planar data from CharLS is re-interleaved below
        if (params.samples_per_pixel == 3 &&
            decoder.interleave_mode() == charls::interleave_mode::none) {
            const std::size_t pixels = params.pixels_per_frame();
            const std::size_t bps = params.bytes_per_sample();
            std::vector<uint8_t> interleaved(destination.size());
            for (std::size_t p = 0; p < pixels; ++p) {
                for (std::size_t s = 0; s < 3; ++s) {
                    std::copy_n(destination.begin() + static_cast<std::ptrdiff_t>((s * pixels + p) * bps),
                                bps,
                                interleaved.begin() + static_cast<std::ptrdiff_t>((p * 3 + s) * bps));
                }
            }
            destination = std::move(interleaved);
        }
        output_params.planar_configuration = 0;

        return dcmwire::ok(compression_result{std::move(destination), output_params});
    } catch (const charls::jpegls_error& e) {
        return make_error(dcmwire::error_codes::decompression_error,
                          std::string("JPEG-LS decoding failed: ") + e.what());
    }
#endif  // DCMWIRE_WITH_CHARLS
}

codec_result jpeg_ls_codec::encode(std::span<const uint8_t> pixel_data,
                                   const image_params& params,
                                   const compression_options& options) const {
#ifndef DCMWIRE_WITH_CHARLS
    (void)pixel_data;
    (void)params;
    (void)options;
    return not_available();
#else
    if (params.bits_allocated != 8 && params.bits_allocated != 16) {
        return make_error(dcmwire::error_codes::compression_error,
                          "JPEG-LS requires 8 or 16 bits allocated, not " +
                              std::to_string(params.bits_allocated));
    }
    if (pixel_data.size() != params.frame_size_bytes()) {
        return make_error(dcmwire::error_codes::frame_size_mismatch,
                          "Pixel data size mismatch: expected " +
                              std::to_string(params.frame_size_bytes()) + ", got " +
                              std::to_string(pixel_data.size()));
    }

    const int near_value =
        options.lossless ? 0 : std::clamp(options.near_lossless, 0, jpeg_ls_max_near);

    try {
        charls::jpegls_encoder encoder;

        charls::frame_info info{};
        info.width = params.columns;
        info.height = params.rows;
        info.bits_per_sample = params.bits_stored;
        info.component_count = params.samples_per_pixel;
        encoder.frame_info(info);
        encoder.interleave_mode(get_interleave_mode(params));
        encoder.near_lossless(near_value);

        std::vector<uint8_t> destination((std::max)(
            {encoder.estimated_destination_size(), pixel_data.size() + pixel_data.size() / 5,
             pixel_data.size() + 1024}));
        encoder.destination(destination);
        const std::size_t bytes_written = encoder.encode(pixel_data);
        destination.resize(bytes_written);

        image_params output_params = params;
        return dcmwire::ok(compression_result{std::move(destination), output_params});
    } catch (const charls::jpegls_error& e) {
        return make_error(dcmwire::error_codes::compression_error,
                          std::string("JPEG-LS encoding failed: ") + e.what());
    }
#endif  // DCMWIRE_WITH_CHARLS
}

}  // namespace dcmwire::encoding::compression
