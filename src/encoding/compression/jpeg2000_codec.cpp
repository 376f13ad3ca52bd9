#include "dcmwire/encoding/compression/jpeg2000_codec.hpp"
#include <dcmwire/core/result.hpp>

#include <algorithm>
#include <cstring>
#include <memory>

#ifdef DCMWIRE_WITH_OPENJPEG
#include <openjpeg.h>
#endif

namespace dcmwire::encoding::compression {

namespace {

#ifdef DCMWIRE_WITH_OPENJPEG

codec_result make_decompression_error(const std::string& message) {
    return dcmwire::dcmwire_error<compression_result>(dcmwire::error_codes::decompression_error,
                                                      message);
}

void opj_error_callback(const char* msg, void* client_data) {
    auto* error_msg = static_cast<std::string*>(client_data);
    if (error_msg == nullptr || msg == nullptr) {
        return;
    }
    if (!error_msg->empty()) {
        error_msg->append("; ");
    }
    error_msg->append(msg);
    while (!error_msg->empty() && error_msg->back() == '\n') {
        error_msg->pop_back();
    }
}

void opj_warning_callback(const char* msg, void* client_data) {
    const auto* handler = static_cast<const core::warning_handler*>(client_data);
    if (handler != nullptr && *handler && msg != nullptr) {
        std::string message{msg};
        while (!message.empty() && message.back() == '\n') {
            message.pop_back();
        }
        (*handler)("OpenJPEG: " + message);
    }
}

void opj_info_callback([[maybe_unused]] const char* msg, [[maybe_unused]] void* client_data) {}

struct opj_memory_stream {
    const uint8_t* data;
    std::size_t size;
    std::size_t offset;
};

OPJ_SIZE_T opj_memory_stream_read(void* buffer, OPJ_SIZE_T nb_bytes, void* user_data) {
    auto* stream = static_cast<opj_memory_stream*>(user_data);
    if (stream->offset >= stream->size) {
        return static_cast<OPJ_SIZE_T>(-1);
    }
    const OPJ_SIZE_T count =
        (std::min)(nb_bytes, static_cast<OPJ_SIZE_T>(stream->size - stream->offset));
    std::memcpy(buffer, stream->data + stream->offset, count);
    stream->offset += count;
    return count;
}

OPJ_OFF_T opj_memory_stream_skip(OPJ_OFF_T nb_bytes, void* user_data) {
    auto* stream = static_cast<opj_memory_stream*>(user_data);
    if (nb_bytes < 0) {
        nb_bytes = -static_cast<OPJ_OFF_T>(
            (std::min)(stream->offset, static_cast<std::size_t>(-nb_bytes)));
    } else if (stream->offset + static_cast<std::size_t>(nb_bytes) > stream->size) {
        nb_bytes = static_cast<OPJ_OFF_T>(stream->size - stream->offset);
    }
    stream->offset = static_cast<std::size_t>(static_cast<OPJ_OFF_T>(stream->offset) + nb_bytes);
    return nb_bytes;
}

OPJ_BOOL opj_memory_stream_seek(OPJ_OFF_T nb_bytes, void* user_data) {
    auto* stream = static_cast<opj_memory_stream*>(user_data);
    if (nb_bytes < 0 || static_cast<std::size_t>(nb_bytes) > stream->size) {
        return OPJ_FALSE;
    }
    stream->offset = static_cast<std::size_t>(nb_bytes);
    return OPJ_TRUE;
}

/// JP2 signature box: 00 00 00 0C 6A 50 20 20 0D 0A 87 0A
OPJ_CODEC_FORMAT detect_j2k_format(std::span<const uint8_t> data) {
    static constexpr uint8_t jp2_signature[] = {0x00, 0x00, 0x00, 0x0C, 0x6A, 0x50,
                                                0x20, 0x20, 0x0D, 0x0A, 0x87, 0x0A};
    if (data.size() >= sizeof(jp2_signature) &&
        std::memcmp(data.data(), jp2_signature, sizeof(jp2_signature)) == 0) {
        return OPJ_CODEC_JP2;
    }
    return OPJ_CODEC_J2K;
}

struct codec_deleter {
    void operator()(opj_codec_t* codec) const { opj_destroy_codec(codec); }
};

struct stream_deleter {
    void operator()(opj_stream_t* stream) const { opj_stream_destroy(stream); }
};

struct image_deleter {
    void operator()(opj_image_t* image) const { opj_image_destroy(image); }
};

#endif  // DCMWIRE_WITH_OPENJPEG

}  // namespace

bool jpeg2000_codec::supports(const transfer_syntax& syntax) const noexcept {
    return syntax == transfer_syntax::jpeg2000_lossless || syntax == transfer_syntax::jpeg2000_lossy;
}

std::vector<std::string> jpeg2000_codec::missing_dependencies() const {
#ifdef DCMWIRE_WITH_OPENJPEG
    return {};
#else
    return {"OpenJPEG"};
#endif
}

codec_result jpeg2000_codec::decode(std::span<const uint8_t> frame,
                                    const image_params& params,
                                    const core::warning_handler& on_warning) const {
#ifndef DCMWIRE_WITH_OPENJPEG
    (void)frame;
    (void)params;
    (void)on_warning;
    return dcmwire::dcmwire_error<compression_result>(
        dcmwire::error_codes::plugin_unavailable,
        "JPEG 2000 codec not available: OpenJPEG library not found at build time");
#else
    if (frame.empty()) {
        return make_decompression_error("Empty compressed data");
    }

    std::unique_ptr<opj_codec_t, codec_deleter> codec{
        opj_create_decompress(detect_j2k_format(frame))};
    if (!codec) {
        return make_decompression_error("Failed to create OpenJPEG decoder");
    }

    std::string error_msg;
    opj_set_error_handler(codec.get(), opj_error_callback, &error_msg);
    opj_set_warning_handler(codec.get(), opj_warning_callback,
                            const_cast<core::warning_handler*>(&on_warning));
    opj_set_info_handler(codec.get(), opj_info_callback, nullptr);

    opj_dparameters_t parameters;
    opj_set_default_decoder_parameters(&parameters);
    if (!opj_setup_decoder(codec.get(), &parameters)) {
        return make_decompression_error("Failed to setup OpenJPEG decoder: " + error_msg);
    }

    opj_memory_stream input{frame.data(), frame.size(), 0};
    std::unique_ptr<opj_stream_t, stream_deleter> stream{opj_stream_default_create(OPJ_TRUE)};
    if (!stream) {
        return make_decompression_error("Failed to create OpenJPEG input stream");
    }
    opj_stream_set_user_data(stream.get(), &input, nullptr);
    opj_stream_set_user_data_length(stream.get(), frame.size());
    opj_stream_set_read_function(stream.get(), opj_memory_stream_read);
    opj_stream_set_skip_function(stream.get(), opj_memory_stream_skip);
    opj_stream_set_seek_function(stream.get(), opj_memory_stream_seek);

    opj_image_t* raw_image = nullptr;
    if (!opj_read_header(stream.get(), codec.get(), &raw_image)) {
        return make_decompression_error("Failed to read JPEG 2000 header: " + error_msg);
    }
    std::unique_ptr<opj_image_t, image_deleter> image{raw_image};

    if (!opj_decode(codec.get(), stream.get(), image.get()) ||
        !opj_end_decompress(codec.get(), stream.get())) {
        return make_decompression_error("Failed to decode JPEG 2000 data: " + error_msg);
    }

    const auto width = image->x1 - image->x0;
    const auto height = image->y1 - image->y0;
    if (width != params.columns || height != params.rows) {
        return make_decompression_error(
            "Image size mismatch: expected " + std::to_string(params.columns) + "x" +
            std::to_string(params.rows) + ", got " + std::to_string(width) + "x" +
            std::to_string(height));
    }
    if (image->numcomps != params.samples_per_pixel) {
        return make_decompression_error(
            "Samples per pixel mismatch: expected " + std::to_string(params.samples_per_pixel) +
            ", got " + std::to_string(image->numcomps));
    }

    image_params output_params = params;
    output_params.planar_configuration = 0;
    if (image->numcomps > 0 && image->comps[0].prec > output_params.bits_stored) {
        output_params.bits_stored = static_cast<uint16_t>(
            (std::min)(image->comps[0].prec, static_cast<OPJ_UINT32>(params.bits_allocated)));
    }

    const std::size_t pixel_count = params.pixels_per_frame();
    const std::size_t bytes_per_sample = params.bytes_per_sample();
    std::vector<uint8_t> output(params.frame_size_bytes());

    for (OPJ_UINT32 c = 0; c < image->numcomps; ++c) {
        const OPJ_INT32* comp_data = image->comps[c].data;
        for (std::size_t i = 0; i < pixel_count; ++i) {
            const std::size_t dst = (i * params.samples_per_pixel + c) * bytes_per_sample;
            const auto value = static_cast<uint32_t>(comp_data[i]);
            for (std::size_t b = 0; b < bytes_per_sample; ++b) {
                output[dst + b] = static_cast<uint8_t>((value >> (8 * b)) & 0xFF);
            }
        }
    }

    return dcmwire::ok(compression_result{std::move(output), output_params});
#endif  // DCMWIRE_WITH_OPENJPEG
}

}  // namespace dcmwire::encoding::compression
