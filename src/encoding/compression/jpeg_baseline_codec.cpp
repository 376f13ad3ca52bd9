#include "dcmwire/encoding/compression/jpeg_baseline_codec.hpp"

#include <dcmwire/core/result.hpp>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <jpeglib.h>
#include <jerror.h>

namespace dcmwire::encoding::compression {

namespace {

/**
 * @brief libjpeg error manager that records the message and longjmps.
 */
struct jpeg_error_handler {
    jpeg_error_mgr pub;  // Must be first
    jmp_buf setjmp_buffer;
    std::string error_message;
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<jpeg_error_handler*>(cinfo->err);
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    err->error_message = buffer;
    std::longjmp(err->setjmp_buffer, 1);
}

void jpeg_output_message([[maybe_unused]] j_common_ptr cinfo) {}

class jpeg_compressor {
public:
    jpeg_compressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jpeg_create_compress(&cinfo_);
    }

    ~jpeg_compressor() { jpeg_destroy_compress(&cinfo_); }

    jpeg_compressor(const jpeg_compressor&) = delete;
    jpeg_compressor& operator=(const jpeg_compressor&) = delete;

    jpeg_compress_struct* operator->() { return &cinfo_; }
    jpeg_compress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_compress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

class jpeg_decompressor {
public:
    jpeg_decompressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jpeg_create_decompress(&cinfo_);
    }

    ~jpeg_decompressor() { jpeg_destroy_decompress(&cinfo_); }

    jpeg_decompressor(const jpeg_decompressor&) = delete;
    jpeg_decompressor& operator=(const jpeg_decompressor&) = delete;

    jpeg_decompress_struct* operator->() { return &cinfo_; }
    jpeg_decompress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_decompress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

codec_result make_compression_error(const std::string& message) {
    return dcmwire::dcmwire_error<compression_result>(dcmwire::error_codes::compression_error,
                                                      message);
}

codec_result make_decompression_error(const std::string& message) {
    return dcmwire::dcmwire_error<compression_result>(dcmwire::error_codes::decompression_error,
                                                      message);
}

/**
 * @brief Copy planar input into pixel interleaved order.
 */
std::vector<uint8_t> interleave(std::span<const uint8_t> planar, std::size_t pixels) {
    std::vector<uint8_t> out(planar.size());
    for (std::size_t p = 0; p < pixels; ++p) {
        for (std::size_t s = 0; s < 3; ++s) {
            out[p * 3 + s] = planar[s * pixels + p];
        }
    }
    return out;
}

}  // namespace

bool jpeg_baseline_codec::supports(const transfer_syntax& syntax) const noexcept {
    return syntax == transfer_syntax::jpeg_baseline || syntax == transfer_syntax::jpeg_extended;
}

bool jpeg_baseline_codec::can_encode(const transfer_syntax& syntax) const noexcept {
    return syntax == transfer_syntax::jpeg_baseline;
}

codec_result jpeg_baseline_codec::decode(std::span<const uint8_t> frame,
                                         const image_params& params,
                                         const core::warning_handler& /*on_warning*/) const {
    if (frame.empty()) {
        return make_decompression_error("Empty compressed data");
    }
    if (params.bits_allocated != 8) {
        return make_decompression_error("libjpeg only supports 8-bit data, the frame has " +
                                        std::to_string(params.bits_allocated) +
                                        " bits allocated");
    }

    jpeg_decompressor decompressor;
    std::vector<uint8_t> output;

    if (setjmp(decompressor.error().setjmp_buffer)) {
        return make_decompression_error("JPEG decompression failed: " +
                                        decompressor.error().error_message);
    }

    // Some libjpeg builds declare the buffer non-const; it is only read
    jpeg_mem_src(&decompressor.get(), const_cast<unsigned char*>(frame.data()),
                 static_cast<unsigned long>(frame.size()));

    if (jpeg_read_header(&decompressor.get(), TRUE) != JPEG_HEADER_OK) {
        return make_decompression_error("Invalid JPEG header");
    }

    if (decompressor->image_width != params.columns ||
        decompressor->image_height != params.rows) {
        return make_decompression_error(
            "Image size mismatch: expected " + std::to_string(params.columns) + "x" +
            std::to_string(params.rows) + ", got " + std::to_string(decompressor->image_width) +
            "x" + std::to_string(decompressor->image_height));
    }
    if (decompressor->num_components != static_cast<int>(params.samples_per_pixel)) {
        return make_decompression_error(
            "Samples per pixel mismatch: expected " + std::to_string(params.samples_per_pixel) +
            ", got " + std::to_string(decompressor->num_components));
    }

    if (decompressor->num_components == 3) {
        decompressor->out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&decompressor.get());

    const JDIMENSION row_stride =
        decompressor->output_width * static_cast<JDIMENSION>(decompressor->output_components);
    output.resize(static_cast<std::size_t>(row_stride) * decompressor->output_height);

    while (decompressor->output_scanline < decompressor->output_height) {
        JSAMPROW row = output.data() +
                       static_cast<std::size_t>(decompressor->output_scanline) * row_stride;
        jpeg_read_scanlines(&decompressor.get(), &row, 1);
    }

    jpeg_finish_decompress(&decompressor.get());

    image_params output_params = params;
    output_params.planar_configuration = 0;
    if (output_params.samples_per_pixel == 3) {
        output_params.photometric = photometric_interpretation::rgb;
    }

    return dcmwire::ok(compression_result{std::move(output), output_params});
}

codec_result jpeg_baseline_codec::encode(std::span<const uint8_t> pixel_data,
                                         const image_params& params,
                                         const compression_options& options) const {
    if (params.bits_allocated != 8 || params.bits_stored > 8) {
        return make_compression_error("JPEG Baseline requires 8-bit samples");
    }
    if (params.is_signed()) {
        return make_compression_error("JPEG Baseline requires unsigned samples");
    }

    const std::size_t expected_size = params.frame_size_bytes();
    if (pixel_data.size() != expected_size) {
        return make_compression_error("Pixel data size mismatch: expected " +
                                      std::to_string(expected_size) + ", got " +
                                      std::to_string(pixel_data.size()));
    }

    std::vector<uint8_t> interleaved;
    if (params.samples_per_pixel == 3 && params.planar_configuration == 1) {
        interleaved = interleave(pixel_data, params.pixels_per_frame());
        pixel_data = interleaved;
    }

    const JDIMENSION row_stride = static_cast<JDIMENSION>(params.columns) * params.samples_per_pixel;
    std::vector<JSAMPROW> row_pointers(params.rows);
    for (JDIMENSION row = 0; row < params.rows; ++row) {
        row_pointers[row] = const_cast<JSAMPROW>(pixel_data.data() + row * row_stride);
    }

    jpeg_compressor compressor;
    uint8_t* out_buffer = nullptr;
    unsigned long out_size = 0;

    if (setjmp(compressor.error().setjmp_buffer)) {
        std::free(out_buffer);
        return make_compression_error("JPEG compression failed: " +
                                      compressor.error().error_message);
    }

    jpeg_mem_dest(&compressor.get(), &out_buffer, &out_size);

    compressor->image_width = params.columns;
    compressor->image_height = params.rows;
    compressor->input_components = static_cast<int>(params.samples_per_pixel);
    compressor->in_color_space = params.samples_per_pixel == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_set_defaults(&compressor.get());
    jpeg_set_quality(&compressor.get(), std::clamp(options.quality, 1, 100), TRUE);

    jpeg_start_compress(&compressor.get(), TRUE);
    jpeg_write_scanlines(&compressor.get(), row_pointers.data(),
                         static_cast<JDIMENSION>(params.rows));
    jpeg_finish_compress(&compressor.get());

    std::vector<uint8_t> result(out_buffer, out_buffer + out_size);
    std::free(out_buffer);

    image_params output_params = params;
    output_params.planar_configuration = 0;
    if (params.samples_per_pixel == 3) {
        output_params.photometric = photometric_interpretation::ycbcr_full_422;
    }
    return dcmwire::ok(compression_result{std::move(result), output_params});
}

}  // namespace dcmwire::encoding::compression
