#include "dcmwire/encoding/compression/rle_codec.hpp"

#include "dcmwire/encoding/byte_order.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

#include <algorithm>

namespace dcmwire::encoding::compression {

using integration::logger_adapter;

namespace {

/**
 * @brief Appends a literal run split into chunks of at most 128 bytes.
 */
void flush_literal(std::vector<uint8_t>& literal, std::vector<uint8_t>& out) {
    for (std::size_t start = 0; start < literal.size(); start += 128) {
        const auto count = std::min<std::size_t>(128, literal.size() - start);
        out.push_back(static_cast<uint8_t>(count - 1));
        out.insert(out.end(), literal.begin() + static_cast<std::ptrdiff_t>(start),
                   literal.begin() + static_cast<std::ptrdiff_t>(start + count));
    }
    literal.clear();
}

/**
 * @brief Rearranges planar (RRR...GGG...BBB...) data to interleaved.
 */
std::vector<uint8_t> interleave_planes(std::span<const uint8_t> planar,
                                       const image_params& params) {
    const auto pixels = params.pixels_per_frame();
    const auto bps = params.bytes_per_sample();
    const auto spp = params.samples_per_pixel;
    std::vector<uint8_t> out(planar.size());
    for (std::size_t sample = 0; sample < spp; ++sample) {
        for (std::size_t pixel = 0; pixel < pixels; ++pixel) {
            const auto* src = planar.data() + (sample * pixels + pixel) * bps;
            auto* dst = out.data() + (pixel * spp + sample) * bps;
            std::copy(src, src + bps, dst);
        }
    }
    return out;
}

std::string bits_allocated_error(uint16_t bits_allocated) {
    return "Unable to process RLE encoded pixel data with a (0028,0100) "
           "'Bits Allocated' value of " + std::to_string(bits_allocated);
}

}  // namespace

// ============================================================================
// Building Blocks
// ============================================================================

void rle_encode_row(std::span<const uint8_t> row, std::vector<uint8_t>& out) {
    std::vector<uint8_t> literal;
    literal.reserve(128);

    std::size_t pos = 0;
    while (pos < row.size()) {
        const uint8_t value = row[pos];
        std::size_t run = 1;
        while (pos + run < row.size() && row[pos + run] == value) {
            ++run;
        }
        pos += run;

        if (run == 1) {
            literal.push_back(value);
            continue;
        }

        flush_literal(literal, out);
        for (std::size_t start = 0; start < run; start += 128) {
            const auto count = std::min<std::size_t>(128, run - start);
            if (count > 1) {
                out.push_back(static_cast<uint8_t>(257 - count));
            } else {
                out.push_back(0);
            }
            out.push_back(value);
        }
    }

    flush_literal(literal, out);
}

std::vector<uint8_t> rle_encode_segment(std::span<const uint8_t> segment,
                                        std::size_t columns) {
    std::vector<uint8_t> out;
    out.reserve(segment.size() + segment.size() / 64 + 2);
    if (columns == 0) {
        return out;
    }
    for (std::size_t start = 0; start < segment.size(); start += columns) {
        const auto count = std::min(columns, segment.size() - start);
        rle_encode_row(segment.subspan(start, count), out);
    }
    if (out.size() % 2 != 0) {
        out.push_back(0);
    }
    return out;
}

std::vector<uint8_t> rle_decode_segment(std::span<const uint8_t> segment) {
    std::vector<uint8_t> out;
    out.reserve(segment.size() * 2);

    std::size_t pos = 0;
    while (pos < segment.size()) {
        const unsigned control = segment[pos++];
        if (control > 128) {
            // Replicate the next byte 257 - control times
            if (pos >= segment.size()) {
                break;
            }
            out.insert(out.end(), 257 - control, segment[pos]);
            ++pos;
        } else if (control < 128) {
            // Copy the next control + 1 bytes
            const auto count = std::min<std::size_t>(control + 1, segment.size() - pos);
            out.insert(out.end(), segment.begin() + static_cast<std::ptrdiff_t>(pos),
                       segment.begin() + static_cast<std::ptrdiff_t>(pos + count));
            pos += count;
        }
        // control == 128 is a no-op
    }

    return out;
}

dcmwire::Result<std::vector<uint32_t>> rle_parse_header(std::span<const uint8_t> header) {
    if (header.size() != rle_header_size) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::decompression_error,
            "The RLE header can only be 64 bytes long");
    }

    const auto count = read_u32(header.data(), byte_order::little_endian);
    if (count > rle_max_segments) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::decompression_error,
            "The RLE header specifies an invalid number of segments (" +
                std::to_string(count) + ")");
    }

    std::vector<uint32_t> offsets(count);
    for (uint32_t i = 0; i < count; ++i) {
        offsets[i] = read_u32(header.data() + 4 * (i + 1), byte_order::little_endian);
    }
    return dcmwire::ok(std::move(offsets));
}

dcmwire::Result<std::vector<uint8_t>> rle_encode_frame(std::span<const uint8_t> pixel_data,
                                                       const image_params& params) {
    if (params.bits_allocated % 8 != 0) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::unsupported_bit_depth,
            bits_allocated_error(params.bits_allocated));
    }

    const auto bps = params.bytes_per_sample();
    const auto nr_segments = bps * params.samples_per_pixel;
    if (nr_segments > rle_max_segments) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::rle_segment_limit,
            "Unable to encode as the DICOM Standard only allows a maximum of 15 "
            "segments in RLE encoded data, " + std::to_string(nr_segments) +
                " would be required");
    }

    const auto expected = params.frame_size_bytes();
    if (pixel_data.size() != expected) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::frame_size_mismatch,
            "The length of the data to be encoded is " +
                std::to_string(pixel_data.size()) +
                " bytes but the image parameters require " + std::to_string(expected));
    }

    std::vector<uint8_t> interleaved;
    if (params.samples_per_pixel > 1 && params.planar_configuration == 1) {
        interleaved = interleave_planes(pixel_data, params);
        pixel_data = interleaved;
    }

    const auto pixels = params.pixels_per_frame();
    std::vector<uint8_t> header;
    header.reserve(rle_header_size);
    write_u32(header, static_cast<uint32_t>(nr_segments), byte_order::little_endian);

    std::vector<uint8_t> body;
    std::vector<uint8_t> segment(pixels);
    for (std::size_t sample = 0; sample < params.samples_per_pixel; ++sample) {
        // Most significant byte first; samples are stored little endian
        for (std::size_t i = 0; i < bps; ++i) {
            const auto byte_offset = bps - 1 - i;
            const auto index = sample * bps + byte_offset;
            for (std::size_t pixel = 0; pixel < pixels; ++pixel) {
                segment[pixel] = pixel_data[pixel * nr_segments + index];
            }
            write_u32(header, static_cast<uint32_t>(rle_header_size + body.size()),
                      byte_order::little_endian);
            auto encoded = rle_encode_segment(segment, params.columns);
            body.insert(body.end(), encoded.begin(), encoded.end());
        }
    }
    header.resize(rle_header_size, 0);

    header.insert(header.end(), body.begin(), body.end());
    return dcmwire::ok(std::move(header));
}

dcmwire::Result<std::vector<uint8_t>> rle_decode_frame(std::span<const uint8_t> frame,
                                                       const image_params& params,
                                                       const core::warning_handler& on_warning) {
    if (params.bits_allocated % 8 != 0) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::unsupported_bit_depth,
            bits_allocated_error(params.bits_allocated));
    }
    if (frame.size() < rle_header_size) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::decompression_error,
            "The RLE frame is " + std::to_string(frame.size()) +
                " bytes long, too short to contain the 64 byte header");
    }

    auto header = rle_parse_header(frame.first(rle_header_size));
    if (header.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(header.error());
    }
    auto offsets = std::move(header.value());

    const auto bps = params.bytes_per_sample();
    const auto nr_segments = bps * params.samples_per_pixel;
    if (offsets.size() != nr_segments) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::decompression_error,
            "The number of RLE segments in the pixel data doesn't match the "
            "expected amount (" + std::to_string(offsets.size()) + " vs. " +
                std::to_string(nr_segments) + " segments)");
    }
    offsets.push_back(static_cast<uint32_t>(frame.size()));
    for (std::size_t i = 0; i < nr_segments; ++i) {
        if (offsets[i] < rle_header_size || offsets[i] > offsets[i + 1]) {
            return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                dcmwire::error_codes::decompression_error,
                "The RLE header contains an invalid offset (" +
                    std::to_string(offsets[i]) + ") for segment " + std::to_string(i));
        }
    }

    const auto pixels = params.pixels_per_frame();
    std::vector<uint8_t> out(pixels * nr_segments);
    for (std::size_t sample = 0; sample < params.samples_per_pixel; ++sample) {
        for (std::size_t i = 0; i < bps; ++i) {
            const auto segment_index = sample * bps + i;
            auto decoded = rle_decode_segment(frame.subspan(
                offsets[segment_index], offsets[segment_index + 1] - offsets[segment_index]));

            if (decoded.size() < pixels) {
                return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                    dcmwire::error_codes::decompression_error,
                    "The amount of decoded RLE segment data doesn't match the "
                    "expected amount (" + std::to_string(decoded.size()) + " vs. " +
                        std::to_string(pixels) + " bytes)");
            }
            if (decoded.size() > pixels) {
                core::report_warning(
                    on_warning,
                    "The decoded RLE segment contains non-conformant padding - " +
                        std::to_string(decoded.size()) + " vs. " +
                        std::to_string(pixels) + " bytes expected");
            }

            // Segment i holds the i-th most significant byte of the sample
            const auto index = sample * bps + (bps - 1 - i);
            for (std::size_t pixel = 0; pixel < pixels; ++pixel) {
                out[pixel * nr_segments + index] = decoded[pixel];
            }
        }
    }

    return dcmwire::ok(std::move(out));
}

// ============================================================================
// rle_codec
// ============================================================================

bool rle_codec::supports(const transfer_syntax& syntax) const noexcept {
    return syntax == transfer_syntax::rle_lossless;
}

bool rle_codec::can_encode(const transfer_syntax& syntax) const noexcept {
    return supports(syntax);
}

codec_result rle_codec::decode(std::span<const uint8_t> frame,
                               const image_params& params,
                               const core::warning_handler& on_warning) const {
    auto decoded = rle_decode_frame(frame, params, on_warning);
    if (decoded.is_err()) {
        return codec_result::err(decoded.error());
    }

    compression_result result;
    result.data = std::move(decoded.value());
    result.output_params = params;
    result.output_params.planar_configuration = 0;
    logger_adapter::trace("RLE decoded {} bytes into {} bytes", frame.size(),
                          result.data.size());
    return dcmwire::ok(std::move(result));
}

codec_result rle_codec::encode(std::span<const uint8_t> pixel_data,
                               const image_params& params,
                               [[maybe_unused]] const compression_options& options) const {
    auto encoded = rle_encode_frame(pixel_data, params);
    if (encoded.is_err()) {
        return codec_result::err(encoded.error());
    }

    compression_result result;
    result.data = std::move(encoded.value());
    result.output_params = params;
    result.output_params.planar_configuration = 0;
    return dcmwire::ok(std::move(result));
}

}  // namespace dcmwire::encoding::compression
