/**
 * @file stream_reader.cpp
 * @brief Implementation of the element-by-element stream decoder
 */

#include "dcmwire/encoding/stream_reader.hpp"

#include "dcmwire/compat/format.hpp"
#include "dcmwire/core/dicom_dataset.hpp"
#include "dcmwire/core/dicom_tag_constants.hpp"
#include "dcmwire/core/tag_dictionary.hpp"
#include "dcmwire/encoding/dataset_reader.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

#include <algorithm>
#include <array>

namespace dcmwire::encoding {

using integration::logger_adapter;

namespace {

constexpr uint32_t undefined_length = core::dicom_element::undefined_length;

/// Chunk size used when scanning for a delimiter
constexpr std::size_t scan_chunk = 4096;

core::dicom_tag read_tag(const uint8_t* data, byte_order order) noexcept {
    return core::dicom_tag{read_u16(data, order), read_u16(data + 2, order)};
}

std::array<uint8_t, 4> tag_bytes(core::dicom_tag tag, byte_order order) {
    std::vector<uint8_t> bytes;
    write_u16(bytes, tag.group(), order);
    write_u16(bytes, tag.element(), order);
    return {bytes[0], bytes[1], bytes[2], bytes[3]};
}

std::string describe(core::dicom_tag tag) {
    return core::tag_dictionary::instance().describe(tag);
}

/**
 * @brief Splits a (0008,0005) value into its defined terms.
 */
std::vector<std::string> parse_character_sets(std::span<const uint8_t> value) {
    std::vector<std::string> terms;
    std::string term;
    auto flush = [&]() {
        while (!term.empty() && (term.back() == ' ' || term.back() == '\0')) {
            term.pop_back();
        }
        auto first = term.find_first_not_of(' ');
        terms.push_back(first == std::string::npos ? std::string{} : term.substr(first));
        term.clear();
    };
    for (auto byte : value) {
        if (byte == '\\') {
            flush();
        } else {
            term.push_back(static_cast<char>(byte));
        }
    }
    flush();

    // A single empty term means the default repertoire
    if (terms.size() == 1 && terms.front().empty()) {
        terms.clear();
    }
    return terms;
}

struct item_stream {
    uint64_t length{0};
    uint32_t delimiter_length{0};
};

/**
 * @brief Skips defined-length items up to a Sequence Delimitation Item.
 *
 * Used for encapsulated Pixel Data. On success the source is left after the
 * delimiter. Returns std::nullopt, with the source position unchanged, if
 * the value is not a well-formed item stream.
 */
std::optional<item_stream> skip_item_stream(byte_source& source, byte_order order) {
    const auto start = source.tell();
    while (true) {
        auto header = source.read_bytes(8);
        if (header.size() < 8) {
            break;
        }
        const auto tag = read_tag(header.data(), order);
        const auto length = read_u32(header.data() + 4, order);
        if (tag.is_item() && length != undefined_length) {
            if (source.remaining() < length) {
                break;
            }
            source.skip(length);
            continue;
        }
        if (tag.is_sequence_delimiter()) {
            return item_stream{source.tell() - 8 - start, length};
        }
        break;
    }
    source.seek(start);
    return std::nullopt;
}

}  // namespace

stream_reader::stream_reader(byte_source& source, bool is_implicit_vr, byte_order order,
                             const read_options& options, stop_predicate stop_when,
                             std::vector<std::string> character_sets)
    : source_(source),
      implicit_(is_implicit_vr),
      order_(order),
      options_(options),
      stop_when_(std::move(stop_when)),
      character_sets_(std::move(character_sets)) {}

dcmwire::Result<std::optional<core::dicom_element>> stream_reader::next() {
    using element_result = dcmwire::Result<std::optional<core::dicom_element>>;

    if (done_) {
        return dcmwire::ok(std::optional<core::dicom_element>{});
    }

    auto header = read_header();
    if (header.is_err()) {
        done_ = true;
        return element_result::err(header.error());
    }
    if (!header.value()) {
        done_ = true;
        return dcmwire::ok(std::optional<core::dicom_element>{});
    }
    const auto& hdr = *header.value();

    if (hdr.tag.is_item_delimiter()) {
        if (hdr.length != 0) {
            core::report_warning(
                options_.on_warning,
                compat::format("Expected 0x00000000 after delimiter, found 0x{:X}, at "
                               "position 0x{:X}",
                               hdr.length, source_.tell() - 4));
        }
        item_delimiter_ = true;
        done_ = true;
        return dcmwire::ok(std::optional<core::dicom_element>{});
    }

    if (hdr.tag.is_sequence_delimiter()) {
        // Leave it for the enclosing sequence
        source_.seek(hdr.header_start);
        sequence_delimiter_ = true;
        done_ = true;
        auto policy = core::enforce_policy(
            options_.validation, options_.on_warning,
            dcmwire::error_codes::invalid_sequence,
            compat::format("Unexpected Sequence Delimitation Item at position 0x{:X} "
                           "inside a dataset",
                           hdr.header_start));
        if (policy.is_err()) {
            return element_result::err(policy.error());
        }
        return dcmwire::ok(std::optional<core::dicom_element>{});
    }

    if (stop_when_ && stop_when_(hdr.tag, hdr.vr, hdr.length)) {
        logger_adapter::trace("Reading ended by the stop predicate at {}",
                              hdr.tag.to_string());
        source_.seek(hdr.header_start);
        stopped_ = true;
        done_ = true;
        return dcmwire::ok(std::optional<core::dicom_element>{});
    }

    auto element = hdr.length == undefined_length ? read_undefined(hdr) : read_defined(hdr);
    if (element.is_err()) {
        done_ = true;
        return element;
    }
    if (element.value()) {
        if (element.value()->tag() == core::tags::specific_character_set) {
            update_character_sets(*element.value());
        }
        logger_adapter::trace("{} {} length {} at 0x{:X}", element.value()->tag().to_string(),
                              element.value()->has_vr()
                                  ? vr_code(element.value()->vr())
                                  : std::string{"--"},
                              hdr.length, element.value()->value_offset());
    }
    return element;
}

dcmwire::Result<std::optional<stream_reader::element_header>> stream_reader::read_header() {
    using header_result = dcmwire::Result<std::optional<element_header>>;

    element_header header;
    header.header_start = source_.tell();

    auto raw = source_.read_bytes(8);
    if (raw.empty()) {
        return dcmwire::ok(std::optional<element_header>{});
    }
    if (raw.size() < 8) {
        auto policy = truncation(compat::format(
            "Unexpected end of data at position 0x{:X}: {} bytes remain where an element "
            "header was expected",
            header.header_start, raw.size()));
        if (policy.is_err()) {
            return header_result::err(policy.error());
        }
        return dcmwire::ok(std::optional<element_header>{});
    }

    header.tag = read_tag(raw.data(), order_);

    // Item and delimitation tags never carry a VR
    const bool implicit_header =
        implicit_ || header.tag.group() == 0xFFFE || !is_valid_vr_code(raw[4], raw[5]);

    if (implicit_header) {
        if (!implicit_ && header.tag.group() != 0xFFFE) {
            logger_adapter::debug("Implicit VR element {} found in an explicit VR dataset",
                                  header.tag.to_string());
        }
        header.length = read_u32(raw.data() + 4, order_);
        return dcmwire::ok(std::optional<element_header>{header});
    }

    const auto vr = vr_from_bytes(raw[4], raw[5]);
    header.vr = vr;
    if (!is_known_vr(vr)) {
        auto policy = core::enforce_policy(
            options_.validation, options_.on_warning, dcmwire::error_codes::invalid_vr,
            "Unknown VR '" + vr_code(vr) + "' for " + describe(header.tag) +
                ", reading it with a 2-byte length");
        if (policy.is_err()) {
            return header_result::err(policy.error());
        }
    }

    if (is_known_vr(vr) && has_explicit_32bit_length(vr)) {
        auto extra = source_.read_bytes(4);
        if (extra.size() < 4) {
            auto policy = truncation(compat::format(
                "Unexpected end of data at position 0x{:X} while reading the length of {}",
                header.header_start, header.tag.to_string()));
            if (policy.is_err()) {
                return header_result::err(policy.error());
            }
            return dcmwire::ok(std::optional<element_header>{});
        }
        header.length = read_u32(extra.data(), order_);
        header.header_length = 12;
    } else {
        header.length = read_u16(raw.data() + 6, order_);
    }
    return dcmwire::ok(std::optional<element_header>{header});
}

dcmwire::Result<std::optional<core::dicom_element>> stream_reader::read_defined(
    const element_header& header) {
    using element_result = dcmwire::Result<std::optional<core::dicom_element>>;

    const auto value_offset = source_.tell();

    if (options_.defer_size && header.length > *options_.defer_size &&
        header.tag != core::tags::specific_character_set) {
        if (source_.remaining() < header.length) {
            auto policy = truncation(compat::format(
                "Unexpected end of data: {} needs {} bytes but only {} remain",
                describe(header.tag), header.length, source_.remaining()));
            if (policy.is_err()) {
                return element_result::err(policy.error());
            }
        }
        source_.skip(header.length);
        const auto vr = header.vr ? header.vr : resolve_vr(header.tag);
        logger_adapter::trace("Deferring {} ({} bytes)", header.tag.to_string(), header.length);
        return dcmwire::ok(std::optional<core::dicom_element>{core::dicom_element::deferred(
            header.tag, vr, header.length, value_offset, header.header_length)});
    }

    const auto vr = header.vr ? header.vr : resolve_vr(header.tag);

    if (vr == vr_type::SQ) {
        auto items = dataset_reader::read_sequence(source_, implicit_, order_, header.length,
                                                   options_, character_sets_);
        if (items.is_err()) {
            return element_result::err(items.error());
        }
        source_.seek(value_offset + header.length);
        core::dicom_element element{header.tag, vr_type::SQ};
        element.sequence_items() = std::move(items.value());
        element.set_stream_position(header.length, value_offset, header.header_length);
        return dcmwire::ok(std::optional<core::dicom_element>{std::move(element)});
    }

    auto value = source_.read_bytes(header.length);
    if (value.size() < header.length) {
        auto policy = truncation(compat::format(
            "Unexpected end of data: {} needs {} bytes but only {} remain",
            describe(header.tag), header.length, value.size()));
        if (policy.is_err()) {
            return element_result::err(policy.error());
        }
    }

    core::dicom_element element{header.tag, vr, std::move(value)};
    element.set_stream_position(header.length, value_offset, header.header_length);
    return dcmwire::ok(std::optional<core::dicom_element>{std::move(element)});
}

dcmwire::Result<std::optional<core::dicom_element>> stream_reader::read_undefined(
    const element_header& header) {
    using element_result = dcmwire::Result<std::optional<core::dicom_element>>;

    const auto value_offset = source_.tell();

    auto vr = header.vr;
    if (vr == vr_type::UN) {
        // UN with undefined length is a sequence
        vr = vr_type::SQ;
    }
    if (!vr) {
        vr = resolve_vr(header.tag);
    }
    if (!vr) {
        auto next = source_.peek(4);
        if (next.size() == 4 && read_tag(next.data(), order_).is_item()) {
            vr = vr_type::SQ;
        }
    }

    if (vr == vr_type::SQ) {
        auto items = dataset_reader::read_sequence(source_, implicit_, order_, std::nullopt,
                                                   options_, character_sets_);
        if (items.is_err()) {
            return element_result::err(items.error());
        }
        core::dicom_element element{header.tag, vr_type::SQ};
        element.sequence_items() = std::move(items.value());
        element.set_stream_position(undefined_length, value_offset, header.header_length);
        return dcmwire::ok(std::optional<core::dicom_element>{std::move(element)});
    }

    auto length = skip_undefined_value(header);
    if (length.is_err()) {
        return element_result::err(length.error());
    }
    const auto value_end = source_.tell();

    if (options_.defer_size && length.value() > *options_.defer_size) {
        return dcmwire::ok(std::optional<core::dicom_element>{core::dicom_element::deferred(
            header.tag, vr, undefined_length, value_offset, header.header_length)});
    }

    source_.seek(value_offset);
    auto value = source_.read_bytes(static_cast<std::size_t>(length.value()));
    source_.seek(value_end);

    core::dicom_element element{header.tag, vr, std::move(value)};
    element.set_stream_position(undefined_length, value_offset, header.header_length);
    return dcmwire::ok(std::optional<core::dicom_element>{std::move(element)});
}

dcmwire::Result<uint64_t> stream_reader::skip_undefined_value(const element_header& header) {
    const auto start = source_.tell();

    if (auto items = skip_item_stream(source_, order_)) {
        if (items->delimiter_length != 0) {
            core::report_warning(
                options_.on_warning,
                compat::format("Expected 4 zero bytes after undefined length delimiter at "
                               "position 0x{:X}",
                               source_.tell() - 4));
        }
        return dcmwire::ok(items->length);
    }

    // Not an item stream, the value ends at the nearest delimiter. Only the
    // last 3 bytes of a chunk are carried over, for a tag split across chunks.
    const auto sequence_delimiter = tag_bytes(core::tags::sequence_delimitation_item, order_);
    const auto item_delimiter = tag_bytes(core::tags::item_delimitation_item, order_);

    std::vector<uint8_t> window;
    uint64_t window_start = start;
    while (true) {
        auto chunk = source_.read_bytes(scan_chunk);
        if (chunk.empty()) {
            break;
        }
        window.insert(window.end(), chunk.begin(), chunk.end());

        auto seq = std::search(window.begin(), window.end(), sequence_delimiter.begin(),
                               sequence_delimiter.end());
        auto item = std::search(window.begin(), window.end(), item_delimiter.begin(),
                                item_delimiter.end());
        auto found = std::min(seq, item);
        if (found != window.end()) {
            const auto delimiter_at = window_start + static_cast<uint64_t>(found - window.begin());
            source_.seek(delimiter_at + 4);

            auto length = source_.read_bytes(4);
            if (length.size() < 4 || read_u32(length.data(), order_) != 0) {
                core::report_warning(
                    options_.on_warning,
                    compat::format("Expected 4 zero bytes after undefined length delimiter "
                                   "at position 0x{:X}",
                                   delimiter_at + 4));
            }
            return dcmwire::ok(delimiter_at - start);
        }

        const auto keep = std::min<std::size_t>(window.size(), 3);
        window_start += window.size() - keep;
        window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(keep));
    }

    auto policy = truncation("End of data reached before the delimiter of the undefined "
                             "length value of " + describe(header.tag));
    if (policy.is_err()) {
        return dcmwire::Result<uint64_t>::err(policy.error());
    }
    return dcmwire::ok(source_.tell() - start);
}

std::optional<vr_type> stream_reader::resolve_vr(core::dicom_tag tag) const {
    if (options_.resolve_vr) {
        return options_.resolve_vr(tag);
    }
    return core::dictionary_vr(tag);
}

dcmwire::VoidResult stream_reader::truncation(const std::string& message) {
    truncated_ = true;
    done_ = true;
    return core::enforce_policy(options_.validation, options_.on_warning,
                                dcmwire::error_codes::insufficient_data, message);
}

void stream_reader::update_character_sets(const core::dicom_element& element) {
    if (element.is_deferred()) {
        return;
    }
    auto terms = parse_character_sets(element.raw_data());
    character_sets_ = terms.empty() ? options_.default_character_sets : std::move(terms);
    logger_adapter::debug("Specific Character Set is now '{}'",
                          character_sets_.empty() ? std::string{} : character_sets_.front());
}

}  // namespace dcmwire::encoding
