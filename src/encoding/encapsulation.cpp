/**
 * @file encapsulation.cpp
 * @brief Implementation of encapsulated Pixel Data framing
 */

#include "dcmwire/encoding/encapsulation.hpp"

#include "dcmwire/compat/format.hpp"
#include "dcmwire/core/dicom_tag.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace dcmwire::encoding {

using integration::logger_adapter;

namespace {

constexpr uint32_t item_tag = 0xFFFEE000;
constexpr uint32_t sequence_delimiter_tag = 0xFFFEE0DD;
constexpr uint32_t undefined_length = 0xFFFFFFFF;
constexpr uint64_t max_bot_offset = std::numeric_limits<uint32_t>::max();

/// Number of trailing bytes searched for the end-of-image marker
constexpr std::size_t eoi_search_window = 10;

uint32_t read_tag(const uint8_t* data, byte_order order) noexcept {
    return (static_cast<uint32_t>(read_u16(data, order)) << 16) | read_u16(data + 2, order);
}

std::string tag_string(uint32_t tag) {
    return core::dicom_tag{tag}.to_string();
}

/**
 * @brief Restores the source position when leaving scope.
 */
class position_guard {
public:
    explicit position_guard(byte_source& source)
        : source_(source), position_(source.tell()) {}
    ~position_guard() { source_.seek(position_); }

    position_guard(const position_guard&) = delete;
    position_guard& operator=(const position_guard&) = delete;

    [[nodiscard]] uint64_t position() const noexcept { return position_; }

private:
    byte_source& source_;
    uint64_t position_;
};

bool has_end_of_image_marker(const std::vector<uint8_t>& fragment) {
    const auto window = std::min(fragment.size(), eoi_search_window);
    const auto begin = fragment.end() - static_cast<std::ptrdiff_t>(window);
    for (auto it = begin; it != fragment.end() && std::next(it) != fragment.end(); ++it) {
        if (*it == 0xFF && *std::next(it) == 0xD9) {
            return true;
        }
    }
    return false;
}

std::vector<uint64_t> decode_u64_array(std::span<const uint8_t> bytes, byte_order order) {
    std::vector<uint64_t> values(bytes.size() / 8);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = read_u64(bytes.data() + i * 8, order);
    }
    return values;
}

std::vector<uint8_t> encode_u64_array(const std::vector<uint64_t>& values, byte_order order) {
    std::vector<uint8_t> bytes;
    bytes.reserve(values.size() * 8);
    for (auto value : values) {
        write_u64(bytes, value, order);
    }
    return bytes;
}

std::string boundaries_indeterminate_message() {
    return "Unable to determine the frame boundaries for the encapsulated pixel "
           "data as there is no Basic or Extended Offset Table and the number of "
           "frames has not been supplied";
}

}  // namespace

// ============================================================================
// extended_offset_table
// ============================================================================

dcmwire::Result<extended_offset_table> extended_offset_table::from_bytes(
    std::span<const uint8_t> offsets, std::span<const uint8_t> lengths, byte_order order) {
    if (offsets.size() % 8 != 0 || lengths.size() % 8 != 0) {
        return dcmwire::dcmwire_error<extended_offset_table>(
            dcmwire::error_codes::invalid_offset_table,
            "The Extended Offset Table values must be a multiple of 8 bytes long");
    }
    if (offsets.size() != lengths.size()) {
        return dcmwire::dcmwire_error<extended_offset_table>(
            dcmwire::error_codes::invalid_offset_table,
            "The Extended Offset Table has " + std::to_string(offsets.size() / 8) +
                " offsets but " + std::to_string(lengths.size() / 8) + " lengths");
    }

    extended_offset_table table;
    table.offsets = decode_u64_array(offsets, order);
    table.lengths = decode_u64_array(lengths, order);
    return dcmwire::ok(std::move(table));
}

std::vector<uint8_t> extended_offset_table::offsets_bytes(byte_order order) const {
    return encode_u64_array(offsets, order);
}

std::vector<uint8_t> extended_offset_table::lengths_bytes(byte_order order) const {
    return encode_u64_array(lengths, order);
}

// ============================================================================
// Offset table and fragment parsing
// ============================================================================

dcmwire::Result<std::vector<uint32_t>> parse_basic_offsets(byte_source& source,
                                                           byte_order order) {
    const auto start = source.tell();
    auto header = source.read_exact(8);
    if (header.is_err()) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::invalid_offset_table,
            "Unable to read the Basic Offset Table item at offset " + std::to_string(start),
            header.error().message);
    }

    const auto& bytes = header.value();
    const auto tag = read_tag(bytes.data(), order);
    if (tag != item_tag) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::invalid_offset_table,
            "Found unexpected tag " + tag_string(tag) +
                " instead of (FFFE,E000) when parsing the Basic Offset Table item");
    }

    const auto length = read_u32(bytes.data() + 4, order);
    if (length % 4 != 0) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::invalid_offset_table,
            "The length of the Basic Offset Table item is not a multiple of 4");
    }

    auto table = source.read_exact(length);
    if (table.is_err()) {
        return dcmwire::dcmwire_error<std::vector<uint32_t>>(
            dcmwire::error_codes::invalid_offset_table,
            "The Basic Offset Table item is truncated", table.error().message);
    }

    std::vector<uint32_t> offsets(length / 4);
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        offsets[i] = read_u32(table.value().data() + i * 4, order);
    }
    return dcmwire::ok(std::move(offsets));
}

dcmwire::Result<fragment_scan> parse_fragments(byte_source& source, byte_order order,
                                               const core::warning_handler& on_warning) {
    position_guard guard{source};
    fragment_scan scan;

    while (true) {
        const auto position = source.tell();
        auto raw_tag = source.read_bytes(4);
        if (raw_tag.size() < 4) {
            break;
        }

        const auto tag = read_tag(raw_tag.data(), order);
        if (tag == item_tag) {
            auto raw_length = source.read_bytes(4);
            if (raw_length.size() < 4) {
                return dcmwire::dcmwire_error<fragment_scan>(
                    dcmwire::error_codes::invalid_fragment,
                    "Unable to determine the length of the item at offset " +
                        std::to_string(position) +
                        " as the end of the data has been reached - the "
                        "encapsulated pixel data may be invalid");
            }
            const auto length = read_u32(raw_length.data(), order);
            if (length == undefined_length) {
                return dcmwire::dcmwire_error<fragment_scan>(
                    dcmwire::error_codes::invalid_fragment,
                    "Undefined item length at offset " + std::to_string(position + 4) +
                        " when parsing the encapsulated pixel data fragments");
            }
            scan.offsets.push_back(position);
            ++scan.count;
            source.skip(static_cast<int64_t>(length));
        } else if (tag == sequence_delimiter_tag) {
            auto raw_length = source.read_bytes(4);
            if (raw_length.size() == 4) {
                const auto length = read_u32(raw_length.data(), order);
                if (length != 0) {
                    core::report_warning(
                        on_warning,
                        compat::format("Expected 0x00000000 after the (FFFE,E0DD) "
                                       "Sequence Delimiter Item, found 0x{:08X}",
                                       length));
                }
            }
            break;
        } else {
            return dcmwire::dcmwire_error<fragment_scan>(
                dcmwire::error_codes::invalid_fragment,
                "Unexpected tag '" + tag_string(tag) + "' at offset " +
                    std::to_string(position) +
                    " when parsing the encapsulated pixel data fragment items");
        }
    }

    return dcmwire::ok(std::move(scan));
}

// ============================================================================
// fragment_reader
// ============================================================================

fragment_reader::fragment_reader(byte_source& source, byte_order order,
                                 core::warning_handler on_warning)
    : source_(&source), order_(order), on_warning_(std::move(on_warning)) {}

dcmwire::Result<std::optional<std::vector<uint8_t>>> fragment_reader::next() {
    if (done_) {
        return dcmwire::ok(std::optional<std::vector<uint8_t>>{});
    }

    const auto position = source_->tell();
    auto raw_tag = source_->read_bytes(4);
    if (raw_tag.size() < 4) {
        done_ = true;
        return dcmwire::ok(std::optional<std::vector<uint8_t>>{});
    }

    const auto tag = read_tag(raw_tag.data(), order_);
    if (tag == sequence_delimiter_tag) {
        done_ = true;
        auto raw_length = source_->read_bytes(4);
        if (raw_length.size() == 4 && read_u32(raw_length.data(), order_) != 0) {
            core::report_warning(
                on_warning_,
                compat::format("Expected 0x00000000 after the (FFFE,E0DD) Sequence "
                               "Delimiter Item, found 0x{:08X}",
                               read_u32(raw_length.data(), order_)));
        }
        return dcmwire::ok(std::optional<std::vector<uint8_t>>{});
    }

    if (tag != item_tag) {
        done_ = true;
        return dcmwire::dcmwire_error<std::optional<std::vector<uint8_t>>>(
            dcmwire::error_codes::invalid_fragment,
            "Unexpected tag '" + tag_string(tag) + "' at offset " +
                std::to_string(position) +
                " when parsing the encapsulated pixel data fragment items");
    }

    auto raw_length = source_->read_bytes(4);
    if (raw_length.size() < 4) {
        done_ = true;
        return dcmwire::dcmwire_error<std::optional<std::vector<uint8_t>>>(
            dcmwire::error_codes::invalid_fragment,
            "Unable to determine the length of the item at offset " +
                std::to_string(position) +
                " as the end of the data has been reached - the encapsulated "
                "pixel data may be invalid");
    }

    const auto length = read_u32(raw_length.data(), order_);
    if (length == undefined_length) {
        done_ = true;
        return dcmwire::dcmwire_error<std::optional<std::vector<uint8_t>>>(
            dcmwire::error_codes::invalid_fragment,
            "Undefined item length at offset " + std::to_string(position + 4) +
                " when parsing the encapsulated pixel data fragments");
    }

    return dcmwire::ok(std::optional<std::vector<uint8_t>>{source_->read_bytes(length)});
}

// ============================================================================
// frame_iterator
// ============================================================================

dcmwire::Result<frame_iterator> frame_iterator::create(byte_source& source,
                                                       frame_options options) {
    auto basic = parse_basic_offsets(source, options.endianness);
    if (basic.is_err()) {
        return dcmwire::Result<frame_iterator>::err(basic.error());
    }
    auto basic_offsets = std::move(basic.value());
    const auto fragments_start = source.tell();

    if (options.extended_offsets) {
        if (options.extended_offsets->offsets.size() !=
            options.extended_offsets->lengths.size()) {
            return dcmwire::dcmwire_error<frame_iterator>(
                dcmwire::error_codes::invalid_offset_table,
                "The Extended Offset Table has a different number of offsets and lengths");
        }
        logger_adapter::trace("Framing {} frames using the Extended Offset Table",
                              options.extended_offsets->offsets.size());
        return dcmwire::ok(frame_iterator{source, std::move(options), strategy::extended_table,
                                          std::move(basic_offsets), fragments_start});
    }

    if (!basic_offsets.empty()) {
        if (!std::is_sorted(basic_offsets.begin(), basic_offsets.end())) {
            return dcmwire::dcmwire_error<frame_iterator>(
                dcmwire::error_codes::invalid_offset_table,
                "The Basic Offset Table offsets are not in ascending order");
        }
        logger_adapter::trace("Framing {} frames using the Basic Offset Table",
                              basic_offsets.size());
        return dcmwire::ok(frame_iterator{source, std::move(options), strategy::basic_table,
                                          std::move(basic_offsets), fragments_start});
    }

    if (!options.number_of_frames) {
        return dcmwire::dcmwire_error<frame_iterator>(
            dcmwire::error_codes::frame_boundaries_indeterminate,
            boundaries_indeterminate_message());
    }

    const auto frames = *options.number_of_frames;
    if (frames == 1) {
        return dcmwire::ok(frame_iterator{source, std::move(options), strategy::single_frame,
                                          {}, fragments_start});
    }

    auto scan = parse_fragments(source, options.endianness, options.on_warning);
    if (scan.is_err()) {
        return dcmwire::Result<frame_iterator>::err(scan.error());
    }
    const auto fragments = scan.value().count;

    if (fragments == frames) {
        return dcmwire::ok(frame_iterator{source, std::move(options),
                                          strategy::one_per_fragment, {}, fragments_start});
    }
    if (fragments > frames) {
        logger_adapter::debug(
            "Searching for end-of-image markers to split {} fragments into {} frames",
            fragments, frames);
        return dcmwire::ok(frame_iterator{source, std::move(options),
                                          strategy::end_of_image_marker, {}, fragments_start});
    }

    return dcmwire::dcmwire_error<frame_iterator>(
        dcmwire::error_codes::insufficient_fragments,
        "Unable to generate frames from the encapsulated pixel data as there are "
        "fewer fragments than frames; the dataset may be corrupt or the number "
        "of frames may be incorrect");
}

frame_iterator::frame_iterator(byte_source& source, frame_options options, strategy mode,
                               std::vector<uint32_t> basic_offsets, uint64_t fragments_start)
    : source_(&source),
      options_(std::move(options)),
      mode_(mode),
      basic_offsets_(std::move(basic_offsets)),
      fragments_start_(fragments_start),
      reader_(source, options_.endianness, options_.on_warning) {}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_fragments() {
    if (finished_) {
        return dcmwire::ok(std::optional<fragment_list>{});
    }

    dcmwire::Result<std::optional<fragment_list>> result =
        dcmwire::ok(std::optional<fragment_list>{});
    switch (mode_) {
        case strategy::extended_table:
            result = next_extended();
            break;
        case strategy::basic_table:
            result = next_basic();
            break;
        case strategy::single_frame:
            result = next_single();
            break;
        case strategy::one_per_fragment:
            result = next_one_per_fragment();
            break;
        case strategy::end_of_image_marker:
            result = next_by_marker();
            break;
    }

    if (result.is_err()) {
        finished_ = true;
    } else if (result.value()) {
        ++frames_read_;
    } else {
        finished_ = true;
    }
    return result;
}

dcmwire::Result<std::optional<std::vector<uint8_t>>> frame_iterator::next() {
    auto fragments = next_fragments();
    if (fragments.is_err()) {
        return dcmwire::Result<std::optional<std::vector<uint8_t>>>::err(fragments.error());
    }
    if (!fragments.value()) {
        return dcmwire::ok(std::optional<std::vector<uint8_t>>{});
    }
    return dcmwire::ok(std::optional<std::vector<uint8_t>>{join_fragments(*fragments.value())});
}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_extended() {
    const auto& table = *options_.extended_offsets;
    if (frames_read_ >= table.offsets.size()) {
        return dcmwire::ok(std::optional<fragment_list>{});
    }

    // Skip the item tag and length, the table gives the length
    source_->seek(fragments_start_ + table.offsets[frames_read_] + 8);
    auto frame = source_->read_exact(static_cast<std::size_t>(table.lengths[frames_read_]));
    if (frame.is_err()) {
        return dcmwire::dcmwire_error<std::optional<fragment_list>>(
            dcmwire::error_codes::insufficient_data,
            "There is insufficient pixel data for frame " + std::to_string(frames_read_) +
                " of the Extended Offset Table",
            frame.error().message);
    }

    fragment_list fragments;
    fragments.push_back(std::move(frame.value()));
    return dcmwire::ok(std::optional<fragment_list>{std::move(fragments)});
}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_basic() {
    const auto final_index = basic_offsets_.size() - 1;
    fragment_list frame;
    if (pending_) {
        frame.push_back(std::move(*pending_));
        pending_.reset();
    }

    while (true) {
        auto fragment = reader_.next();
        if (fragment.is_err()) {
            return dcmwire::Result<std::optional<fragment_list>>::err(fragment.error());
        }
        if (!fragment.value()) {
            if (frame.empty()) {
                return dcmwire::ok(std::optional<fragment_list>{});
            }
            finished_ = true;
            return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
        }

        auto data = std::move(*fragment.value());
        const auto item_length = data.size() + 8;

        // The final frame takes every remaining fragment
        if (frames_read_ == final_index || current_offset_ < basic_offsets_[frames_read_ + 1]) {
            frame.push_back(std::move(data));
            current_offset_ += item_length;
            continue;
        }

        // Passed the start of the next frame
        current_offset_ += item_length;
        pending_ = std::move(data);
        return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
    }
}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_single() {
    fragment_list frame;
    while (true) {
        auto fragment = reader_.next();
        if (fragment.is_err()) {
            return dcmwire::Result<std::optional<fragment_list>>::err(fragment.error());
        }
        if (!fragment.value()) {
            break;
        }
        frame.push_back(std::move(*fragment.value()));
    }
    finished_ = true;
    return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_one_per_fragment() {
    auto fragment = reader_.next();
    if (fragment.is_err()) {
        return dcmwire::Result<std::optional<fragment_list>>::err(fragment.error());
    }
    if (!fragment.value()) {
        return dcmwire::ok(std::optional<fragment_list>{});
    }
    fragment_list frame;
    frame.push_back(std::move(*fragment.value()));
    return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
}

dcmwire::Result<std::optional<fragment_list>> frame_iterator::next_by_marker() {
    const auto expected = *options_.number_of_frames;
    fragment_list frame;

    while (true) {
        auto fragment = reader_.next();
        if (fragment.is_err()) {
            return dcmwire::Result<std::optional<fragment_list>>::err(fragment.error());
        }
        if (!fragment.value()) {
            break;
        }
        const bool complete = has_end_of_image_marker(*fragment.value());
        frame.push_back(std::move(*fragment.value()));
        if (complete) {
            return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
        }
    }

    // End of the fragments
    finished_ = true;
    const auto found = frames_read_ + (frame.empty() ? 0 : 1);
    if (!frame.empty()) {
        core::report_warning(options_.on_warning,
                             "The end of the encapsulated pixel data has been reached but "
                             "no JPEG EOI/EOC marker was found, the final frame may be "
                             "invalid");
    }
    if (found < expected) {
        core::report_warning(options_.on_warning,
                             "The end of the encapsulated pixel data has been reached but "
                             "fewer frames than expected have been found (" +
                                 std::to_string(found) + " vs. " +
                                 std::to_string(expected) +
                                 "), please confirm that the generated frame data is correct");
    }
    if (frame.empty()) {
        return dcmwire::ok(std::optional<fragment_list>{});
    }
    return dcmwire::ok(std::optional<fragment_list>{std::move(frame)});
}

std::vector<uint8_t> join_fragments(const fragment_list& fragments) {
    const auto total = std::accumulate(
        fragments.begin(), fragments.end(), std::size_t{0},
        [](std::size_t sum, const auto& fragment) { return sum + fragment.size(); });
    std::vector<uint8_t> frame;
    frame.reserve(total);
    for (const auto& fragment : fragments) {
        frame.insert(frame.end(), fragment.begin(), fragment.end());
    }
    return frame;
}

// ============================================================================
// Random access
// ============================================================================

namespace {

dcmwire::Result<std::vector<uint8_t>> read_all_fragments(byte_source& source,
                                                         const frame_options& options) {
    fragment_reader reader{source, options.endianness, options.on_warning};
    fragment_list fragments;
    while (true) {
        auto fragment = reader.next();
        if (fragment.is_err()) {
            return dcmwire::Result<std::vector<uint8_t>>::err(fragment.error());
        }
        if (!fragment.value()) {
            break;
        }
        fragments.push_back(std::move(*fragment.value()));
    }
    return dcmwire::ok(join_fragments(fragments));
}

dcmwire::Result<std::vector<uint8_t>> index_error(const std::string& message) {
    return dcmwire::dcmwire_error<std::vector<uint8_t>>(
        dcmwire::error_codes::frame_index_out_of_range, message);
}

}  // namespace

dcmwire::Result<std::vector<uint8_t>> get_frame(byte_source& source, std::size_t index,
                                                const frame_options& options) {
    position_guard guard{source};

    auto basic = parse_basic_offsets(source, options.endianness);
    if (basic.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(basic.error());
    }
    const auto& basic_offsets = basic.value();
    const auto fragments_start = source.tell();

    if (options.extended_offsets) {
        const auto& table = *options.extended_offsets;
        if (index >= table.offsets.size() || index >= table.lengths.size()) {
            return index_error("There aren't enough offsets in the Extended Offset Table for " +
                               std::to_string(index + 1) + " frames");
        }
        source.seek(fragments_start + table.offsets[index] + 8);
        auto frame = source.read_exact(static_cast<std::size_t>(table.lengths[index]));
        if (frame.is_err()) {
            return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                dcmwire::error_codes::insufficient_data,
                "There is insufficient pixel data for frame " + std::to_string(index) +
                    " of the Extended Offset Table",
                frame.error().message);
        }
        return frame;
    }

    if (!basic_offsets.empty()) {
        if (index >= basic_offsets.size()) {
            return index_error("There aren't enough offsets in the Basic Offset Table for " +
                               std::to_string(index + 1) + " frames");
        }
        const uint64_t frame_start = fragments_start + basic_offsets[index];
        if (frame_start >= source.size()) {
            return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                dcmwire::error_codes::insufficient_data,
                "The Basic Offset Table offset " + std::to_string(basic_offsets[index]) +
                    " for frame " + std::to_string(index) +
                    " is past the end of the encapsulated pixel data");
        }
        source.seek(frame_start);
        if (index + 1 < basic_offsets.size()) {
            if (basic_offsets[index + 1] < basic_offsets[index]) {
                return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                    dcmwire::error_codes::invalid_offset_table,
                    "The Basic Offset Table offsets are not in ascending order");
            }
            // Only the items of this frame
            auto items = source.read_exact(basic_offsets[index + 1] - basic_offsets[index]);
            if (items.is_err()) {
                return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                    dcmwire::error_codes::insufficient_data,
                    "There is insufficient pixel data for frame " + std::to_string(index) +
                        " of the Basic Offset Table",
                    items.error().message);
            }
            memory_source frame_items{std::move(items.value())};
            return read_all_fragments(frame_items, options);
        }
        return read_all_fragments(source, options);
    }

    if (!options.number_of_frames) {
        return dcmwire::dcmwire_error<std::vector<uint8_t>>(
            dcmwire::error_codes::frame_boundaries_indeterminate,
            boundaries_indeterminate_message());
    }

    const auto frames = *options.number_of_frames;
    if (frames == 1) {
        if (index != 0) {
            return index_error("The 'index' must be 0 if the number of frames is 1");
        }
        return read_all_fragments(source, options);
    }

    auto scan = parse_fragments(source, options.endianness, options.on_warning);
    if (scan.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(scan.error());
    }
    const auto& fragments = scan.value();

    if (fragments.count == frames) {
        if (index >= fragments.count) {
            return index_error("Found " + std::to_string(fragments.count) +
                               " frame fragments in the encapsulated pixel data, an "
                               "'index' of " + std::to_string(index) + " is invalid");
        }
        // Skip the item tag, then read the item length and value
        source.seek(fragments.offsets[index] + 4);
        auto raw_length = source.read_exact(4);
        if (raw_length.is_err()) {
            return dcmwire::Result<std::vector<uint8_t>>::err(raw_length.error());
        }
        const auto length = read_u32(raw_length.value().data(), options.endianness);
        return dcmwire::ok(source.read_bytes(length));
    }

    source.seek(guard.position());
    auto iterator = frame_iterator::create(source, options);
    if (iterator.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(iterator.error());
    }
    auto& frames_it = iterator.value();
    for (std::size_t i = 0;; ++i) {
        auto frame = frames_it.next();
        if (frame.is_err()) {
            return dcmwire::Result<std::vector<uint8_t>>::err(frame.error());
        }
        if (!frame.value()) {
            break;
        }
        if (i == index) {
            return dcmwire::ok(std::move(*frame.value()));
        }
    }

    return index_error("There is insufficient pixel data to contain " +
                       std::to_string(index + 1) + " frames");
}

dcmwire::Result<std::vector<uint8_t>> get_frame(std::span<const uint8_t> encapsulated,
                                                std::size_t index,
                                                const frame_options& options) {
    memory_source source{encapsulated};
    return get_frame(source, index, options);
}

// ============================================================================
// Writing
// ============================================================================

dcmwire::Result<fragment_list> fragment_frame(std::span<const uint8_t> frame,
                                              std::size_t nr_fragments) {
    if (nr_fragments == 0) {
        return dcmwire::dcmwire_error<fragment_list>(
            dcmwire::error_codes::invalid_fragment_count,
            "At least one fragment is required per frame");
    }
    if (nr_fragments > frame.size()) {
        return dcmwire::dcmwire_error<fragment_list>(
            dcmwire::error_codes::invalid_fragment_count,
            "Too many fragments requested (the minimum fragment size is 1 byte), " +
                std::to_string(nr_fragments) + " fragments for a frame of " +
                std::to_string(frame.size()) + " bytes");
    }

    // Even fragment length, rounded up
    auto fragment_length = (frame.size() + nr_fragments - 1) / nr_fragments;
    if (fragment_length % 2 != 0) {
        ++fragment_length;
    }

    fragment_list fragments;
    fragments.reserve(nr_fragments);
    std::size_t offset = 0;
    for (std::size_t i = 0; i < nr_fragments; ++i) {
        const auto start = std::min(offset, frame.size());
        const auto end = (i + 1 == nr_fragments)
                             ? frame.size()
                             : std::min(offset + fragment_length, frame.size());
        std::vector<uint8_t> fragment(frame.begin() + static_cast<std::ptrdiff_t>(start),
                                      frame.begin() + static_cast<std::ptrdiff_t>(end));
        if (fragment.size() % 2 != 0) {
            fragment.push_back(0);
        }
        fragments.push_back(std::move(fragment));
        offset += fragment_length;
    }
    return dcmwire::ok(std::move(fragments));
}

std::vector<uint8_t> itemize_fragment(std::span<const uint8_t> fragment) {
    std::vector<uint8_t> item;
    item.reserve(fragment.size() + 8);
    write_u16(item, 0xFFFE, byte_order::little_endian);
    write_u16(item, 0xE000, byte_order::little_endian);
    write_u32(item, static_cast<uint32_t>(fragment.size()), byte_order::little_endian);
    item.insert(item.end(), fragment.begin(), fragment.end());
    return item;
}

dcmwire::Result<std::vector<uint8_t>> itemize_frame(std::span<const uint8_t> frame,
                                                    std::size_t nr_fragments) {
    auto fragments = fragment_frame(frame, nr_fragments);
    if (fragments.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(fragments.error());
    }

    std::vector<uint8_t> items;
    for (const auto& fragment : fragments.value()) {
        auto item = itemize_fragment(fragment);
        items.insert(items.end(), item.begin(), item.end());
    }
    return dcmwire::ok(std::move(items));
}

dcmwire::VoidResult check_basic_offset_table_limit(std::span<const uint64_t> frame_lengths) {
    if (frame_lengths.empty()) {
        return dcmwire::ok();
    }
    // The last frame's offset is the total length of all preceding items
    uint64_t total = (frame_lengths.size() - 1) * 8;
    for (std::size_t i = 0; i + 1 < frame_lengths.size(); ++i) {
        total += frame_lengths[i];
    }
    if (total > max_bot_offset) {
        return dcmwire::dcmwire_void_error(
            dcmwire::error_codes::offset_table_overflow,
            "The total length of the encapsulated frame data (" + std::to_string(total) +
                " bytes) will be greater than the maximum allowed by the Basic Offset "
                "Table (4294967295 bytes), it's recommended that you use the Extended "
                "Offset Table instead (see the 'encapsulate_extended' function)");
    }
    return dcmwire::ok();
}

dcmwire::Result<std::vector<uint8_t>> encapsulate(std::span<const std::vector<uint8_t>> frames,
                                                  std::size_t fragments_per_frame,
                                                  bool has_bot,
                                                  bool append_delimiter) {
    const auto nr_frames = frames.size();

    if (has_bot) {
        std::vector<uint64_t> lengths;
        lengths.reserve(nr_frames);
        for (const auto& frame : frames) {
            lengths.push_back(frame.size());
        }
        auto limit = check_basic_offset_table_limit(lengths);
        if (limit.is_err()) {
            return dcmwire::Result<std::vector<uint8_t>>::err(limit.error());
        }
    }

    std::vector<uint8_t> output;
    write_u16(output, 0xFFFE, byte_order::little_endian);
    write_u16(output, 0xE000, byte_order::little_endian);
    write_u32(output, has_bot ? static_cast<uint32_t>(4 * nr_frames) : 0u,
              byte_order::little_endian);
    const auto table_start = output.size();
    if (has_bot) {
        output.resize(table_start + 4 * nr_frames, 0);
    }
    const auto items_start = output.size();

    std::vector<uint64_t> offsets;
    offsets.reserve(nr_frames);
    for (const auto& frame : frames) {
        offsets.push_back(output.size() - items_start);
        auto items = itemize_frame(frame, fragments_per_frame);
        if (items.is_err()) {
            return dcmwire::Result<std::vector<uint8_t>>::err(items.error());
        }
        output.insert(output.end(), items.value().begin(), items.value().end());
    }

    if (has_bot) {
        std::vector<uint8_t> table;
        table.reserve(4 * nr_frames);
        for (auto offset : offsets) {
            if (offset > max_bot_offset) {
                return dcmwire::dcmwire_error<std::vector<uint8_t>>(
                    dcmwire::error_codes::offset_table_overflow,
                    "A frame offset of " + std::to_string(offset) +
                        " bytes cannot be stored in the Basic Offset Table, use the "
                        "Extended Offset Table instead");
            }
            write_u32(table, static_cast<uint32_t>(offset), byte_order::little_endian);
        }
        std::copy(table.begin(), table.end(),
                  output.begin() + static_cast<std::ptrdiff_t>(table_start));
    }

    if (append_delimiter) {
        write_u16(output, 0xFFFE, byte_order::little_endian);
        write_u16(output, 0xE0DD, byte_order::little_endian);
        write_u32(output, 0, byte_order::little_endian);
    }

    logger_adapter::trace("Encapsulated {} frames into {} bytes", nr_frames, output.size());
    return dcmwire::ok(std::move(output));
}

dcmwire::Result<extended_encapsulation> encapsulate_extended(
    std::span<const std::vector<uint8_t>> frames, bool append_delimiter) {
    auto encapsulated = encapsulate(frames, 1, false, append_delimiter);
    if (encapsulated.is_err()) {
        return dcmwire::Result<extended_encapsulation>::err(encapsulated.error());
    }

    extended_encapsulation result;
    result.encapsulated = std::move(encapsulated.value());
    uint64_t offset = 0;
    for (const auto& frame : frames) {
        // Odd length frames are padded when itemized
        const uint64_t length = frame.size() + (frame.size() % 2);
        result.table.offsets.push_back(offset);
        result.table.lengths.push_back(length);
        offset += length + 8;
    }
    return dcmwire::ok(std::move(result));
}

}  // namespace dcmwire::encoding
