/**
 * @file encapsulation.hpp
 * @brief Encapsulated Pixel Data framing (fragments, offset tables, frames)
 *
 * All readers take a byte_source positioned at the first byte of the
 * encapsulated value, i.e. the Basic Offset Table item tag.
 *
 * @see DICOM PS3.5 Section A.4 - Transfer Syntaxes for Encapsulation of
 *      Encoded Pixel Data
 */

#ifndef DCMWIRE_ENCODING_ENCAPSULATION_HPP
#define DCMWIRE_ENCODING_ENCAPSULATION_HPP

#include "dcmwire/core/diagnostics.hpp"
#include "dcmwire/core/result.hpp"
#include "dcmwire/encoding/byte_order.hpp"
#include "dcmwire/encoding/byte_source.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace dcmwire::encoding {

/// Fragments making up one frame, in stream order
using fragment_list = std::vector<std::vector<uint8_t>>;

/**
 * @brief Extended Offset Table (7FE0,0001) and its lengths (7FE0,0002).
 *
 * offsets[i] is the position of the item holding the start of frame i,
 * relative to the first byte after the Basic Offset Table item.
 */
struct extended_offset_table {
    std::vector<uint64_t> offsets;
    std::vector<uint64_t> lengths;

    /**
     * @brief Decode the two OV values.
     */
    [[nodiscard]] static dcmwire::Result<extended_offset_table> from_bytes(
        std::span<const uint8_t> offsets, std::span<const uint8_t> lengths,
        byte_order order = byte_order::little_endian);

    [[nodiscard]] std::vector<uint8_t> offsets_bytes(
        byte_order order = byte_order::little_endian) const;

    [[nodiscard]] std::vector<uint8_t> lengths_bytes(
        byte_order order = byte_order::little_endian) const;
};

/**
 * @brief Inputs for frame reconstruction.
 */
struct frame_options {
    /// Number of Frames (0028,0008), needed when there is no offset table
    std::optional<uint32_t> number_of_frames;

    /// Takes precedence over the Basic Offset Table when present
    std::optional<extended_offset_table> extended_offsets;

    byte_order endianness{byte_order::little_endian};

    core::warning_handler on_warning;
};

/**
 * @brief Result of scanning the fragment items.
 */
struct fragment_scan {
    std::size_t count{0};

    /// Absolute position of each fragment's item tag
    std::vector<uint64_t> offsets;
};

/// @name Reading
/// @{

/**
 * @brief Read the Basic Offset Table item.
 *
 * On success the source is positioned after the item.
 *
 * @return The frame offsets, empty if the table has length 0
 */
[[nodiscard]] dcmwire::Result<std::vector<uint32_t>> parse_basic_offsets(
    byte_source& source, byte_order order = byte_order::little_endian);

/**
 * @brief Count the fragment items that follow the current position.
 *
 * Scanning stops at a Sequence Delimiter or at the end of the data. The
 * source position is restored.
 */
[[nodiscard]] dcmwire::Result<fragment_scan> parse_fragments(
    byte_source& source, byte_order order = byte_order::little_endian,
    const core::warning_handler& on_warning = {});

/**
 * @brief Pull iterator over fragment payloads.
 */
class fragment_reader {
public:
    explicit fragment_reader(byte_source& source,
                             byte_order order = byte_order::little_endian,
                             core::warning_handler on_warning = {});

    /**
     * @brief Read the next fragment.
     * @return The payload, or std::nullopt after the last fragment
     */
    [[nodiscard]] dcmwire::Result<std::optional<std::vector<uint8_t>>> next();

private:
    byte_source* source_;
    byte_order order_;
    core::warning_handler on_warning_;
    bool done_{false};
};

/**
 * @brief Lazy iterator reconstructing frames from the fragment stream.
 *
 * Frame boundaries come from, in order of preference: the Extended Offset
 * Table, the Basic Offset Table, one fragment per frame, all fragments in
 * a single frame, and finally a search for the JPEG end-of-image marker
 * (FF D9) near the end of each fragment. The marker search is best
 * effort; a warning is issued whenever the frames found do not add up.
 *
 * The iterator reads from the source as frames are requested; the source
 * must outlive it and must not be moved by anyone else meanwhile.
 */
class frame_iterator {
public:
    /**
     * @brief Parse the Basic Offset Table and choose the framing strategy.
     *
     * Fails with frame_boundaries_indeterminate when there is no offset
     * table and no number of frames, and with insufficient_fragments when
     * there are fewer fragments than frames.
     */
    [[nodiscard]] static dcmwire::Result<frame_iterator> create(byte_source& source,
                                                                frame_options options = {});

    /**
     * @brief Fragments of the next frame, std::nullopt when done.
     */
    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_fragments();

    /**
     * @brief The next frame with its fragments joined, std::nullopt when done.
     */
    [[nodiscard]] dcmwire::Result<std::optional<std::vector<uint8_t>>> next();

    [[nodiscard]] std::size_t frames_read() const noexcept { return frames_read_; }

private:
    enum class strategy {
        extended_table,
        basic_table,
        single_frame,
        one_per_fragment,
        end_of_image_marker
    };

    frame_iterator(byte_source& source, frame_options options, strategy mode,
                   std::vector<uint32_t> basic_offsets, uint64_t fragments_start);

    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_extended();
    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_basic();
    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_single();
    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_one_per_fragment();
    [[nodiscard]] dcmwire::Result<std::optional<fragment_list>> next_by_marker();

    byte_source* source_;
    frame_options options_;
    strategy mode_;
    std::vector<uint32_t> basic_offsets_;
    uint64_t fragments_start_;
    fragment_reader reader_;
    std::optional<std::vector<uint8_t>> pending_;
    uint64_t current_offset_{0};
    std::size_t frames_read_{0};
    bool finished_{false};
};

/**
 * @brief Concatenate fragments into one frame.
 */
[[nodiscard]] std::vector<uint8_t> join_fragments(const fragment_list& fragments);

/**
 * @brief Read a single frame.
 *
 * With an offset table or one fragment per frame only that frame is read;
 * otherwise frames are reconstructed up to index. The source position is
 * restored on return.
 */
[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> get_frame(
    byte_source& source, std::size_t index, const frame_options& options = {});

[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> get_frame(
    std::span<const uint8_t> encapsulated, std::size_t index,
    const frame_options& options = {});

/// @}

/// @name Writing
/// @{

/**
 * @brief Split a frame into nr_fragments fragments of even length.
 *
 * Requires 1 <= nr_fragments <= frame length. The fragment holding the
 * final byte of an odd-length frame is padded with a zero; fragments past
 * the end of the data are empty.
 */
[[nodiscard]] dcmwire::Result<fragment_list> fragment_frame(
    std::span<const uint8_t> frame, std::size_t nr_fragments = 1);

/**
 * @brief Wrap a fragment in an Item header (little endian).
 */
[[nodiscard]] std::vector<uint8_t> itemize_fragment(std::span<const uint8_t> fragment);

/**
 * @brief Fragment a frame and itemize every fragment.
 */
[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> itemize_frame(
    std::span<const uint8_t> frame, std::size_t nr_fragments = 1);

/**
 * @brief Check that a Basic Offset Table can address frames of these lengths.
 *
 * Fails with offset_table_overflow, recommending the Extended Offset
 * Table, when the last frame would start beyond 2^32 - 1.
 */
[[nodiscard]] dcmwire::VoidResult check_basic_offset_table_limit(
    std::span<const uint64_t> frame_lengths);

/**
 * @brief Build an encapsulated value from frames.
 *
 * @param frames The encoded frames
 * @param fragments_per_frame Number of fragments each frame is split into
 * @param has_bot Fill the Basic Offset Table, otherwise it is left empty
 * @param append_delimiter Terminate with a Sequence Delimitation Item
 */
[[nodiscard]] dcmwire::Result<std::vector<uint8_t>> encapsulate(
    std::span<const std::vector<uint8_t>> frames,
    std::size_t fragments_per_frame = 1,
    bool has_bot = true,
    bool append_delimiter = false);

/**
 * @brief Encapsulated value plus the Extended Offset Table describing it.
 */
struct extended_encapsulation {
    std::vector<uint8_t> encapsulated;
    extended_offset_table table;
};

/**
 * @brief Build an encapsulated value with an empty Basic Offset Table and
 *        one fragment per frame, returning the Extended Offset Table.
 */
[[nodiscard]] dcmwire::Result<extended_encapsulation> encapsulate_extended(
    std::span<const std::vector<uint8_t>> frames, bool append_delimiter = false);

/// @}

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_ENCAPSULATION_HPP
