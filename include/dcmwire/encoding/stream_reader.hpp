/**
 * @file stream_reader.hpp
 * @brief Element-by-element decoder for implicit and explicit VR streams
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#ifndef DCMWIRE_ENCODING_STREAM_READER_HPP
#define DCMWIRE_ENCODING_STREAM_READER_HPP

#include "dcmwire/core/dicom_element.hpp"
#include "dcmwire/core/result.hpp"
#include "dcmwire/encoding/byte_order.hpp"
#include "dcmwire/encoding/byte_source.hpp"
#include "dcmwire/encoding/read_options.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Pull decoder producing one data element per call.
 *
 * The reader stops at the end of the data, at an Item Delimitation Item
 * (consumed), at a Sequence Delimitation Item (left in the stream) or when
 * the stop predicate fires (the source is rewound to the element header).
 *
 * Explicit VR streams are checked per element: VR bytes that are not two
 * uppercase letters mean the element was written with an implicit VR
 * header, and it is read as such.
 *
 * Sequence values are parsed through dataset_reader::read_sequence.
 * Values longer than read_options::defer_size are skipped and returned as
 * deferred placeholders, except (0008,0005) which is always read because
 * its value becomes the character set for the following elements.
 *
 * @example
 * @code
 * memory_source source{bytes};
 * stream_reader reader{source, true, byte_order::little_endian, options};
 * while (true) {
 *     auto element = reader.next();
 *     if (element.is_err() || !element.value()) break;
 * }
 * @endcode
 */
class stream_reader {
public:
    /**
     * @param source Input positioned at the first element header
     * @param is_implicit_vr Encoding of the element headers
     * @param order Byte order of tags, lengths and numeric values
     * @param options Reader configuration (must outlive the reader)
     * @param stop_when Optional stop predicate
     * @param character_sets Character sets inherited from the parent dataset
     */
    stream_reader(byte_source& source, bool is_implicit_vr, byte_order order,
                  const read_options& options, stop_predicate stop_when = {},
                  std::vector<std::string> character_sets = {});

    /**
     * @brief Read the next element.
     * @return The element, or std::nullopt when reading has ended
     */
    [[nodiscard]] dcmwire::Result<std::optional<core::dicom_element>> next();

    /**
     * @brief Character sets in effect for the elements read so far.
     */
    [[nodiscard]] const std::vector<std::string>& character_sets() const noexcept {
        return character_sets_;
    }

    [[nodiscard]] bool stopped() const noexcept { return stopped_; }

    [[nodiscard]] bool reached_item_delimiter() const noexcept { return item_delimiter_; }

    [[nodiscard]] bool reached_sequence_delimiter() const noexcept {
        return sequence_delimiter_;
    }

    /**
     * @brief True if the data ended inside an element (ignore/warn modes).
     */
    [[nodiscard]] bool truncated() const noexcept { return truncated_; }

private:
    struct element_header {
        core::dicom_tag tag;
        std::optional<vr_type> vr;
        uint32_t length{0};
        uint64_t header_start{0};
        uint8_t header_length{8};
    };

    [[nodiscard]] dcmwire::Result<std::optional<element_header>> read_header();

    [[nodiscard]] dcmwire::Result<std::optional<core::dicom_element>> read_defined(
        const element_header& header);

    [[nodiscard]] dcmwire::Result<std::optional<core::dicom_element>> read_undefined(
        const element_header& header);

    /**
     * @brief Moves past an undefined length value without keeping its bytes.
     * @return Length of the value, excluding the delimiter
     */
    [[nodiscard]] dcmwire::Result<uint64_t> skip_undefined_value(const element_header& header);

    [[nodiscard]] std::optional<vr_type> resolve_vr(core::dicom_tag tag) const;

    [[nodiscard]] dcmwire::VoidResult truncation(const std::string& message);

    void update_character_sets(const core::dicom_element& element);

    byte_source& source_;
    bool implicit_;
    byte_order order_;
    const read_options& options_;
    stop_predicate stop_when_;
    std::vector<std::string> character_sets_;
    bool done_{false};
    bool stopped_{false};
    bool item_delimiter_{false};
    bool sequence_delimiter_{false};
    bool truncated_{false};
};

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_STREAM_READER_HPP
