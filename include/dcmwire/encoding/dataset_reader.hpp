/**
 * @file dataset_reader.hpp
 * @brief Assembles datasets and sequences from a byte stream
 *
 * @see DICOM PS3.5 Section 7.5 - Nesting of Data Sets
 */

#ifndef DCMWIRE_ENCODING_DATASET_READER_HPP
#define DCMWIRE_ENCODING_DATASET_READER_HPP

#include "dcmwire/core/dicom_dataset.hpp"
#include "dcmwire/core/result.hpp"
#include "dcmwire/encoding/byte_order.hpp"
#include "dcmwire/encoding/byte_source.hpp"
#include "dcmwire/encoding/read_options.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Reads whole datasets, sequences and deferred values.
 *
 * Each dataset re-checks its encoding on its first element, since some
 * writers switch between implicit and explicit VR. Problems found while
 * reading go through read_options::validation; in the ignore and warn
 * modes whatever was read before a problem is kept.
 */
class dataset_reader {
public:
    /**
     * @brief Read one dataset.
     *
     * @param source Input positioned at the first element
     * @param is_implicit_vr Expected encoding
     * @param order Byte order
     * @param byte_length Bytes belonging to the dataset, unbounded if absent
     * @param options Reader configuration
     * @param stop_when Optional stop predicate
     * @param parent_character_sets Character sets of the enclosing dataset
     * @param at_top_level False for sequence items
     */
    [[nodiscard]] static dcmwire::Result<core::dicom_dataset> read_dataset(
        byte_source& source,
        bool is_implicit_vr,
        byte_order order,
        std::optional<uint64_t> byte_length,
        const read_options& options,
        const stop_predicate& stop_when = {},
        const std::vector<std::string>& parent_character_sets = {},
        bool at_top_level = true);

    /**
     * @brief Read the items of a sequence value.
     *
     * @param byte_length Value length, absent for undefined length (read
     *        until the Sequence Delimitation Item)
     */
    [[nodiscard]] static dcmwire::Result<std::vector<core::dicom_dataset>> read_sequence(
        byte_source& source,
        bool is_implicit_vr,
        byte_order order,
        std::optional<uint64_t> byte_length,
        const read_options& options,
        const std::vector<std::string>& character_sets);

    /**
     * @brief Read one sequence item.
     * @return The item, or std::nullopt at the Sequence Delimitation Item
     */
    [[nodiscard]] static dcmwire::Result<std::optional<core::dicom_dataset>> read_sequence_item(
        byte_source& source,
        bool is_implicit_vr,
        byte_order order,
        const read_options& options,
        const std::vector<std::string>& character_sets);

    /**
     * @brief Decide which VR encoding the next dataset really uses.
     *
     * Peeks at the VR bytes of the first element; the source position is
     * unchanged. Items of a sequence inside an implicit dataset are always
     * implicit, and an implicit item inside an explicit sequence is
     * accepted without complaint.
     */
    [[nodiscard]] static dcmwire::Result<bool> detect_implicit_vr(
        byte_source& source,
        bool implicit_vr_is_assumed,
        byte_order order,
        const stop_predicate& stop_when,
        bool is_sequence,
        const read_options& options);

    /**
     * @brief Read the value of a deferred element.
     *
     * The element is read again from its header; tag and VR must match
     * the placeholder.
     */
    [[nodiscard]] static dcmwire::Result<core::dicom_element> read_deferred_element(
        byte_source& source,
        const core::dicom_element& element,
        const core::dataset_encoding& encoding,
        const read_options& options);
};

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_DATASET_READER_HPP
