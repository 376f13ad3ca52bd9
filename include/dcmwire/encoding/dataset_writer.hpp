/**
 * @file dataset_writer.hpp
 * @brief Serializes datasets back into a byte stream
 *
 * @see DICOM PS3.5 Section 7 - The Data Set
 */

#ifndef DCMWIRE_ENCODING_DATASET_WRITER_HPP
#define DCMWIRE_ENCODING_DATASET_WRITER_HPP

#include "dcmwire/core/dicom_dataset.hpp"
#include "dcmwire/core/dicom_element.hpp"
#include "dcmwire/core/result.hpp"
#include "dcmwire/encoding/byte_order.hpp"

#include <cstdint>
#include <vector>

namespace dcmwire::encoding {

/**
 * @brief Encodes datasets in any of the uncompressed layouts.
 *
 * Sequences and items that were read with undefined length are written
 * with undefined length and their delimiters; all others get explicit
 * lengths. Undefined-length values that are not sequences (encapsulated
 * pixel data) are written followed by a Sequence Delimitation Item.
 *
 * Deferred elements must be materialized before writing.
 */
class dataset_writer {
public:
    /**
     * @brief Encode all elements of a dataset in ascending tag order.
     */
    [[nodiscard]] static dcmwire::Result<std::vector<uint8_t>> encode(
        const core::dicom_dataset& dataset, bool is_implicit_vr, byte_order order);

    /**
     * @brief Encode one element, appending to out.
     */
    [[nodiscard]] static dcmwire::VoidResult encode_element(const core::dicom_element& element,
                                                            bool is_implicit_vr,
                                                            byte_order order,
                                                            std::vector<uint8_t>& out);

private:
    static dcmwire::VoidResult encode_into(const core::dicom_dataset& dataset,
                                           bool is_implicit_vr,
                                           byte_order order,
                                           std::vector<uint8_t>& out);

    static dcmwire::VoidResult encode_sequence(const core::dicom_element& element,
                                               bool is_implicit_vr,
                                               byte_order order,
                                               std::vector<uint8_t>& out);
};

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_DATASET_WRITER_HPP
