/**
 * @file dataset_writer.cpp
 * @brief Implementation of dataset serialization
 */

#include "dcmwire/encoding/dataset_writer.hpp"

#include "dcmwire/core/dicom_tag_constants.hpp"
#include "dcmwire/core/tag_dictionary.hpp"
#include "dcmwire/encoding/vr_type.hpp"

namespace dcmwire::encoding {

namespace {

constexpr uint32_t undefined_length = core::dicom_element::undefined_length;

void write_tag(std::vector<uint8_t>& out, core::dicom_tag tag, byte_order order) {
    write_u16(out, tag.group(), order);
    write_u16(out, tag.element(), order);
}

/**
 * @brief Write a tag, VR and length header.
 */
dcmwire::VoidResult write_header(std::vector<uint8_t>& out,
                                 core::dicom_tag tag,
                                 vr_type vr,
                                 uint32_t length,
                                 bool is_implicit_vr,
                                 byte_order order) {
    write_tag(out, tag, order);
    if (is_implicit_vr) {
        write_u32(out, length, order);
        return dcmwire::ok();
    }

    const auto code = vr_code(vr);
    out.push_back(static_cast<uint8_t>(code[0]));
    out.push_back(static_cast<uint8_t>(code[1]));
    if (has_explicit_32bit_length(vr)) {
        write_u16(out, 0x0000, order);
        write_u32(out, length, order);
        return dcmwire::ok();
    }

    if (length > 0xFFFF) {
        return dcmwire::dcmwire_void_error(
            dcmwire::error_codes::encode_error,
            "The value of " + core::tag_dictionary::instance().describe(tag) +
                " is too long for VR " + code + " (" + std::to_string(length) + " bytes)");
    }
    write_u16(out, static_cast<uint16_t>(length), order);
    return dcmwire::ok();
}

void write_delimiter(std::vector<uint8_t>& out, core::dicom_tag tag, byte_order order) {
    write_tag(out, tag, order);
    write_u32(out, 0, order);
}

}  // namespace

dcmwire::Result<std::vector<uint8_t>> dataset_writer::encode(const core::dicom_dataset& dataset,
                                                             bool is_implicit_vr,
                                                             byte_order order) {
    std::vector<uint8_t> out;
    out.reserve(4096);
    auto result = encode_into(dataset, is_implicit_vr, order, out);
    if (result.is_err()) {
        return dcmwire::Result<std::vector<uint8_t>>::err(result.error());
    }
    return dcmwire::ok(std::move(out));
}

dcmwire::VoidResult dataset_writer::encode_into(const core::dicom_dataset& dataset,
                                                bool is_implicit_vr,
                                                byte_order order,
                                                std::vector<uint8_t>& out) {
    for (const auto& [tag, element] : dataset) {
        auto result = encode_element(element, is_implicit_vr, order, out);
        if (result.is_err()) {
            return result;
        }
    }
    return dcmwire::ok();
}

dcmwire::VoidResult dataset_writer::encode_element(const core::dicom_element& element,
                                                   bool is_implicit_vr,
                                                   byte_order order,
                                                   std::vector<uint8_t>& out) {
    if (element.is_deferred()) {
        return dcmwire::dcmwire_void_error(
            dcmwire::error_codes::encode_error,
            "Unable to encode " + element.tag().to_string() +
                " as its value has not been read yet");
    }

    if (element.is_sequence()) {
        return encode_sequence(element, is_implicit_vr, order, out);
    }

    auto data = element.raw_data();
    const bool odd = data.size() % 2 != 0;
    const auto padded_length = static_cast<uint32_t>(data.size() + (odd ? 1 : 0));

    if (element.is_undefined_length()) {
        auto header = write_header(out, element.tag(), element.vr(), undefined_length,
                                   is_implicit_vr, order);
        if (header.is_err()) {
            return header;
        }
        out.insert(out.end(), data.begin(), data.end());
        write_delimiter(out, core::tags::sequence_delimitation_item, order);
        return dcmwire::ok();
    }

    auto header = write_header(out, element.tag(), element.vr(), padded_length, is_implicit_vr,
                               order);
    if (header.is_err()) {
        return header;
    }
    out.insert(out.end(), data.begin(), data.end());
    if (odd) {
        out.push_back(static_cast<uint8_t>(padding_char(element.vr())));
    }
    return dcmwire::ok();
}

dcmwire::VoidResult dataset_writer::encode_sequence(const core::dicom_element& element,
                                                    bool is_implicit_vr,
                                                    byte_order order,
                                                    std::vector<uint8_t>& out) {
    const bool undefined = element.is_undefined_length();

    std::vector<uint8_t> value;
    for (const auto& item : element.sequence_items()) {
        std::vector<uint8_t> item_value;
        auto result = encode_into(item, is_implicit_vr, order, item_value);
        if (result.is_err()) {
            return result;
        }

        write_tag(value, core::tags::item, order);
        write_u32(value, undefined ? undefined_length : static_cast<uint32_t>(item_value.size()),
                  order);
        value.insert(value.end(), item_value.begin(), item_value.end());
        if (undefined) {
            write_delimiter(value, core::tags::item_delimitation_item, order);
        }
    }

    auto header = write_header(out, element.tag(), vr_type::SQ,
                               undefined ? undefined_length : static_cast<uint32_t>(value.size()),
                               is_implicit_vr, order);
    if (header.is_err()) {
        return header;
    }
    out.insert(out.end(), value.begin(), value.end());
    if (undefined) {
        write_delimiter(out, core::tags::sequence_delimitation_item, order);
    }
    return dcmwire::ok();
}

}  // namespace dcmwire::encoding
