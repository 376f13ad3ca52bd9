/**
 * @file stream_builder.hpp
 * @brief Hand-assembled element streams for the encoding tests
 *
 * Writes element headers byte by byte so that the readers are tested
 * against known encodings rather than against the writer.
 */

#pragma once

#include <dcmwire/core/dicom_tag.hpp>
#include <dcmwire/encoding/byte_order.hpp>
#include <dcmwire/encoding/vr_type.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace dcmwire::testing {

class stream_builder {
public:
    explicit stream_builder(encoding::byte_order order = encoding::byte_order::little_endian)
        : order_(order) {}

    /// Explicit VR element; the length field width follows the VR
    auto explicit_element(core::dicom_tag tag, std::string_view vr,
                          std::span<const uint8_t> value) -> stream_builder& {
        explicit_header(tag, vr, static_cast<uint32_t>(value.size()));
        return raw(value);
    }

    auto explicit_string(core::dicom_tag tag, std::string_view vr, std::string_view value)
        -> stream_builder& {
        return explicit_element(tag, vr, as_bytes(value));
    }

    auto explicit_header(core::dicom_tag tag, std::string_view vr, uint32_t length)
        -> stream_builder& {
        write_tag(tag);
        bytes_.push_back(static_cast<uint8_t>(vr[0]));
        bytes_.push_back(static_cast<uint8_t>(vr[1]));
        const auto parsed = encoding::from_string(vr);
        if (parsed && encoding::has_explicit_32bit_length(*parsed)) {
            encoding::write_u16(bytes_, 0, order_);
            encoding::write_u32(bytes_, length, order_);
        } else {
            encoding::write_u16(bytes_, static_cast<uint16_t>(length), order_);
        }
        return *this;
    }

    auto implicit_element(core::dicom_tag tag, std::span<const uint8_t> value)
        -> stream_builder& {
        implicit_header(tag, static_cast<uint32_t>(value.size()));
        return raw(value);
    }

    auto implicit_string(core::dicom_tag tag, std::string_view value) -> stream_builder& {
        return implicit_element(tag, as_bytes(value));
    }

    auto implicit_header(core::dicom_tag tag, uint32_t length) -> stream_builder& {
        write_tag(tag);
        encoding::write_u32(bytes_, length, order_);
        return *this;
    }

    auto item(uint32_t length = 0xFFFFFFFF) -> stream_builder& {
        return implicit_header(core::dicom_tag{0xFFFE, 0xE000}, length);
    }

    auto item_delimiter(uint32_t length = 0) -> stream_builder& {
        return implicit_header(core::dicom_tag{0xFFFE, 0xE00D}, length);
    }

    auto sequence_delimiter(uint32_t length = 0) -> stream_builder& {
        return implicit_header(core::dicom_tag{0xFFFE, 0xE0DD}, length);
    }

    auto u16(uint16_t value) -> stream_builder& {
        encoding::write_u16(bytes_, value, order_);
        return *this;
    }

    auto u32(uint32_t value) -> stream_builder& {
        encoding::write_u32(bytes_, value, order_);
        return *this;
    }

    auto raw(std::span<const uint8_t> data) -> stream_builder& {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    [[nodiscard]] auto bytes() const noexcept -> const std::vector<uint8_t>& { return bytes_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return bytes_.size(); }

private:
    static auto as_bytes(std::string_view value) -> std::span<const uint8_t> {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    void write_tag(core::dicom_tag tag) {
        encoding::write_u16(bytes_, tag.group(), order_);
        encoding::write_u16(bytes_, tag.element(), order_);
    }

    encoding::byte_order order_;
    std::vector<uint8_t> bytes_;
};

/// Little endian unsigned short value bytes
inline auto us_value(uint16_t value) -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes;
    encoding::write_u16(bytes, value, encoding::byte_order::little_endian);
    return bytes;
}

}  // namespace dcmwire::testing
