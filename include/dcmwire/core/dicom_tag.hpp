/**
 * @file dicom_tag.hpp
 * @brief Attribute tag, the (group,element) key of every data element
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dcmwire::core {

/**
 * @brief A (group,element) pair packed as (group << 16) | element
 *
 * Integer order of the packed value equals the ascending tag order that
 * data elements must follow inside a dataset.
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept = default;

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : value_{(static_cast<uint32_t>(group) << 16) | element} {}

    explicit constexpr dicom_tag(uint32_t packed) noexcept : value_{packed} {}

    /**
     * @brief Parse "(GGGG,EEEE)", "GGGG,EEEE" or "GGGGEEEE"
     *
     * Hex digits may be upper or lower case; surrounding blanks are ignored.
     */
    [[nodiscard]] static auto from_string(std::string_view text) -> std::optional<dicom_tag>;

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(value_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(value_);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t { return value_; }

    /// Odd groups above 0008; groups 0001, 0003, 0005 and 0007 are illegal, not private
    [[nodiscard]] constexpr auto is_private() const noexcept -> bool {
        return (group() & 1u) != 0 && group() > 0x0008;
    }

    /// Reservation slot (gggg,0010)-(gggg,00FF) of a private group
    [[nodiscard]] constexpr auto is_private_creator() const noexcept -> bool {
        return is_private() && element() >= 0x0010 && element() <= 0x00FF;
    }

    /// (gggg,0000)
    [[nodiscard]] constexpr auto is_group_length() const noexcept -> bool {
        return element() == 0x0000;
    }

    /// Group 0002, always written explicit VR little endian
    [[nodiscard]] constexpr auto is_file_meta() const noexcept -> bool {
        return group() == 0x0002;
    }

    /// Any tag of group FFFE; these carry a length but never a VR
    [[nodiscard]] constexpr auto is_delimitation() const noexcept -> bool {
        return group() == 0xFFFE;
    }

    [[nodiscard]] constexpr auto is_item() const noexcept -> bool {
        return value_ == 0xFFFEE000;
    }

    [[nodiscard]] constexpr auto is_item_delimiter() const noexcept -> bool {
        return value_ == 0xFFFEE00D;
    }

    [[nodiscard]] constexpr auto is_sequence_delimiter() const noexcept -> bool {
        return value_ == 0xFFFEE0DD;
    }

    /// Upper-case "(GGGG,EEEE)"
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag&) const noexcept
        -> std::strong_ordering = default;

    [[nodiscard]] constexpr auto operator==(const dicom_tag&) const noexcept -> bool = default;

private:
    uint32_t value_{0};
};

}  // namespace dcmwire::core

template <>
struct std::hash<dcmwire::core::dicom_tag> {
    [[nodiscard]] auto operator()(const dcmwire::core::dicom_tag& tag) const noexcept
        -> size_t {
        return std::hash<uint32_t>{}(tag.combined());
    }
};
