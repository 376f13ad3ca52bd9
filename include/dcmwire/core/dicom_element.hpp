/**
 * @file dicom_element.hpp
 * @brief DICOM Data Element representation (Tag, VR, Value)
 *
 * An element read from a stream remembers where its value started, how
 * long its header was and the length declared in the stream, so that a
 * deferred value can be read again later.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include "dicom_tag.hpp"
#include "result.hpp"

#include <dcmwire/encoding/byte_order.hpp>
#include <dcmwire/encoding/vr_type.hpp>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dcmwire::core {

class dicom_dataset;

/**
 * @brief Represents a DICOM Data Element (Tag, VR, Value)
 *
 * The value is one of:
 * - raw bytes in the byte order of the stream it came from
 * - nested datasets (VR SQ)
 * - a deferred placeholder (offset and length only)
 *
 * The VR is absent when an implicit VR element could not be resolved
 * through the dictionary; vr() then reports UN.
 *
 * @example
 * @code
 * auto rows = dicom_element::from_numeric<uint16_t>(tags::rows, vr_type::US, 512);
 * auto value = rows.as_numeric<uint16_t>();
 * @endcode
 */
class dicom_element {
public:
    /// Length value marking an undefined-length element
    static constexpr uint32_t undefined_length = 0xFFFFFFFF;

    dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept;

    dicom_element(dicom_tag tag, encoding::vr_type vr,
                  std::span<const uint8_t> data);

    /**
     * @brief Construct an element as read from a stream
     * @param tag The DICOM tag
     * @param vr The VR, absent if it could not be determined
     * @param data The raw value bytes (taken over)
     */
    dicom_element(dicom_tag tag, std::optional<encoding::vr_type> vr,
                  std::vector<uint8_t> data);

    dicom_element(const dicom_element&);
    dicom_element(dicom_element&&) noexcept;
    auto operator=(const dicom_element&) -> dicom_element&;
    auto operator=(dicom_element&&) noexcept -> dicom_element&;
    ~dicom_element();

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create an element from a string value, padded to even length
     */
    [[nodiscard]] static auto from_string(dicom_tag tag, encoding::vr_type vr,
                                          std::string_view value) -> dicom_element;

    /**
     * @brief Create an element from a numeric value
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] static auto from_numeric(
        dicom_tag tag, encoding::vr_type vr, T value,
        encoding::byte_order order = encoding::byte_order::little_endian)
        -> dicom_element;

    /**
     * @brief Create a placeholder for a value that was not read
     *
     * @param tag The DICOM tag
     * @param vr The VR, absent for unresolved implicit VR elements
     * @param length Declared value length
     * @param value_offset Absolute position of the first value byte
     * @param header_length Size of the element header (8 or 12)
     */
    [[nodiscard]] static auto deferred(dicom_tag tag,
                                       std::optional<encoding::vr_type> vr,
                                       uint32_t length,
                                       uint64_t value_offset,
                                       uint8_t header_length) -> dicom_element;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] constexpr auto tag() const noexcept -> dicom_tag { return tag_; }

    /**
     * @brief Get the element's VR, UN when it is not known
     */
    [[nodiscard]] auto vr() const noexcept -> encoding::vr_type {
        return vr_.value_or(encoding::vr_type::UN);
    }

    /**
     * @brief Get the VR exactly as determined while reading
     */
    [[nodiscard]] auto stored_vr() const noexcept -> std::optional<encoding::vr_type> {
        return vr_;
    }

    [[nodiscard]] auto has_vr() const noexcept -> bool { return vr_.has_value(); }

    void set_vr(encoding::vr_type vr) noexcept { vr_ = vr; }

    /**
     * @brief Get the value length in bytes
     *
     * For a deferred element this is the declared length of the skipped
     * value.
     */
    [[nodiscard]] auto length() const noexcept -> uint32_t {
        if (deferred_) {
            return declared_length_;
        }
        return static_cast<uint32_t>(data_.size());
    }

    /**
     * @brief Get the length field as found in the stream
     */
    [[nodiscard]] auto declared_length() const noexcept -> uint32_t {
        return declared_length_;
    }

    [[nodiscard]] auto is_undefined_length() const noexcept -> bool {
        return declared_length_ == undefined_length;
    }

    /**
     * @brief Absolute position of the value in its source
     */
    [[nodiscard]] auto value_offset() const noexcept -> uint64_t {
        return value_offset_;
    }

    [[nodiscard]] auto header_length() const noexcept -> uint8_t {
        return header_length_;
    }

    /**
     * @brief Record where the element was found in its source
     */
    void set_stream_position(uint32_t declared_length, uint64_t value_offset,
                             uint8_t header_length) noexcept {
        declared_length_ = declared_length;
        value_offset_ = value_offset;
        header_length_ = header_length;
    }

    [[nodiscard]] auto is_deferred() const noexcept -> bool { return deferred_; }

    [[nodiscard]] auto raw_data() const noexcept -> std::span<const uint8_t> {
        return data_;
    }

    [[nodiscard]] auto is_empty() const noexcept -> bool {
        return data_.empty() && sequence_items_.empty();
    }

    // ========================================================================
    // Value Access
    // ========================================================================

    /**
     * @brief Get the value as a string with trailing padding removed
     *
     * Fails for deferred elements and sequences.
     */
    [[nodiscard]] auto as_string() const -> dcmwire::Result<std::string>;

    /**
     * @brief Get a multi-valued string split on backslash
     */
    [[nodiscard]] auto as_string_list() const
        -> dcmwire::Result<std::vector<std::string>>;

    /**
     * @brief Get the first value as a numeric type
     * @param order Byte order of the stored bytes
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric(
        encoding::byte_order order = encoding::byte_order::little_endian) const
        -> dcmwire::Result<T>;

    /**
     * @brief Get all values as a numeric list
     * @param order Byte order of the stored bytes
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto as_numeric_list(
        encoding::byte_order order = encoding::byte_order::little_endian) const
        -> dcmwire::Result<std::vector<T>>;

    // ========================================================================
    // Sequence Access
    // ========================================================================

    [[nodiscard]] auto is_sequence() const noexcept -> bool {
        return vr_ == encoding::vr_type::SQ;
    }

    [[nodiscard]] auto sequence_items() -> std::vector<dicom_dataset>&;

    [[nodiscard]] auto sequence_items() const -> const std::vector<dicom_dataset>&;

    // ========================================================================
    // Modification
    // ========================================================================

    void set_value(std::span<const uint8_t> data);

    void set_value(std::vector<uint8_t>&& data) noexcept;

    void set_string(std::string_view value);

    template <typename T>
        requires std::is_arithmetic_v<T>
    void set_numeric(T value,
                     encoding::byte_order order = encoding::byte_order::little_endian);

private:
    template <typename T>
    static auto load(const uint8_t* src, encoding::byte_order order) noexcept -> T;

    void store(std::vector<uint8_t> bytes) noexcept;

    dicom_tag tag_;
    std::optional<encoding::vr_type> vr_;
    std::vector<uint8_t> data_;
    std::vector<dicom_dataset> sequence_items_;
    uint32_t declared_length_{0};
    uint64_t value_offset_{0};
    uint8_t header_length_{0};
    bool deferred_{false};
};

// ============================================================================
// Template Implementations
// ============================================================================

namespace detail {

[[nodiscard]] constexpr auto needs_swap(encoding::byte_order order) noexcept -> bool {
    return (order == encoding::byte_order::big_endian) !=
           (std::endian::native == std::endian::big);
}

}  // namespace detail

template <typename T>
auto dicom_element::load(const uint8_t* src, encoding::byte_order order) noexcept -> T {
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, src, sizeof(T));
    if (detail::needs_swap(order)) {
        std::reverse(bytes, bytes + sizeof(T));
    }
    T result{};
    std::memcpy(&result, bytes, sizeof(T));
    return result;
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::from_numeric(dicom_tag tag, encoding::vr_type vr, T value,
                                 encoding::byte_order order) -> dicom_element {
    dicom_element elem{tag, vr};
    elem.set_numeric(value, order);
    return elem;
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric(encoding::byte_order order) const -> dcmwire::Result<T> {
    if (deferred_) {
        return dcmwire::dcmwire_error<T>(
            dcmwire::error_codes::deferred_read_error,
            "Value of " + tag_.to_string() + " has not been read yet");
    }
    if (data_.size() < sizeof(T)) {
        return dcmwire::dcmwire_error<T>(
            dcmwire::error_codes::data_size_mismatch,
            "Insufficient data for numeric conversion of " + tag_.to_string() +
                ": expected " + std::to_string(sizeof(T)) + " bytes, got " +
                std::to_string(data_.size()));
    }
    return dcmwire::ok(load<T>(data_.data(), order));
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_element::as_numeric_list(encoding::byte_order order) const
    -> dcmwire::Result<std::vector<T>> {
    if (data_.size() % sizeof(T) != 0) {
        return dcmwire::dcmwire_error<std::vector<T>>(
            dcmwire::error_codes::data_size_mismatch,
            "Data size not aligned for numeric type: " +
                std::to_string(data_.size()) + " bytes is not divisible by " +
                std::to_string(sizeof(T)));
    }
    const size_t count = data_.size() / sizeof(T);
    std::vector<T> result(count);
    for (size_t i = 0; i < count; ++i) {
        result[i] = load<T>(data_.data() + i * sizeof(T), order);
    }
    return dcmwire::ok(std::move(result));
}

template <typename T>
    requires std::is_arithmetic_v<T>
void dicom_element::set_numeric(T value, encoding::byte_order order) {
    data_.resize(sizeof(T));
    std::memcpy(data_.data(), &value, sizeof(T));
    if (detail::needs_swap(order)) {
        std::reverse(data_.begin(), data_.end());
    }
    declared_length_ = static_cast<uint32_t>(data_.size());
    deferred_ = false;
}

}  // namespace dcmwire::core
