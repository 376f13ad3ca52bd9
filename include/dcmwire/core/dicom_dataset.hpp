/**
 * @file dicom_dataset.hpp
 * @brief DICOM Dataset - ordered collection of Data Elements
 *
 * @see DICOM PS3.5 Section 7 - The Data Set
 */

#pragma once

#include "dicom_element.hpp"
#include "dicom_tag.hpp"

#include <dcmwire/encoding/byte_order.hpp>
#include <dcmwire/encoding/vr_type.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dcmwire::core {

/**
 * @brief Encoding a dataset was read with (or is to be written with)
 */
struct dataset_encoding {
    /// Implicit VR if true, explicit VR otherwise
    bool is_implicit_vr{false};

    /// Byte order of the stored numeric values
    encoding::byte_order endianness{encoding::byte_order::little_endian};

    /// Active Specific Character Set terms, inherited from the parent if
    /// the dataset does not carry (0008,0005)
    std::vector<std::string> character_sets;
};

/**
 * @brief Tag-ordered collection of DICOM Data Elements
 *
 * Elements are stored in a std::map, so iteration always yields
 * ascending tag order and each tag appears at most once.
 */
class dicom_dataset {
public:
    using storage_type = std::map<dicom_tag, dicom_element>;
    using iterator = storage_type::iterator;
    using const_iterator = storage_type::const_iterator;

    dicom_dataset() = default;
    dicom_dataset(const dicom_dataset&) = default;
    dicom_dataset(dicom_dataset&&) noexcept = default;
    auto operator=(const dicom_dataset&) -> dicom_dataset& = default;
    auto operator=(dicom_dataset&&) noexcept -> dicom_dataset& = default;
    ~dicom_dataset() = default;

    // ========================================================================
    // Element Access
    // ========================================================================

    [[nodiscard]] auto contains(dicom_tag tag) const noexcept -> bool;

    /**
     * @brief Get a pointer to the element, nullptr if absent
     */
    [[nodiscard]] auto get(dicom_tag tag) noexcept -> dicom_element*;

    [[nodiscard]] auto get(dicom_tag tag) const noexcept -> const dicom_element*;

    /**
     * @brief Get the string value of an element or a default
     */
    [[nodiscard]] auto get_string(dicom_tag tag,
                                  std::string_view default_value = "") const
        -> std::string;

    /**
     * @brief Get the first numeric value of an element
     *
     * The stored bytes are interpreted with this dataset's byte order.
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] auto get_numeric(dicom_tag tag) const -> std::optional<T>;

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Insert or replace an element
     * @return true if an element with the same tag was replaced
     */
    auto insert(dicom_element element) -> bool;

    void set_string(dicom_tag tag, encoding::vr_type vr, std::string_view value);

    /**
     * @brief Store a numeric value in this dataset's byte order
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    void set_numeric(dicom_tag tag, encoding::vr_type vr, T value);

    auto remove(dicom_tag tag) -> bool;

    void clear() noexcept;

    // ========================================================================
    // Encoding
    // ========================================================================

    [[nodiscard]] auto encoding() const noexcept -> const dataset_encoding& {
        return encoding_;
    }

    void set_encoding(dataset_encoding encoding) { encoding_ = std::move(encoding); }

    // ========================================================================
    // Iteration
    // ========================================================================

    [[nodiscard]] auto begin() noexcept -> iterator { return elements_.begin(); }
    [[nodiscard]] auto end() noexcept -> iterator { return elements_.end(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return elements_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return elements_.end(); }

    [[nodiscard]] auto size() const noexcept -> size_t { return elements_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return elements_.empty(); }

private:
    storage_type elements_;
    dataset_encoding encoding_;
};

// ============================================================================
// Template Implementations
// ============================================================================

template <typename T>
    requires std::is_arithmetic_v<T>
auto dicom_dataset::get_numeric(dicom_tag tag) const -> std::optional<T> {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }
    auto value = elem->as_numeric<T>(encoding_.endianness);
    if (value.is_err()) {
        return std::nullopt;
    }
    return value.value();
}

template <typename T>
    requires std::is_arithmetic_v<T>
void dicom_dataset::set_numeric(dicom_tag tag, encoding::vr_type vr, T value) {
    insert(dicom_element::from_numeric<T>(tag, vr, value, encoding_.endianness));
}

}  // namespace dcmwire::core
