/**
 * @file tag_dictionary.hpp
 * @brief Minimal DICOM data dictionary for implicit VR resolution
 *
 * Holds the VR, keyword and name of the attributes the reader and the
 * pixel pipeline meet most often, plus the rules the standard defines for
 * whole tag classes (group lengths, private creators, repeating groups).
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"

#include <dcmwire/encoding/vr_type.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dcmwire::core {

/**
 * @brief Dictionary entry for one attribute
 */
struct tag_info {
    dicom_tag tag;
    encoding::vr_type vr{encoding::vr_type::UN};
    std::string_view keyword;
    std::string_view name;
};

/**
 * @brief Read-only lookup of attribute metadata
 *
 * The table is built once on first use and never modified, so lookups are
 * safe from any thread.
 */
class tag_dictionary {
public:
    [[nodiscard]] static auto instance() -> const tag_dictionary&;

    tag_dictionary(const tag_dictionary&) = delete;
    tag_dictionary(tag_dictionary&&) = delete;
    auto operator=(const tag_dictionary&) -> tag_dictionary& = delete;
    auto operator=(tag_dictionary&&) -> tag_dictionary& = delete;

    /**
     * @brief Find the entry for a tag
     *
     * Repeating groups (50xx, 60xx) are looked up by their base group.
     */
    [[nodiscard]] auto find(dicom_tag tag) const -> std::optional<tag_info>;

    /**
     * @brief Resolve the VR an implicit VR element should be read with
     *
     * Group length tags are UL and private creators LO even when the
     * table has no entry for them.
     */
    [[nodiscard]] auto vr_of(dicom_tag tag) const -> std::optional<encoding::vr_type>;

    /**
     * @brief Describe a tag for diagnostics, e.g. "(0028,0010) 'Rows'"
     */
    [[nodiscard]] auto describe(dicom_tag tag) const -> std::string;

    [[nodiscard]] auto size() const noexcept -> size_t { return tag_map_.size(); }

private:
    tag_dictionary();

    std::unordered_map<dicom_tag, tag_info> tag_map_;
};

/**
 * @brief Convenience wrapper over tag_dictionary::instance().vr_of()
 */
[[nodiscard]] auto dictionary_vr(dicom_tag tag) -> std::optional<encoding::vr_type>;

}  // namespace dcmwire::core
