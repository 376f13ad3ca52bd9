/**
 * @file tag_dictionary.cpp
 * @brief Implementation of tag_dictionary
 */

#include "dcmwire/core/tag_dictionary.hpp"

namespace dcmwire::core {

// Defined in tag_dictionary_data.cpp
extern auto dictionary_table() -> std::span<const tag_info>;

namespace {

// Overlay (60xx) and curve (50xx) groups repeat in even groups of the range.
auto base_repeating_tag(dicom_tag tag) noexcept -> dicom_tag {
    const auto group = tag.group();
    if ((group & 0xFF00) == 0x6000 || (group & 0xFF00) == 0x5000) {
        if ((group & 1) == 0) {
            return dicom_tag{static_cast<uint16_t>(group & 0xFF00), tag.element()};
        }
    }
    return tag;
}

constexpr tag_info overlay_data{dicom_tag{0x6000, 0x3000}, encoding::vr_type::OW,
                                "OverlayData", "Overlay Data"};

}  // namespace

auto tag_dictionary::instance() -> const tag_dictionary& {
    static const tag_dictionary dictionary;
    return dictionary;
}

tag_dictionary::tag_dictionary() {
    const auto table = dictionary_table();
    tag_map_.reserve(table.size() + 1);
    for (const auto& info : table) {
        tag_map_.emplace(info.tag, info);
    }
    tag_map_.emplace(overlay_data.tag, overlay_data);
}

auto tag_dictionary::find(dicom_tag tag) const -> std::optional<tag_info> {
    auto it = tag_map_.find(tag);
    if (it == tag_map_.end()) {
        it = tag_map_.find(base_repeating_tag(tag));
    }
    if (it == tag_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto tag_dictionary::vr_of(dicom_tag tag) const -> std::optional<encoding::vr_type> {
    if (auto info = find(tag)) {
        return info->vr;
    }
    if (tag.is_group_length()) {
        return encoding::vr_type::UL;
    }
    if (tag.is_private_creator()) {
        return encoding::vr_type::LO;
    }
    return std::nullopt;
}

auto tag_dictionary::describe(dicom_tag tag) const -> std::string {
    auto info = find(tag);
    if (!info) {
        return tag.to_string();
    }
    return tag.to_string() + " '" + std::string{info->name} + "'";
}

auto dictionary_vr(dicom_tag tag) -> std::optional<encoding::vr_type> {
    return tag_dictionary::instance().vr_of(tag);
}

}  // namespace dcmwire::core
