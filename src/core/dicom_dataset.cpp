/**
 * @file dicom_dataset.cpp
 * @brief Implementation of DICOM Dataset
 */

#include <dcmwire/core/dicom_dataset.hpp>

namespace dcmwire::core {

auto dicom_dataset::contains(dicom_tag tag) const noexcept -> bool {
    return elements_.find(tag) != elements_.end();
}

auto dicom_dataset::get(dicom_tag tag) noexcept -> dicom_element* {
    auto it = elements_.find(tag);
    return it != elements_.end() ? &it->second : nullptr;
}

auto dicom_dataset::get(dicom_tag tag) const noexcept -> const dicom_element* {
    auto it = elements_.find(tag);
    return it != elements_.end() ? &it->second : nullptr;
}

auto dicom_dataset::get_string(dicom_tag tag, std::string_view default_value) const
    -> std::string {
    const auto* elem = get(tag);
    if (elem == nullptr) {
        return std::string{default_value};
    }
    auto value = elem->as_string();
    if (value.is_err()) {
        return std::string{default_value};
    }
    return value.value();
}

auto dicom_dataset::insert(dicom_element element) -> bool {
    const auto tag = element.tag();
    auto [it, inserted] = elements_.insert_or_assign(tag, std::move(element));
    return !inserted;
}

void dicom_dataset::set_string(dicom_tag tag, encoding::vr_type vr,
                               std::string_view value) {
    insert(dicom_element::from_string(tag, vr, value));
}

auto dicom_dataset::remove(dicom_tag tag) -> bool {
    return elements_.erase(tag) > 0;
}

void dicom_dataset::clear() noexcept {
    elements_.clear();
}

}  // namespace dcmwire::core
