/**
 * @file dicom_element.cpp
 * @brief Value handling of dicom_element
 */

#include <dcmwire/core/dicom_element.hpp>
#include <dcmwire/core/dicom_dataset.hpp>

namespace dcmwire::core {

namespace {

// Values always have even length; odd strings get the VR's pad byte.
auto pad_to_even(std::string_view text, std::optional<encoding::vr_type> vr)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> bytes(text.begin(), text.end());
    if (bytes.size() % 2 != 0) {
        bytes.push_back(static_cast<uint8_t>(
            encoding::padding_char(vr.value_or(encoding::vr_type::UN))));
    }
    return bytes;
}

// Trailing NULs go for every VR, trailing spaces for all but UI.
auto strip_padding(std::string_view text, encoding::vr_type vr) -> std::string_view {
    while (!text.empty() && text.back() == '\0') {
        text.remove_suffix(1);
    }
    if (vr == encoding::vr_type::UI) {
        return text;
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr) noexcept
    : tag_{tag}, vr_{vr} {}

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr,
                             std::span<const uint8_t> data)
    : dicom_element{tag, std::optional<encoding::vr_type>{vr},
                    std::vector<uint8_t>(data.begin(), data.end())} {}

dicom_element::dicom_element(dicom_tag tag, std::optional<encoding::vr_type> vr,
                             std::vector<uint8_t> data)
    : tag_{tag}, vr_{vr} {
    store(std::move(data));
}

dicom_element::dicom_element(const dicom_element&) = default;
dicom_element::dicom_element(dicom_element&&) noexcept = default;
auto dicom_element::operator=(const dicom_element&) -> dicom_element& = default;
auto dicom_element::operator=(dicom_element&&) noexcept -> dicom_element& = default;
dicom_element::~dicom_element() = default;

auto dicom_element::from_string(dicom_tag tag, encoding::vr_type vr,
                                std::string_view value) -> dicom_element {
    dicom_element elem{tag, vr};
    elem.set_string(value);
    return elem;
}

auto dicom_element::deferred(dicom_tag tag, std::optional<encoding::vr_type> vr,
                             uint32_t length, uint64_t value_offset,
                             uint8_t header_length) -> dicom_element {
    dicom_element elem{tag, vr, std::vector<uint8_t>{}};
    elem.set_stream_position(length, value_offset, header_length);
    elem.deferred_ = true;
    return elem;
}

// ============================================================================
// Text values
// ============================================================================

auto dicom_element::as_string() const -> dcmwire::Result<std::string> {
    using R = dcmwire::Result<std::string>;
    if (deferred_) {
        return dcmwire::dcmwire_error<std::string>(
            dcmwire::error_codes::deferred_read_error,
            "Value of " + tag_.to_string() + " has not been read yet");
    }
    if (is_sequence()) {
        return dcmwire::dcmwire_error<std::string>(
            dcmwire::error_codes::value_conversion_error,
            "Sequence " + tag_.to_string() + " has no string value");
    }

    const std::string_view raw{reinterpret_cast<const char*>(data_.data()), data_.size()};
    if (!vr_ || !encoding::is_string_vr(*vr_)) {
        // Binary or unresolved VR: hand back the bytes untouched
        return R::ok(std::string{raw});
    }
    return R::ok(std::string{strip_padding(raw, *vr_)});
}

auto dicom_element::as_string_list() const -> dcmwire::Result<std::vector<std::string>> {
    using R = dcmwire::Result<std::vector<std::string>>;
    auto text = as_string();
    if (text.is_err()) {
        return R::err(text.error());
    }

    std::vector<std::string> values;
    std::string_view rest{text.value()};
    if (rest.empty()) {
        return R::ok(std::move(values));
    }
    for (auto sep = rest.find('\\'); sep != std::string_view::npos; sep = rest.find('\\')) {
        values.emplace_back(rest.substr(0, sep));
        rest.remove_prefix(sep + 1);
    }
    values.emplace_back(rest);
    return R::ok(std::move(values));
}

auto dicom_element::sequence_items() -> std::vector<dicom_dataset>& {
    return sequence_items_;
}

auto dicom_element::sequence_items() const -> const std::vector<dicom_dataset>& {
    return sequence_items_;
}

// ============================================================================
// Assignment
// ============================================================================

void dicom_element::store(std::vector<uint8_t> bytes) noexcept {
    data_ = std::move(bytes);
    declared_length_ = static_cast<uint32_t>(data_.size());
    deferred_ = false;
}

void dicom_element::set_value(std::span<const uint8_t> data) {
    store(std::vector<uint8_t>(data.begin(), data.end()));
}

void dicom_element::set_value(std::vector<uint8_t>&& data) noexcept {
    store(std::move(data));
}

void dicom_element::set_string(std::string_view value) {
    store(pad_to_even(value, vr_));
}

}  // namespace dcmwire::core
