/**
 * @file dicom_tag.cpp
 * @brief Text conversion of dicom_tag
 */

#include "dcmwire/core/dicom_tag.hpp"

#include "dcmwire/compat/format.hpp"

#include <charconv>

namespace dcmwire::core {

namespace {

auto trim_blanks(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// Exactly four hex digits, no sign or prefix
auto parse_word(std::string_view digits) -> std::optional<uint16_t> {
    if (digits.size() != 4) {
        return std::nullopt;
    }
    uint16_t word = 0;
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, word, 16);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return word;
}

}  // namespace

auto dicom_tag::from_string(std::string_view text) -> std::optional<dicom_tag> {
    text = trim_blanks(text);
    if (text.size() == 11 && text.front() == '(' && text.back() == ')') {
        text = text.substr(1, 9);
    }

    std::string_view group_digits;
    std::string_view element_digits;
    if (text.size() == 9 && text[4] == ',') {
        group_digits = text.substr(0, 4);
        element_digits = text.substr(5);
    } else if (text.size() == 8) {
        group_digits = text.substr(0, 4);
        element_digits = text.substr(4);
    } else {
        return std::nullopt;
    }

    const auto group = parse_word(group_digits);
    const auto element = parse_word(element_digits);
    if (!group || !element) {
        return std::nullopt;
    }
    return dicom_tag{*group, *element};
}

auto dicom_tag::to_string() const -> std::string {
    return dcmwire::compat::format("({:04X},{:04X})", group(), element());
}

}  // namespace dcmwire::core
