/**
 * @file vr_type.hpp
 * @brief DICOM Value Representation (VR) enumeration
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */

#ifndef DCMWIRE_ENCODING_VR_TYPE_HPP
#define DCMWIRE_ENCODING_VR_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dcmwire::encoding {

/**
 * @brief DICOM Value Representation (VR) types.
 *
 * Each VR is encoded as two ASCII characters (e.g., "PN" for Person Name).
 * The enum values are the uint16_t representation of these two ASCII
 * characters, first character in the high byte. A two-letter code read
 * from a stream that is not one of the enumerators is still representable
 * (see vr_from_bytes()) and reported by is_known_vr() as unknown.
 */
enum class vr_type : uint16_t {
    // String VRs
    AE = 0x4145,  ///< Application Entity
    AS = 0x4153,  ///< Age String
    CS = 0x4353,  ///< Code String
    DA = 0x4441,  ///< Date
    DS = 0x4453,  ///< Decimal String
    DT = 0x4454,  ///< Date Time
    IS = 0x4953,  ///< Integer String
    LO = 0x4C4F,  ///< Long String
    LT = 0x4C54,  ///< Long Text
    PN = 0x504E,  ///< Person Name
    SH = 0x5348,  ///< Short String
    ST = 0x5354,  ///< Short Text
    TM = 0x544D,  ///< Time
    UC = 0x5543,  ///< Unlimited Characters
    UI = 0x5549,  ///< Unique Identifier
    UR = 0x5552,  ///< Universal Resource Identifier
    UT = 0x5554,  ///< Unlimited Text

    // Numeric VRs (binary encoded)
    FL = 0x464C,  ///< Floating Point Single
    FD = 0x4644,  ///< Floating Point Double
    SL = 0x534C,  ///< Signed Long
    SS = 0x5353,  ///< Signed Short
    UL = 0x554C,  ///< Unsigned Long
    US = 0x5553,  ///< Unsigned Short

    // Binary VRs (raw bytes)
    OB = 0x4F42,  ///< Other Byte
    OD = 0x4F44,  ///< Other Double
    OF = 0x4F46,  ///< Other Float
    OL = 0x4F4C,  ///< Other Long
    OV = 0x4F56,  ///< Other 64-bit Very Long
    OW = 0x4F57,  ///< Other Word
    UN = 0x554E,  ///< Unknown

    // Special VRs
    AT = 0x4154,  ///< Attribute Tag
    SQ = 0x5351,  ///< Sequence of Items
    SV = 0x5356,  ///< Signed 64-bit Very Long
    UV = 0x5556,  ///< Unsigned 64-bit Very Long
};

/// @name Conversion Functions
/// @{

/**
 * @brief Checks whether a vr_type value is one of the standard VRs.
 */
[[nodiscard]] constexpr bool is_known_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::AT:
        case vr_type::CS: case vr_type::DA: case vr_type::DS:
        case vr_type::DT: case vr_type::FD: case vr_type::FL:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::PN: case vr_type::SH: case vr_type::SL:
        case vr_type::SQ: case vr_type::SS: case vr_type::ST:
        case vr_type::SV: case vr_type::TM: case vr_type::UC:
        case vr_type::UI: case vr_type::UL: case vr_type::UN:
        case vr_type::UR: case vr_type::US: case vr_type::UT:
        case vr_type::UV:
            return true;
    }
    return false;
}

/**
 * @brief Checks if two bytes look like an explicit VR code.
 *
 * Both bytes must be uppercase ASCII letters. Anything else means the
 * header bytes belong to an implicit VR element.
 */
[[nodiscard]] constexpr bool is_valid_vr_code(uint8_t first, uint8_t second) noexcept {
    return first >= 'A' && first <= 'Z' && second >= 'A' && second <= 'Z';
}

/**
 * @brief Builds a vr_type from the two VR bytes of an explicit header.
 *
 * The result is not necessarily a known VR.
 */
[[nodiscard]] constexpr vr_type vr_from_bytes(uint8_t first, uint8_t second) noexcept {
    return static_cast<vr_type>(static_cast<uint16_t>((first << 8) | second));
}

/**
 * @brief Converts a vr_type to its two-character string representation.
 *
 * Returns "??" for codes that are not standard VRs; use vr_code() to get
 * the raw characters of such a code.
 */
[[nodiscard]] constexpr std::string_view to_string(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: return "AE";
        case vr_type::AS: return "AS";
        case vr_type::CS: return "CS";
        case vr_type::DA: return "DA";
        case vr_type::DS: return "DS";
        case vr_type::DT: return "DT";
        case vr_type::IS: return "IS";
        case vr_type::LO: return "LO";
        case vr_type::LT: return "LT";
        case vr_type::PN: return "PN";
        case vr_type::SH: return "SH";
        case vr_type::ST: return "ST";
        case vr_type::TM: return "TM";
        case vr_type::UC: return "UC";
        case vr_type::UI: return "UI";
        case vr_type::UR: return "UR";
        case vr_type::UT: return "UT";
        case vr_type::FL: return "FL";
        case vr_type::FD: return "FD";
        case vr_type::SL: return "SL";
        case vr_type::SS: return "SS";
        case vr_type::UL: return "UL";
        case vr_type::US: return "US";
        case vr_type::OB: return "OB";
        case vr_type::OD: return "OD";
        case vr_type::OF: return "OF";
        case vr_type::OL: return "OL";
        case vr_type::OV: return "OV";
        case vr_type::OW: return "OW";
        case vr_type::UN: return "UN";
        case vr_type::AT: return "AT";
        case vr_type::SQ: return "SQ";
        case vr_type::SV: return "SV";
        case vr_type::UV: return "UV";
    }
    return "??";
}

/**
 * @brief Returns the two raw characters of any VR code, known or not.
 */
[[nodiscard]] inline std::string vr_code(vr_type vr) {
    const auto code = static_cast<uint16_t>(vr);
    return std::string{static_cast<char>(code >> 8), static_cast<char>(code & 0xFF)};
}

/**
 * @brief Parses a two-character string to a standard vr_type.
 * @return The corresponding vr_type, or std::nullopt if not recognized
 */
[[nodiscard]] constexpr std::optional<vr_type> from_string(std::string_view str) noexcept {
    if (str.size() != 2) {
        return std::nullopt;
    }
    const auto vr = vr_from_bytes(static_cast<uint8_t>(str[0]), static_cast<uint8_t>(str[1]));
    if (!is_known_vr(vr)) {
        return std::nullopt;
    }
    return vr;
}

/// @}

/// @name VR Category Classification Functions
/// @{

/**
 * @brief Checks if a VR is a string type (space or null padded).
 */
[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::CS:
        case vr_type::DA: case vr_type::DS: case vr_type::DT:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::PN: case vr_type::SH: case vr_type::ST:
        case vr_type::TM: case vr_type::UC: case vr_type::UI:
        case vr_type::UR: case vr_type::UT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR's text is interpreted through (0008,0005).
 *
 * @see DICOM PS3.5 Section 6.1.2.3 - Encoding of Character Repertoires
 */
[[nodiscard]] constexpr bool is_character_set_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::SH: case vr_type::LO: case vr_type::ST:
        case vr_type::LT: case vr_type::UC: case vr_type::UT:
        case vr_type::PN:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Checks if a VR requires 32-bit length field in Explicit VR encoding.
 *
 * In Explicit VR encoding, these VRs have a 2-byte reserved field followed
 * by a 4-byte length field, instead of a 2-byte length field.
 *
 * @see DICOM PS3.5 Section 7.1.2 - Data Element Structure with Explicit VR
 */
[[nodiscard]] constexpr bool has_explicit_32bit_length(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::SQ: case vr_type::SV: case vr_type::UC:
        case vr_type::UN: case vr_type::UR: case vr_type::UT:
        case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Gets the padding character for a VR.
 *
 * String VRs are padded with space except UI, which is padded with null.
 */
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    if (vr == vr_type::UI) {
        return '\0';
    }
    if (is_string_vr(vr)) {
        return ' ';
    }
    return '\0';
}

/// @}

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_VR_TYPE_HPP
