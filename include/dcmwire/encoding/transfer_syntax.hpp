/**
 * @file transfer_syntax.hpp
 * @brief Transfer syntaxes dcmwire recognizes and how each one lays out bytes
 *
 * @see DICOM PS3.5 Section 10 - Transfer Syntax
 */

#ifndef DCMWIRE_ENCODING_TRANSFER_SYNTAX_HPP
#define DCMWIRE_ENCODING_TRANSFER_SYNTAX_HPP

#include "dcmwire/encoding/byte_order.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcmwire::encoding {

/// Compression family of the pixel data, or of the whole body for deflate
enum class compression_kind { none, deflate, jpeg, jpeg_ls, jpeg2000, rle };

namespace detail {
struct ts_entry;
}  // namespace detail

/**
 * @brief A transfer syntax UID together with its encoding properties.
 *
 * An unrecognized UID still yields a usable object: is_valid() is false
 * and the properties are those of Explicit VR Little Endian, which the
 * stream reader falls back to.
 */
class transfer_syntax {
public:
    /// Trailing NUL or space padding of a UI value is stripped from @p uid
    explicit transfer_syntax(std::string_view uid);

    [[nodiscard]] std::string_view uid() const noexcept { return uid_; }

    /// "Unknown" for unrecognized UIDs
    [[nodiscard]] std::string_view name() const noexcept;

    [[nodiscard]] byte_order endianness() const noexcept;

    [[nodiscard]] vr_encoding encoding() const noexcept;

    [[nodiscard]] compression_kind compression() const noexcept;

    [[nodiscard]] bool is_implicit_vr() const noexcept {
        return encoding() == vr_encoding::implicit;
    }

    [[nodiscard]] bool is_little_endian() const noexcept {
        return endianness() == byte_order::little_endian;
    }

    /// Pixel data stored as an item sequence of fragments
    [[nodiscard]] bool is_encapsulated() const noexcept;

    /// Everything after the file meta group is zlib deflated
    [[nodiscard]] bool is_deflated() const noexcept {
        return compression() == compression_kind::deflate;
    }

    /// Decoded pixels may differ from the originally encoded ones
    [[nodiscard]] bool is_lossy() const noexcept;

    [[nodiscard]] bool is_valid() const noexcept;

    /// Recognized and readable; only the deflated syntax is not
    [[nodiscard]] bool is_supported() const noexcept;

    static const transfer_syntax implicit_vr_little_endian;
    static const transfer_syntax explicit_vr_little_endian;
    static const transfer_syntax explicit_vr_big_endian;
    static const transfer_syntax deflated_explicit_vr_le;
    static const transfer_syntax jpeg_baseline;
    static const transfer_syntax jpeg_extended;
    static const transfer_syntax jpeg_lossless_sv1;
    static const transfer_syntax jpeg_ls_lossless;
    static const transfer_syntax jpeg_ls_near_lossless;
    static const transfer_syntax jpeg2000_lossless;
    static const transfer_syntax jpeg2000_lossy;
    static const transfer_syntax rle_lossless;

    bool operator==(const transfer_syntax& other) const noexcept { return uid_ == other.uid_; }
    bool operator!=(const transfer_syntax& other) const noexcept { return uid_ != other.uid_; }

private:
    std::string uid_;
    const detail::ts_entry* entry_;
};

/// Recognized syntax for @p uid, padding ignored; nullopt otherwise
[[nodiscard]] std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid);

/// Every recognized syntax, in registry order
[[nodiscard]] std::vector<transfer_syntax> all_transfer_syntaxes();

}  // namespace dcmwire::encoding

#endif  // DCMWIRE_ENCODING_TRANSFER_SYNTAX_HPP
