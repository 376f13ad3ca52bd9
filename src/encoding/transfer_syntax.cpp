#include "dcmwire/encoding/transfer_syntax.hpp"

#include <algorithm>
#include <array>

namespace dcmwire::encoding {

namespace detail {

struct ts_entry {
    std::string_view uid;
    std::string_view name;
    byte_order endian;
    vr_encoding vr;
    compression_kind compression;
    bool lossy;
    bool known;
};

}  // namespace detail

namespace {

using detail::ts_entry;

constexpr auto le = byte_order::little_endian;
constexpr auto explicit_vr = vr_encoding::explicit_vr;

// Encapsulated syntaxes are always explicit VR little endian (PS3.5 A.4)
constexpr std::array<ts_entry, 12> registry{{
    {"1.2.840.10008.1.2", "Implicit VR Little Endian", le, vr_encoding::implicit,
     compression_kind::none, false, true},
    {"1.2.840.10008.1.2.1", "Explicit VR Little Endian", le, explicit_vr,
     compression_kind::none, false, true},
    {"1.2.840.10008.1.2.2", "Explicit VR Big Endian", byte_order::big_endian, explicit_vr,
     compression_kind::none, false, true},
    {"1.2.840.10008.1.2.1.99", "Deflated Explicit VR Little Endian", le, explicit_vr,
     compression_kind::deflate, false, true},
    {"1.2.840.10008.1.2.4.50", "JPEG Baseline (Process 1)", le, explicit_vr,
     compression_kind::jpeg, true, true},
    {"1.2.840.10008.1.2.4.51", "JPEG Extended (Process 2 and 4)", le, explicit_vr,
     compression_kind::jpeg, true, true},
    {"1.2.840.10008.1.2.4.70", "JPEG Lossless, Non-Hierarchical, First-Order Prediction", le,
     explicit_vr, compression_kind::jpeg, false, true},
    {"1.2.840.10008.1.2.4.80", "JPEG-LS Lossless Image Compression", le, explicit_vr,
     compression_kind::jpeg_ls, false, true},
    {"1.2.840.10008.1.2.4.81", "JPEG-LS Lossy (Near-Lossless) Image Compression", le,
     explicit_vr, compression_kind::jpeg_ls, true, true},
    {"1.2.840.10008.1.2.4.90", "JPEG 2000 Image Compression (Lossless Only)", le, explicit_vr,
     compression_kind::jpeg2000, false, true},
    {"1.2.840.10008.1.2.4.91", "JPEG 2000 Image Compression", le, explicit_vr,
     compression_kind::jpeg2000, true, true},
    {"1.2.840.10008.1.2.5", "RLE Lossless", le, explicit_vr, compression_kind::rle, false,
     true},
}};

constexpr ts_entry unknown_entry{"", "Unknown", le, explicit_vr, compression_kind::none,
                                 false, false};

std::string_view strip_padding(std::string_view uid) {
    const auto end = uid.find_last_not_of(std::string_view{"\0 ", 2});
    return end == std::string_view::npos ? std::string_view{} : uid.substr(0, end + 1);
}

const ts_entry* lookup(std::string_view uid) {
    uid = strip_padding(uid);
    const auto it = std::find_if(registry.begin(), registry.end(),
                                 [uid](const ts_entry& e) { return e.uid == uid; });
    return it == registry.end() ? nullptr : &*it;
}

}  // namespace

const transfer_syntax transfer_syntax::implicit_vr_little_endian{"1.2.840.10008.1.2"};
const transfer_syntax transfer_syntax::explicit_vr_little_endian{"1.2.840.10008.1.2.1"};
const transfer_syntax transfer_syntax::explicit_vr_big_endian{"1.2.840.10008.1.2.2"};
const transfer_syntax transfer_syntax::deflated_explicit_vr_le{"1.2.840.10008.1.2.1.99"};
const transfer_syntax transfer_syntax::jpeg_baseline{"1.2.840.10008.1.2.4.50"};
const transfer_syntax transfer_syntax::jpeg_extended{"1.2.840.10008.1.2.4.51"};
const transfer_syntax transfer_syntax::jpeg_lossless_sv1{"1.2.840.10008.1.2.4.70"};
const transfer_syntax transfer_syntax::jpeg_ls_lossless{"1.2.840.10008.1.2.4.80"};
const transfer_syntax transfer_syntax::jpeg_ls_near_lossless{"1.2.840.10008.1.2.4.81"};
const transfer_syntax transfer_syntax::jpeg2000_lossless{"1.2.840.10008.1.2.4.90"};
const transfer_syntax transfer_syntax::jpeg2000_lossy{"1.2.840.10008.1.2.4.91"};
const transfer_syntax transfer_syntax::rle_lossless{"1.2.840.10008.1.2.5"};

transfer_syntax::transfer_syntax(std::string_view uid) : uid_(strip_padding(uid)) {
    const auto* found = lookup(uid_);
    entry_ = found != nullptr ? found : &unknown_entry;
}

std::string_view transfer_syntax::name() const noexcept { return entry_->name; }

byte_order transfer_syntax::endianness() const noexcept { return entry_->endian; }

vr_encoding transfer_syntax::encoding() const noexcept { return entry_->vr; }

compression_kind transfer_syntax::compression() const noexcept { return entry_->compression; }

bool transfer_syntax::is_encapsulated() const noexcept {
    return entry_->compression != compression_kind::none &&
           entry_->compression != compression_kind::deflate;
}

bool transfer_syntax::is_lossy() const noexcept { return entry_->lossy; }

bool transfer_syntax::is_valid() const noexcept { return entry_->known; }

bool transfer_syntax::is_supported() const noexcept {
    return entry_->known && entry_->compression != compression_kind::deflate;
}

std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid) {
    if (lookup(uid) == nullptr) {
        return std::nullopt;
    }
    return transfer_syntax{uid};
}

std::vector<transfer_syntax> all_transfer_syntaxes() {
    std::vector<transfer_syntax> syntaxes;
    syntaxes.reserve(registry.size());
    for (const auto& entry : registry) {
        syntaxes.emplace_back(entry.uid);
    }
    return syntaxes;
}

}  // namespace dcmwire::encoding
