/**
 * @file dicom_file.cpp
 * @brief Implementation of DICOM Part 10 file handling
 */

#include "dcmwire/core/dicom_file.hpp"

#include <dcmwire/encoding/dataset_reader.hpp>
#include <dcmwire/encoding/dataset_writer.hpp>
#include <dcmwire/integration/logger_adapter.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace dcmwire::core {

using integration::logger_adapter;

namespace {

[[nodiscard]] auto not_group_0002(dicom_tag tag, std::optional<encoding::vr_type> /*vr*/,
                                  uint32_t /*length*/) -> bool {
    return tag.group() != 0x0002;
}

[[nodiscard]] auto at_pixel_data(dicom_tag tag, std::optional<encoding::vr_type> /*vr*/,
                                 uint32_t /*length*/) -> bool {
    return tag == tags::float_pixel_data || tag == tags::double_float_pixel_data ||
           tag == tags::pixel_data;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

dicom_file::dicom_file(dicom_dataset meta_info, dicom_dataset main_dataset,
                       encoding::transfer_syntax ts)
    : meta_info_(std::move(meta_info)),
      dataset_(std::move(main_dataset)),
      transfer_syntax_(std::move(ts)) {}

// ============================================================================
// Reading
// ============================================================================

auto dicom_file::open(const std::filesystem::path& path, const file_read_options& options)
    -> dcmwire::Result<dicom_file> {
    logger_adapter::source_scope scope{path.filename().string()};
    auto source = encoding::file_source::open(path);
    if (source.is_err()) {
        return dcmwire::Result<dicom_file>::err(source.error());
    }

    auto file = read(*source.value(), options);
    if (file.is_err()) {
        return file;
    }

    std::error_code ec;
    auto modified = std::filesystem::last_write_time(path, ec);
    file.value().path_ = path;
    if (!ec) {
        file.value().modified_ = modified;
    }
    return file;
}

auto dicom_file::from_bytes(std::span<const uint8_t> data, const file_read_options& options)
    -> dcmwire::Result<dicom_file> {
    auto source = std::make_shared<encoding::memory_source>(
        std::vector<uint8_t>(data.begin(), data.end()));

    auto file = read(*source, options);
    if (file.is_err()) {
        return file;
    }
    file.value().memory_ = std::move(source);
    return file;
}

auto dicom_file::read(encoding::byte_source& source, const file_read_options& options)
    -> dcmwire::Result<dicom_file> {
    const auto start = source.tell();

    // Preamble and prefix
    std::optional<std::array<uint8_t, 128>> preamble;
    auto header = source.peek(kPreambleSize + 4);
    if (header.size() == kPreambleSize + 4 &&
        std::memcmp(header.data() + kPreambleSize, kDicmPrefix, 4) == 0) {
        std::array<uint8_t, 128> bytes{};
        std::copy_n(header.begin(), kPreambleSize, bytes.begin());
        preamble = bytes;
        source.skip(static_cast<int64_t>(kPreambleSize + 4));
    } else if (!options.force) {
        return dcmwire::dcmwire_error<dicom_file>(
            dcmwire::error_codes::missing_dicm_prefix,
            "File is missing DICOM File Meta Information header or the 'DICM' prefix is "
            "missing from the header. Use force to read the data anyway");
    } else {
        logger_adapter::info(
            "File is not conformant with the DICOM File Format: 'DICM' prefix is missing "
            "from the File Meta Information header or the header itself is missing. "
            "Assuming no header and continuing");
        source.seek(start);
    }

    // File Meta Information
    const auto meta_start = source.tell();
    auto meta = encoding::dataset_reader::read_dataset(
        source, false, encoding::byte_order::little_endian, std::nullopt, options.reader,
        not_group_0002);
    if (meta.is_err()) {
        return dcmwire::Result<dicom_file>::err(meta.error());
    }

    if (auto group_length = meta.value().get_numeric<uint32_t>(tags::file_meta_information_group_length)) {
        const auto actual = source.tell() - (meta_start + 12);
        if (*group_length != actual) {
            logger_adapter::info(
                "(0002,0000) 'File Meta Information Group Length' value doesn't match the "
                "actual File Meta Information length ({} vs {} bytes)",
                *group_length, actual);
        }
    }

    // Dataset encoding
    encoding::transfer_syntax ts{encoding::transfer_syntax::implicit_vr_little_endian};
    const auto uid = meta.value().get_string(tags::transfer_syntax_uid);
    if (uid.empty()) {
        if (!source.at_end()) {
            ts = guess_encoding(source);
        }
        logger_adapter::debug("No Transfer Syntax UID, reading as '{}'", ts.name());
    } else {
        ts = encoding::transfer_syntax{uid};
        if (ts.is_deflated()) {
            return dcmwire::dcmwire_error<dicom_file>(
                dcmwire::error_codes::unsupported_transfer_syntax,
                "Unable to read the dataset as '" + std::string{ts.name()} +
                    "' is not supported");
        }
        if (!ts.is_valid()) {
            logger_adapter::warn("Unknown Transfer Syntax UID '{}', reading as explicit VR "
                                 "little endian",
                                 uid);
        }
    }

    auto dataset = encoding::dataset_reader::read_dataset(
        source, ts.is_implicit_vr(), ts.endianness(), std::nullopt, options.reader,
        options.stop_before_pixels ? encoding::stop_predicate{at_pixel_data}
                                   : encoding::stop_predicate{});
    if (dataset.is_err()) {
        return dcmwire::Result<dicom_file>::err(dataset.error());
    }

    dicom_file file{std::move(meta.value()), std::move(dataset.value()), std::move(ts)};
    file.preamble_ = preamble;
    file.reader_options_ = options.reader;
    return dcmwire::ok(std::move(file));
}

auto dicom_file::guess_encoding(encoding::byte_source& source) -> encoding::transfer_syntax {
    auto peek = source.peek(6);
    if (peek.size() < 6) {
        return encoding::transfer_syntax::implicit_vr_little_endian;
    }

    const auto vr = encoding::vr_from_bytes(peek[4], peek[5]);
    if (!encoding::is_known_vr(vr)) {
        return encoding::transfer_syntax::implicit_vr_little_endian;
    }

    // A big endian group below 0x0100 reads as 0x0100 or more in little endian
    const auto group = encoding::read_u16(peek.data(), encoding::byte_order::little_endian);
    if (group >= 1024) {
        return encoding::transfer_syntax::explicit_vr_big_endian;
    }
    return encoding::transfer_syntax::explicit_vr_little_endian;
}

// ============================================================================
// Creation and Writing
// ============================================================================

auto dicom_file::create(dicom_dataset dataset, const encoding::transfer_syntax& ts)
    -> dicom_file {
    auto meta = generate_meta_information(dataset, ts);

    dataset_encoding encoding;
    encoding.is_implicit_vr = ts.is_implicit_vr();
    encoding.endianness = ts.endianness();
    encoding.character_sets = dataset.encoding().character_sets;
    dataset.set_encoding(std::move(encoding));

    return dicom_file{std::move(meta), std::move(dataset), ts};
}

auto dicom_file::generate_meta_information(const dicom_dataset& dataset,
                                           const encoding::transfer_syntax& ts)
    -> dicom_dataset {
    using encoding::vr_type;

    dicom_dataset meta;
    const uint8_t version[] = {0x00, 0x01};
    meta.insert(dicom_element{tags::file_meta_information_version, vr_type::OB, version});
    meta.set_string(tags::media_storage_sop_class_uid, vr_type::UI,
                    dataset.get_string(tags::sop_class_uid));
    meta.set_string(tags::media_storage_sop_instance_uid, vr_type::UI,
                    dataset.get_string(tags::sop_instance_uid));
    meta.set_string(tags::transfer_syntax_uid, vr_type::UI, ts.uid());
    meta.set_string(tags::implementation_class_uid, vr_type::UI, kImplementationClassUid);
    meta.set_string(tags::implementation_version_name, vr_type::SH, kImplementationVersionName);
    return meta;
}

auto dicom_file::to_bytes() const -> dcmwire::Result<std::vector<uint8_t>> {
    using bytes_result = dcmwire::Result<std::vector<uint8_t>>;

    auto meta = meta_info_;
    meta.remove(tags::file_meta_information_group_length);
    auto meta_bytes =
        encoding::dataset_writer::encode(meta, false, encoding::byte_order::little_endian);
    if (meta_bytes.is_err()) {
        return bytes_result::err(meta_bytes.error());
    }

    auto data_bytes = encoding::dataset_writer::encode(dataset_, transfer_syntax_.is_implicit_vr(),
                                                       transfer_syntax_.endianness());
    if (data_bytes.is_err()) {
        return bytes_result::err(data_bytes.error());
    }

    std::vector<uint8_t> out;
    out.reserve(kPreambleSize + 4 + 12 + meta_bytes.value().size() + data_bytes.value().size());
    if (preamble_) {
        out.insert(out.end(), preamble_->begin(), preamble_->end());
    } else {
        out.resize(kPreambleSize, 0);
    }
    out.insert(out.end(), std::begin(kDicmPrefix), std::end(kDicmPrefix));

    auto group_length = dicom_element::from_numeric<uint32_t>(
        tags::file_meta_information_group_length, encoding::vr_type::UL,
        static_cast<uint32_t>(meta_bytes.value().size()));
    auto written = encoding::dataset_writer::encode_element(
        group_length, false, encoding::byte_order::little_endian, out);
    if (written.is_err()) {
        return bytes_result::err(written.error());
    }

    out.insert(out.end(), meta_bytes.value().begin(), meta_bytes.value().end());
    out.insert(out.end(), data_bytes.value().begin(), data_bytes.value().end());
    return dcmwire::ok(std::move(out));
}

auto dicom_file::save(const std::filesystem::path& path) const -> VoidResult {
    auto bytes = to_bytes();
    if (bytes.is_err()) {
        return VoidResult(bytes.error());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return dcmwire::dcmwire_void_error(dcmwire::error_codes::file_write_error,
                                           "Failed to open file for writing: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.value().data()),
               static_cast<std::streamsize>(bytes.value().size()));
    if (!file) {
        return dcmwire::dcmwire_void_error(dcmwire::error_codes::file_write_error,
                                           "Failed to write file: " + path.string());
    }
    return dcmwire::ok();
}

// ============================================================================
// Deferred Values
// ============================================================================

auto dicom_file::materialize(dicom_tag tag) -> VoidResult {
    const auto* element = dataset_.get(tag);
    if (element == nullptr) {
        return dcmwire::dcmwire_void_error(dcmwire::error_codes::element_not_found,
                                           "No element " + tag.to_string() + " in the dataset");
    }
    if (!element->is_deferred()) {
        return dcmwire::ok();
    }

    std::unique_ptr<encoding::file_source> reopened;
    encoding::byte_source* source = memory_.get();
    if (path_) {
        std::error_code ec;
        auto modified = std::filesystem::last_write_time(*path_, ec);
        if (!ec && modified_ && modified != *modified_) {
            report_warning(reader_options_.on_warning,
                           "Deferred read warning -- file modification time has changed");
        }

        auto opened = encoding::file_source::open(*path_);
        if (opened.is_err()) {
            return VoidResult(opened.error());
        }
        reopened = std::move(opened.value());
        source = reopened.get();
    }

    if (source == nullptr) {
        return dcmwire::dcmwire_void_error(
            dcmwire::error_codes::deferred_read_error,
            "Unable to read the deferred value of " + tag.to_string() +
                " as the source of the dataset is not available");
    }

    auto value = encoding::dataset_reader::read_deferred_element(*source, *element,
                                                                 dataset_.encoding(),
                                                                 reader_options_);
    if (value.is_err()) {
        return VoidResult(value.error());
    }
    dataset_.insert(std::move(value.value()));
    return dcmwire::ok();
}

// ============================================================================
// Convenience Accessors
// ============================================================================

auto dicom_file::sop_class_uid() const -> std::string {
    return meta_info_.get_string(tags::media_storage_sop_class_uid);
}

auto dicom_file::sop_instance_uid() const -> std::string {
    return meta_info_.get_string(tags::media_storage_sop_instance_uid);
}

}  // namespace dcmwire::core
