/**
 * @file dataset_reader.cpp
 * @brief Implementation of dataset, sequence and deferred element reading
 */

#include "dcmwire/encoding/dataset_reader.hpp"

#include "dcmwire/compat/format.hpp"
#include "dcmwire/core/tag_dictionary.hpp"
#include "dcmwire/encoding/stream_reader.hpp"
#include "dcmwire/integration/logger_adapter.hpp"

namespace dcmwire::encoding {

using integration::logger_adapter;

namespace {

core::dicom_tag read_tag(const uint8_t* data, byte_order order) noexcept {
    return core::dicom_tag{read_u16(data, order), read_u16(data + 2, order)};
}

}  // namespace

// ============================================================================
// Datasets
// ============================================================================

dcmwire::Result<core::dicom_dataset> dataset_reader::read_dataset(
    byte_source& source,
    bool is_implicit_vr,
    byte_order order,
    std::optional<uint64_t> byte_length,
    const read_options& options,
    const stop_predicate& stop_when,
    const std::vector<std::string>& parent_character_sets,
    bool at_top_level) {
    const auto start = source.tell();

    auto implicit = detect_implicit_vr(source, is_implicit_vr, order, stop_when,
                                       !at_top_level, options);
    if (implicit.is_err()) {
        return dcmwire::Result<core::dicom_dataset>::err(implicit.error());
    }

    const auto& inherited =
        parent_character_sets.empty() ? options.default_character_sets : parent_character_sets;
    stream_reader reader{source, implicit.value(), order, options, stop_when, inherited};

    core::dicom_dataset dataset;
    while (!byte_length || source.tell() - start < *byte_length) {
        auto element = reader.next();
        if (element.is_err()) {
            return dcmwire::Result<core::dicom_dataset>::err(element.error());
        }
        if (!element.value()) {
            break;
        }

        const auto tag = element.value()->tag();
        if (dataset.insert(std::move(*element.value()))) {
            auto policy = core::enforce_policy(
                options.validation, options.on_warning, dcmwire::error_codes::decode_error,
                "Duplicate element " + core::tag_dictionary::instance().describe(tag) +
                    " found, the later value is used");
            if (policy.is_err()) {
                return dcmwire::Result<core::dicom_dataset>::err(policy.error());
            }
        }
    }

    core::dataset_encoding encoding;
    encoding.is_implicit_vr = implicit.value();
    encoding.endianness = order;
    encoding.character_sets = reader.character_sets();
    dataset.set_encoding(std::move(encoding));
    return dcmwire::ok(std::move(dataset));
}

dcmwire::Result<bool> dataset_reader::detect_implicit_vr(byte_source& source,
                                                         bool implicit_vr_is_assumed,
                                                         byte_order order,
                                                         const stop_predicate& stop_when,
                                                         bool is_sequence,
                                                         const read_options& options) {
    // Items do not switch from implicit to explicit
    if (is_sequence && implicit_vr_is_assumed) {
        return dcmwire::ok(true);
    }

    auto header = source.peek(6);
    if (header.size() < 6) {
        return dcmwire::ok(implicit_vr_is_assumed);
    }

    const bool found_implicit = !is_valid_vr_code(header[4], header[5]);
    if (found_implicit == implicit_vr_is_assumed) {
        return dcmwire::ok(found_implicit);
    }

    const auto tag = read_tag(header.data(), order);
    if (stop_when) {
        std::optional<vr_type> vr;
        if (!found_implicit) {
            vr = vr_from_bytes(header[4], header[5]);
        }
        if (stop_when(tag, vr, 0)) {
            return dcmwire::ok(found_implicit);
        }
    }

    // Sequence items may be implicit inside an explicit dataset
    if (found_implicit && is_sequence) {
        return dcmwire::ok(true);
    }

    const std::string found = found_implicit ? "implicit" : "explicit";
    const std::string expected = found_implicit ? "explicit" : "implicit";
    const auto message = "Expected " + expected + " VR, but found " + found + " VR";
    if (options.validation == core::validation_mode::raise) {
        return dcmwire::dcmwire_error<bool>(dcmwire::error_codes::invalid_dicom_file, message);
    }
    if (options.validation == core::validation_mode::warn) {
        core::report_warning(options.on_warning, message + " - using " + found +
                                                     " VR for reading");
    }
    return dcmwire::ok(found_implicit);
}

// ============================================================================
// Sequences
// ============================================================================

dcmwire::Result<std::vector<core::dicom_dataset>> dataset_reader::read_sequence(
    byte_source& source,
    bool is_implicit_vr,
    byte_order order,
    std::optional<uint64_t> byte_length,
    const read_options& options,
    const std::vector<std::string>& character_sets) {
    std::vector<core::dicom_dataset> items;
    if (byte_length && *byte_length == 0) {
        return dcmwire::ok(std::move(items));
    }

    const auto start = source.tell();
    while (!byte_length || source.tell() - start < *byte_length) {
        if (source.at_end()) {
            if (!byte_length) {
                auto policy = core::enforce_policy(
                    options.validation, options.on_warning,
                    dcmwire::error_codes::insufficient_data,
                    "End of data reached before the Sequence Delimitation Item");
                if (policy.is_err()) {
                    return dcmwire::Result<std::vector<core::dicom_dataset>>::err(
                        policy.error());
                }
            }
            break;
        }

        auto item = read_sequence_item(source, is_implicit_vr, order, options, character_sets);
        if (item.is_err()) {
            return dcmwire::Result<std::vector<core::dicom_dataset>>::err(item.error());
        }
        if (!item.value()) {
            break;
        }
        items.push_back(std::move(*item.value()));
    }

    logger_adapter::trace("Read a sequence of {} items", items.size());
    return dcmwire::ok(std::move(items));
}

dcmwire::Result<std::optional<core::dicom_dataset>> dataset_reader::read_sequence_item(
    byte_source& source,
    bool is_implicit_vr,
    byte_order order,
    const read_options& options,
    const std::vector<std::string>& character_sets) {
    using item_result = dcmwire::Result<std::optional<core::dicom_dataset>>;

    const auto item_start = source.tell();
    auto header = source.read_bytes(8);
    if (header.size() < 8) {
        auto policy = core::enforce_policy(
            options.validation, options.on_warning, dcmwire::error_codes::insufficient_data,
            compat::format("No tag to read at position 0x{:X}", item_start));
        if (policy.is_err()) {
            return item_result::err(policy.error());
        }
        return dcmwire::ok(std::optional<core::dicom_dataset>{});
    }

    const auto tag = read_tag(header.data(), order);
    const auto length = read_u32(header.data() + 4, order);

    if (tag.is_sequence_delimiter()) {
        if (length != 0) {
            core::report_warning(
                options.on_warning,
                compat::format("Expected 0x00000000 after delimiter, found 0x{:X}, at "
                               "position 0x{:X}",
                               length, item_start + 4));
        }
        return dcmwire::ok(std::optional<core::dicom_dataset>{});
    }

    if (!tag.is_item()) {
        auto policy = core::enforce_policy(
            options.validation, options.on_warning, dcmwire::error_codes::invalid_sequence,
            compat::format("Expected sequence item with tag (FFFE,E000) at position 0x{:X}, "
                           "found {}",
                           item_start, tag.to_string()));
        if (policy.is_err()) {
            return item_result::err(policy.error());
        }
    }

    const bool undefined = length == core::dicom_element::undefined_length;
    auto dataset = read_dataset(source, is_implicit_vr, order,
                                undefined ? std::nullopt : std::optional<uint64_t>{length},
                                options, {}, character_sets, false);
    if (dataset.is_err()) {
        return item_result::err(dataset.error());
    }

    if (!undefined && source.tell() != item_start + 8 + length) {
        source.seek(item_start + 8 + length);
    }
    return dcmwire::ok(std::optional<core::dicom_dataset>{std::move(dataset.value())});
}

// ============================================================================
// Deferred elements
// ============================================================================

dcmwire::Result<core::dicom_element> dataset_reader::read_deferred_element(
    byte_source& source,
    const core::dicom_element& element,
    const core::dataset_encoding& encoding,
    const read_options& options) {
    if (!element.is_deferred()) {
        return dcmwire::ok(element);
    }

    read_options reread = options;
    reread.defer_size.reset();

    source.seek(element.value_offset() - element.header_length());
    stream_reader reader{source, encoding.is_implicit_vr, encoding.endianness, reread, {},
                         encoding.character_sets};
    auto result = reader.next();
    if (result.is_err()) {
        return dcmwire::Result<core::dicom_element>::err(result.error());
    }
    if (!result.value()) {
        return dcmwire::dcmwire_error<core::dicom_element>(
            dcmwire::error_codes::deferred_read_error,
            "Unable to read the deferred value of " + element.tag().to_string() +
                compat::format(" at position 0x{:X}", element.value_offset()));
    }

    auto reread_element = std::move(*result.value());
    if (reread_element.tag() != element.tag()) {
        return dcmwire::dcmwire_error<core::dicom_element>(
            dcmwire::error_codes::deferred_read_error,
            "Deferred read tag " + reread_element.tag().to_string() +
                " does not match original " + element.tag().to_string());
    }
    if (element.has_vr() && reread_element.has_vr() &&
        reread_element.vr() != element.vr()) {
        return dcmwire::dcmwire_error<core::dicom_element>(
            dcmwire::error_codes::vr_mismatch,
            "Deferred read VR '" + vr_code(reread_element.vr()) +
                "' does not match original '" + vr_code(element.vr()) + "'");
    }
    return dcmwire::ok(std::move(reread_element));
}

}  // namespace dcmwire::encoding
