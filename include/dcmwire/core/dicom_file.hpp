/**
 * @file dicom_file.hpp
 * @brief DICOM Part 10 file reading and writing
 *
 * A Part 10 file is a 128-byte preamble, the "DICM" prefix, the File Meta
 * Information group (0002) in Explicit VR Little Endian and the dataset
 * encoded with the Transfer Syntax named in the meta information.
 *
 * @see DICOM PS3.10 Section 7 - DICOM File Format
 */

#pragma once

#include "dicom_dataset.hpp"
#include "dicom_tag_constants.hpp"
#include "result.hpp"

#include <dcmwire/encoding/byte_source.hpp>
#include <dcmwire/encoding/read_options.hpp>
#include <dcmwire/encoding/transfer_syntax.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dcmwire::core {

/**
 * @brief Options for reading a Part 10 file
 */
struct file_read_options {
    /// Read data without a preamble and "DICM" prefix from offset 0
    bool force{false};

    /// Stop at the first pixel data element, (7FE0,0008) or later
    bool stop_before_pixels{false};

    /// Options passed to the dataset reader
    encoding::read_options reader;
};

/**
 * @brief A DICOM Part 10 file: preamble, File Meta Information and dataset
 *
 * Files opened from a path, or created from bytes, remember where they
 * came from so that deferred values can be read later with materialize().
 *
 * @example
 * @code
 * file_read_options options;
 * options.reader.defer_size = 1024;
 * auto file = dicom_file::open("image.dcm", options);
 * if (file.is_ok()) {
 *     auto pixels = file.value().materialize(tags::pixel_data);
 * }
 * @endcode
 */
class dicom_file {
public:
    // ========================================================================
    // Reading
    // ========================================================================

    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   const file_read_options& options = {})
        -> dcmwire::Result<dicom_file>;

    /**
     * @brief Read a file from memory; the bytes are copied
     */
    [[nodiscard]] static auto from_bytes(std::span<const uint8_t> data,
                                         const file_read_options& options = {})
        -> dcmwire::Result<dicom_file>;

    /**
     * @brief Read a file from an arbitrary source
     *
     * The source is not retained; deferred values of the result cannot be
     * materialized.
     */
    [[nodiscard]] static auto read(encoding::byte_source& source,
                                   const file_read_options& options = {})
        -> dcmwire::Result<dicom_file>;

    // ========================================================================
    // Creation and Writing
    // ========================================================================

    /**
     * @brief Wrap a dataset with generated File Meta Information
     */
    [[nodiscard]] static auto create(dicom_dataset dataset,
                                     const encoding::transfer_syntax& ts) -> dicom_file;

    /**
     * @brief Encode preamble, prefix, meta information and dataset
     *
     * (0002,0000) is recomputed from the encoded meta information.
     */
    [[nodiscard]] auto to_bytes() const -> dcmwire::Result<std::vector<uint8_t>>;

    [[nodiscard]] auto save(const std::filesystem::path& path) const -> VoidResult;

    // ========================================================================
    // Deferred Values
    // ========================================================================

    /**
     * @brief Read the value of a deferred top-level element
     *
     * Files opened by path are reopened; a warning is emitted if the file
     * was modified since it was read.
     */
    [[nodiscard]] auto materialize(dicom_tag tag) -> VoidResult;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto meta_information() const noexcept -> const dicom_dataset& {
        return meta_info_;
    }
    [[nodiscard]] auto meta_information() noexcept -> dicom_dataset& { return meta_info_; }

    [[nodiscard]] auto dataset() const noexcept -> const dicom_dataset& { return dataset_; }
    [[nodiscard]] auto dataset() noexcept -> dicom_dataset& { return dataset_; }

    /**
     * @brief Transfer Syntax the dataset is encoded with
     *
     * Guessed from the data when the meta information has none.
     */
    [[nodiscard]] auto transfer_syntax() const -> const encoding::transfer_syntax& {
        return transfer_syntax_;
    }

    [[nodiscard]] auto preamble() const noexcept -> const std::optional<std::array<uint8_t, 128>>& {
        return preamble_;
    }

    [[nodiscard]] auto path() const noexcept -> const std::optional<std::filesystem::path>& {
        return path_;
    }

    [[nodiscard]] auto sop_class_uid() const -> std::string;
    [[nodiscard]] auto sop_instance_uid() const -> std::string;

    dicom_file(const dicom_file&) = default;
    dicom_file(dicom_file&&) noexcept = default;
    auto operator=(const dicom_file&) -> dicom_file& = default;
    auto operator=(dicom_file&&) noexcept -> dicom_file& = default;
    ~dicom_file() = default;

private:
    dicom_file(dicom_dataset meta_info, dicom_dataset main_dataset,
               encoding::transfer_syntax ts);

    [[nodiscard]] static auto generate_meta_information(const dicom_dataset& dataset,
                                                        const encoding::transfer_syntax& ts)
        -> dicom_dataset;

    [[nodiscard]] static auto guess_encoding(encoding::byte_source& source)
        -> encoding::transfer_syntax;

    dicom_dataset meta_info_;
    dicom_dataset dataset_;
    encoding::transfer_syntax transfer_syntax_{encoding::transfer_syntax::explicit_vr_little_endian};
    std::optional<std::array<uint8_t, 128>> preamble_;

    std::optional<std::filesystem::path> path_;
    std::optional<std::filesystem::file_time_type> modified_;
    std::shared_ptr<encoding::byte_source> memory_;
    encoding::read_options reader_options_;

    static constexpr std::string_view kImplementationClassUid =
        "2.25.305828488182831875890203105390285383139";
    static constexpr std::string_view kImplementationVersionName = "DCMWIRE_10";
    static constexpr uint8_t kDicmPrefix[4] = {'D', 'I', 'C', 'M'};
    static constexpr size_t kPreambleSize = 128;
};

}  // namespace dcmwire::core
