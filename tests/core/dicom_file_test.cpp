/**
 * @file dicom_file_test.cpp
 * @brief Unit tests for Part 10 file reading and writing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <dcmwire/core/dicom_file.hpp>

#include "fixtures/stream_builder.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace dcmwire;
using namespace dcmwire::core;
using namespace dcmwire::encoding;
using dcmwire::testing::stream_builder;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr std::string_view ct_image_storage = "1.2.840.10008.5.1.4.1.1.2";

dicom_dataset sample_dataset() {
    dicom_dataset dataset;
    dataset.set_string(tags::sop_class_uid, vr_type::UI, ct_image_storage);
    dataset.set_string(tags::sop_instance_uid, vr_type::UI, "1.2.3.4.5");
    dataset.set_string(tags::patient_name, vr_type::PN, "DOE^JOHN");
    dataset.set_numeric<uint16_t>(tags::rows, vr_type::US, 2);
    dataset.set_numeric<uint16_t>(tags::columns, vr_type::US, 2);

    dicom_element pixels{tags::pixel_data, vr_type::OW};
    pixels.set_value(std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8});
    dataset.insert(std::move(pixels));
    return dataset;
}

std::vector<uint8_t> sample_file(const transfer_syntax& ts) {
    auto bytes = dicom_file::create(sample_dataset(), ts).to_bytes();
    REQUIRE(bytes.is_ok());
    return bytes.value();
}

class temp_path {
public:
    explicit temp_path(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {}
    ~temp_path() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    temp_path(const temp_path&) = delete;
    temp_path& operator=(const temp_path&) = delete;

    [[nodiscard]] auto get() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

// ============================================================================
// Creation and Writing
// ============================================================================

TEST_CASE("dicom_file create", "[dicom_file][create]") {
    auto file = dicom_file::create(sample_dataset(), transfer_syntax::explicit_vr_little_endian);

    const auto& meta = file.meta_information();
    CHECK(meta.get_string(tags::transfer_syntax_uid) == "1.2.840.10008.1.2.1");
    CHECK(meta.get_string(tags::media_storage_sop_class_uid) == ct_image_storage);
    CHECK(meta.get_string(tags::media_storage_sop_instance_uid) == "1.2.3.4.5");
    CHECK(meta.contains(tags::file_meta_information_version));
    CHECK_FALSE(meta.get_string(tags::implementation_class_uid).empty());

    CHECK(file.sop_class_uid() == ct_image_storage);
    CHECK(file.sop_instance_uid() == "1.2.3.4.5");
    CHECK(file.transfer_syntax() == transfer_syntax::explicit_vr_little_endian);
    CHECK_FALSE(file.preamble().has_value());
    CHECK_FALSE(file.path().has_value());
}

TEST_CASE("dicom_file to_bytes layout", "[dicom_file][write]") {
    const auto bytes = sample_file(transfer_syntax::explicit_vr_little_endian);

    REQUIRE(bytes.size() > 144);
    CHECK(std::all_of(bytes.begin(), bytes.begin() + 128, [](uint8_t b) { return b == 0; }));
    CHECK(std::string(bytes.begin() + 128, bytes.begin() + 132) == "DICM");

    // (0002,0000) UL 4 is the first element after the prefix
    stream_builder group_length;
    group_length.explicit_header(tags::file_meta_information_group_length, "UL", 4);
    CHECK(std::equal(group_length.bytes().begin(), group_length.bytes().end(),
                     bytes.begin() + 132));

    const auto declared = read_u32(bytes.data() + 140, byte_order::little_endian);
    const auto dataset_start = 144 + declared;
    REQUIRE(dataset_start < bytes.size());
    CHECK(read_u16(bytes.data() + dataset_start, byte_order::little_endian) == 0x0008);
}

// ============================================================================
// Reading
// ============================================================================

TEST_CASE("dicom_file from_bytes", "[dicom_file][read]") {
    SECTION("explicit VR little endian") {
        const auto bytes = sample_file(transfer_syntax::explicit_vr_little_endian);
        auto file = dicom_file::from_bytes(bytes);
        REQUIRE(file.is_ok());

        const auto& dataset = file.value().dataset();
        CHECK(file.value().preamble().has_value());
        CHECK(file.value().transfer_syntax() == transfer_syntax::explicit_vr_little_endian);
        CHECK(file.value().meta_information().contains(tags::file_meta_information_group_length));
        CHECK_FALSE(dataset.contains(tags::transfer_syntax_uid));
        CHECK(dataset.get_string(tags::patient_name) == "DOE^JOHN");
        CHECK(dataset.get_numeric<uint16_t>(tags::rows) == uint16_t{2});
        CHECK(dataset.get(tags::pixel_data)->length() == 8);
    }

    SECTION("implicit VR little endian") {
        const auto bytes = sample_file(transfer_syntax::implicit_vr_little_endian);
        auto file = dicom_file::from_bytes(bytes);
        REQUIRE(file.is_ok());
        CHECK(file.value().dataset().encoding().is_implicit_vr);
        CHECK(file.value().dataset().get(tags::patient_name)->vr() == vr_type::PN);
    }

    SECTION("explicit VR big endian") {
        const auto bytes = sample_file(transfer_syntax::explicit_vr_big_endian);
        auto file = dicom_file::from_bytes(bytes);
        REQUIRE(file.is_ok());
        CHECK(file.value().dataset().encoding().endianness == byte_order::big_endian);
        CHECK(file.value().dataset().get_string(tags::patient_name) == "DOE^JOHN");
    }

    SECTION("stop before pixels") {
        const auto bytes = sample_file(transfer_syntax::explicit_vr_little_endian);
        file_read_options options;
        options.stop_before_pixels = true;
        auto file = dicom_file::from_bytes(bytes, options);
        REQUIRE(file.is_ok());
        CHECK_FALSE(file.value().dataset().contains(tags::pixel_data));
        CHECK(file.value().dataset().contains(tags::rows));
    }

    SECTION("the deflated syntax is not supported") {
        const auto bytes = sample_file(transfer_syntax::deflated_explicit_vr_le);
        auto file = dicom_file::from_bytes(bytes);
        REQUIRE(file.is_err());
        CHECK(file.error().code == error_codes::unsupported_transfer_syntax);
    }
}

TEST_CASE("dicom_file without a header", "[dicom_file][read]") {
    stream_builder raw;
    raw.implicit_string(tags::modality, "CT")
        .implicit_string(tags::patient_name, "DOE^JOHN");

    SECTION("the prefix is required by default") {
        auto file = dicom_file::from_bytes(raw.bytes());
        REQUIRE(file.is_err());
        CHECK(file.error().code == error_codes::missing_dicm_prefix);
        CHECK_THAT(file.error().message, ContainsSubstring("'DICM' prefix"));
    }

    SECTION("force reads the data as a dataset") {
        file_read_options options;
        options.force = true;
        auto file = dicom_file::from_bytes(raw.bytes(), options);
        REQUIRE(file.is_ok());
        CHECK_FALSE(file.value().preamble().has_value());
        CHECK(file.value().meta_information().empty());
        CHECK(file.value().transfer_syntax() == transfer_syntax::implicit_vr_little_endian);
        CHECK(file.value().dataset().get_string(tags::modality) == "CT");
        CHECK(file.value().dataset().get_string(tags::patient_name) == "DOE^JOHN");
    }

    SECTION("force guesses explicit VR") {
        stream_builder explicit_raw;
        explicit_raw.explicit_string(tags::modality, "CS", "MR");
        file_read_options options;
        options.force = true;
        auto file = dicom_file::from_bytes(explicit_raw.bytes(), options);
        REQUIRE(file.is_ok());
        CHECK(file.value().transfer_syntax() == transfer_syntax::explicit_vr_little_endian);
        CHECK(file.value().dataset().get_string(tags::modality) == "MR");
    }
}

// ============================================================================
// Deferred Values
// ============================================================================

TEST_CASE("dicom_file deferred values", "[dicom_file][deferred]") {
    const auto bytes = sample_file(transfer_syntax::explicit_vr_little_endian);
    file_read_options options;
    options.reader.defer_size = 4;

    SECTION("large values are read on demand") {
        auto file = dicom_file::from_bytes(bytes, options);
        REQUIRE(file.is_ok());

        const auto* pixels = file.value().dataset().get(tags::pixel_data);
        REQUIRE(pixels != nullptr);
        CHECK(pixels->is_deferred());
        CHECK(pixels->length() == 8);

        REQUIRE(file.value().materialize(tags::pixel_data).is_ok());
        pixels = file.value().dataset().get(tags::pixel_data);
        CHECK_FALSE(pixels->is_deferred());
        CHECK(pixels->raw_data()[7] == 8);

        // Already loaded
        CHECK(file.value().materialize(tags::pixel_data).is_ok());
    }

    SECTION("missing elements") {
        auto file = dicom_file::from_bytes(bytes, options);
        REQUIRE(file.is_ok());
        auto result = file.value().materialize(tags::patient_id);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::element_not_found);
    }

    SECTION("files read from a caller source cannot materialize") {
        memory_source source{std::span<const uint8_t>{bytes}};
        auto file = dicom_file::read(source, options);
        REQUIRE(file.is_ok());
        auto result = file.value().materialize(tags::pixel_data);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::deferred_read_error);
    }

    SECTION("deferred values cannot be written") {
        auto file = dicom_file::from_bytes(bytes, options);
        REQUIRE(file.is_ok());
        CHECK(file.value().to_bytes().is_err());
    }
}

// ============================================================================
// Files on Disk
// ============================================================================

TEST_CASE("dicom_file save and open", "[dicom_file][io]") {
    temp_path path{"dcmwire_dicom_file_test.dcm"};
    auto created = dicom_file::create(sample_dataset(), transfer_syntax::explicit_vr_little_endian);
    REQUIRE(created.save(path.get()).is_ok());

    SECTION("reopened contents") {
        auto file = dicom_file::open(path.get());
        REQUIRE(file.is_ok());
        CHECK(file.value().path() == path.get());
        CHECK(file.value().sop_instance_uid() == "1.2.3.4.5");
        CHECK(file.value().dataset().get_string(tags::patient_name) == "DOE^JOHN");
    }

    SECTION("deferred values are read from the file") {
        file_read_options options;
        options.reader.defer_size = 4;
        auto file = dicom_file::open(path.get(), options);
        REQUIRE(file.is_ok());
        REQUIRE(file.value().materialize(tags::pixel_data).is_ok());
        CHECK(file.value().dataset().get(tags::pixel_data)->raw_data()[0] == 1);
    }

    SECTION("missing files") {
        auto file = dicom_file::open(path.get().string() + ".missing");
        REQUIRE(file.is_err());
        CHECK(file.error().code == error_codes::file_not_found);
    }
}
