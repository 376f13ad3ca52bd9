/**
 * @file dicom_dataset_test.cpp
 * @brief Unit tests for dicom_dataset
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmwire/core/dicom_dataset.hpp>
#include <dcmwire/core/dicom_tag_constants.hpp>

#include <vector>

using namespace dcmwire::core;
using namespace dcmwire::encoding;

TEST_CASE("dicom_dataset starts empty", "[dicom_dataset]") {
    dicom_dataset dataset;
    CHECK(dataset.empty());
    CHECK(dataset.size() == 0);
    CHECK(dataset.get(tags::patient_name) == nullptr);
    CHECK_FALSE(dataset.contains(tags::patient_name));
    CHECK_FALSE(dataset.encoding().is_implicit_vr);
    CHECK(dataset.encoding().endianness == byte_order::little_endian);
}

TEST_CASE("dicom_dataset insertion", "[dicom_dataset]") {
    dicom_dataset dataset;

    SECTION("insert reports replacement") {
        CHECK_FALSE(dataset.insert(dicom_element::from_string(tags::modality, vr_type::CS, "CT")));
        CHECK(dataset.insert(dicom_element::from_string(tags::modality, vr_type::CS, "MR")));
        CHECK(dataset.size() == 1);
        CHECK(dataset.get_string(tags::modality) == "MR");
    }

    SECTION("elements iterate in tag order") {
        dataset.set_string(tags::patient_id, vr_type::LO, "ID");
        dataset.set_string(tags::modality, vr_type::CS, "CT");
        dataset.set_numeric<uint16_t>(tags::rows, vr_type::US, 64);
        dataset.set_string(tags::patient_name, vr_type::PN, "DOE");

        std::vector<dicom_tag> order;
        for (const auto& [tag, element] : dataset) {
            CHECK(element.tag() == tag);
            order.push_back(tag);
        }
        CHECK(order == std::vector<dicom_tag>{tags::modality, tags::patient_name,
                                              tags::patient_id, tags::rows});
    }

    SECTION("elements are modifiable in place") {
        dataset.set_string(tags::patient_id, vr_type::LO, "OLD");
        dataset.get(tags::patient_id)->set_string("NEW");
        CHECK(dataset.get_string(tags::patient_id) == "NEW");
    }
}

TEST_CASE("dicom_dataset value access", "[dicom_dataset]") {
    dicom_dataset dataset;
    dataset.set_string(tags::patient_name, vr_type::PN, "DOE^JANE");
    dataset.set_numeric<uint16_t>(tags::columns, vr_type::US, 0x0102);

    SECTION("strings") {
        CHECK(dataset.get_string(tags::patient_name) == "DOE^JANE");
        CHECK(dataset.get_string(tags::patient_id).empty());
        CHECK(dataset.get_string(tags::patient_id, "UNKNOWN") == "UNKNOWN");
    }

    SECTION("numbers") {
        CHECK(dataset.get_numeric<uint16_t>(tags::columns) == uint16_t{0x0102});
        CHECK_FALSE(dataset.get_numeric<uint16_t>(tags::rows).has_value());
        CHECK_FALSE(dataset.get_numeric<uint32_t>(tags::columns).has_value());
    }

    SECTION("sequences have no string value") {
        dataset.insert(dicom_element{tags::referenced_image_sequence, vr_type::SQ});
        CHECK(dataset.get_string(tags::referenced_image_sequence, "none") == "none");
    }
}

TEST_CASE("dicom_dataset byte order", "[dicom_dataset][encoding]") {
    dicom_dataset dataset;
    dataset_encoding encoding;
    encoding.endianness = byte_order::big_endian;
    dataset.set_encoding(encoding);

    dataset.set_numeric<uint16_t>(tags::rows, vr_type::US, 0x0102);
    CHECK(dataset.get(tags::rows)->raw_data()[0] == 0x01);
    CHECK(dataset.get_numeric<uint16_t>(tags::rows) == uint16_t{0x0102});

    SECTION("values are not converted when the encoding changes") {
        dataset.set_encoding(dataset_encoding{});
        CHECK(dataset.get_numeric<uint16_t>(tags::rows) == uint16_t{0x0201});
    }
}

TEST_CASE("dicom_dataset removal", "[dicom_dataset]") {
    dicom_dataset dataset;
    dataset.set_string(tags::patient_name, vr_type::PN, "DOE");
    dataset.set_string(tags::patient_id, vr_type::LO, "1");

    CHECK(dataset.remove(tags::patient_name));
    CHECK_FALSE(dataset.remove(tags::patient_name));
    CHECK(dataset.size() == 1);

    dataset.clear();
    CHECK(dataset.empty());
}

TEST_CASE("dicom_dataset copies are independent", "[dicom_dataset]") {
    dicom_dataset original;
    original.set_string(tags::patient_name, vr_type::PN, "ORIGINAL");

    auto copy = original;
    copy.set_string(tags::patient_name, vr_type::PN, "COPY");

    CHECK(original.get_string(tags::patient_name) == "ORIGINAL");
    CHECK(copy.get_string(tags::patient_name) == "COPY");

    auto moved = std::move(copy);
    CHECK(moved.get_string(tags::patient_name) == "COPY");
}
