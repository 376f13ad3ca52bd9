/**
 * @file tag_dictionary_test.cpp
 * @brief Unit tests for tag_dictionary
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmwire/core/dicom_tag_constants.hpp>
#include <dcmwire/core/tag_dictionary.hpp>

using namespace dcmwire::core;
using namespace dcmwire::encoding;

TEST_CASE("tag_dictionary lookup", "[tag_dictionary]") {
    const auto& dict = tag_dictionary::instance();
    CHECK(&dict == &tag_dictionary::instance());
    CHECK(dict.size() > 100);

    SECTION("known attributes") {
        auto info = dict.find(tags::patient_name);
        REQUIRE(info.has_value());
        CHECK(info->tag == tags::patient_name);
        CHECK(info->vr == vr_type::PN);
        CHECK(info->keyword == "PatientName");
        CHECK(info->name == "Patient's Name");

        CHECK(dict.vr_of(tags::rows) == vr_type::US);
        CHECK(dict.vr_of(tags::transfer_syntax_uid) == vr_type::UI);
        CHECK(dict.vr_of(tags::pixel_data) == vr_type::OW);
        CHECK(dict.vr_of(tags::extended_offset_table) == vr_type::OV);
    }

    SECTION("unknown attributes") {
        CHECK_FALSE(dict.find(dicom_tag{0x0011, 0x1234}).has_value());
        CHECK_FALSE(dict.vr_of(dicom_tag{0x0011, 0x1234}).has_value());
    }
}

TEST_CASE("tag_dictionary tag classes", "[tag_dictionary]") {
    const auto& dict = tag_dictionary::instance();

    SECTION("group length is UL") {
        CHECK(dict.vr_of(dicom_tag{0x0008, 0x0000}) == vr_type::UL);
        CHECK(dict.vr_of(dicom_tag{0x0029, 0x0000}) == vr_type::UL);
    }

    SECTION("private creators are LO") {
        CHECK(dict.vr_of(dicom_tag{0x0029, 0x0010}) == vr_type::LO);
        CHECK_FALSE(dict.vr_of(dicom_tag{0x0029, 0x1010}).has_value());
    }

    SECTION("repeating overlay groups") {
        CHECK(dict.vr_of(dicom_tag{0x6000, 0x3000}) == vr_type::OW);
        CHECK(dict.vr_of(dicom_tag{0x6002, 0x3000}) == vr_type::OW);
        CHECK(dict.vr_of(dicom_tag{0x601E, 0x3000}) == vr_type::OW);
        CHECK_FALSE(dict.find(dicom_tag{0x6001, 0x3000}).has_value());
    }

    SECTION("free function") {
        CHECK(dictionary_vr(tags::modality) == vr_type::CS);
    }
}

TEST_CASE("tag_dictionary describe", "[tag_dictionary]") {
    const auto& dict = tag_dictionary::instance();
    CHECK(dict.describe(tags::patient_name) == "(0010,0010) 'Patient's Name'");
    CHECK(dict.describe(tags::rows) == "(0028,0010) 'Rows'");
    CHECK(dict.describe(dicom_tag{0x0011, 0x1234}) == "(0011,1234)");
}
