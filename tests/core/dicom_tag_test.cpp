/**
 * @file dicom_tag_test.cpp
 * @brief Unit tests for dicom_tag
 */

#include <catch2/catch_test_macros.hpp>

#include <dcmwire/core/dicom_tag.hpp>
#include <dcmwire/core/dicom_tag_constants.hpp>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace dcmwire::core;

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("dicom_tag construction", "[dicom_tag][construction]") {
    SECTION("default is (0000,0000)") {
        constexpr dicom_tag tag;
        STATIC_REQUIRE(tag.combined() == 0);
    }

    SECTION("from group and element") {
        constexpr dicom_tag tag{0x7FE0, 0x0010};
        STATIC_REQUIRE(tag.group() == 0x7FE0);
        STATIC_REQUIRE(tag.element() == 0x0010);
        STATIC_REQUIRE(tag.combined() == 0x7FE00010);
    }

    SECTION("from the combined value") {
        const dicom_tag tag{0x00100020u};
        CHECK(tag == tags::patient_id);
    }
}

// ============================================================================
// Text forms
// ============================================================================

TEST_CASE("dicom_tag to_string", "[dicom_tag][string]") {
    CHECK(tags::patient_name.to_string() == "(0010,0010)");
    CHECK(tags::study_instance_uid.to_string() == "(0020,000D)");
    CHECK(dicom_tag{0xFFFE, 0xE0DD}.to_string() == "(FFFE,E0DD)");
    CHECK(dicom_tag{}.to_string() == "(0000,0000)");
}

TEST_CASE("dicom_tag from_string", "[dicom_tag][string]") {
    SECTION("accepted forms") {
        CHECK(dicom_tag::from_string("(0010,0020)") == tags::patient_id);
        CHECK(dicom_tag::from_string("0010,0020") == tags::patient_id);
        CHECK(dicom_tag::from_string("00100020") == tags::patient_id);
        CHECK(dicom_tag::from_string("(7fe0,0010)") == tags::pixel_data);
        CHECK(dicom_tag::from_string("  (0010,0020)\t") == tags::patient_id);
    }

    SECTION("rejected forms") {
        const std::vector<std::string_view> invalid{
            "", "   ", "(GGGG,0010)", "(0010,002)", "0010002", "(00100020)",
            "(0010,0020", "0010,0020)", "0010-0020", "PatientName"};
        for (auto text : invalid) {
            INFO("input: '" << text << "'");
            CHECK_FALSE(dicom_tag::from_string(text).has_value());
        }
    }

    SECTION("round trip") {
        for (auto tag : {tags::sop_class_uid, tags::pixel_data, dicom_tag{0xABCD, 0xEF01}}) {
            CHECK(dicom_tag::from_string(tag.to_string()) == tag);
        }
    }
}

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("dicom_tag private tags", "[dicom_tag][private]") {
    CHECK_FALSE(tags::patient_name.is_private());
    CHECK_FALSE(dicom_tag(0x0001, 0x0010).is_private());
    CHECK_FALSE(dicom_tag(0x0007, 0x0010).is_private());
    CHECK(dicom_tag(0x0009, 0x0010).is_private());
    CHECK(dicom_tag(0x0029, 0x1001).is_private());

    SECTION("private creators") {
        CHECK(dicom_tag(0x0009, 0x0010).is_private_creator());
        CHECK(dicom_tag(0x0009, 0x00FF).is_private_creator());
        CHECK_FALSE(dicom_tag(0x0009, 0x000F).is_private_creator());
        CHECK_FALSE(dicom_tag(0x0009, 0x1010).is_private_creator());
        CHECK_FALSE(dicom_tag(0x0010, 0x0010).is_private_creator());
    }
}

TEST_CASE("dicom_tag group length", "[dicom_tag]") {
    CHECK(tags::file_meta_information_group_length.is_group_length());
    CHECK(dicom_tag(0x0008, 0x0000).is_group_length());
    CHECK_FALSE(tags::modality.is_group_length());
}

TEST_CASE("dicom_tag item and delimiter tags", "[dicom_tag]") {
    CHECK(tags::item.is_item());
    CHECK(tags::item_delimitation_item.is_item_delimiter());
    CHECK(tags::sequence_delimitation_item.is_sequence_delimiter());

    CHECK_FALSE(tags::item.is_item_delimiter());
    CHECK_FALSE(tags::item_delimitation_item.is_sequence_delimiter());
    CHECK_FALSE(tags::sequence_delimitation_item.is_item());
    CHECK_FALSE(dicom_tag(0xFFFE, 0xE001).is_item());

    CHECK(dicom_tag(0xFFFE, 0xE001).is_delimitation());
    CHECK_FALSE(tags::pixel_data.is_delimitation());
}

TEST_CASE("dicom_tag file meta group", "[dicom_tag]") {
    CHECK(tags::transfer_syntax_uid.is_file_meta());
    CHECK(tags::file_meta_information_group_length.is_file_meta());
    CHECK_FALSE(tags::sop_class_uid.is_file_meta());
}

// ============================================================================
// Ordering and hashing
// ============================================================================

TEST_CASE("dicom_tag ordering", "[dicom_tag][comparison]") {
    CHECK(tags::modality < tags::patient_name);
    CHECK(dicom_tag(0x0010, 0x0010) < dicom_tag(0x0010, 0x0020));
    CHECK(tags::pixel_data > tags::rows);
    CHECK(tags::item != tags::item_delimitation_item);

    std::vector<dicom_tag> unordered{tags::pixel_data, tags::sop_class_uid, tags::rows,
                                     tags::file_meta_information_version};
    std::sort(unordered.begin(), unordered.end());
    CHECK(unordered.front() == tags::file_meta_information_version);
    CHECK(unordered.back() == tags::pixel_data);
}

TEST_CASE("dicom_tag hashing", "[dicom_tag][hash]") {
    std::unordered_set<dicom_tag> seen;
    seen.insert(tags::patient_name);
    seen.insert(dicom_tag{0x0010, 0x0010});
    seen.insert(tags::patient_id);

    CHECK(seen.size() == 2);
    CHECK(seen.count(dicom_tag::from_string("(0010,0020)").value()) == 1);
}
