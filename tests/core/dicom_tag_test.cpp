/**
 * @file dicom_tag_test.cpp
 * @brief Unit tests for dicom_tag class
 */

#include <catch2/catch_test_macros.hpp>

#include <viewer/core/dicom_tag.hpp>
#include <viewer/core/dicom_tag_constants.hpp>

using namespace viewer::core;

TEST_CASE("dicom_tag group and element", "[core][dicom_tag]") {
    constexpr dicom_tag tag{0x7FE0, 0x0010};
    STATIC_REQUIRE(tag.group() == 0x7FE0);
    STATIC_REQUIRE(tag.element() == 0x0010);
    STATIC_REQUIRE(tag == tags::pixel_data);
}

TEST_CASE("dicom_tag to_string", "[core][dicom_tag]") {
    CHECK(tags::rows.to_string() == "(0028,0010)");
    CHECK(tags::pixel_data.to_string() == "(7FE0,0010)");
    CHECK(dicom_tag{0xABCD, 0x00EF}.to_string() == "(ABCD,00EF)");
}

TEST_CASE("dicom_tag ordering", "[core][dicom_tag]") {
    SECTION("group decides before element") {
        CHECK(tags::transfer_syntax_uid < tags::samples_per_pixel);
        CHECK(tags::voi_lut_sequence < tags::pixel_data);
        CHECK(dicom_tag{0x0028, 0xFFFF} < dicom_tag{0x0029, 0x0000});
    }

    SECTION("element decides within a group") {
        CHECK(tags::rows < tags::columns);
        CHECK(tags::rows != tags::columns);
        CHECK(tags::rows == dicom_tag{0x0028, 0x0010});
    }
}
