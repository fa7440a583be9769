/**
 * @file image_metadata_test.cpp
 * @brief Unit tests for Image Pixel attribute extraction
 */

#include <catch2/catch_test_macros.hpp>

#include "fixtures/image_dataset.hpp"

#include <viewer/imaging/image_metadata.hpp>

#include <vector>

using namespace viewer::imaging;
using viewer::core::dicom_dataset;
using viewer::encoding::vr_type;
namespace tags = viewer::core::tags;
namespace codes = viewer::error_codes;

namespace {

dicom_dataset make_valid_dataset() {
    return viewer::test::make_grayscale_dataset(2, 2, 8, {1, 2, 3, 4});
}

int error_code_of(const dicom_dataset& ds) {
    auto result = extract_image_metadata(ds);
    REQUIRE(result.is_err());
    return result.error().code;
}

}  // namespace

// ============================================================================
// Successful Extraction
// ============================================================================

TEST_CASE("extract_image_metadata reads all attributes", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    auto result = extract_image_metadata(ds);
    REQUIRE(result.is_ok());
    const auto& meta = result.value();

    CHECK(meta.syntax == viewer::encoding::transfer_syntax::uncompressed_little_endian);
    CHECK(meta.traits.scheme == viewer::encoding::compression::none);
    CHECK(meta.rows == 2);
    CHECK(meta.columns == 2);
    CHECK(meta.pixel_count() == 4);
    CHECK(meta.samples_per_pixel == 1);
    CHECK(meta.photometric == photometric_interpretation::monochrome2);
    CHECK(meta.planar == planar_configuration::interlaced);
    CHECK(meta.bits_allocated == 8);
    CHECK(meta.bits_stored == 8);
    CHECK(meta.high_bit == 7);
    CHECK(meta.representation == pixel_representation::unsigned_integer);
    CHECK(meta.pixel_vr == pixel_data_vr::ob);
    CHECK(meta.pixel_data == std::vector<uint8_t>{1, 2, 3, 4});
    CHECK_FALSE(meta.windowing.has_value());
}

TEST_CASE("extract_image_metadata defaults and variants", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    SECTION("missing transfer syntax defaults to uncompressed little endian") {
        ds.remove(tags::transfer_syntax_uid);

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_ok());
        CHECK(result.value().syntax ==
              viewer::encoding::transfer_syntax::uncompressed_little_endian);
    }

    SECTION("big endian syntax") {
        ds.set_string(tags::transfer_syntax_uid, vr_type::UI, viewer::test::explicit_be_uid);

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_ok());
        CHECK(result.value().traits.endianness == viewer::encoding::byte_order::big_endian);
    }

    SECTION("separated planar configuration") {
        ds.set_uint16(tags::planar_configuration, vr_type::US, 1);

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_ok());
        CHECK(result.value().planar == planar_configuration::separated);
    }

    SECTION("UN pixel data is read as OB") {
        ds.set_bytes(tags::pixel_data, vr_type::UN, std::vector<uint8_t>{1, 2, 3, 4});

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_ok());
        CHECK(result.value().pixel_vr == pixel_data_vr::ob);
    }

    SECTION("OW pixel data") {
        ds.set_bytes(tags::pixel_data, vr_type::OW, std::vector<uint8_t>{1, 2, 3, 4});

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_ok());
        CHECK(result.value().pixel_vr == pixel_data_vr::ow);
    }

    SECTION("high bit of zero is accepted") {
        ds.set_uint16(tags::high_bit, vr_type::US, 0);

        CHECK(extract_image_metadata(ds).is_ok());
    }
}

TEST_CASE("extract_image_metadata copies the pixel data", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    auto result = extract_image_metadata(ds);
    REQUIRE(result.is_ok());

    ds.set_bytes(tags::pixel_data, vr_type::OB, std::vector<uint8_t>{9, 9, 9, 9});
    ds.clear();

    CHECK(result.value().pixel_data == std::vector<uint8_t>{1, 2, 3, 4});
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("extract_image_metadata reports missing attributes", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    SECTION("rows") {
        ds.remove(tags::rows);
        CHECK(error_code_of(ds) == codes::missing_rows);
    }

    SECTION("zero rows") {
        ds.set_uint16(tags::rows, vr_type::US, 0);
        CHECK(error_code_of(ds) == codes::missing_rows);
    }

    SECTION("columns") {
        ds.remove(tags::columns);
        CHECK(error_code_of(ds) == codes::missing_columns);
    }

    SECTION("samples per pixel") {
        ds.remove(tags::samples_per_pixel);
        CHECK(error_code_of(ds) == codes::missing_samples_per_pixel);
    }

    SECTION("photometric interpretation") {
        ds.remove(tags::photometric_interpretation);
        CHECK(error_code_of(ds) == codes::missing_photometric_interpretation);
    }

    SECTION("bits allocated") {
        ds.remove(tags::bits_allocated);
        CHECK(error_code_of(ds) == codes::missing_bits_allocated);
    }

    SECTION("bits stored") {
        ds.remove(tags::bits_stored);
        CHECK(error_code_of(ds) == codes::missing_bits_stored);
    }

    SECTION("high bit") {
        ds.remove(tags::high_bit);
        CHECK(error_code_of(ds) == codes::missing_high_bit);
    }

    SECTION("pixel representation") {
        ds.remove(tags::pixel_representation);
        CHECK(error_code_of(ds) == codes::missing_pixel_representation);
    }

    SECTION("pixel data") {
        ds.remove(tags::pixel_data);
        CHECK(error_code_of(ds) == codes::missing_pixel_data);
    }
}

TEST_CASE("extract_image_metadata checks attributes in order", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    SECTION("rows are reported before anything else") {
        ds.remove(tags::rows);
        ds.remove(tags::columns);
        ds.remove(tags::pixel_data);
        ds.set_string(tags::photometric_interpretation, vr_type::CS, "MONOCHROME1");

        CHECK(error_code_of(ds) == codes::missing_rows);
    }

    SECTION("transfer syntax is checked first") {
        ds.remove(tags::rows);
        ds.set_string(tags::transfer_syntax_uid, vr_type::UI, "1.2.3.4");

        CHECK(error_code_of(ds) == codes::unrecognized_transfer_syntax);
    }

    SECTION("pixel data is checked before the VOI LUT sequence") {
        ds.remove(tags::pixel_data);
        ds.set_bytes(tags::voi_lut_sequence, vr_type::SQ, std::vector<uint8_t>{});

        CHECK(error_code_of(ds) == codes::missing_pixel_data);
    }
}

TEST_CASE("extract_image_metadata rejects invalid values", "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();

    SECTION("unknown photometric interpretation") {
        ds.set_string(tags::photometric_interpretation, vr_type::CS, "GRAYSCALE");

        auto result = extract_image_metadata(ds);
        REQUIRE(result.is_err());
        CHECK(result.error().code == codes::invalid_enumerated_value);
        REQUIRE(result.error().details.has_value());
        CHECK(*result.error().details == "GRAYSCALE");
    }

    SECTION("planar configuration out of range") {
        ds.set_uint16(tags::planar_configuration, vr_type::US, 2);
        CHECK(error_code_of(ds) == codes::invalid_enumerated_value);
    }

    SECTION("pixel representation out of range") {
        ds.set_uint16(tags::pixel_representation, vr_type::US, 7);
        CHECK(error_code_of(ds) == codes::invalid_enumerated_value);
    }

    SECTION("pixel data with a non binary VR") {
        ds.set_string(tags::pixel_data, vr_type::LO, "ABCD");
        CHECK(error_code_of(ds) == codes::invalid_enumerated_value);
    }

    SECTION("unrecognized transfer syntax does not fall back to the default") {
        ds.set_string(tags::transfer_syntax_uid, vr_type::UI, "1.2.840.10008.1.2.1.99");
        CHECK(error_code_of(ds) == codes::unrecognized_transfer_syntax);
    }

    SECTION("VOI LUT sequence") {
        ds.set_bytes(tags::voi_lut_sequence, vr_type::SQ, std::vector<uint8_t>{});
        CHECK(error_code_of(ds) == codes::unsupported_voi_lut_sequence);
    }
}

// ============================================================================
// Windowing Hint
// ============================================================================

TEST_CASE("extract_windowing_hint", "[imaging][image_metadata]") {
    dicom_dataset ds;

    SECTION("absent attributes give no hint") {
        auto hint = extract_windowing_hint(ds);
        CHECK_FALSE(hint.has_value());
    }

    SECTION("center and width without function default to LINEAR") {
        ds.set_string(tags::window_center, vr_type::DS, "40");
        ds.set_string(tags::window_width, vr_type::DS, "400");

        auto hint = extract_windowing_hint(ds);
        REQUIRE(hint.has_value());
        CHECK(hint->center == 40.0);
        CHECK(hint->width == 400.0);
        CHECK(hint->function == voi_lut_function::linear);
    }

    SECTION("multi-valued attributes use the first value") {
        ds.set_string(tags::window_center, vr_type::DS, "40\\300");
        ds.set_string(tags::window_width, vr_type::DS, "400\\1500");

        auto hint = extract_windowing_hint(ds);
        CHECK(hint->center == 40.0);
        CHECK(hint->width == 400.0);
    }

    SECTION("unparsable values are treated as absent") {
        ds.set_string(tags::window_center, vr_type::DS, "abc");
        ds.set_string(tags::window_width, vr_type::DS, "400");
        ds.set_string(tags::voi_lut_function, vr_type::CS, "SIGMOID");

        auto hint = extract_windowing_hint(ds);
        REQUIRE(hint.has_value());
        CHECK_FALSE(hint->center.has_value());
        CHECK(hint->width == 400.0);
        CHECK(hint->function == voi_lut_function::sigmoid);
    }

    SECTION("width alone gives no hint") {
        ds.set_string(tags::window_width, vr_type::DS, "400");

        auto hint = extract_windowing_hint(ds);
        CHECK_FALSE(hint.has_value());
    }

    SECTION("unknown function is treated as absent") {
        ds.set_string(tags::window_center, vr_type::DS, "40");
        ds.set_string(tags::window_width, vr_type::DS, "400");
        ds.set_string(tags::voi_lut_function, vr_type::CS, "LOG");

        auto hint = extract_windowing_hint(ds);
        REQUIRE(hint.has_value());
        CHECK(hint->center == 40.0);
        CHECK(hint->function == voi_lut_function::linear);
    }

    SECTION("unknown function without center gives no hint") {
        ds.set_string(tags::voi_lut_function, vr_type::CS, "LOG");

        CHECK_FALSE(extract_windowing_hint(ds).has_value());
    }

    SECTION("non-numeric DS values such as nan and inf are unparsable") {
        ds.set_string(tags::window_center, vr_type::DS, "nan");
        ds.set_string(tags::window_width, vr_type::DS, "inf");

        CHECK_FALSE(extract_windowing_hint(ds).has_value());
    }

    SECTION("infinite width is dropped but a finite center is kept") {
        ds.set_string(tags::window_center, vr_type::DS, "40");
        ds.set_string(tags::window_width, vr_type::DS, "-Infinity");

        auto hint = extract_windowing_hint(ds);
        REQUIRE(hint.has_value());
        CHECK(hint->center == 40.0);
        CHECK_FALSE(hint->width.has_value());
    }

    SECTION("hint is carried into the metadata") {
        auto image = make_valid_dataset();
        image.set_string(tags::window_center, vr_type::DS, "128");
        image.set_string(tags::window_width, vr_type::DS, "256");

        auto meta = extract_image_metadata(image);
        REQUIRE(meta.is_ok());
        REQUIRE(meta.value().windowing.has_value());
        CHECK(meta.value().windowing->center == 128.0);
    }
}

TEST_CASE("extract_image_metadata accepts an unknown VOI LUT Function",
          "[imaging][image_metadata]") {
    auto ds = make_valid_dataset();
    ds.set_string(tags::window_center, vr_type::DS, "128");
    ds.set_string(tags::window_width, vr_type::DS, "256");
    ds.set_string(tags::voi_lut_function, vr_type::CS, "LOG");

    auto meta = extract_image_metadata(ds);
    REQUIRE(meta.is_ok());
    REQUIRE(meta.value().windowing.has_value());
    CHECK(meta.value().windowing->function == voi_lut_function::linear);
}
