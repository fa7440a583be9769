/**
 * @file image_metadata.cpp
 * @brief Extraction of Image Pixel attributes from a tag source
 */

#include "viewer/imaging/image_metadata.hpp"
#include "viewer/imaging/detail/decimal_string.hpp"

#include <viewer/core/dicom_tag_constants.hpp>

#include <string>
#include <utility>

namespace viewer::imaging {

namespace {

namespace tags = core::tags;

/**
 * @brief Reads a required US attribute.
 * @param positive Reject zero with the same error code
 */
viewer::Result<uint16_t> require_uint16(const core::tag_source& source,
                                        core::dicom_tag tag,
                                        int missing_code,
                                        const std::string& name,
                                        bool positive) {
    const auto value = source.uint16_at(tag);
    if (!value) {
        return viewer::viewer_error<uint16_t>(
            missing_code,
            "Image needs " + name + " " + tag.to_string());
    }
    if (positive && *value == 0) {
        return viewer::viewer_error<uint16_t>(
            missing_code,
            name + " " + tag.to_string() + " must be positive");
    }
    return viewer::ok(*value);
}

template <typename T>
viewer::Result<T> invalid_enumerated_value(const std::string& field,
                                           const std::string& raw) {
    return viewer::viewer_error<T>(
        viewer::error_codes::invalid_enumerated_value,
        "Invalid enumerated value for " + field + ": '" + raw + "'",
        raw);
}

viewer::Result<encoding::transfer_syntax> read_transfer_syntax(
    const core::tag_source& source) {
    const auto uid = source.string_at(tags::transfer_syntax_uid);
    if (!uid) {
        return viewer::ok(encoding::default_transfer_syntax());
    }
    return encoding::resolve_transfer_syntax(*uid);
}

viewer::Result<planar_configuration> read_planar_configuration(
    const core::tag_source& source) {
    const auto value = source.uint16_at(tags::planar_configuration);
    if (!value) {
        return viewer::ok(planar_configuration::interlaced);
    }
    switch (*value) {
        case 0: return viewer::ok(planar_configuration::interlaced);
        case 1: return viewer::ok(planar_configuration::separated);
        default:
            return invalid_enumerated_value<planar_configuration>(
                "PlanarConfiguration", std::to_string(*value));
    }
}

viewer::Result<pixel_representation> read_pixel_representation(
    const core::tag_source& source) {
    const auto value = source.uint16_at(tags::pixel_representation);
    if (!value) {
        return viewer::viewer_error<pixel_representation>(
            viewer::error_codes::missing_pixel_representation,
            "Image needs PixelRepresentation " + tags::pixel_representation.to_string());
    }
    switch (*value) {
        case 0: return viewer::ok(pixel_representation::unsigned_integer);
        case 1: return viewer::ok(pixel_representation::signed_integer);
        default:
            return invalid_enumerated_value<pixel_representation>(
                "PixelRepresentation", std::to_string(*value));
    }
}

}  // namespace

std::optional<windowing_hint> extract_windowing_hint(
    const core::tag_source& source) {
    windowing_hint hint;

    if (auto center = source.string_at(tags::window_center)) {
        hint.center = detail::parse_decimal(detail::first_value(*center));
    }
    if (auto width = source.string_at(tags::window_width)) {
        hint.width = detail::parse_decimal(detail::first_value(*width));
    }

    // An unrecognized function term is read as if the attribute were absent
    if (auto term = source.string_at(tags::voi_lut_function)) {
        hint.function = parse_voi_lut_function(detail::first_value(*term));
    }

    if (!hint.function) {
        if (!hint.center) {
            return std::nullopt;
        }
        hint.function = voi_lut_function::linear;
    }

    return hint;
}

viewer::Result<image_metadata> extract_image_metadata(const core::tag_source& source) {
    using viewer::error_codes::missing_bits_allocated;
    using viewer::error_codes::missing_bits_stored;
    using viewer::error_codes::missing_columns;
    using viewer::error_codes::missing_high_bit;
    using viewer::error_codes::missing_rows;
    using viewer::error_codes::missing_samples_per_pixel;

    image_metadata metadata;

    auto syntax = read_transfer_syntax(source);
    if (syntax.is_err()) {
        return viewer::forward_error<image_metadata>(syntax);
    }
    metadata.syntax = syntax.value();
    metadata.traits = encoding::classify(metadata.syntax);

    auto row_count = require_uint16(source, tags::rows, missing_rows, "Rows", true);
    if (row_count.is_err()) {
        return viewer::forward_error<image_metadata>(row_count);
    }
    metadata.rows = row_count.value();

    auto column_count = require_uint16(source, tags::columns, missing_columns, "Columns", true);
    if (column_count.is_err()) {
        return viewer::forward_error<image_metadata>(column_count);
    }
    metadata.columns = column_count.value();

    auto samples = require_uint16(source, tags::samples_per_pixel, missing_samples_per_pixel,
                                  "SamplesPerPixel", true);
    if (samples.is_err()) {
        return viewer::forward_error<image_metadata>(samples);
    }
    metadata.samples_per_pixel = samples.value();

    const auto photometric_term = source.string_at(tags::photometric_interpretation);
    if (!photometric_term) {
        return viewer::viewer_error<image_metadata>(
            viewer::error_codes::missing_photometric_interpretation,
            "Image needs PhotometricInterpretation " +
                tags::photometric_interpretation.to_string());
    }
    const auto photometric = parse_photometric_interpretation(*photometric_term);
    if (!photometric) {
        return invalid_enumerated_value<image_metadata>(
            "PhotometricInterpretation", *photometric_term);
    }
    metadata.photometric = *photometric;

    auto planar = read_planar_configuration(source);
    if (planar.is_err()) {
        return viewer::forward_error<image_metadata>(planar);
    }
    metadata.planar = planar.value();

    auto allocated = require_uint16(source, tags::bits_allocated, missing_bits_allocated,
                                    "BitsAllocated", true);
    if (allocated.is_err()) {
        return viewer::forward_error<image_metadata>(allocated);
    }
    metadata.bits_allocated = allocated.value();

    auto stored = require_uint16(source, tags::bits_stored, missing_bits_stored,
                                 "BitsStored", true);
    if (stored.is_err()) {
        return viewer::forward_error<image_metadata>(stored);
    }
    metadata.bits_stored = stored.value();

    // High Bit is zero for 1-bit images, so only presence is required
    auto high = require_uint16(source, tags::high_bit, missing_high_bit, "HighBit", false);
    if (high.is_err()) {
        return viewer::forward_error<image_metadata>(high);
    }
    metadata.high_bit = high.value();

    auto representation = read_pixel_representation(source);
    if (representation.is_err()) {
        return viewer::forward_error<image_metadata>(representation);
    }
    metadata.representation = representation.value();

    const auto pixels = source.element_at(tags::pixel_data);
    if (!pixels) {
        return viewer::viewer_error<image_metadata>(
            viewer::error_codes::missing_pixel_data,
            "Image needs PixelData " + tags::pixel_data.to_string());
    }
    switch (pixels->vr) {
        case encoding::vr_type::OB:
        case encoding::vr_type::UN:  // implicit VR: no VR recorded in the stream
            metadata.pixel_vr = pixel_data_vr::ob;
            break;
        case encoding::vr_type::OW:
            metadata.pixel_vr = pixel_data_vr::ow;
            break;
        default:
            return invalid_enumerated_value<image_metadata>(
                "PixelData VR", encoding::to_string(pixels->vr));
    }
    metadata.pixel_data.assign(pixels->value.begin(), pixels->value.end());

    metadata.windowing = extract_windowing_hint(source);

    if (source.contains(tags::voi_lut_sequence)) {
        return viewer::viewer_error<image_metadata>(
            viewer::error_codes::unsupported_voi_lut_sequence,
            "VOI LUT Sequence " + tags::voi_lut_sequence.to_string() + " is not supported");
    }

    return viewer::ok(std::move(metadata));
}

}  // namespace viewer::imaging
