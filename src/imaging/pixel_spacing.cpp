/**
 * @file pixel_spacing.cpp
 * @brief Parsing of the Pixel Spacing (0028,0030) attribute
 */

#include "viewer/imaging/pixel_spacing.hpp"
#include "viewer/imaging/detail/decimal_string.hpp"

#include <viewer/core/dicom_tag_constants.hpp>

#include <string>

namespace viewer::imaging {

viewer::Result<pixel_spacing> parse_pixel_spacing(std::string_view value) {
    const auto separator = value.find('\\');
    const bool two_fields = separator != std::string_view::npos &&
                            value.find('\\', separator + 1) == std::string_view::npos;

    if (two_fields) {
        const auto row = detail::parse_decimal(value.substr(0, separator));
        const auto column = detail::parse_decimal(value.substr(separator + 1));
        if (row && column) {
            return viewer::ok(pixel_spacing{*row, *column});
        }
    }

    return viewer::viewer_error<pixel_spacing>(
        viewer::error_codes::invalid_pixel_spacing,
        "Pixel Spacing must be two decimal values separated by '\\', got '" +
            std::string(value) + "'",
        std::string(value));
}

viewer::Result<std::optional<pixel_spacing>> extract_pixel_spacing(
    const core::tag_source& source) {
    const auto value = source.string_at(core::tags::pixel_spacing);
    if (!value) {
        return viewer::ok(std::optional<pixel_spacing>{});
    }

    auto parsed = parse_pixel_spacing(*value);
    if (parsed.is_err()) {
        return viewer::forward_error<std::optional<pixel_spacing>>(parsed);
    }
    return viewer::ok(std::optional<pixel_spacing>{parsed.value()});
}

}  // namespace viewer::imaging
