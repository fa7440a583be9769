/**
 * @file pixel_spacing.hpp
 * @brief Pixel Spacing (0028,0030) parsing
 */

#ifndef VIEWER_IMAGING_PIXEL_SPACING_HPP
#define VIEWER_IMAGING_PIXEL_SPACING_HPP

#include <viewer/core/result.hpp>
#include <viewer/core/tag_source.hpp>

#include <optional>
#include <string_view>

namespace viewer::imaging {

/**
 * @brief Physical distance between pixel centers, in millimetres.
 */
struct pixel_spacing {
    double row{0.0};     ///< between adjacent rows
    double column{0.0};  ///< between adjacent columns

    bool operator==(const pixel_spacing&) const noexcept = default;
};

/**
 * @brief Parses a "row\\column" decimal string pair.
 *
 * Exactly two backslash separated values are required, each a complete
 * decimal number; surrounding spaces are allowed.
 *
 * @return The spacing, or invalid_pixel_spacing
 */
[[nodiscard]] viewer::Result<pixel_spacing> parse_pixel_spacing(std::string_view value);

/**
 * @brief Reads Pixel Spacing from a tag source.
 * @return nullopt when the attribute is absent, invalid_pixel_spacing when
 *         it is present but malformed
 */
[[nodiscard]] viewer::Result<std::optional<pixel_spacing>> extract_pixel_spacing(
    const core::tag_source& source);

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_PIXEL_SPACING_HPP
