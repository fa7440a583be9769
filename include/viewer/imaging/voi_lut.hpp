/**
 * @file voi_lut.hpp
 * @brief VOI LUT (window/level) configuration
 *
 * A VOI LUT module describes how stored sample values are mapped to
 * display intensities: a window (center, width) and a response function.
 * This header only derives the configuration; applying it to a raster is
 * done by voi_lut_renderer.hpp.
 *
 * @see DICOM PS3.3 C.11.2 - VOI LUT Module
 */

#ifndef VIEWER_IMAGING_VOI_LUT_HPP
#define VIEWER_IMAGING_VOI_LUT_HPP

#include <optional>
#include <string_view>

namespace viewer::imaging {

/**
 * @brief VOI LUT Function (0028,1056).
 *
 * String forms are the DICOM defined terms and must not change.
 */
enum class voi_lut_function {
    linear,        ///< "LINEAR"
    linear_exact,  ///< "LINEAR_EXACT"
    sigmoid        ///< "SIGMOID"
};

[[nodiscard]] std::string_view to_string(voi_lut_function function) noexcept;

/**
 * @brief Parses a VOI LUT Function defined term.
 * @return The matching member, or nullopt for any other string
 */
[[nodiscard]] std::optional<voi_lut_function> parse_voi_lut_function(
    std::string_view str) noexcept;

/**
 * @brief Window center and width, in stored-value units.
 *
 * Defaults are used when the data set carries no windowing attributes.
 */
struct voi_lut_window {
    double center{1024.0};
    double width{4096.0};

    bool operator==(const voi_lut_window&) const noexcept = default;
};

/**
 * @brief Complete windowing configuration handed to the renderer.
 */
struct voi_lut_module {
    voi_lut_window window{};
    voi_lut_function function{voi_lut_function::linear};

    bool operator==(const voi_lut_module&) const noexcept = default;
};

/**
 * @brief Windowing attributes as found in the data set.
 *
 * Each field is independently optional.
 */
struct windowing_hint {
    std::optional<double> center;
    std::optional<double> width;
    std::optional<voi_lut_function> function;

    bool operator==(const windowing_hint&) const noexcept = default;
};

/**
 * @brief Relative adjustment of a window, e.g. from a drag gesture.
 */
struct windowing_offset {
    double center{0.0};
    double width{0.0};
};

/**
 * @brief Derives the windowing configuration from an optional hint.
 *
 * When the hint has both center and width they are used verbatim, without
 * checking them against the sample range. Otherwise the default window
 * {1024, 4096} applies. The function is taken from the hint when present
 * and is LINEAR otherwise. Never fails.
 */
[[nodiscard]] voi_lut_module resolve_voi_lut(const std::optional<windowing_hint>& hint);

/**
 * @brief Applies a relative offset to a windowing configuration.
 *
 * The resulting width is clamped to at least 1.
 */
[[nodiscard]] voi_lut_module apply_offset(const voi_lut_module& module,
                                          const windowing_offset& offset) noexcept;

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_VOI_LUT_HPP
