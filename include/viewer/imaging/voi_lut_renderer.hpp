/**
 * @file voi_lut_renderer.hpp
 * @brief Application of a VOI LUT module to a grayscale raster
 *
 * Maps stored values to 8-bit display values with the DICOM VOI LUT
 * Function formulas (output range 0..255):
 *
 *   LINEAR:        x <= c - 0.5 - (w-1)/2          -> 0
 *                  x >  c - 0.5 + (w-1)/2          -> 255
 *                  else ((x - (c-0.5)) / (w-1) + 0.5) * 255
 *   LINEAR_EXACT:  x <= c - w/2 -> 0, x > c + w/2 -> 255
 *                  else ((x - c) / w + 0.5) * 255
 *   SIGMOID:       255 / (1 + exp(-4 (x - c) / w))
 *
 * @see DICOM PS3.3 C.11.2.1.2 - Window Center and Window Width
 */

#ifndef VIEWER_IMAGING_VOI_LUT_RENDERER_HPP
#define VIEWER_IMAGING_VOI_LUT_RENDERER_HPP

#include "viewer/imaging/decoded_raster.hpp"
#include "viewer/imaging/voi_lut.hpp"

#include <viewer/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace viewer::imaging {

/**
 * @brief Checks that the window width is usable with the module's function.
 *
 * LINEAR needs width >= 1, LINEAR_EXACT and SIGMOID need width > 0.
 *
 * @return The module unchanged, or invalid_window
 */
[[nodiscard]] viewer::Result<voi_lut_module> validate_voi_lut(const voi_lut_module& module);

/**
 * @brief Maps one stored value to a display value.
 *
 * The module must have passed validate_voi_lut().
 */
[[nodiscard]] uint8_t map_voi_value(double value, const voi_lut_module& module) noexcept;

/**
 * @brief Precomputed display values for every 8- or 16-bit input.
 */
class window_lut {
public:
    /**
     * @brief Builds a table covering 0 .. 2^bits - 1.
     * @param bits 8 or 16
     * @return The table, invalid_window, or unsupported_bit_depth
     */
    [[nodiscard]] static viewer::Result<window_lut> create(const voi_lut_module& module,
                                                           uint16_t bits);

    void apply(const uint8_t* src, uint8_t* dst, std::size_t pixel_count) const noexcept;

    void apply(const uint16_t* src, uint8_t* dst, std::size_t pixel_count) const noexcept;

    [[nodiscard]] uint8_t operator[](std::size_t value) const noexcept { return table_[value]; }

    [[nodiscard]] std::size_t size() const noexcept { return table_.size(); }

private:
    window_lut() = default;

    std::vector<uint8_t> table_;
};

/**
 * @brief Renders a grayscale raster to one display byte per pixel.
 *
 * 8- and 16-bit rasters go through a window_lut; 32-bit rasters are mapped
 * per sample.
 *
 * @return rows x columns bytes, row-major, or invalid_window
 */
[[nodiscard]] viewer::Result<std::vector<uint8_t>> render_grayscale(
    const grayscale_raster& raster,
    const voi_lut_module& module);

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_VOI_LUT_RENDERER_HPP
