/**
 * @file voi_lut.cpp
 * @brief VOI LUT function names and windowing resolution
 */

#include "viewer/imaging/voi_lut.hpp"

#include <algorithm>

namespace viewer::imaging {

std::string_view to_string(voi_lut_function function) noexcept {
    switch (function) {
        case voi_lut_function::linear: return "LINEAR";
        case voi_lut_function::linear_exact: return "LINEAR_EXACT";
        case voi_lut_function::sigmoid: return "SIGMOID";
    }
    return "";
}

std::optional<voi_lut_function> parse_voi_lut_function(std::string_view str) noexcept {
    if (str == "LINEAR") return voi_lut_function::linear;
    if (str == "LINEAR_EXACT") return voi_lut_function::linear_exact;
    if (str == "SIGMOID") return voi_lut_function::sigmoid;
    return std::nullopt;
}

voi_lut_module resolve_voi_lut(const std::optional<windowing_hint>& hint) {
    voi_lut_module module;
    if (!hint) {
        return module;
    }

    if (hint->center && hint->width) {
        module.window = voi_lut_window{*hint->center, *hint->width};
    }
    module.function = hint->function.value_or(voi_lut_function::linear);
    return module;
}

voi_lut_module apply_offset(const voi_lut_module& module,
                            const windowing_offset& offset) noexcept {
    voi_lut_module adjusted = module;
    adjusted.window.center += offset.center;
    adjusted.window.width = std::max(1.0, module.window.width + offset.width);
    return adjusted;
}

}  // namespace viewer::imaging
