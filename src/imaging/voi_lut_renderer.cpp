/**
 * @file voi_lut_renderer.cpp
 * @brief Implementation of VOI LUT display mapping
 */

#include "viewer/imaging/voi_lut_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace viewer::imaging {

namespace {

uint8_t to_display(double value) noexcept {
    return static_cast<uint8_t>(std::lround(std::clamp(value, 0.0, 255.0)));
}

}  // namespace

viewer::Result<voi_lut_module> validate_voi_lut(const voi_lut_module& module) {
    const double width = module.window.width;
    bool valid = false;
    switch (module.function) {
        case voi_lut_function::linear:
            valid = width >= 1.0;
            break;
        case voi_lut_function::linear_exact:
        case voi_lut_function::sigmoid:
            valid = width > 0.0;
            break;
    }
    if (!valid || !std::isfinite(module.window.center)) {
        return viewer::viewer_error<voi_lut_module>(
            viewer::error_codes::invalid_window,
            "Window width " + std::to_string(width) + " is not valid for " +
                std::string(to_string(module.function)));
    }
    return viewer::ok(module);
}

uint8_t map_voi_value(double value, const voi_lut_module& module) noexcept {
    const double c = module.window.center;
    const double w = module.window.width;

    switch (module.function) {
        case voi_lut_function::linear: {
            const double lower = c - 0.5 - (w - 1.0) / 2.0;
            const double upper = c - 0.5 + (w - 1.0) / 2.0;
            if (value <= lower) return 0;
            if (value > upper) return 255;
            return to_display(((value - (c - 0.5)) / (w - 1.0) + 0.5) * 255.0);
        }
        case voi_lut_function::linear_exact:
            if (value <= c - w / 2.0) return 0;
            if (value > c + w / 2.0) return 255;
            return to_display(((value - c) / w + 0.5) * 255.0);
        case voi_lut_function::sigmoid:
            return to_display(255.0 / (1.0 + std::exp(-4.0 * (value - c) / w)));
    }
    return 0;
}

viewer::Result<window_lut> window_lut::create(const voi_lut_module& module, uint16_t bits) {
    auto checked = validate_voi_lut(module);
    if (checked.is_err()) {
        return viewer::forward_error<window_lut>(checked);
    }
    if (bits != 8 && bits != 16) {
        return viewer::viewer_error<window_lut>(
            viewer::error_codes::unsupported_bit_depth,
            "Lookup tables cover 8 or 16 bit input, not " + std::to_string(bits));
    }

    window_lut lut;
    lut.table_.resize(std::size_t{1} << bits);
    for (std::size_t i = 0; i < lut.table_.size(); ++i) {
        lut.table_[i] = map_voi_value(static_cast<double>(i), module);
    }
    return viewer::ok(std::move(lut));
}

void window_lut::apply(const uint8_t* src, uint8_t* dst,
                       std::size_t pixel_count) const noexcept {
    for (std::size_t i = 0; i < pixel_count; ++i) {
        dst[i] = table_[src[i]];
    }
}

void window_lut::apply(const uint16_t* src, uint8_t* dst,
                       std::size_t pixel_count) const noexcept {
    const std::size_t last = table_.size() - 1;
    for (std::size_t i = 0; i < pixel_count; ++i) {
        dst[i] = table_[std::min<std::size_t>(src[i], last)];
    }
}

viewer::Result<std::vector<uint8_t>> render_grayscale(const grayscale_raster& raster,
                                                      const voi_lut_module& module) {
    auto checked = validate_voi_lut(module);
    if (checked.is_err()) {
        return viewer::forward_error<std::vector<uint8_t>>(checked);
    }

    std::vector<uint8_t> display(raster.sample_count());

    return std::visit(
        [&](const auto& samples) -> viewer::Result<std::vector<uint8_t>> {
            using sample_type = typename std::decay_t<decltype(samples)>::value_type;

            if constexpr (std::is_same_v<sample_type, uint32_t>) {
                std::transform(samples.begin(), samples.end(), display.begin(),
                               [&module](uint32_t value) {
                                   return map_voi_value(static_cast<double>(value), module);
                               });
            } else {
                auto lut = window_lut::create(
                    module, static_cast<uint16_t>(sizeof(sample_type) * 8));
                if (lut.is_err()) {
                    return viewer::forward_error<std::vector<uint8_t>>(lut);
                }
                lut.value().apply(samples.data(), display.data(), samples.size());
            }
            return viewer::ok(std::move(display));
        },
        raster.samples);
}

}  // namespace viewer::imaging
