#include "viewer/imaging/image_types.hpp"

#include <array>
#include <utility>

namespace viewer::imaging {

namespace {

constexpr std::array<std::pair<std::string_view, photometric_interpretation>, 13>
    PHOTOMETRIC_TERMS = {{
        {"MONOCHROME1", photometric_interpretation::monochrome1},
        {"MONOCHROME2", photometric_interpretation::monochrome2},
        {"PALETTE COLOR", photometric_interpretation::palette_color},
        {"RGB", photometric_interpretation::rgb},
        {"HSV", photometric_interpretation::hsv},
        {"ARGB", photometric_interpretation::argb},
        {"CMYK", photometric_interpretation::cmyk},
        {"YBR_FULL", photometric_interpretation::ybr_full},
        {"YBR_FULL_422", photometric_interpretation::ybr_full_422},
        {"YBR_PARTIAL_422", photometric_interpretation::ybr_partial_422},
        {"YBR_PARTIAL_420", photometric_interpretation::ybr_partial_420},
        {"YBR_ICT", photometric_interpretation::ybr_ict},
        {"YBR_RCT", photometric_interpretation::ybr_rct},
    }};

}  // namespace

std::string_view to_string(photometric_interpretation pi) noexcept {
    for (const auto& [term, value] : PHOTOMETRIC_TERMS) {
        if (value == pi) {
            return term;
        }
    }
    return "";
}

std::optional<photometric_interpretation> parse_photometric_interpretation(
    std::string_view str) noexcept {
    for (const auto& [term, value] : PHOTOMETRIC_TERMS) {
        if (term == str) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view to_string(pixel_representation repr) noexcept {
    switch (repr) {
        case pixel_representation::unsigned_integer: return "UNSIGNED";
        case pixel_representation::signed_integer: return "SIGNED";
    }
    return "";
}

std::string_view to_string(pixel_data_vr vr) noexcept {
    switch (vr) {
        case pixel_data_vr::ob: return "OB";
        case pixel_data_vr::ow: return "OW";
    }
    return "";
}

}  // namespace viewer::imaging
