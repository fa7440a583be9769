#ifndef VIEWER_IMAGING_IMAGE_TYPES_HPP
#define VIEWER_IMAGING_IMAGE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace viewer::imaging {

/**
 * @brief Photometric interpretation of pixel data.
 *
 * The string form of each member is the DICOM defined term and is what
 * gets displayed and persisted; it must not change.
 *
 * @see DICOM PS3.3 Section C.7.6.3.1.2
 */
enum class photometric_interpretation {
    monochrome1,      ///< "MONOCHROME1" - minimum value displayed as white
    monochrome2,      ///< "MONOCHROME2" - minimum value displayed as black
    palette_color,    ///< "PALETTE COLOR"
    rgb,              ///< "RGB"
    hsv,              ///< "HSV" (retired)
    argb,             ///< "ARGB" (retired)
    cmyk,             ///< "CMYK" (retired)
    ybr_full,         ///< "YBR_FULL"
    ybr_full_422,     ///< "YBR_FULL_422"
    ybr_partial_422,  ///< "YBR_PARTIAL_422" (retired)
    ybr_partial_420,  ///< "YBR_PARTIAL_420"
    ybr_ict,          ///< "YBR_ICT"
    ybr_rct           ///< "YBR_RCT"
};

/**
 * @brief Pixel Representation (0028,0103).
 */
enum class pixel_representation : uint16_t {
    unsigned_integer = 0,
    signed_integer = 1
};

/**
 * @brief Planar Configuration (0028,0006).
 *
 * interlaced: R1G1B1R2G2B2..., separated: RRR...GGG...BBB...
 */
enum class planar_configuration : uint16_t {
    interlaced = 0,
    separated = 1
};

/**
 * @brief Value Representation of the Pixel Data element.
 */
enum class pixel_data_vr {
    ob,  ///< Other Byte
    ow   ///< Other Word
};

/// @name String Conversion
/// @{

/**
 * @brief Converts a photometric interpretation to its DICOM defined term.
 */
[[nodiscard]] std::string_view to_string(photometric_interpretation pi) noexcept;

/**
 * @brief Parses a DICOM photometric interpretation defined term.
 * @return The matching member, or nullopt for any other string
 */
[[nodiscard]] std::optional<photometric_interpretation> parse_photometric_interpretation(
    std::string_view str) noexcept;

[[nodiscard]] std::string_view to_string(pixel_representation repr) noexcept;

[[nodiscard]] std::string_view to_string(pixel_data_vr vr) noexcept;

/// @}

/**
 * @brief Checks whether the interpretation is one of the grayscale terms.
 */
[[nodiscard]] constexpr bool is_monochrome(photometric_interpretation pi) noexcept {
    return pi == photometric_interpretation::monochrome1 ||
           pi == photometric_interpretation::monochrome2;
}

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_IMAGE_TYPES_HPP
