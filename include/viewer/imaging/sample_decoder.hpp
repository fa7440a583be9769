/**
 * @file sample_decoder.hpp
 * @brief Conversion of uncompressed pixel data bytes into a typed raster
 *
 * Only unsigned MONOCHROME2 images with a contiguous stored-bit layout are
 * decoded. Every other combination is rejected with a specific error code
 * rather than rendered approximately.
 *
 * @see DICOM PS3.5 Section 8 - Encoding of Pixel, Overlay and Waveform Data
 */

#ifndef VIEWER_IMAGING_SAMPLE_DECODER_HPP
#define VIEWER_IMAGING_SAMPLE_DECODER_HPP

#include "viewer/imaging/decoded_raster.hpp"
#include "viewer/imaging/image_metadata.hpp"

#include <viewer/core/result.hpp>

#include <string_view>

namespace viewer::imaging {

/**
 * @brief What to do with images that are not grayscale.
 */
enum class color_decode_policy {
    reject,       ///< fail with unsupported_color_layout
    best_effort   ///< reinterpret as packed 32-bit pixels
};

[[nodiscard]] std::string_view to_string(color_decode_policy policy) noexcept;

/**
 * @brief Decodes a grayscale image into a grayscale_raster.
 *
 * Checks, in order: no compression, MONOCHROME1/2 with one sample per
 * pixel, OW only with 16 bits allocated, high bit == bits stored - 1,
 * MONOCHROME2, unsigned samples, bits allocated of 8, 16 or 32, and a
 * buffer large enough for rows x columns samples.
 *
 * No rescale slope or intercept is applied.
 */
[[nodiscard]] viewer::Result<decoded_raster> decode_grayscale(const image_metadata& metadata);

/**
 * @brief Color decoding entry point.
 *
 * Planar configuration, per-channel depth and signedness are not
 * interpreted yet, so this always fails with unsupported_color_layout.
 */
[[nodiscard]] viewer::Result<decoded_raster> decode_color(const image_metadata& metadata);

/**
 * @brief Reinterprets the pixel bytes as packed little-endian 32-bit pixels.
 *
 * Ignores planar configuration, bits allocated, high bit and pixel
 * representation, so the output is only correct for 4-byte interleaved
 * pixels. A warning is logged on every call.
 *
 * @return rgb_raster, or pixel_data_size_mismatch when the byte count is
 *         not a multiple of 4
 */
[[nodiscard]] viewer::Result<decoded_raster> decode_rgb_best_effort(
    const image_metadata& metadata);

/**
 * @brief Routes an image to the grayscale or color path.
 *
 * Compressed images fail before routing. Images that are not single
 * sample monochrome go to decode_color() or decode_rgb_best_effort()
 * according to the policy.
 */
[[nodiscard]] viewer::Result<decoded_raster> decode_image_metadata(
    const image_metadata& metadata,
    color_decode_policy policy = color_decode_policy::reject);

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_SAMPLE_DECODER_HPP
