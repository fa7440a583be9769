/**
 * @file image_decoder.hpp
 * @brief One-call decoding of a data set into a displayable image
 *
 * decode_image() chains metadata extraction, sample decoding, windowing
 * resolution and (optionally) Pixel Spacing parsing. Either every step
 * succeeds or the first failure is returned; nothing partial is produced.
 *
 * @code
 * auto decoded = viewer::imaging::decode_image(dataset);
 * if (decoded.is_ok()) {
 *     const auto& gray = std::get<grayscale_raster>(decoded.value().raster);
 *     auto display = render_grayscale(gray, decoded.value().voi_lut);
 * }
 * @endcode
 */

#ifndef VIEWER_IMAGING_IMAGE_DECODER_HPP
#define VIEWER_IMAGING_IMAGE_DECODER_HPP

#include "viewer/imaging/decoded_raster.hpp"
#include "viewer/imaging/pixel_spacing.hpp"
#include "viewer/imaging/sample_decoder.hpp"
#include "viewer/imaging/voi_lut.hpp"

#include <viewer/core/result.hpp>
#include <viewer/core/tag_source.hpp>

#include <optional>

namespace viewer::imaging {

/**
 * @brief Options for decode_image().
 */
struct decode_options {
    /// Handling of images that are not single-sample monochrome
    color_decode_policy color_policy{color_decode_policy::reject};

    /// Parse Pixel Spacing (0028,0030); a malformed value then fails the decode
    bool read_pixel_spacing{true};
};

/**
 * @brief A decoded image and how to display it.
 */
struct decoded_image {
    decoded_raster raster;
    voi_lut_module voi_lut;
    std::optional<pixel_spacing> spacing;
};

/**
 * @brief Decodes the image held by a tag source.
 *
 * The source is only read during the call; the result owns all its data.
 */
[[nodiscard]] viewer::Result<decoded_image> decode_image(const core::tag_source& source,
                                                         const decode_options& options = {});

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_IMAGE_DECODER_HPP
