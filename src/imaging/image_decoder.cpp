/**
 * @file image_decoder.cpp
 * @brief Implementation of the decode pipeline
 */

#include "viewer/imaging/image_decoder.hpp"
#include "viewer/imaging/image_metadata.hpp"

#include <viewer/integration/logger_adapter.hpp>

#include <utility>

namespace viewer::imaging {

namespace {

using integration::logger_adapter;

template <typename T, typename U>
viewer::Result<T> log_and_forward(const viewer::Result<U>& failed, const char* stage) {
    logger_adapter::debug("Image decode failed during {}: [{}] {}", stage,
                          failed.error().code, failed.error().message);
    return viewer::forward_error<T>(failed);
}

}  // namespace

viewer::Result<decoded_image> decode_image(const core::tag_source& source,
                                           const decode_options& options) {
    auto metadata = extract_image_metadata(source);
    if (metadata.is_err()) {
        return log_and_forward<decoded_image>(metadata, "metadata extraction");
    }
    const auto& meta = metadata.value();

    auto raster = decode_image_metadata(meta, options.color_policy);
    if (raster.is_err()) {
        return log_and_forward<decoded_image>(raster, "sample decoding");
    }

    std::optional<pixel_spacing> spacing;
    if (options.read_pixel_spacing) {
        auto parsed = extract_pixel_spacing(source);
        if (parsed.is_err()) {
            return log_and_forward<decoded_image>(parsed, "pixel spacing");
        }
        spacing = parsed.value();
    }

    logger_adapter::debug("Decoded {}x{} image, {} bits allocated, {} stored, {} ({})",
                          meta.rows, meta.columns, meta.bits_allocated, meta.bits_stored,
                          to_string(meta.photometric), encoding::to_string(meta.syntax));

    decoded_image image{std::move(raster.value()), resolve_voi_lut(meta.windowing), spacing};
    return viewer::ok(std::move(image));
}

}  // namespace viewer::imaging
