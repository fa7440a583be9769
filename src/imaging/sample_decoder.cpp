/**
 * @file sample_decoder.cpp
 * @brief Implementation of grayscale and best-effort color decoding
 */

#include "viewer/imaging/sample_decoder.hpp"

#include <viewer/encoding/byte_swap.hpp>
#include <viewer/integration/logger_adapter.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace viewer::imaging {

namespace {

using integration::logger_adapter;

bool is_single_sample_monochrome(const image_metadata& metadata) noexcept {
    return is_monochrome(metadata.photometric) && metadata.samples_per_pixel == 1;
}

viewer::Result<decoded_raster> reject_compressed(const image_metadata& metadata) {
    const auto scheme = metadata.traits.scheme;
    return viewer::viewer_error<decoded_raster>(
        viewer::error_codes::unsupported_compression,
        "Compressed pixel data is not supported: " +
            std::string(encoding::to_string(scheme)) + " (" +
            std::string(encoding::to_string(metadata.syntax)) + ")");
}

/**
 * @brief Copies rows x columns samples of type T out of the byte buffer.
 *
 * Bytes past the last sample are ignored; DICOM pads odd-length values.
 */
template <typename T>
viewer::Result<decoded_raster> unpack_samples(const image_metadata& metadata) {
    const std::size_t count = metadata.pixel_count();
    const std::size_t needed = count * sizeof(T);
    if (metadata.pixel_data.size() < needed) {
        return viewer::viewer_error<decoded_raster>(
            viewer::error_codes::pixel_data_size_mismatch,
            "Pixel Data holds " + std::to_string(metadata.pixel_data.size()) +
                " bytes, " + std::to_string(metadata.rows) + "x" +
                std::to_string(metadata.columns) + " samples of " +
                std::to_string(sizeof(T) * 8) + " bits need " + std::to_string(needed));
    }

    std::vector<T> samples(count);
    const uint8_t* src = metadata.pixel_data.data();
    const auto order = metadata.traits.endianness;
    for (std::size_t i = 0; i < count; ++i) {
        samples[i] = encoding::read_sample<T>(src + i * sizeof(T), order);
    }

    grayscale_raster raster;
    raster.rows = metadata.rows;
    raster.columns = metadata.columns;
    raster.samples = std::move(samples);
    return viewer::ok(decoded_raster{std::move(raster)});
}

}  // namespace

std::string_view to_string(color_decode_policy policy) noexcept {
    switch (policy) {
        case color_decode_policy::reject: return "reject";
        case color_decode_policy::best_effort: return "best_effort";
    }
    return "";
}

viewer::Result<decoded_raster> decode_grayscale(const image_metadata& metadata) {
    using namespace viewer::error_codes;

    if (metadata.traits.scheme != encoding::compression::none) {
        return reject_compressed(metadata);
    }

    if (!is_single_sample_monochrome(metadata)) {
        return viewer::viewer_error<decoded_raster>(
            unsupported_color_layout,
            "Grayscale decoding needs MONOCHROME1/2 with 1 sample per pixel, got " +
                std::string(to_string(metadata.photometric)) + " with " +
                std::to_string(metadata.samples_per_pixel) + " samples");
    }

    if (metadata.pixel_vr == pixel_data_vr::ow && metadata.bits_allocated != 16) {
        return viewer::viewer_error<decoded_raster>(
            unsupported_pixel_data_representation,
            "OW Pixel Data needs 16 bits allocated, got " +
                std::to_string(metadata.bits_allocated));
    }

    if (metadata.high_bit + 1 != metadata.bits_stored) {
        return viewer::viewer_error<decoded_raster>(
            unsupported_bit_layout,
            "High Bit " + std::to_string(metadata.high_bit) +
                " does not match Bits Stored " + std::to_string(metadata.bits_stored));
    }

    if (metadata.photometric == photometric_interpretation::monochrome1) {
        return viewer::viewer_error<decoded_raster>(
            unsupported_photometric_interpretation,
            "MONOCHROME1 is not supported");
    }

    if (metadata.representation != pixel_representation::unsigned_integer) {
        return viewer::viewer_error<decoded_raster>(
            unsupported_pixel_representation,
            "Signed pixel data is not supported");
    }

    switch (metadata.bits_allocated) {
        case 8: return unpack_samples<uint8_t>(metadata);
        case 16: return unpack_samples<uint16_t>(metadata);
        case 32: return unpack_samples<uint32_t>(metadata);
        default:
            return viewer::viewer_error<decoded_raster>(
                unsupported_bit_depth,
                "Bits Allocated " + std::to_string(metadata.bits_allocated) +
                    " is not 8, 16 or 32");
    }
}

viewer::Result<decoded_raster> decode_color(const image_metadata& metadata) {
    return viewer::viewer_error<decoded_raster>(
        viewer::error_codes::unsupported_color_layout,
        "Color decoding is not implemented for " +
            std::string(to_string(metadata.photometric)) + " with " +
            std::to_string(metadata.samples_per_pixel) + " samples per pixel");
}

viewer::Result<decoded_raster> decode_rgb_best_effort(const image_metadata& metadata) {
    logger_adapter::warn(
        "Best-effort RGB decode of {} image ({}x{}, {} samples, planar {}); "
        "layout is not interpreted",
        to_string(metadata.photometric), metadata.rows, metadata.columns,
        metadata.samples_per_pixel, static_cast<uint16_t>(metadata.planar));

    const auto& bytes = metadata.pixel_data;
    if (bytes.size() % 4 != 0) {
        return viewer::viewer_error<decoded_raster>(
            viewer::error_codes::pixel_data_size_mismatch,
            "Packed RGB needs a multiple of 4 bytes, got " + std::to_string(bytes.size()));
    }

    std::vector<uint32_t> pixels(bytes.size() / 4);
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = encoding::read_sample<uint32_t>(bytes.data() + i * 4,
                                                    encoding::byte_order::little_endian);
    }

    rgb_raster raster;
    raster.rows = metadata.rows;
    raster.columns = metadata.columns;
    raster.pixels = std::move(pixels);
    return viewer::ok(decoded_raster{std::move(raster)});
}

viewer::Result<decoded_raster> decode_image_metadata(const image_metadata& metadata,
                                                     color_decode_policy policy) {
    if (metadata.traits.scheme != encoding::compression::none) {
        return reject_compressed(metadata);
    }
    if (is_single_sample_monochrome(metadata)) {
        return decode_grayscale(metadata);
    }

    switch (policy) {
        case color_decode_policy::reject: return decode_color(metadata);
        case color_decode_policy::best_effort: return decode_rgb_best_effort(metadata);
    }
    return decode_color(metadata);
}

}  // namespace viewer::imaging
