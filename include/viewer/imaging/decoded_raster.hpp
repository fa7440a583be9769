/**
 * @file decoded_raster.hpp
 * @brief Decoded pixel buffers handed to the rendering side
 */

#ifndef VIEWER_IMAGING_DECODED_RASTER_HPP
#define VIEWER_IMAGING_DECODED_RASTER_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <variant>
#include <vector>

namespace viewer::imaging {

/**
 * @brief Sample buffer of a grayscale raster.
 *
 * The alternative in use matches Bits Allocated (8, 16 or 32). Samples
 * are in host byte order, row-major, one per pixel.
 */
using grayscale_samples =
    std::variant<std::vector<uint8_t>, std::vector<uint16_t>, std::vector<uint32_t>>;

/**
 * @brief Single-channel raster of unsigned stored values.
 */
struct grayscale_raster {
    uint16_t rows{0};
    uint16_t columns{0};
    grayscale_samples samples;

    /**
     * @brief Width in bits of one sample (8, 16 or 32).
     */
    [[nodiscard]] uint16_t bits_allocated() const noexcept {
        return static_cast<uint16_t>(std::visit(
            [](const auto& buffer) {
                return sizeof(typename std::decay_t<decltype(buffer)>::value_type) * 8;
            },
            samples));
    }

    [[nodiscard]] std::size_t sample_count() const noexcept {
        return std::visit([](const auto& buffer) { return buffer.size(); }, samples);
    }
};

/**
 * @brief Packed 32-bit color raster, one element per pixel.
 *
 * Only produced by decode_rgb_best_effort(); channel order is whatever the
 * source bytes contained.
 */
struct rgb_raster {
    uint16_t rows{0};
    uint16_t columns{0};
    std::vector<uint32_t> pixels;
};

using decoded_raster = std::variant<grayscale_raster, rgb_raster>;

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_DECODED_RASTER_HPP
