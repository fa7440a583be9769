/**
 * @file image_metadata.hpp
 * @brief Validated Image Pixel attributes and their extraction
 *
 * image_metadata holds everything the sample decoder and the windowing
 * resolver need, copied out of a tag source so that the source can be
 * released as soon as extraction finishes.
 *
 * @see DICOM PS3.3 C.7.6.3 - Image Pixel Module
 */

#ifndef VIEWER_IMAGING_IMAGE_METADATA_HPP
#define VIEWER_IMAGING_IMAGE_METADATA_HPP

#include "viewer/imaging/image_types.hpp"
#include "viewer/imaging/voi_lut.hpp"

#include <viewer/core/result.hpp>
#include <viewer/core/tag_source.hpp>
#include <viewer/encoding/transfer_syntax.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace viewer::imaging {

/**
 * @brief Image Pixel attributes of one data set.
 *
 * Built once by extract_image_metadata() and not modified afterwards.
 * Owns its copy of the pixel data bytes.
 */
struct image_metadata {
    /// Transfer syntax resolved from (0002,0010)
    encoding::transfer_syntax syntax{encoding::default_transfer_syntax()};

    /// Compression and byte order derived from syntax
    encoding::transfer_syntax_traits traits{
        encoding::classify(encoding::default_transfer_syntax())};

    /// Rows (0028,0010)
    uint16_t rows{0};

    /// Columns (0028,0011)
    uint16_t columns{0};

    /// Samples per Pixel (0028,0002)
    uint16_t samples_per_pixel{1};

    /// Photometric Interpretation (0028,0004)
    photometric_interpretation photometric{photometric_interpretation::monochrome2};

    /// Planar Configuration (0028,0006), interlaced when absent
    planar_configuration planar{planar_configuration::interlaced};

    /// Bits Allocated (0028,0100)
    uint16_t bits_allocated{0};

    /// Bits Stored (0028,0101)
    uint16_t bits_stored{0};

    /// High Bit (0028,0102)
    uint16_t high_bit{0};

    /// Pixel Representation (0028,0103)
    pixel_representation representation{pixel_representation::unsigned_integer};

    /// Pixel Data (7FE0,0010) value bytes, exactly the element length
    std::vector<uint8_t> pixel_data;

    /// VR of the Pixel Data element
    pixel_data_vr pixel_vr{pixel_data_vr::ob};

    /// Window Center / Width / VOI LUT Function, absent when none is set
    std::optional<windowing_hint> windowing;

    /**
     * @brief Number of pixels in one frame (rows x columns).
     */
    [[nodiscard]] std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(rows) * columns;
    }
};

/**
 * @brief Extracts and validates the Image Pixel attributes.
 *
 * Attributes are checked in a fixed order and the first failure is
 * returned, so e.g. a data set without Rows reports missing_rows before
 * any pixel data is looked at.
 *
 * @param source Tag source to read; only read, and not referenced after
 *               the call returns
 * @return The metadata, or one of the missing_* / invalid_enumerated_value /
 *         unrecognized_transfer_syntax / unsupported_voi_lut_sequence errors
 */
[[nodiscard]] viewer::Result<image_metadata> extract_image_metadata(
    const core::tag_source& source);

/**
 * @brief Reads the windowing attributes permissively.
 *
 * Unparsable center or width values and unrecognized VOI LUT Function
 * terms are treated as absent. Multi-valued attributes contribute their
 * first value. Without a function, a present center implies LINEAR.
 *
 * @return The hint, or nullopt when neither a function nor a center is set
 */
[[nodiscard]] std::optional<windowing_hint> extract_windowing_hint(
    const core::tag_source& source);

}  // namespace viewer::imaging

#endif  // VIEWER_IMAGING_IMAGE_METADATA_HPP
