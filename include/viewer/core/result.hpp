/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the DICOM viewer core
 *
 * Every fallible operation of the viewer core returns a Result<T> built on
 * common_system's Result pattern. Failures carry one of the codes below,
 * a message naming the rejected attribute, and the "viewer" module tag.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace viewer {

/**
 * @brief Result type alias for viewer operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Viewer-specific error codes
 *
 * Error code range: -700 to -799
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int viewer_base = -700;

    // Format resolution errors (-700 to -709)
    constexpr int unrecognized_transfer_syntax = viewer_base - 0;

    // Metadata errors (-710 to -739)
    constexpr int missing_rows = viewer_base - 10;
    constexpr int missing_columns = viewer_base - 11;
    constexpr int missing_samples_per_pixel = viewer_base - 12;
    constexpr int missing_photometric_interpretation = viewer_base - 13;
    constexpr int missing_bits_allocated = viewer_base - 14;
    constexpr int missing_bits_stored = viewer_base - 15;
    constexpr int missing_high_bit = viewer_base - 16;
    constexpr int missing_pixel_representation = viewer_base - 17;
    constexpr int missing_pixel_data = viewer_base - 18;
    constexpr int invalid_enumerated_value = viewer_base - 19;
    constexpr int invalid_pixel_spacing = viewer_base - 20;

    // Unsupported attribute combinations (-740 to -759)
    constexpr int unsupported_pixel_data_representation = viewer_base - 40;
    constexpr int unsupported_bit_layout = viewer_base - 41;
    constexpr int unsupported_photometric_interpretation = viewer_base - 42;
    constexpr int unsupported_pixel_representation = viewer_base - 43;
    constexpr int unsupported_bit_depth = viewer_base - 44;
    constexpr int pixel_data_size_mismatch = viewer_base - 45;
    constexpr int invalid_window = viewer_base - 46;

    // Not implemented (-760 to -769)
    constexpr int unsupported_compression = viewer_base - 60;
    constexpr int unsupported_voi_lut_sequence = viewer_base - 61;
    constexpr int unsupported_color_layout = viewer_base - 62;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a viewer error result with module context
 * @tparam T The result value type
 * @param code Error code from viewer::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> viewer_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "viewer");
    }
    return kcenon::common::make_error<T>(code, message, "viewer", details);
}

/**
 * @brief Re-wrap the error of one result as a Result of another type
 *
 * Used when a failure found while building one value aborts the
 * construction of an enclosing value.
 */
template <typename T, typename U>
inline Result<T> forward_error(const Result<U>& failed) {
    return Result<T>::err(failed.error());
}

} // namespace viewer
