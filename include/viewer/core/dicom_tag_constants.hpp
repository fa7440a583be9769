/**
 * @file dicom_tag_constants.hpp
 * @brief Compile-time constants for the DICOM tags read by the viewer core
 *
 * Only the attributes needed to interpret and display pixel data are
 * listed, grouped by the module that defines them.
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "dicom_tag.hpp"

namespace viewer::core::tags {

// ============================================================================
// File Meta Information (Group 0x0002)
// ============================================================================

/// Transfer Syntax UID
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};

// ============================================================================
// Image Pixel Module (Group 0x0028)
// ============================================================================

/// Samples per Pixel
inline constexpr dicom_tag samples_per_pixel{0x0028, 0x0002};

/// Photometric Interpretation
inline constexpr dicom_tag photometric_interpretation{0x0028, 0x0004};

/// Planar Configuration
inline constexpr dicom_tag planar_configuration{0x0028, 0x0006};

/// Rows
inline constexpr dicom_tag rows{0x0028, 0x0010};

/// Columns
inline constexpr dicom_tag columns{0x0028, 0x0011};

/// Pixel Spacing
inline constexpr dicom_tag pixel_spacing{0x0028, 0x0030};

/// Bits Allocated
inline constexpr dicom_tag bits_allocated{0x0028, 0x0100};

/// Bits Stored
inline constexpr dicom_tag bits_stored{0x0028, 0x0101};

/// High Bit
inline constexpr dicom_tag high_bit{0x0028, 0x0102};

/// Pixel Representation
inline constexpr dicom_tag pixel_representation{0x0028, 0x0103};

// ============================================================================
// VOI LUT Module (Group 0x0028)
// ============================================================================

/// Window Center
inline constexpr dicom_tag window_center{0x0028, 0x1050};

/// Window Width
inline constexpr dicom_tag window_width{0x0028, 0x1051};

/// VOI LUT Function
inline constexpr dicom_tag voi_lut_function{0x0028, 0x1056};

/// VOI LUT Sequence
inline constexpr dicom_tag voi_lut_sequence{0x0028, 0x3010};

// ============================================================================
// Pixel Data (Group 0x7FE0)
// ============================================================================

/// Pixel Data
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

}  // namespace viewer::core::tags
