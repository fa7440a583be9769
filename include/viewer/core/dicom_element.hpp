/**
 * @file dicom_element.hpp
 * @brief One attribute of an in-memory data set: tag, VR and value bytes
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include "dicom_tag.hpp"
#include "result.hpp"

#include <viewer/encoding/vr_type.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace viewer::core {

/**
 * @brief Owned element value as it would appear in an Explicit VR Little
 *        Endian stream
 *
 * Strings are stored padded to even length; US values are stored as two
 * little-endian bytes.
 *
 * @code
 * auto rows = dicom_element::from_uint16(tags::rows, vr_type::US, 512);
 * auto pi = dicom_element::from_string(tags::photometric_interpretation,
 *                                      vr_type::CS, "MONOCHROME2");
 * @endcode
 */
class dicom_element {
public:
    dicom_element(dicom_tag tag, encoding::vr_type vr, std::vector<uint8_t> value) noexcept;

    /**
     * @brief Create a string element, padded with the VR's padding character
     */
    [[nodiscard]] static auto from_string(dicom_tag tag, encoding::vr_type vr,
                                          std::string_view value) -> dicom_element;

    [[nodiscard]] static auto from_uint16(dicom_tag tag, encoding::vr_type vr,
                                          uint16_t value) -> dicom_element;

    [[nodiscard]] auto tag() const noexcept -> dicom_tag { return tag_; }

    [[nodiscard]] auto vr() const noexcept -> encoding::vr_type { return vr_; }

    [[nodiscard]] auto value() const noexcept -> std::span<const uint8_t> { return value_; }

    /**
     * @brief The value as text, without padding or surrounding spaces
     * @return invalid_argument for a non-string VR
     */
    [[nodiscard]] auto as_string() const -> viewer::Result<std::string>;

    /**
     * @brief The first US value
     * @return nullopt for a string VR or fewer than two value bytes
     */
    [[nodiscard]] auto as_uint16() const noexcept -> std::optional<uint16_t>;

private:
    dicom_tag tag_;
    encoding::vr_type vr_;
    std::vector<uint8_t> value_;
};

}  // namespace viewer::core
