/**
 * @file dicom_tag.hpp
 * @brief Attribute tag used to key lookups into a tag source
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace viewer::core {

/**
 * @brief A (group, element) pair naming one DICOM attribute
 *
 * Tags compare by group first, then by element, which is the order in which
 * attributes appear in an encoded data set.
 */
class dicom_tag {
public:
    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : group_{group}, element_{element} {}

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t { return group_; }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t { return element_; }

    /**
     * @brief Formats the tag as "(GGGG,EEEE)" with upper-case hex digits
     *
     * Used to name the offending attribute in error messages.
     */
    [[nodiscard]] auto to_string() const -> std::string;

    constexpr auto operator<=>(const dicom_tag&) const noexcept = default;

private:
    uint16_t group_;
    uint16_t element_;
};

}  // namespace viewer::core
