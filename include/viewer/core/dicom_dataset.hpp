/**
 * @file dicom_dataset.hpp
 * @brief DICOM Dataset - in-memory tag source
 *
 * This file provides the dicom_dataset class, an ordered collection of
 * DICOM Data Elements that implements the tag_source interface. It is a
 * container only: populating it from a byte stream is the job of an
 * external parser.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Set
 */

#pragma once

#include "dicom_element.hpp"
#include "dicom_tag.hpp"
#include "tag_source.hpp"

#include <viewer/encoding/vr_type.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace viewer::core {

/**
 * @brief Ordered collection of Data Elements usable as a tag source
 *
 * Elements are stored in ascending tag order. Setting a tag that already
 * exists replaces its element.
 *
 * Thread Safety: concurrent const access is safe; mutation requires
 * external synchronization.
 *
 * @example
 * @code
 * dicom_dataset ds;
 * ds.set_uint16(tags::rows, encoding::vr_type::US, 512);
 * ds.set_string(tags::photometric_interpretation, encoding::vr_type::CS,
 *               "MONOCHROME2");
 * ds.set_bytes(tags::pixel_data, encoding::vr_type::OW, pixels);
 *
 * auto metadata = imaging::extract_image_metadata(ds);
 * @endcode
 */
class dicom_dataset final : public tag_source {
public:
    /// Storage type for elements (ordered by tag)
    using storage_type = std::map<dicom_tag, dicom_element>;

    using const_iterator = storage_type::const_iterator;

    dicom_dataset() = default;
    dicom_dataset(const dicom_dataset&) = default;
    dicom_dataset(dicom_dataset&&) noexcept = default;
    auto operator=(const dicom_dataset&) -> dicom_dataset& = default;
    auto operator=(dicom_dataset&&) noexcept -> dicom_dataset& = default;
    ~dicom_dataset() override = default;

    // ========================================================================
    // tag_source
    // ========================================================================

    [[nodiscard]] auto contains(dicom_tag tag) const noexcept -> bool override;

    [[nodiscard]] auto string_at(dicom_tag tag) const
        -> std::optional<std::string> override;

    [[nodiscard]] auto uint16_at(dicom_tag tag) const
        -> std::optional<uint16_t> override;

    [[nodiscard]] auto element_at(dicom_tag tag) const
        -> std::optional<element_view> override;

    // ========================================================================
    // Modification
    // ========================================================================

    void set_string(dicom_tag tag, encoding::vr_type vr, std::string_view value);

    void set_uint16(dicom_tag tag, encoding::vr_type vr, uint16_t value);

    /**
     * @brief Set a binary value (OB, OW, ...) for the given tag
     * @param data The raw bytes, copied into the element
     */
    void set_bytes(dicom_tag tag, encoding::vr_type vr,
                   std::span<const uint8_t> data);

    /**
     * @brief Remove an element from the dataset
     * @return true if an element was removed
     */
    auto remove(dicom_tag tag) -> bool;

    void clear() noexcept;

    // ========================================================================
    // Iteration / Size
    // ========================================================================

    [[nodiscard]] auto begin() const noexcept -> const_iterator;
    [[nodiscard]] auto end() const noexcept -> const_iterator;

    [[nodiscard]] auto size() const noexcept -> size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;

private:
    void insert(dicom_element element);

    [[nodiscard]] auto find(dicom_tag tag) const noexcept -> const dicom_element*;

    storage_type elements_;
};

}  // namespace viewer::core
