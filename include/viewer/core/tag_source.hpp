/**
 * @file tag_source.hpp
 * @brief Read-only, tag-keyed view over a parsed DICOM data set
 *
 * The metadata extractor never depends on a concrete container or parser.
 * Anything that can answer typed lookups by tag (the in-memory
 * dicom_dataset, an adapter over a third-party parser, a test fixture)
 * implements this interface.
 */

#pragma once

#include "dicom_tag.hpp"

#include <viewer/encoding/vr_type.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace viewer::core {

/**
 * @brief Non-owning view of one element's encoded value
 *
 * The span points into the source's storage and is only valid while the
 * source is alive. Consumers that keep the bytes must copy them.
 */
struct element_view {
    /// Value Representation as recorded by the source
    encoding::vr_type vr;

    /// Value bytes (length == element value length)
    std::span<const uint8_t> value;
};

/**
 * @brief Abstract tag source consumed by the metadata extractor
 *
 * All lookups are typed: a getter returns std::nullopt both when the tag
 * is absent and when the stored value cannot be read as the requested
 * type. Implementations never throw from these methods.
 *
 * Thread Safety: implementations must allow concurrent const access.
 */
class tag_source {
public:
    virtual ~tag_source() = default;

    /**
     * @brief Check whether an element with this tag is present
     */
    [[nodiscard]] virtual auto contains(dicom_tag tag) const noexcept -> bool = 0;

    /**
     * @brief Read a character-string value with trailing padding removed
     * @return The string, or nullopt if absent or not a string VR
     */
    [[nodiscard]] virtual auto string_at(dicom_tag tag) const
        -> std::optional<std::string> = 0;

    /**
     * @brief Read the first value of an unsigned short element
     * @return The value, or nullopt if absent, empty, or a string VR
     */
    [[nodiscard]] virtual auto uint16_at(dicom_tag tag) const
        -> std::optional<uint16_t> = 0;

    /**
     * @brief Access the raw encoded value of an element
     * @return View of the value bytes, or nullopt if absent
     */
    [[nodiscard]] virtual auto element_at(dicom_tag tag) const
        -> std::optional<element_view> = 0;

protected:
    tag_source() = default;
    tag_source(const tag_source&) = default;
    tag_source(tag_source&&) noexcept = default;
    auto operator=(const tag_source&) -> tag_source& = default;
    auto operator=(tag_source&&) noexcept -> tag_source& = default;
};

}  // namespace viewer::core
