/**
 * @file dicom_dataset.cpp
 * @brief Implementation of DICOM Dataset
 */

#include <viewer/core/dicom_dataset.hpp>

#include <utility>
#include <vector>

namespace viewer::core {

// ============================================================================
// tag_source
// ============================================================================

auto dicom_dataset::contains(dicom_tag tag) const noexcept -> bool {
    return elements_.contains(tag);
}

auto dicom_dataset::string_at(dicom_tag tag) const -> std::optional<std::string> {
    const auto* elem = find(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }

    auto result = elem->as_string();
    if (result.is_err()) {
        return std::nullopt;
    }
    return result.value();
}

auto dicom_dataset::uint16_at(dicom_tag tag) const -> std::optional<uint16_t> {
    const auto* elem = find(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }
    return elem->as_uint16();
}

auto dicom_dataset::element_at(dicom_tag tag) const -> std::optional<element_view> {
    const auto* elem = find(tag);
    if (elem == nullptr) {
        return std::nullopt;
    }
    return element_view{elem->vr(), elem->value()};
}

auto dicom_dataset::find(dicom_tag tag) const noexcept -> const dicom_element* {
    auto it = elements_.find(tag);
    if (it == elements_.end()) {
        return nullptr;
    }
    return &it->second;
}

// ============================================================================
// Modification
// ============================================================================

void dicom_dataset::insert(dicom_element element) {
    elements_.insert_or_assign(element.tag(), std::move(element));
}

void dicom_dataset::set_string(dicom_tag tag, encoding::vr_type vr,
                               std::string_view value) {
    insert(dicom_element::from_string(tag, vr, value));
}

void dicom_dataset::set_uint16(dicom_tag tag, encoding::vr_type vr, uint16_t value) {
    insert(dicom_element::from_uint16(tag, vr, value));
}

void dicom_dataset::set_bytes(dicom_tag tag, encoding::vr_type vr,
                              std::span<const uint8_t> data) {
    insert(dicom_element{tag, vr, std::vector<uint8_t>(data.begin(), data.end())});
}

auto dicom_dataset::remove(dicom_tag tag) -> bool {
    return elements_.erase(tag) > 0;
}

void dicom_dataset::clear() noexcept {
    elements_.clear();
}

// ============================================================================
// Iteration / Size
// ============================================================================

auto dicom_dataset::begin() const noexcept -> const_iterator {
    return elements_.begin();
}

auto dicom_dataset::end() const noexcept -> const_iterator {
    return elements_.end();
}

auto dicom_dataset::size() const noexcept -> size_t {
    return elements_.size();
}

auto dicom_dataset::empty() const noexcept -> bool {
    return elements_.empty();
}

}  // namespace viewer::core
