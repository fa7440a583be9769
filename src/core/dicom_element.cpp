/**
 * @file dicom_element.cpp
 * @brief Implementation of dicom_element
 */

#include <viewer/core/dicom_element.hpp>

#include <viewer/encoding/byte_swap.hpp>

#include <utility>

namespace viewer::core {

dicom_element::dicom_element(dicom_tag tag, encoding::vr_type vr,
                             std::vector<uint8_t> value) noexcept
    : tag_{tag}, vr_{vr}, value_{std::move(value)} {}

auto dicom_element::from_string(dicom_tag tag, encoding::vr_type vr,
                                std::string_view value) -> dicom_element {
    std::vector<uint8_t> bytes(value.begin(), value.end());
    if (bytes.size() % 2 != 0) {
        bytes.push_back(static_cast<uint8_t>(encoding::padding_char(vr)));
    }
    return dicom_element{tag, vr, std::move(bytes)};
}

auto dicom_element::from_uint16(dicom_tag tag, encoding::vr_type vr,
                                uint16_t value) -> dicom_element {
    std::vector<uint8_t> bytes;
    encoding::write_sample<uint16_t>(bytes, value, encoding::byte_order::little_endian);
    return dicom_element{tag, vr, std::move(bytes)};
}

auto dicom_element::as_string() const -> viewer::Result<std::string> {
    if (!encoding::is_string_vr(vr_)) {
        return viewer::viewer_error<std::string>(
            viewer::error_codes::invalid_argument,
            "Element " + tag_.to_string() + " with VR " + encoding::to_string(vr_) +
                " has no text value");
    }

    std::string_view text{reinterpret_cast<const char*>(value_.data()), value_.size()};

    // NUL pads UI values; writers are not consistent, so strip spaces as well
    const auto last = text.find_last_not_of(std::string_view{"\0 ", 2});
    if (last == std::string_view::npos) {
        return viewer::ok(std::string{});
    }
    text = text.substr(0, last + 1);
    text.remove_prefix(text.find_first_not_of(' '));
    return viewer::ok(std::string{text});
}

auto dicom_element::as_uint16() const noexcept -> std::optional<uint16_t> {
    if (encoding::is_string_vr(vr_) || value_.size() < sizeof(uint16_t)) {
        return std::nullopt;
    }
    return encoding::read_sample<uint16_t>(value_.data(), encoding::byte_order::little_endian);
}

}  // namespace viewer::core
