/**
 * @file decimal_string.hpp
 * @brief Strict parsing of DICOM Decimal String (DS) values
 */

#ifndef VIEWER_IMAGING_DETAIL_DECIMAL_STRING_HPP
#define VIEWER_IMAGING_DETAIL_DECIMAL_STRING_HPP

#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <system_error>

namespace viewer::imaging::detail {

/**
 * @brief Parses one DS value.
 *
 * Leading and trailing spaces are allowed, as is a single leading '+'.
 * The remainder may only hold the DS characters 0-9 + - . e E and must be
 * consumed completely by a finite number, so "nan" and "inf" are rejected.
 *
 * @return The value, or nullopt for empty or malformed input
 */
[[nodiscard]] inline std::optional<double> parse_decimal(std::string_view str) noexcept {
    while (!str.empty() && str.front() == ' ') {
        str.remove_prefix(1);
    }
    while (!str.empty() && str.back() == ' ') {
        str.remove_suffix(1);
    }
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
    }
    if (str.empty() || str.find_first_not_of("0123456789+-.eE") != std::string_view::npos) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Returns the first value of a multi-valued (backslash separated) string.
 */
[[nodiscard]] constexpr std::string_view first_value(std::string_view str) noexcept {
    return str.substr(0, str.find('\\'));
}

}  // namespace viewer::imaging::detail

#endif  // VIEWER_IMAGING_DETAIL_DECIMAL_STRING_HPP
