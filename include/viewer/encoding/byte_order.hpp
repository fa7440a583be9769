#ifndef VIEWER_ENCODING_BYTE_ORDER_HPP
#define VIEWER_ENCODING_BYTE_ORDER_HPP

#include <string_view>

namespace viewer::encoding {

/**
 * @brief Byte ordering of multi-byte values in the pixel data.
 *
 * Little-endian is what every transfer syntax except Explicit VR Big
 * Endian uses.
 */
enum class byte_order {
    little_endian,  ///< Least significant byte first (most common)
    big_endian      ///< Most significant byte first (retired syntax 1.2.840.10008.1.2.2)
};

/**
 * @brief Returns the label used when a byte order is displayed or persisted.
 */
[[nodiscard]] constexpr std::string_view to_string(byte_order order) noexcept {
    switch (order) {
        case byte_order::little_endian: return "LITTLE_ENDIAN";
        case byte_order::big_endian: return "BIG_ENDIAN";
    }
    return "";
}

}  // namespace viewer::encoding

#endif  // VIEWER_ENCODING_BYTE_ORDER_HPP
