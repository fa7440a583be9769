/**
 * @file byte_swap.hpp
 * @brief Byte-order aware reading and writing of pixel samples
 *
 * Samples are assembled from individual bytes, so the result is the same
 * on little- and big-endian hosts and no separate swap pass is needed.
 *
 * @see DICOM PS3.5 Section 7.3 - Big Endian Versus Little Endian Byte Ordering
 */

#ifndef VIEWER_ENCODING_BYTE_SWAP_HPP
#define VIEWER_ENCODING_BYTE_SWAP_HPP

#include "viewer/encoding/byte_order.hpp"

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace viewer::encoding {

/// @name Sample Read Functions
/// @{

/**
 * @brief Reads an unsigned sample of type T stored in the given byte order.
 * @tparam T uint8_t, uint16_t or uint32_t
 * @param data Pointer to at least sizeof(T) bytes
 * @param order Byte order of the stored value
 * @return The value in host representation
 */
template <typename T>
    requires std::is_unsigned_v<T>
[[nodiscard]] constexpr T read_sample(const uint8_t* data, byte_order order) noexcept {
    T value = 0;
    if (order == byte_order::big_endian) {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | data[i]);
        }
    } else {
        for (std::size_t i = sizeof(T); i > 0; --i) {
            value = static_cast<T>((value << 8) | data[i - 1]);
        }
    }
    return value;
}

/// @}

/// @name Sample Write Functions
/// @{

/**
 * @brief Appends an unsigned sample of type T in the given byte order.
 * @param buffer Buffer to append to
 * @param value The value to write
 * @param order Byte order to write in
 */
template <typename T>
    requires std::is_unsigned_v<T>
inline void write_sample(std::vector<uint8_t>& buffer, T value, byte_order order) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t shift = order == byte_order::big_endian
                                      ? (sizeof(T) - 1 - i) * 8
                                      : i * 8;
        buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

/// @}

}  // namespace viewer::encoding

#endif  // VIEWER_ENCODING_BYTE_SWAP_HPP
