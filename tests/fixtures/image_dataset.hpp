/**
 * @file image_dataset.hpp
 * @brief Builders for in-memory image data sets used by the tests
 */

#pragma once

#include <viewer/core/dicom_dataset.hpp>
#include <viewer/core/dicom_tag_constants.hpp>
#include <viewer/encoding/byte_swap.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace viewer::test {

inline constexpr std::string_view explicit_le_uid = "1.2.840.10008.1.2.1";
inline constexpr std::string_view explicit_be_uid = "1.2.840.10008.1.2.2";

/**
 * @brief Encodes unsigned samples in the given byte order.
 */
template <typename T>
std::vector<uint8_t> encode_samples(const std::vector<T>& samples,
                                    encoding::byte_order order) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * sizeof(T));
    for (T value : samples) {
        encoding::write_sample<T>(bytes, value, order);
    }
    return bytes;
}

/**
 * @brief A complete unsigned MONOCHROME2 image with the given pixel bytes.
 *
 * Bits Stored equals Bits Allocated and High Bit is Bits Stored - 1.
 */
inline core::dicom_dataset make_grayscale_dataset(uint16_t rows,
                                                  uint16_t columns,
                                                  uint16_t bits_allocated,
                                                  const std::vector<uint8_t>& pixels,
                                                  std::string_view ts_uid = explicit_le_uid) {
    using encoding::vr_type;
    namespace tags = core::tags;

    core::dicom_dataset ds;
    ds.set_string(tags::transfer_syntax_uid, vr_type::UI, ts_uid);
    ds.set_uint16(tags::rows, vr_type::US, rows);
    ds.set_uint16(tags::columns, vr_type::US, columns);
    ds.set_uint16(tags::samples_per_pixel, vr_type::US, 1);
    ds.set_string(tags::photometric_interpretation, vr_type::CS, "MONOCHROME2");
    ds.set_uint16(tags::bits_allocated, vr_type::US, bits_allocated);
    ds.set_uint16(tags::bits_stored, vr_type::US, bits_allocated);
    ds.set_uint16(tags::high_bit, vr_type::US,
                             static_cast<uint16_t>(bits_allocated - 1));
    ds.set_uint16(tags::pixel_representation, vr_type::US, 0);
    ds.set_bytes(tags::pixel_data, bits_allocated == 16 ? vr_type::OW : vr_type::OB, pixels);
    return ds;
}

/**
 * @brief A 2x2 16-bit little endian image holding 0, 1, 256 and 65535.
 */
inline core::dicom_dataset make_sample_ct_dataset() {
    const std::vector<uint16_t> samples{0, 1, 256, 65535};
    return make_grayscale_dataset(
        2, 2, 16, encode_samples(samples, encoding::byte_order::little_endian));
}

}  // namespace viewer::test
