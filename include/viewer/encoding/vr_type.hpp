#ifndef VIEWER_ENCODING_VR_TYPE_HPP
#define VIEWER_ENCODING_VR_TYPE_HPP

#include <cstdint>
#include <string>

namespace viewer::encoding {

/**
 * @brief DICOM Value Representation (VR) types.
 *
 * Each VR is encoded as two ASCII characters (e.g., "OW" for Other Word).
 * The enum values are the uint16_t representation of these two characters,
 * first character in the high byte, so the code can be rebuilt from the
 * value alone.
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */
enum class vr_type : uint16_t {
    // String VRs
    AE = 0x4145, AS = 0x4153, CS = 0x4353, DA = 0x4441, DS = 0x4453,
    DT = 0x4454, IS = 0x4953, LO = 0x4C4F, LT = 0x4C54, PN = 0x504E,
    SH = 0x5348, ST = 0x5354, TM = 0x544D, UC = 0x5543, UI = 0x5549,
    UR = 0x5552, UT = 0x5554,

    // Numeric VRs (binary encoded)
    FL = 0x464C, FD = 0x4644, SL = 0x534C, SS = 0x5353, UL = 0x554C,
    US = 0x5553,

    // Binary VRs (raw bytes)
    OB = 0x4F42,  ///< Other Byte - 8-bit pixel data
    OD = 0x4F44, OF = 0x4F46, OL = 0x4F4C, OV = 0x4F56,
    OW = 0x4F57,  ///< Other Word - 16-bit pixel data
    UN = 0x554E,  ///< Unknown - what an implicit VR parser reports

    // Special VRs
    AT = 0x4154, SQ = 0x5351, SV = 0x5356, UV = 0x5556,
};

/**
 * @brief Returns the two-character code of a VR (e.g. "OW").
 */
[[nodiscard]] inline std::string to_string(vr_type vr) {
    const auto code = static_cast<uint16_t>(vr);
    return {static_cast<char>(code >> 8), static_cast<char>(code & 0xFF)};
}

/**
 * @brief Checks if a VR carries character data.
 */
[[nodiscard]] constexpr bool is_string_vr(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: case vr_type::AS: case vr_type::CS:
        case vr_type::DA: case vr_type::DS: case vr_type::DT:
        case vr_type::IS: case vr_type::LO: case vr_type::LT:
        case vr_type::PN: case vr_type::SH: case vr_type::ST:
        case vr_type::TM: case vr_type::UC: case vr_type::UI:
        case vr_type::UR: case vr_type::UT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Gets the padding character for a VR.
 *
 * Values have even length. String VRs are padded with a space, except UI
 * which is padded with NUL like the binary VRs.
 */
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    if (vr != vr_type::UI && is_string_vr(vr)) {
        return ' ';
    }
    return '\0';
}

}  // namespace viewer::encoding

#endif  // VIEWER_ENCODING_VR_TYPE_HPP
