#ifndef VIEWER_ENCODING_TRANSFER_SYNTAX_HPP
#define VIEWER_ENCODING_TRANSFER_SYNTAX_HPP

#include "viewer/encoding/byte_order.hpp"

#include <viewer/core/result.hpp>

#include <span>
#include <string_view>

namespace viewer::encoding {

/**
 * @brief Transfer Syntaxes the viewer recognizes.
 *
 * Several UIDs may map onto one member (e.g. Implicit and Explicit VR
 * Little Endian are both uncompressed_little_endian: the VR encoding only
 * matters to the parser, not to pixel decoding).
 *
 * @see DICOM PS3.5 Section 10 - Transfer Syntax
 */
enum class transfer_syntax {
    jpeg2000,
    rle,
    jpeg_lossless,
    jpeg_baseline,
    uncompressed_little_endian,
    uncompressed_big_endian
};

/**
 * @brief Compression scheme applied to the pixel data.
 */
enum class compression {
    none,
    jpeg_lossless,
    jpeg_baseline,
    jpeg2000,
    rle
};

/**
 * @brief How a transfer syntax encodes pixel data.
 */
struct transfer_syntax_traits {
    compression scheme;
    byte_order endianness;

    bool operator==(const transfer_syntax_traits&) const noexcept = default;
};

/**
 * @brief Registry entry mapping one UID to a transfer syntax.
 */
struct transfer_syntax_entry {
    std::string_view uid;
    std::string_view name;
    transfer_syntax syntax;
};

/// @name Resolution
/// @{

/**
 * @brief Resolves a Transfer Syntax UID by exact match.
 * @param uid The UID from (0002,0010), without padding
 * @return The transfer syntax, or error_codes::unrecognized_transfer_syntax
 */
[[nodiscard]] viewer::Result<transfer_syntax> resolve_transfer_syntax(
    std::string_view uid);

/**
 * @brief Maps a transfer syntax to its compression and byte order.
 *
 * Total over the enumeration; the switch has no default branch so that
 * -Werror=switch rejects a new member that is not handled here.
 */
[[nodiscard]] constexpr transfer_syntax_traits classify(transfer_syntax ts) noexcept {
    switch (ts) {
        case transfer_syntax::uncompressed_big_endian:
            return {compression::none, byte_order::big_endian};
        case transfer_syntax::uncompressed_little_endian:
            return {compression::none, byte_order::little_endian};
        case transfer_syntax::rle:
            return {compression::rle, byte_order::little_endian};
        case transfer_syntax::jpeg_lossless:
            return {compression::jpeg_lossless, byte_order::little_endian};
        case transfer_syntax::jpeg2000:
            return {compression::jpeg2000, byte_order::little_endian};
        case transfer_syntax::jpeg_baseline:
            return {compression::jpeg_baseline, byte_order::little_endian};
    }
    // Unreachable for valid enumerators
    return {compression::none, byte_order::little_endian};
}

/**
 * @brief Transfer syntax assumed when a data set carries no UID at all.
 *
 * Never used as a fallback for an unrecognized UID.
 */
[[nodiscard]] constexpr transfer_syntax default_transfer_syntax() noexcept {
    return transfer_syntax::uncompressed_little_endian;
}

/**
 * @brief Returns every recognized UID in registry order.
 */
[[nodiscard]] std::span<const transfer_syntax_entry> uid_table() noexcept;

/// @}

/// @name String Conversion
/// @{

[[nodiscard]] std::string_view to_string(transfer_syntax ts) noexcept;

[[nodiscard]] std::string_view to_string(compression scheme) noexcept;

/// @}

}  // namespace viewer::encoding

#endif  // VIEWER_ENCODING_TRANSFER_SYNTAX_HPP
