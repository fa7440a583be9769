#include "viewer/encoding/transfer_syntax.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace viewer::encoding {

namespace {

/**
 * @brief Static registry of the recognized Transfer Syntax UIDs.
 *
 * Each UID appears exactly once.
 */
constexpr std::array<transfer_syntax_entry, 10> TS_REGISTRY = {{
    {"1.2.840.10008.1.2",
     "Implicit VR Little Endian",
     transfer_syntax::uncompressed_little_endian},

    {"1.2.840.10008.1.2.1",
     "Explicit VR Little Endian",
     transfer_syntax::uncompressed_little_endian},

    {"1.2.840.10008.1.2.2",
     "Explicit VR Big Endian",
     transfer_syntax::uncompressed_big_endian},

    {"1.2.840.10008.1.2.4.90",
     "JPEG 2000 Image Compression (Lossless Only)",
     transfer_syntax::jpeg2000},

    {"1.2.840.10008.1.2.4.91",
     "JPEG 2000 Image Compression",
     transfer_syntax::jpeg2000},

    {"1.2.840.10008.1.2.5",
     "RLE Lossless",
     transfer_syntax::rle},

    {"1.2.840.10008.1.2.4.57",
     "JPEG Lossless, Non-Hierarchical (Process 14)",
     transfer_syntax::jpeg_lossless},

    {"1.2.840.10008.1.2.4.70",
     "JPEG Lossless, Non-Hierarchical, First-Order Prediction",
     transfer_syntax::jpeg_lossless},

    {"1.2.840.10008.1.2.4.50",
     "JPEG Baseline (Process 1)",
     transfer_syntax::jpeg_baseline},

    {"1.2.840.10008.1.2.4.51",
     "JPEG Extended (Process 2 & 4)",
     transfer_syntax::jpeg_baseline},
}};

}  // namespace

viewer::Result<transfer_syntax> resolve_transfer_syntax(std::string_view uid) {
    auto it = std::find_if(TS_REGISTRY.begin(), TS_REGISTRY.end(),
                           [&uid](const transfer_syntax_entry& entry) {
                               return entry.uid == uid;
                           });
    if (it == TS_REGISTRY.end()) {
        return viewer::viewer_error<transfer_syntax>(
            viewer::error_codes::unrecognized_transfer_syntax,
            "Unrecognized transfer syntax UID: " + std::string{uid});
    }
    return viewer::ok(it->syntax);
}

std::span<const transfer_syntax_entry> uid_table() noexcept {
    return TS_REGISTRY;
}

std::string_view to_string(transfer_syntax ts) noexcept {
    switch (ts) {
        case transfer_syntax::jpeg2000: return "JPEG2000";
        case transfer_syntax::rle: return "RLE";
        case transfer_syntax::jpeg_lossless: return "JPEGLossless";
        case transfer_syntax::jpeg_baseline: return "JPEGBaseline";
        case transfer_syntax::uncompressed_little_endian: return "UncompressedLE";
        case transfer_syntax::uncompressed_big_endian: return "UncompressedBE";
    }
    return "";
}

std::string_view to_string(compression scheme) noexcept {
    switch (scheme) {
        case compression::none: return "NONE";
        case compression::jpeg_lossless: return "JPEG_LOSSLESS";
        case compression::jpeg_baseline: return "JPEG_BASELINE";
        case compression::jpeg2000: return "JPEG_2000";
        case compression::rle: return "RLE";
    }
    return "";
}

}  // namespace viewer::encoding
