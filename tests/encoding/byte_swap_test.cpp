/**
 * @file byte_swap_test.cpp
 * @brief Unit tests for byte-order aware sample assembly
 */

#include <catch2/catch_test_macros.hpp>

#include <viewer/encoding/byte_swap.hpp>

#include <array>
#include <vector>

using namespace viewer::encoding;

// ============================================================================
// Sample Read / Write Tests
// ============================================================================

TEST_CASE("read_sample honours byte order", "[encoding][byte_swap]") {
    const std::array<uint8_t, 4> bytes{0x12, 0x34, 0x56, 0x78};

    SECTION("8-bit samples ignore byte order") {
        CHECK(read_sample<uint8_t>(bytes.data(), byte_order::little_endian) == 0x12);
        CHECK(read_sample<uint8_t>(bytes.data(), byte_order::big_endian) == 0x12);
    }

    SECTION("16-bit samples") {
        CHECK(read_sample<uint16_t>(bytes.data(), byte_order::little_endian) == 0x3412);
        CHECK(read_sample<uint16_t>(bytes.data(), byte_order::big_endian) == 0x1234);
    }

    SECTION("32-bit samples") {
        CHECK(read_sample<uint32_t>(bytes.data(), byte_order::little_endian) == 0x78563412);
        CHECK(read_sample<uint32_t>(bytes.data(), byte_order::big_endian) == 0x12345678);
    }
}

TEST_CASE("write_sample appends in byte order", "[encoding][byte_swap]") {
    std::vector<uint8_t> buffer;

    SECTION("little endian") {
        write_sample<uint16_t>(buffer, 0x1234, byte_order::little_endian);
        CHECK(buffer == std::vector<uint8_t>{0x34, 0x12});
    }

    SECTION("big endian") {
        write_sample<uint32_t>(buffer, 0x12345678, byte_order::big_endian);
        CHECK(buffer == std::vector<uint8_t>{0x12, 0x34, 0x56, 0x78});
    }
}

TEST_CASE("byte_order string form", "[encoding][byte_swap]") {
    CHECK(to_string(byte_order::little_endian) == "LITTLE_ENDIAN");
    CHECK(to_string(byte_order::big_endian) == "BIG_ENDIAN");
}
