/*
 * Unit tests for the bit string reader
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

#include <powgiver/cell/bit_reader.hpp>
#include <powgiver/errors.hpp>

using namespace powgiver;
using namespace powgiver::cell;

static_assert(!std::is_constructible_v<BitReader, BitString&&>,
              "BitReader must not bind to a temporary BitString");
static_assert(std::is_constructible_v<BitReader, const BitString&>);

TEST_SUITE("Bit Reader") {
    TEST_CASE("read_bytes - aligned") {
        BitString bits({0x01, 0x02, 0x03, 0x04});
        BitReader reader(bits);
        CHECK(reader.read_bytes(2) == std::vector<uint8_t>{0x01, 0x02});
        CHECK(reader.position() == 16);
        CHECK(reader.remaining() == 16);
        CHECK(reader.read_bytes(2) == std::vector<uint8_t>{0x03, 0x04});
        CHECK(reader.remaining() == 0);
    }

    TEST_CASE("read_bytes - unaligned after skip") {
        // 0xF0 0xFF: skipping 4 bits leaves 0x0F 0xF0 split across bytes
        BitString bits({0xF0, 0xFF});
        BitReader reader(bits);
        reader.skip(4);
        CHECK(reader.read_bytes(1) == std::vector<uint8_t>{0x0F});
        CHECK(reader.position() == 12);
        CHECK(reader.remaining() == 4);
    }

    TEST_CASE("read_uint - big-endian values") {
        BitString bits({0x12, 0x34, 0x56, 0x78, 0x9A});
        BitReader reader(bits);
        CHECK(reader.read_uint(32) == 0x12345678u);
        CHECK(reader.read_uint(4) == 0x9u);
        CHECK(reader.read_uint(4) == 0xAu);
        CHECK_THROWS_AS(reader.read_uint(1), OutOfRangeError);
    }

    TEST_CASE("skip - past the end") {
        BitString bits({0x00, 0x00});
        BitReader reader(bits);
        reader.skip(16);
        CHECK(reader.remaining() == 0);
        CHECK_THROWS_AS(reader.skip(1), OutOfRangeError);
    }

    TEST_CASE("read_bytes - failure leaves cursor intact") {
        BitString bits({0xAA, 0xBB, 0xCC});
        BitReader reader(bits);
        reader.skip(8);
        CHECK_THROWS_AS(reader.read_bytes(3), OutOfRangeError);
        CHECK(reader.position() == 8);
        CHECK(reader.read_bytes(2) == std::vector<uint8_t>{0xBB, 0xCC});
    }

    TEST_CASE("read_bytes - huge byte count is out of range") {
        BitString bits({0x01, 0x02, 0x03, 0x04});
        BitReader reader(bits);
        const std::size_t huge = std::numeric_limits<std::size_t>::max() / 8 + 2;
        CHECK_THROWS_AS(reader.read_bytes(huge), OutOfRangeError);
        CHECK_THROWS_AS(reader.read_bytes(std::numeric_limits<std::size_t>::max()), OutOfRangeError);
        CHECK(reader.position() == 0);
        CHECK(reader.read_bytes(4) == std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04});
    }

    TEST_CASE("bit length limits readable bits") {
        BitString bits({0xFF, 0xFF}, 12);
        CHECK(bits.length() == 12);
        BitReader reader(bits);
        CHECK(reader.read_bytes(1) == std::vector<uint8_t>{0xFF});
        CHECK_THROWS_AS(reader.read_bytes(1), OutOfRangeError);
        CHECK(reader.read_uint(4) == 0xFu);
    }

    TEST_CASE("bit length larger than data is rejected") {
        CHECK_THROWS_AS(BitString({0x00}, 9), OutOfRangeError);
        CHECK_NOTHROW(BitString({0x00}, 8));
    }

    TEST_CASE("at - msb first") {
        BitString bits({0x80, 0x01});
        CHECK(bits.at(0));
        CHECK_FALSE(bits.at(1));
        CHECK(bits.at(15));
        CHECK_THROWS_AS(bits.at(16), OutOfRangeError);
    }
}
