/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace powgiver {
namespace cell {

/**
 * Immutable bit sequence, MSB-first within each byte.
 * Only the first bit_length bits are readable.
 */
class BitString {
public:
    // All bits of data
    explicit BitString(std::vector<uint8_t> data);

    // @throws OutOfRangeError if bit_length exceeds 8 * data.size()
    BitString(std::vector<uint8_t> data, std::size_t bit_length);

    std::size_t length() const { return bit_length_; }
    bool at(std::size_t index) const;

private:
    std::vector<uint8_t> data_;
    std::size_t bit_length_{0};
};

/**
 * Forward-only cursor over a BitString.
 * A failed read leaves the cursor where it was.
 */
class BitReader {
public:
    explicit BitReader(const BitString& bits) : bits_(bits) {}
    // The reader borrows the bits; a temporary would dangle
    BitReader(BitString&&) = delete;

    void skip(std::size_t n_bits);
    std::vector<uint8_t> read_bytes(std::size_t n_bytes);

    // Big-endian unsigned integer of n_bits (at most 64)
    uint64_t read_uint(std::size_t n_bits);

    std::size_t position() const { return offset_; }
    std::size_t remaining() const { return bits_.length() - offset_; }

private:
    void ensure(std::size_t n_bits) const;

    const BitString& bits_;
    std::size_t offset_{0};
};

} // namespace cell
} // namespace powgiver
