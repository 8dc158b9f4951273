/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgiver/cell/bit_reader.hpp"

#include <utility>

#include <fmt/format.h>

#include "powgiver/errors.hpp"

namespace powgiver {
namespace cell {

BitString::BitString(std::vector<uint8_t> data)
    : data_(std::move(data)), bit_length_(data_.size() * 8) {}

BitString::BitString(std::vector<uint8_t> data, std::size_t bit_length)
    : data_(std::move(data)), bit_length_(bit_length) {
    if (bit_length_ > data_.size() * 8) {
        throw OutOfRangeError(fmt::format("bit length {} exceeds {} available bits",
                                          bit_length_, data_.size() * 8));
    }
}

bool BitString::at(std::size_t index) const {
    if (index >= bit_length_) {
        throw OutOfRangeError(fmt::format("bit {} out of range (length {})", index, bit_length_));
    }
    return (data_[index / 8] >> (7 - index % 8)) & 1;
}

void BitReader::ensure(std::size_t n_bits) const {
    if (n_bits > remaining()) {
        throw OutOfRangeError(fmt::format("need {} bits at offset {}, only {} remain",
                                          n_bits, offset_, remaining()));
    }
}

void BitReader::skip(std::size_t n_bits) {
    ensure(n_bits);
    offset_ += n_bits;
}

std::vector<uint8_t> BitReader::read_bytes(std::size_t n_bytes) {
    if (n_bytes > remaining() / 8) {
        throw OutOfRangeError(fmt::format("need {} bytes at offset {}, only {} bits remain",
                                          n_bytes, offset_, remaining()));
    }
    std::vector<uint8_t> out(n_bytes, 0);
    for (std::size_t i = 0; i < n_bytes * 8; ++i) {
        if (bits_.at(offset_ + i)) {
            out[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    offset_ += n_bytes * 8;
    return out;
}

uint64_t BitReader::read_uint(std::size_t n_bits) {
    if (n_bits > 64) {
        throw OutOfRangeError(fmt::format("cannot read {} bits into a 64-bit integer", n_bits));
    }
    ensure(n_bits);
    uint64_t value = 0;
    for (std::size_t i = 0; i < n_bits; ++i) {
        value = (value << 1) | (bits_.at(offset_ + i) ? 1u : 0u);
    }
    offset_ += n_bits;
    return value;
}

} // namespace cell
} // namespace powgiver
