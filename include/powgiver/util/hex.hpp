/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "powgiver/errors.hpp"

namespace powgiver {
namespace util {

/**
 * Decode loosely formatted hex text.
 * Strips one leading 'x' and then a "0x" prefix, left-fills an odd digit
 * count with '0' ("abc" == "0abc").
 * @throws DecodeError on any non-hex character
 */
std::vector<uint8_t> decode_hex(std::string_view input);

/**
 * Right-align data in a zero-filled buffer of exactly size bytes.
 * @throws SizeError if data is longer than size
 */
std::vector<uint8_t> left_pad(const std::vector<uint8_t>& data, std::size_t size);

// Lowercase hex, no prefix
std::string bytes_to_hex(const uint8_t* data, std::size_t len);

inline std::string bytes_to_hex(const std::vector<uint8_t>& data) {
    return bytes_to_hex(data.data(), data.size());
}

template <std::size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& data) {
    return bytes_to_hex(data.data(), data.size());
}

// Exact-width copy; anything but N bytes is a SizeError
template <std::size_t N>
std::array<uint8_t, N> to_fixed(const std::vector<uint8_t>& data) {
    if (data.size() != N) {
        throw SizeError(fmt::format("expected {} bytes, got {}", N, data.size()));
    }
    std::array<uint8_t, N> out{};
    std::copy(data.begin(), data.end(), out.begin());
    return out;
}

} // namespace util
} // namespace powgiver
