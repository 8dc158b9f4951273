/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgiver/util/hex.hpp"

#include <fmt/format.h>

namespace powgiver {
namespace util {

static int hexval(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

std::vector<uint8_t> decode_hex(std::string_view input) {
    std::string_view digits = input;
    if (!digits.empty() && digits.front() == 'x') {
        digits.remove_prefix(1);
    }
    if (digits.size() >= 2 && digits[0] == '0' && digits[1] == 'x') {
        digits.remove_prefix(2);
    }

    std::string src;
    src.reserve(digits.size() + 1);
    if (digits.size() % 2 != 0) {
        src.push_back('0');
    }
    src.append(digits.data(), digits.size());

    std::vector<uint8_t> out;
    out.reserve(src.size() / 2);
    for (std::size_t i = 0; i < src.size(); i += 2) {
        int hi = hexval(src[i]);
        int lo = hexval(src[i + 1]);
        if (hi < 0 || lo < 0) {
            throw DecodeError(fmt::format("invalid hex string '{}'", input));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::vector<uint8_t> left_pad(const std::vector<uint8_t>& data, std::size_t size) {
    if (data.size() > size) {
        throw SizeError(fmt::format("value of {} bytes does not fit in {} bytes", data.size(), size));
    }
    std::vector<uint8_t> out(size, 0);
    std::copy(data.begin(), data.end(), out.begin() + (size - data.size()));
    return out;
}

std::string bytes_to_hex(const uint8_t* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out[i * 2] = kHex[(data[i] >> 4) & 0x0F];
        out[i * 2 + 1] = kHex[data[i] & 0x0F];
    }
    return out;
}

} // namespace util
} // namespace powgiver
