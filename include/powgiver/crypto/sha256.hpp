/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace powgiver {
namespace crypto {

using Sha256Digest = std::array<uint8_t, 32>;

/**
 * Compute single SHA256 hash
 * @param data Input data to hash
 * @return 32-byte digest
 * @throws CryptoError if OpenSSL fails
 */
Sha256Digest sha256(const uint8_t* data, std::size_t len);

inline Sha256Digest sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

} // namespace crypto
} // namespace powgiver
