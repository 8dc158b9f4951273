#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace powgiver::crypto {

// Fill buf with CSPRNG output (OpenSSL RAND_bytes). Throws CryptoError on failure.
void random_bytes(uint8_t* buf, std::size_t len);

template <std::size_t N>
std::array<uint8_t, N> random_array() {
    std::array<uint8_t, N> out{};
    random_bytes(out.data(), out.size());
    return out;
}

} // namespace powgiver::crypto
