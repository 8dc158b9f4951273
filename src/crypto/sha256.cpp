/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgiver/crypto/sha256.hpp"
#include "powgiver/errors.hpp"
#include <openssl/evp.h>

namespace powgiver {
namespace crypto {

Sha256Digest sha256(const uint8_t* data, std::size_t len) {
    Sha256Digest digest{};
    unsigned int out_len = static_cast<unsigned int>(digest.size());

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw CryptoError("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw CryptoError("Failed to initialize SHA256");
    }

    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw CryptoError("Failed to update SHA256");
    }

    if (EVP_DigestFinal_ex(ctx, digest.data(), &out_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw CryptoError("Failed to finalize SHA256");
    }

    EVP_MD_CTX_free(ctx);
    return digest;
}

} // namespace crypto
} // namespace powgiver
