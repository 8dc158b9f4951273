#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <powgiver/crypto/sha256.hpp>
#include <powgiver/giver/pow_params.hpp>
#include <powgiver/ton/address.hpp>

namespace powgiver::giver {

using Random = std::array<uint8_t, 16>;

// Hashing form carries the 0x00F2 prefix; the wire form leaves it to the
// message envelope. Hash the first, send the second.
enum class JobForm {
    Hashing,
    Wire,
};

constexpr std::array<uint8_t, 2> kJobPrefix{0x00, 0xF2};
constexpr std::array<uint8_t, 4> kMineOp{'M', 'i', 'n', 'e'};

constexpr std::size_t kWireJobSize = 4 + 1 + 4 + 32 + 16 + 16 + 16;
constexpr std::size_t kHashingJobSize = kJobPrefix.size() + kWireJobSize;

// [prefix] "Mine" | flags(0) | expires(u32 BE) | wallet hash
std::vector<uint8_t> build_job_header(const std::array<uint8_t, 32>& wallet_hash,
                                      uint32_t expires_sec, JobForm form);

// header ++ random ++ seed ++ random. All throw UnsupportedWorkchainError
// unless wallet.workchain == 0.
std::vector<uint8_t> build_hashing_job(const Seed& seed, const Random& random,
                                       const ton::Address& wallet, uint32_t expires_sec);
std::vector<uint8_t> build_wire_job(const Seed& seed, const Random& random,
                                    const ton::Address& wallet, uint32_t expires_sec);

crypto::Sha256Digest hash_mining_job(const Seed& seed, const Random& random,
                                     const ton::Address& wallet, uint32_t expires_sec);

// True iff sha256(hashing job) equals hash. A mismatch is not an error.
bool check_mining_job_hash(const Seed& seed, const Random& random,
                           const ton::Address& wallet, uint32_t expires_sec,
                           const std::vector<uint8_t>& hash);

} // namespace powgiver::giver
