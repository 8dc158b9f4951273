#include <powgiver/giver/mining_job.hpp>

#include <algorithm>

#include <fmt/core.h>

#include <powgiver/errors.hpp>

namespace powgiver::giver {

static void require_basic_workchain(const ton::Address& wallet) {
    if (wallet.workchain != 0) {
        throw UnsupportedWorkchainError(
            fmt::format("only wallets in the basic workchain are supported (got workchain {})",
                        wallet.workchain));
    }
}

static void append_u32_be(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

std::vector<uint8_t> build_job_header(const std::array<uint8_t, 32>& wallet_hash,
                                      uint32_t expires_sec, JobForm form) {
    std::vector<uint8_t> header;
    header.reserve(kJobPrefix.size() + 4 + 1 + 4 + wallet_hash.size());
    if (form == JobForm::Hashing) {
        header.insert(header.end(), kJobPrefix.begin(), kJobPrefix.end());
    }
    header.insert(header.end(), kMineOp.begin(), kMineOp.end());
    header.push_back(0); // workchain * 4 + bounce, always zero here
    append_u32_be(header, expires_sec);
    header.insert(header.end(), wallet_hash.begin(), wallet_hash.end());
    return header;
}

static std::vector<uint8_t> build_job(const Seed& seed, const Random& random,
                                      const ton::Address& wallet, uint32_t expires_sec,
                                      JobForm form) {
    require_basic_workchain(wallet);

    std::vector<uint8_t> job = build_job_header(wallet.hash, expires_sec, form);
    job.insert(job.end(), random.begin(), random.end());
    job.insert(job.end(), seed.begin(), seed.end());
    job.insert(job.end(), random.begin(), random.end());
    return job;
}

std::vector<uint8_t> build_hashing_job(const Seed& seed, const Random& random,
                                       const ton::Address& wallet, uint32_t expires_sec) {
    return build_job(seed, random, wallet, expires_sec, JobForm::Hashing);
}

std::vector<uint8_t> build_wire_job(const Seed& seed, const Random& random,
                                    const ton::Address& wallet, uint32_t expires_sec) {
    return build_job(seed, random, wallet, expires_sec, JobForm::Wire);
}

crypto::Sha256Digest hash_mining_job(const Seed& seed, const Random& random,
                                     const ton::Address& wallet, uint32_t expires_sec) {
    return crypto::sha256(build_hashing_job(seed, random, wallet, expires_sec));
}

bool check_mining_job_hash(const Seed& seed, const Random& random,
                           const ton::Address& wallet, uint32_t expires_sec,
                           const std::vector<uint8_t>& hash) {
    const auto digest = hash_mining_job(seed, random, wallet, expires_sec);
    return hash.size() == digest.size() && std::equal(digest.begin(), digest.end(), hash.begin());
}

} // namespace powgiver::giver
