/*
 * powgiver-job
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <powgiver/cli/args.hpp>
#include <powgiver/config/loader.hpp>
#include <powgiver/crypto/random.hpp>
#include <powgiver/errors.hpp>
#include <powgiver/giver/mining_job.hpp>
#include <powgiver/giver/mining_message.hpp>
#include <powgiver/giver/pow_params.hpp>
#include <powgiver/log.hpp>
#include <powgiver/logging/fmt_logger.hpp>
#include <powgiver/ton/address.hpp>
#include <powgiver/util/hex.hpp>

using namespace powgiver;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitHashMismatch = 2;

giver::PowParams load_pow_params(const config::JobConfig& cfg, logging::Logger& logger) {
    if (!cfg.state_hex.empty()) {
        auto bytes = util::decode_hex(cfg.state_hex);
        cell::BitString bits = cfg.state_bits ? cell::BitString(std::move(bytes), *cfg.state_bits)
                                              : cell::BitString(std::move(bytes));
        logger.debugf("reading pow params from {} state bits (layout v{})",
                      bits.length(), giver::kStateLayoutVersion);
        return giver::extract_pow_params_from_state(bits);
    }

    std::ifstream in(cfg.params_path);
    if (!in.good()) {
        throw Error(fmt::format("cannot open params file '{}'", cfg.params_path));
    }
    std::stringstream buffer; buffer << in.rdbuf();
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& ex) {
        throw DecodeError(fmt::format("params file '{}': {}", cfg.params_path, ex.what()));
    }
    // Accept the bare stack or a full response object carrying "stack"
    const nlohmann::json& stack = (response.is_object() && response.contains("stack"))
                                      ? response.at("stack") : response;
    logger.debugf("reading pow params from get_pow_params response {}", cfg.params_path);
    return giver::extract_pow_params_from_call(stack);
}

uint32_t job_expiry(const config::JobConfig& cfg) {
    if (cfg.expires_at) return *cfg.expires_at;
    uint64_t at = static_cast<uint64_t>(log::now_unix()) + cfg.expires_in;
    if (at > std::numeric_limits<uint32_t>::max()) {
        throw SizeError("job expiry does not fit in 32 bits");
    }
    return static_cast<uint32_t>(at);
}

int run(const config::JobConfig& cfg, logging::Logger& logger) {
    const auto giver_addr = ton::parse_raw_address(cfg.giver);
    const auto wallet = ton::parse_raw_address(cfg.wallet);
    const auto params = load_pow_params(cfg, logger);

    giver::Random random = cfg.random_hex.empty()
        ? crypto::random_array<16>()
        : util::to_fixed<16>(util::decode_hex(cfg.random_hex));
    const uint32_t expires = job_expiry(cfg);

    const auto hashing_job = giver::build_hashing_job(params.seed, random, wallet, expires);
    const auto message = giver::build_mining_message(giver_addr, params.seed, random, wallet, expires);

    fmt::print("Mining job\n");
    log::field("giver", "{}", ton::to_raw_string(giver_addr));
    log::field("wallet", "{}", ton::to_raw_string(wallet));
    log::field("seed", "{}", util::bytes_to_hex(params.seed));
    log::field("complexity", "{}", util::bytes_to_hex(params.complexity));
    log::field("random", "{}", util::bytes_to_hex(random));
    log::field("expires", "{}", expires);
    log::field("job", "{}", util::bytes_to_hex(hashing_job));
    log::field("job hash", "{}", util::bytes_to_hex(crypto::sha256(hashing_job)));
    log::field("message", "{}", giver::to_json(message).dump());

    if (cfg.hash_hex.empty()) return kExitOk;

    const auto candidate = util::decode_hex(cfg.hash_hex);
    if (giver::check_mining_job_hash(params.seed, random, wallet, expires, candidate)) {
        logger.info("hash matches job");
        return kExitOk;
    }
    logger.warn("hash does not match job");
    return kExitHashMismatch;
}

} // namespace

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return kExitOk;
    }
    if (!parsed.ok) {
        return kExitError;
    }
    log.set_debug(parsed.debug);

    // Lowest to highest precedence: file, environment, CLI
    config::JobConfig cfg;
    auto errs = config::load_from_file(cfg, parsed.config_path);
    auto env_errs = config::apply_env_overrides(cfg);
    errs.insert(errs.end(), env_errs.begin(), env_errs.end());
    for (const auto& [key, value] : parsed.overrides) {
        auto e = config::apply_setting(cfg, key, value);
        errs.insert(errs.end(), e.begin(), e.end());
    }
    if (errs.empty()) {
        errs = config::validate_final(cfg);
    }
    if (!errs.empty()) {
        for (const auto& e : errs) log.errorf("config: {}", e);
        return kExitError;
    }

    try {
        return run(cfg, log);
    } catch (const powgiver::Error& e) {
        log.error(e.what());
        return kExitError;
    }
}
