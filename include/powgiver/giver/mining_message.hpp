#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include <powgiver/giver/mining_job.hpp>
#include <powgiver/ton/address.hpp>

namespace powgiver::giver {

// Inbound external message to the giver; signing and sending are up to the transport
struct ExternalMessage {
    ton::Address destination;
    std::vector<uint8_t> body;
};

// Body is the wire job. Throws UnsupportedWorkchainError unless wallet.workchain == 0.
ExternalMessage build_mining_message(const ton::Address& giver, const Seed& seed,
                                     const Random& random, const ton::Address& wallet,
                                     uint32_t expires_sec);

// {"destination": "<wc:hex>", "body": "<hex>"}
nlohmann::json to_json(const ExternalMessage& msg);

} // namespace powgiver::giver
