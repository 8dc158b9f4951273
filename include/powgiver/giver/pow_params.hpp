#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>

#include <powgiver/cell/bit_reader.hpp>

namespace powgiver::giver {

using Seed = std::array<uint8_t, 16>;
using Complexity = std::array<uint8_t, 32>;

struct PowParams {
    Seed seed{};
    Complexity complexity{};
};

// Giver state layout: 32-bit seqno, 32-bit subwallet id, 256-bit public key,
// then seed (128 bits) and complexity (256 bits).
constexpr int kStateLayoutVersion = 1;
constexpr std::size_t kStateSkipBits = 32 + 32 + 256;

/**
 * Read seed and complexity straight from the giver's persistent data bits.
 * Both fields come from one snapshot, so unlike two get-method calls they
 * can never come from different blocks. Throws OutOfRangeError when the
 * data is shorter than the layout.
 */
PowParams extract_pow_params_from_state(const cell::BitString& data);

/**
 * Decode a get_pow_params result stack: [["num","0x.."], ["num","0x.."], ...]
 * Throws DecodeError on a malformed stack, SizeError on oversize values.
 */
PowParams extract_pow_params_from_call(const nlohmann::json& stack);

} // namespace powgiver::giver
