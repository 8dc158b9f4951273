#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace powgiver::config {

struct JobConfig {
    std::string giver;       // giver contract, raw address
    std::string wallet;      // reward wallet, raw address
    uint32_t expires_in{900};                // seconds from now
    std::optional<uint32_t> expires_at;      // absolute unixtime, wins over expires_in
    std::string params_path;                 // saved get_pow_params response (JSON)
    std::string state_hex;                   // giver data cell bits (hex)
    std::optional<std::size_t> state_bits;   // bit length of state_hex, default all
    std::string random_hex;                  // 16-byte job random, generated if empty
    std::string hash_hex;                    // candidate hash to verify
};

struct ParseResult {
    std::vector<std::pair<std::string, std::string>> overrides; // key/value from CLI flags
    std::string config_path{"powgiver.conf"};
    bool ok{false};        // false on argument errors
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace powgiver::config
