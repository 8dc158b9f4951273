#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace powgiver::ton {

// Account address: workchain id + 256-bit account hash
struct Address {
    int32_t workchain{0};
    std::array<uint8_t, 32> hash{};

    bool operator==(const Address& other) const {
        return workchain == other.workchain && hash == other.hash;
    }
    bool operator!=(const Address& other) const { return !(*this == other); }
};

// Parse raw form "<workchain>:<64 hex digits>". Throws DecodeError.
Address parse_raw_address(const std::string& text);

// Raw form, lowercase hex
std::string to_raw_string(const Address& addr);

} // namespace powgiver::ton
