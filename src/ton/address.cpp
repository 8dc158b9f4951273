#include <powgiver/ton/address.hpp>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>

#include <fmt/core.h>

#include <powgiver/errors.hpp>
#include <powgiver/util/hex.hpp>

namespace powgiver::ton {

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

static int32_t parse_workchain(const std::string& text, const std::string& full) {
    std::size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size() || text.size() - start > 10 ||
        !std::all_of(text.begin() + start, text.end(), is_digit)) {
        throw DecodeError(fmt::format("invalid workchain in address '{}'", full));
    }
    long long wc = std::strtoll(text.c_str(), nullptr, 10);
    if (wc < INT32_MIN || wc > INT32_MAX) {
        throw DecodeError(fmt::format("workchain out of range in address '{}'", full));
    }
    return static_cast<int32_t>(wc);
}

Address parse_raw_address(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw DecodeError(fmt::format("address '{}' must be in the form workchain:hash", text));
    }
    std::string hash_hex = text.substr(colon + 1);
    if (hash_hex.size() != 64 || !std::all_of(hash_hex.begin(), hash_hex.end(), is_hex_digit)) {
        throw DecodeError(fmt::format("address hash in '{}' must be 64 hex digits", text));
    }

    Address addr;
    addr.workchain = parse_workchain(text.substr(0, colon), text);
    addr.hash = util::to_fixed<32>(util::decode_hex(hash_hex));
    return addr;
}

std::string to_raw_string(const Address& addr) {
    return fmt::format("{}:{}", addr.workchain, util::bytes_to_hex(addr.hash));
}

} // namespace powgiver::ton
