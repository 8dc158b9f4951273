#include <powgiver/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>

#include <powgiver/errors.hpp>
#include <powgiver/ton/address.hpp>
#include <powgiver/util/hex.hpp>

namespace powgiver::config {

bool is_valid_raw_address(const std::string& text, std::string& err) {
    if (text.empty()) { err = "address is empty"; return false; }
    try {
        ton::parse_raw_address(text);
    } catch (const powgiver::Error& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool is_valid_hex_width(const std::string& text, std::size_t width, std::string& err) {
    try {
        auto bytes = util::decode_hex(text);
        if (bytes.size() != width) {
            err = fmt::format("'{}' must be {} bytes, got {}", text, width, bytes.size());
            return false;
        }
    } catch (const powgiver::Error& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool is_whole_byte_hex(const std::string& text, std::string& err) {
    std::string_view digits(text);
    if (!digits.empty() && digits.front() == 'x') digits.remove_prefix(1);
    if (digits.substr(0, 2) == "0x") digits.remove_prefix(2);
    if (digits.size() % 2 != 0) {
        err = fmt::format("'{}' has an odd number of hex digits", text);
        return false;
    }
    return true;
}

bool parse_uint32(const std::string& text, uint32_t& out, std::string& err) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = fmt::format("'{}' must contain only digits", text); return false; }
    unsigned long long v = 0;
    try { v = std::stoull(text); } catch (const std::out_of_range&) { v = std::numeric_limits<unsigned long long>::max(); }
    if (v > std::numeric_limits<uint32_t>::max()) {
        err = fmt::format("'{}' is out of range (0-4294967295)", text); return false; }
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace powgiver::config
