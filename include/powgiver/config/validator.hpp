#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace powgiver::config {

// Validates a raw "workchain:hash" address and returns error in 'err' if invalid.
bool is_valid_raw_address(const std::string& text, std::string& err);

// Validates that hex text decodes to exactly 'width' bytes.
bool is_valid_hex_width(const std::string& text, std::size_t width, std::string& err);

// Validates that hex text (after an optional x / 0x prefix) has an even digit count.
bool is_whole_byte_hex(const std::string& text, std::string& err);

// Parses a decimal unsigned 32-bit value.
bool parse_uint32(const std::string& text, uint32_t& out, std::string& err);

} // namespace powgiver::config
