#include <powgiver/giver/pow_params.hpp>

#include <string>

#include <fmt/core.h>

#include <powgiver/errors.hpp>
#include <powgiver/util/hex.hpp>

using json = nlohmann::json;

namespace powgiver::giver {

PowParams extract_pow_params_from_state(const cell::BitString& data) {
    cell::BitReader reader(data);
    reader.skip(kStateSkipBits);

    PowParams params;
    params.seed = util::to_fixed<16>(reader.read_bytes(params.seed.size()));
    params.complexity = util::to_fixed<32>(reader.read_bytes(params.complexity.size()));
    return params;
}

static std::string stack_value(const json& stack, std::size_t index) {
    const json& entry = stack[index];
    if (!entry.is_array() || entry.size() < 2) {
        throw DecodeError(fmt::format("stack entry {} is not a [type, value] pair", index));
    }
    if (!entry[1].is_string()) {
        throw DecodeError(fmt::format("stack entry {} value is not a string", index));
    }
    return entry[1].get<std::string>();
}

PowParams extract_pow_params_from_call(const json& stack) {
    // Stack layout of get_pow_params:
    // [0] seed (num)
    // [1] pow complexity (num)
    // [2] last success (num), [3] target delta (num), ... are ignored
    if (!stack.is_array()) {
        throw DecodeError("get_pow_params stack is not an array");
    }
    if (stack.size() < 2) {
        throw DecodeError(fmt::format("get_pow_params stack has {} entries, expected at least 2", stack.size()));
    }

    PowParams params;
    params.seed = util::to_fixed<16>(util::left_pad(util::decode_hex(stack_value(stack, 0)), 16));
    params.complexity = util::to_fixed<32>(util::left_pad(util::decode_hex(stack_value(stack, 1)), 32));
    return params;
}

} // namespace powgiver::giver
