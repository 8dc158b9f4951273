/*
 * Unit tests for PoW params extraction (state bits and get-method stack)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powgiver/errors.hpp>
#include <powgiver/giver/pow_params.hpp>
#include <powgiver/util/hex.hpp>
#include <nlohmann/json.hpp>

using namespace powgiver;
using namespace powgiver::giver;
using json = nlohmann::json;

namespace {

// seqno | subwallet | pubkey | seed | complexity | trailing fields
std::vector<uint8_t> make_state(const std::vector<uint8_t>& seed, const std::vector<uint8_t>& complexity) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 40; ++i) data.push_back(static_cast<uint8_t>(0xC0 + i)); // 320 bits of noise
    data.insert(data.end(), seed.begin(), seed.end());
    data.insert(data.end(), complexity.begin(), complexity.end());
    for (int i = 0; i < 8; ++i) data.push_back(0xEE); // last_success etc.
    return data;
}

std::vector<uint8_t> pattern(std::size_t n, uint8_t start) {
    std::vector<uint8_t> out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(start + i);
    return out;
}

} // namespace

TEST_SUITE("PoW Params From State") {
    TEST_CASE("extract_pow_params_from_state - known layout") {
        auto seed = pattern(16, 0x10);
        auto complexity = pattern(32, 0x80);
        cell::BitString bits(make_state(seed, complexity));

        auto params = extract_pow_params_from_state(bits);
        CHECK(std::equal(seed.begin(), seed.end(), params.seed.begin()));
        CHECK(std::equal(complexity.begin(), complexity.end(), params.complexity.begin()));
    }

    TEST_CASE("extract_pow_params_from_state - exactly 704 bits") {
        auto data = make_state(pattern(16, 1), pattern(32, 100));
        cell::BitString bits(data, kStateSkipBits + 128 + 256);
        auto params = extract_pow_params_from_state(bits);
        CHECK(params.seed[0] == 1);
        CHECK(params.complexity[31] == 131);
    }

    TEST_CASE("extract_pow_params_from_state - truncated data") {
        auto data = make_state(pattern(16, 1), pattern(32, 100));
        CHECK_THROWS_AS(extract_pow_params_from_state(cell::BitString(data, 703)), OutOfRangeError);
        CHECK_THROWS_AS(extract_pow_params_from_state(cell::BitString(data, 400)), OutOfRangeError);
        CHECK_THROWS_AS(extract_pow_params_from_state(cell::BitString(std::vector<uint8_t>(10, 0))), OutOfRangeError);
    }

    TEST_CASE("skip width matches the giver layout") {
        CHECK(kStateSkipBits == 320);
    }
}

TEST_SUITE("PoW Params From Get-Method") {
    TEST_CASE("extract_pow_params_from_call - short values are left padded") {
        json stack = json::array({
            json::array({"num", "0x1234"}),
            json::array({"num", "0xabc"}),
            json::array({"num", "0x61b2c0a1"}),
            json::array({"num", "0x708"}),
        });

        auto params = extract_pow_params_from_call(stack);
        for (std::size_t i = 0; i < 14; ++i) CHECK(params.seed[i] == 0);
        CHECK(params.seed[14] == 0x12);
        CHECK(params.seed[15] == 0x34);
        for (std::size_t i = 0; i < 30; ++i) CHECK(params.complexity[i] == 0);
        CHECK(params.complexity[30] == 0x0a);
        CHECK(params.complexity[31] == 0xbc);
    }

    TEST_CASE("extract_pow_params_from_call - full width values") {
        std::string seed_hex = "0x" + std::string(32, 'f');
        std::string complexity_hex = "0x" + std::string(64, '1');
        json stack = json::array({json::array({"num", seed_hex}), json::array({"num", complexity_hex})});

        auto params = extract_pow_params_from_call(stack);
        for (auto b : params.seed) CHECK(b == 0xff);
        for (auto b : params.complexity) CHECK(b == 0x11);
    }

    TEST_CASE("extract_pow_params_from_call - oversize seed") {
        std::string seed_hex = "0x01" + std::string(32, '0');
        json stack = json::array({json::array({"num", seed_hex}), json::array({"num", "0x1"})});
        CHECK_THROWS_AS(extract_pow_params_from_call(stack), SizeError);
    }

    TEST_CASE("extract_pow_params_from_call - malformed stack") {
        CHECK_THROWS_AS(extract_pow_params_from_call(json::object()), DecodeError);
        CHECK_THROWS_AS(extract_pow_params_from_call(json::array()), DecodeError);
        CHECK_THROWS_AS(extract_pow_params_from_call(json::array({json::array({"num", "0x1"})})), DecodeError);
        CHECK_THROWS_AS(extract_pow_params_from_call(json::array({"0x1", "0x2"})), DecodeError);
        CHECK_THROWS_AS(extract_pow_params_from_call(
                            json::array({json::array({"num"}), json::array({"num", "0x2"})})),
                        DecodeError);
        CHECK_THROWS_AS(extract_pow_params_from_call(
                            json::array({json::array({"num", 5}), json::array({"num", "0x2"})})),
                        DecodeError);
    }

    TEST_CASE("extract_pow_params_from_call - bad hex value") {
        json stack = json::array({json::array({"num", "0xzz"}), json::array({"num", "0x2"})});
        CHECK_THROWS_AS(extract_pow_params_from_call(stack), DecodeError);
    }
}
