/*
 * Unit tests for raw address parsing
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include <powgiver/errors.hpp>
#include <powgiver/ton/address.hpp>

using namespace powgiver;
using namespace powgiver::ton;

TEST_SUITE("Raw Address") {
    TEST_CASE("parse_raw_address - basic workchain") {
        std::string hash_hex = "83dfd552e63729b472fcbcc8c45ebcc6691702558b68ec7527e1ba403a0f31a8";
        auto addr = parse_raw_address("0:" + hash_hex);
        CHECK(addr.workchain == 0);
        CHECK(addr.hash[0] == 0x83);
        CHECK(addr.hash[31] == 0xa8);
        CHECK(to_raw_string(addr) == "0:" + hash_hex);
    }

    TEST_CASE("parse_raw_address - masterchain and uppercase hex") {
        auto addr = parse_raw_address("-1:" + std::string(64, 'F'));
        CHECK(addr.workchain == -1);
        for (auto b : addr.hash) CHECK(b == 0xff);
        CHECK(to_raw_string(addr) == "-1:" + std::string(64, 'f'));
    }

    TEST_CASE("parse_raw_address - malformed input") {
        std::string hash_hex(64, '0');
        CHECK_THROWS_AS(parse_raw_address(hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address(":" + hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("-:" + hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("a:" + hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("0:" + hash_hex.substr(1)), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("0:" + hash_hex + "00"), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("0:0x" + hash_hex.substr(2)), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("0:" + std::string(63, '0') + "g"), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("99999999999:" + hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("\xFF:" + hash_hex), DecodeError);
        CHECK_THROWS_AS(parse_raw_address("0:" + std::string(63, '0') + "\xE9"), DecodeError);
    }

    TEST_CASE("address equality") {
        auto a = parse_raw_address("0:" + std::string(64, '1'));
        auto b = parse_raw_address("0:" + std::string(64, '1'));
        auto c = parse_raw_address("-1:" + std::string(64, '1'));
        CHECK(a == b);
        CHECK(a != c);
    }
}
