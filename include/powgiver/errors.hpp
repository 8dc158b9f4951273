/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace powgiver {

/**
 * Base class for every failure raised by the library
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed hex text or malformed get-method stack
class DecodeError : public Error {
public:
    using Error::Error;
};

// Value wider than its fixed-width field
class SizeError : public Error {
public:
    using Error::Error;
};

// Bit cursor would move past the end of the sequence
class OutOfRangeError : public Error {
public:
    using Error::Error;
};

// Wallet is not in the basic workchain
class UnsupportedWorkchainError : public Error {
public:
    using Error::Error;
};

// OpenSSL primitive failed
class CryptoError : public Error {
public:
    using Error::Error;
};

} // namespace powgiver
