#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <powgiver/giver/pow_params.hpp>
#include <powgiver/ton/address.hpp>

namespace powgiver::giver {

// Runs get-methods against a contract. Returns the result stack as
// [[type, value], ...]. The network implementation lives outside this library.
class GetMethodClient {
public:
    virtual ~GetMethodClient() = default;
    virtual nlohmann::json call_get_method(const ton::Address& address, const std::string& method) = 0;
};

// Handle to a deployed PoW giver contract
class PowGiver {
public:
    PowGiver(ton::Address address, GetMethodClient& client)
        : address_(address), client_(client) {}

    const ton::Address& address() const { return address_; }

    // Calls get_pow_params. Client errors propagate unchanged.
    PowParams get_pow_params();

private:
    ton::Address address_;
    GetMethodClient& client_;
};

} // namespace powgiver::giver
