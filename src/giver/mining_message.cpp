#include <powgiver/giver/mining_message.hpp>

#include <powgiver/util/hex.hpp>

using json = nlohmann::json;

namespace powgiver::giver {

ExternalMessage build_mining_message(const ton::Address& giver, const Seed& seed,
                                     const Random& random, const ton::Address& wallet,
                                     uint32_t expires_sec) {
    ExternalMessage msg;
    msg.destination = giver;
    msg.body = build_wire_job(seed, random, wallet, expires_sec);
    return msg;
}

json to_json(const ExternalMessage& msg) {
    json j;
    j["destination"] = ton::to_raw_string(msg.destination);
    j["body"] = util::bytes_to_hex(msg.body);
    return j;
}

} // namespace powgiver::giver
