#include <powgiver/giver/pow_giver.hpp>

namespace powgiver::giver {

PowParams PowGiver::get_pow_params() {
    return extract_pow_params_from_call(client_.call_get_method(address_, "get_pow_params"));
}

} // namespace powgiver::giver
