#include <powgiver/crypto/random.hpp>

#include <climits>

#include <openssl/rand.h>

#include <powgiver/errors.hpp>

namespace powgiver::crypto {

void random_bytes(uint8_t* buf, std::size_t len) {
    if (len > static_cast<std::size_t>(INT_MAX)) {
        throw CryptoError("random request too large");
    }
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw CryptoError("RAND_bytes failed");
    }
}

} // namespace powgiver::crypto
