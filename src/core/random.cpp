#include "core/random.hpp"

#include <openssl/rand.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace execbox::random {

std::string hex(size_t byte_count, bool uppercase) {
    std::vector<uint8_t> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(byte_count * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

} // namespace execbox::random
