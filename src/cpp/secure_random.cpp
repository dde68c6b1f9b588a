#include "../h/secure_random.h"
#include <limits>
#include <stdexcept>
#include <openssl/rand.h>

SecureRandom::SecureRandom() {
    if (RAND_status() != 1 && RAND_poll() != 1) {
        throw std::runtime_error("Failed to seed random generator from OS entropy");
    }
}

void SecureRandom::randomBytes(unsigned char* buf, std::size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
}

std::uint32_t SecureRandom::randomWord() {
    unsigned char bytes[4];
    randomBytes(bytes, sizeof(bytes));
    return static_cast<std::uint32_t>(bytes[0])
         | static_cast<std::uint32_t>(bytes[1]) << 8
         | static_cast<std::uint32_t>(bytes[2]) << 16
         | static_cast<std::uint32_t>(bytes[3]) << 24;
}

std::size_t SecureRandom::uniformIndex(std::size_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("Random bound must be positive");
    }
    const std::uint64_t range = static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max()) + 1;
    if (bound > range) {
        throw std::invalid_argument("Random bound is too large");
    }

    // Reject the tail of the range so every index is equally likely
    const std::uint64_t limit = range - range % bound;
    std::uint64_t value;
    do {
        value = randomWord();
    } while (value >= limit);
    return static_cast<std::size_t>(value % bound);
}

bool SecureRandom::coinFlip() {
    unsigned char byte;
    randomBytes(&byte, 1);
    return (byte & 1) != 0;
}
