#ifndef SECURE_RANDOM_H
#define SECURE_RANDOM_H

#include <cstddef>
#include <cstdint>

// Source of randomness used by the password generator
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform value in [0, bound); bound must be positive
    virtual std::size_t uniformIndex(std::size_t bound) = 0;
    // Uniform true/false
    virtual bool coinFlip() = 0;
};

// Cryptographically secure source backed by the OpenSSL RNG.
// The RNG is seeded from OS entropy once, at construction. Not thread-safe.
class SecureRandom : public RandomSource {
private:
    // Fill buf with len random bytes, throws on RNG failure
    static void randomBytes(unsigned char* buf, std::size_t len);
    static std::uint32_t randomWord();

public:
    // Throws std::runtime_error if the RNG cannot be seeded
    SecureRandom();

    std::size_t uniformIndex(std::size_t bound) override;
    bool coinFlip() override;
};

#endif // SECURE_RANDOM_H
