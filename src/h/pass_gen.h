#ifndef PASS_GEN_H
#define PASS_GEN_H

#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "char_pools.h"
#include "secure_random.h"

// Generates passwords from character-class rules and rates their strength.
// An instance is not safe to share between threads: every generated password
// advances its random source.
class PasswordGenerator {
public:
    // How distributed rules are reordered before filling
    enum class ShuffleMode {
        FrontBack, // each rule is pushed to the front or back on a coin flip
        Uniform    // Fisher-Yates permutation
    };

private:
    std::string lower;
    std::string upper;
    std::string digit;
    std::string symbol;
    std::unique_ptr<RandomSource> rng;
    ShuffleMode shuffle_mode;

    // Randomly reorder the distributed rules according to shuffle_mode
    std::deque<CharRule> shuffleRules(const std::vector<CharRule>& distributed);
    // Draw one character per rule from the matching pool
    std::string fillPassword(const std::deque<CharRule>& rules);
    const std::string& poolFor(CharRule rule) const;

public:
    // Uses a SecureRandom seeded from OS entropy
    explicit PasswordGenerator(ShuffleMode mode = ShuffleMode::FrontBack);
    PasswordGenerator(std::unique_ptr<RandomSource> source, ShuffleMode mode);

    PasswordGenerator(const PasswordGenerator&) = delete;
    PasswordGenerator& operator=(const PasswordGenerator&) = delete;

    ShuffleMode shuffleMode() const { return shuffle_mode; }

    /// Generates a password of exactly `length` characters.
    ///
    /// Positions are assigned to the enabled classes round-robin, so every
    /// class appears floor(length / k) or ceil(length / k) times. The order is
    /// then randomized and each position is filled from its class pool.
    ///
    /// Throws InvalidLengthError when length is outside [0, 255] and
    /// NoClassEnabledError when length > 0 and every flag is false.
    std::string generatePassword(int length, bool withSymbols, bool withDigits,
                                 bool withUppercase, bool withLowercase);

    /// Strength percentage in [0, 100]: 0 for length <= 1, otherwise
    /// 20 + 80 * log(length^pool) / log(255^94).
    double getPasswordStrength(int length, bool withSymbols, bool withDigits,
                               bool withUppercase, bool withLowercase) const;

    // Shannon entropy of the password in bits: length * log2(pool)
    static double getEntropyBits(int length, bool withSymbols, bool withDigits,
                                 bool withUppercase, bool withLowercase);

    // Round-robin rule assignment in the order Symbol, Digit, Lower, Upper.
    // Returns an empty list when no class is enabled.
    static std::vector<CharRule> distributeRules(int length, bool withSymbols, bool withDigits,
                                                 bool withUppercase, bool withLowercase);

    // Number of characters available with the given classes
    static std::size_t poolSize(bool withSymbols, bool withDigits, bool withUppercase, bool withLowercase);
};

#endif // PASS_GEN_H
