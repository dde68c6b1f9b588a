#include "../h/pass_gen.h"
#include "../h/exceptions.h"
#include <cmath>
#include <stdexcept>
#include <utility>

PasswordGenerator::PasswordGenerator(ShuffleMode mode)
    : PasswordGenerator(std::make_unique<SecureRandom>(), mode) {}

PasswordGenerator::PasswordGenerator(std::unique_ptr<RandomSource> source, ShuffleMode mode)
    : lower(CharPools::LOWERCASE), upper(CharPools::UPPERCASE),
      digit(CharPools::DIGITS), symbol(CharPools::SYMBOLS),
      rng(std::move(source)), shuffle_mode(mode) {
    if (!rng) {
        throw std::invalid_argument("Password generator needs a random source");
    }
}

std::size_t PasswordGenerator::poolSize(bool withSymbols, bool withDigits, bool withUppercase, bool withLowercase) {
    std::size_t size = 0;
    if (withSymbols) size += CharPools::SYMBOLS_SIZE;
    if (withDigits) size += CharPools::DIGITS_SIZE;
    if (withUppercase) size += CharPools::UPPERCASE_SIZE;
    if (withLowercase) size += CharPools::LOWERCASE_SIZE;
    return size;
}

double PasswordGenerator::getPasswordStrength(int length, bool withSymbols, bool withDigits,
                                              bool withUppercase, bool withLowercase) const {
    Exceptions::checkLength(length);
    if (length <= 1) {
        return 0.0;
    }

    const double multiplier = static_cast<double>(poolSize(withSymbols, withDigits, withUppercase, withLowercase));
    const double max_multiplier = static_cast<double>(CharPools::MAX_POOL_SIZE);

    // Possible passwords against the largest keyspace, both fit in a double
    const double a = std::pow(static_cast<double>(length), multiplier);
    const double b = std::pow(255.0, max_multiplier);

    // Baseline of 20% for any non-trivial password
    return 20.0 + std::log(a) / std::log(b) * 80.0;
}

double PasswordGenerator::getEntropyBits(int length, bool withSymbols, bool withDigits,
                                         bool withUppercase, bool withLowercase) {
    Exceptions::checkLength(length);
    const std::size_t pool = poolSize(withSymbols, withDigits, withUppercase, withLowercase);
    if (length == 0 || pool == 0) {
        return 0.0;
    }
    return length * std::log2(static_cast<double>(pool));
}

std::vector<CharRule> PasswordGenerator::distributeRules(int length, bool withSymbols, bool withDigits,
                                                         bool withUppercase, bool withLowercase) {
    Exceptions::checkLength(length);

    std::deque<CharRule> queue;
    if (withSymbols) queue.push_back(CharRule::Symbol);
    if (withDigits) queue.push_back(CharRule::Digit);
    if (withLowercase) queue.push_back(CharRule::Lower);
    if (withUppercase) queue.push_back(CharRule::Upper);

    std::vector<CharRule> distributed;
    if (queue.empty()) {
        return distributed;
    }

    // Cycle through the classes so 5 lowercase and 1 symbol cannot happen
    distributed.reserve(length);
    for (int i = 0; i < length; ++i) {
        CharRule next = queue.front();
        queue.pop_front();
        distributed.push_back(next);
        queue.push_back(next);
    }
    return distributed;
}

std::deque<CharRule> PasswordGenerator::shuffleRules(const std::vector<CharRule>& distributed) {
    if (shuffle_mode == ShuffleMode::Uniform) {
        std::deque<CharRule> rules(distributed.begin(), distributed.end());
        for (std::size_t i = rules.size(); i > 1; --i) {
            std::swap(rules[i - 1], rules[rng->uniformIndex(i)]);
        }
        return rules;
    }

    std::deque<CharRule> rules;
    for (CharRule rule : distributed) {
        if (rng->coinFlip()) {
            rules.push_front(rule);
        } else {
            rules.push_back(rule);
        }
    }
    return rules;
}

const std::string& PasswordGenerator::poolFor(CharRule rule) const {
    switch (rule) {
        case CharRule::Symbol: return symbol;
        case CharRule::Digit: return digit;
        case CharRule::Upper: return upper;
        case CharRule::Lower: return lower;
    }
    throw std::logic_error("Unknown character rule");
}

std::string PasswordGenerator::fillPassword(const std::deque<CharRule>& rules) {
    std::string password;
    password.reserve(rules.size());
    for (CharRule rule : rules) {
        const std::string& pool = poolFor(rule);
        password += pool[rng->uniformIndex(pool.size())];
    }
    return password;
}

std::string PasswordGenerator::generatePassword(int length, bool withSymbols, bool withDigits,
                                                bool withUppercase, bool withLowercase) {
    Exceptions::checkLength(length);
    if (length == 0) {
        return "";
    }
    if (!withSymbols && !withDigits && !withUppercase && !withLowercase) {
        throw NoClassEnabledError();
    }

    std::vector<CharRule> distributed = distributeRules(length, withSymbols, withDigits,
                                                        withUppercase, withLowercase);
    return fillPassword(shuffleRules(distributed));
}
