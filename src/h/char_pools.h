#ifndef CHAR_POOLS_H
#define CHAR_POOLS_H

#include <cstddef>

// Fixed alphabets for each character class
namespace CharPools {
    const char LOWERCASE[] = "abcdefghijklmnopqrstuvwxyz";
    const char UPPERCASE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    const char DIGITS[] = "0123456789";
    const char SYMBOLS[] = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

    const std::size_t LOWERCASE_SIZE = sizeof(LOWERCASE) - 1;
    const std::size_t UPPERCASE_SIZE = sizeof(UPPERCASE) - 1;
    const std::size_t DIGITS_SIZE = sizeof(DIGITS) - 1;
    const std::size_t SYMBOLS_SIZE = sizeof(SYMBOLS) - 1;

    // Size of the keyspace with every class enabled (94)
    const std::size_t MAX_POOL_SIZE = LOWERCASE_SIZE + UPPERCASE_SIZE + DIGITS_SIZE + SYMBOLS_SIZE;
}

// Which pool a password position draws from
enum class CharRule {
    Symbol,
    Digit,
    Lower,
    Upper
};

#endif // CHAR_POOLS_H
