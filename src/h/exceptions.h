#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

// Password length outside [MIN_LENGTH, MAX_LENGTH] or not a number
class InvalidLengthError : public std::invalid_argument {
public:
    explicit InvalidLengthError(const std::string& message) : std::invalid_argument(message) {}
};

// Every character class was turned off for a non-empty password
class NoClassEnabledError : public std::logic_error {
public:
    NoClassEnabledError() : std::logic_error("At least one character set must be selected") {}
};

// Password type that is recognised but not implemented
class UnsupportedTypeError : public std::logic_error {
public:
    explicit UnsupportedTypeError(const std::string& type)
        : std::logic_error("Password type '" + type + "' is not supported yet") {}
};

// Malformed command line
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

namespace Exceptions {
    const int MIN_LENGTH = 0;
    const int MAX_LENGTH = 255;

    // Throws InvalidLengthError if length is outside [MIN_LENGTH, MAX_LENGTH]
    void checkLength(int length);
    // Parses a whole string as a length in [MIN_LENGTH, MAX_LENGTH]
    int parseLength(const std::string& text);
    // Parses a whole string as a number in [min, max], throws std::invalid_argument otherwise
    int getValidNumber(const std::string& text, int min, int max);
}

#endif // EXCEPTIONS_H
