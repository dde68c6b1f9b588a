#include "../h/exceptions.h"

namespace Exceptions {
    void checkLength(int length) {
        if (length < MIN_LENGTH || length > MAX_LENGTH) {
            throw InvalidLengthError("length should be a positive number between "
                                     + std::to_string(MIN_LENGTH) + " and " + std::to_string(MAX_LENGTH)
                                     + ", got " + std::to_string(length));
        }
    }

    int getValidNumber(const std::string& text, int min, int max) {
        std::size_t pos = 0;
        long number;
        try {
            number = std::stol(text, &pos);
        } catch (const std::invalid_argument&) {
            throw std::invalid_argument("'" + text + "' is not a number");
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("'" + text + "' is too large");
        }
        if (pos != text.size()) {
            throw std::invalid_argument("'" + text + "' is not a number");
        }
        if (number < min || number > max) {
            throw std::invalid_argument("enter a number from " + std::to_string(min)
                                        + " to " + std::to_string(max));
        }
        return static_cast<int>(number);
    }

    int parseLength(const std::string& text) {
        try {
            return getValidNumber(text, MIN_LENGTH, MAX_LENGTH);
        } catch (const std::invalid_argument& e) {
            throw InvalidLengthError("length should be a positive number between "
                                     + std::to_string(MIN_LENGTH) + " and " + std::to_string(MAX_LENGTH)
                                     + ": " + e.what());
        }
    }
}
