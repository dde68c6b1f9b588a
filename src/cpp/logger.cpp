#include "../h/logger.h"

Logger::Logger(std::ostream& out, Level threshold) : out(&out), threshold(threshold) {}

void Logger::setLevel(Level level) {
    threshold = level;
}

Logger::Level Logger::getLevel() const {
    return threshold;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(Level level, const std::string& message) {
    if (level < threshold) return;

    *out << "[passgen] " << levelName(level) << ": " << message << std::endl;
    if (out->fail()) {
        out->clear();
    }
}

void Logger::debug(const std::string& message) {
    log(Level::Debug, message);
}

void Logger::info(const std::string& message) {
    log(Level::Info, message);
}

void Logger::warning(const std::string& message) {
    log(Level::Warning, message);
}

void Logger::error(const std::string& message) {
    log(Level::Error, message);
}
