#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <string>

// Leveled diagnostics written to a stream (stderr by default)
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

private:
    std::ostream* out;
    Level threshold;

    static const char* levelName(Level level);

public:
    explicit Logger(std::ostream& out = std::cerr, Level threshold = Level::Warning);

    void setLevel(Level level);
    Level getLevel() const;

    // Writes "[passgen] LEVEL: message" if level is at or above the threshold
    void log(Level level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
};

#endif // LOGGER_H
