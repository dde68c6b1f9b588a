#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include "logger.h"
#include "pass_gen.h"

enum class PasswordType {
    Default,   // lowercase plus the requested extra classes
    Random,    // every class
    Pin,       // digits only
    Memorable  // reserved
};

enum class OutputFormat {
    Text,
    Json
};

// Name <-> value conversions, parse functions throw std::invalid_argument
PasswordType parsePasswordType(const std::string& name);
std::string passwordTypeName(PasswordType type);
PasswordGenerator::ShuffleMode parseShuffleMode(const std::string& name);
std::string shuffleModeName(PasswordGenerator::ShuffleMode mode);
OutputFormat parseOutputFormat(const std::string& name);

// Defaults for the command line, optionally read from a JSON file
class Config {
private:
    std::string config_file_path;
    int length;
    PasswordType type;
    PasswordGenerator::ShuffleMode shuffle;
    OutputFormat output;
    bool verbose;

    void loadConfig(Logger& logger);

public:
    // Built-in defaults
    Config();
    // Defaults overridden by the JSON file at path, throws if it cannot be read or parsed
    Config(const std::string& path, Logger& logger);

    // Applies the keys of a JSON document on top of the current values
    void loadFromString(const std::string& json_data, Logger& logger);

    const std::string& getPath() const { return config_file_path; }
    int getLength() const { return length; }
    PasswordType getType() const { return type; }
    PasswordGenerator::ShuffleMode getShuffleMode() const { return shuffle; }
    OutputFormat getOutputFormat() const { return output; }
    bool getVerbose() const { return verbose; }
};

#endif // CONFIG_H
