#ifndef CLI_H
#define CLI_H

#include <iosfwd>
#include <string>
#include <vector>
#include "config.h"
#include "logger.h"
#include "pass_gen.h"

enum class Command {
    Help,
    Generate,
    Interactive
};

// Everything the command line asked for, with config defaults applied
struct CommandLineOptions {
    Command command = Command::Help;
    int length = 10;
    bool numbers = false;
    bool symbols = false;
    bool capitalized = false;
    PasswordType type = PasswordType::Default;
    PasswordGenerator::ShuffleMode shuffle = PasswordGenerator::ShuffleMode::FrontBack;
    OutputFormat output = OutputFormat::Text;
    bool verbose = false;
    std::string config_path;
};

// Length and character classes handed to the generator
struct PasswordRequest {
    int length;
    bool symbols;
    bool digits;
    bool uppercase;
    bool lowercase;
};

class CommandLine {
private:
    Logger& logger;

    void printTextReport(std::ostream& out, std::ostream& err, PasswordType type,
                         const std::string& password, double strength) const;
    void printJsonReport(std::ostream& out, PasswordType type, const PasswordRequest& request,
                         const std::string& password, double strength, double entropy) const;

public:
    explicit CommandLine(Logger& logger);

    static std::string usage();

    // Parses arguments (without the program name). Loads the --config file
    // first so flags can override it. Throws UsageError on a malformed line
    // and InvalidLengthError on a bad --length.
    CommandLineOptions parse(const std::vector<std::string>& args) const;

    // Maps the password type and flags to character classes.
    // Throws UnsupportedTypeError for the memorable type.
    static PasswordRequest resolveRequest(const CommandLineOptions& options);

    // Generates one password and prints the report. Returns the exit code.
    int generate(const CommandLineOptions& options, PasswordGenerator& generator,
                 std::ostream& out, std::ostream& err) const;

    // Full command: parse, dispatch and map errors to exit codes
    // (0 success, 1 generation or config error, 2 usage error).
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

#endif // CLI_H
