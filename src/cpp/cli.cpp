#include "../h/cli.h"
#include "../h/exceptions.h"
#include "../h/tui.h"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <json/json.h>

namespace {
    bool isKnownFlag(Command command, const std::string& name) {
        if (name == "length" || name == "shuffle" || name == "config" || name == "verbose" || name == "help") {
            return true;
        }
        if (command != Command::Generate) {
            return false;
        }
        return name == "numbers" || name == "symbols" || name == "capitalized" || name == "type" || name == "json";
    }

    bool takesValue(const std::string& name) {
        return name == "length" || name == "type" || name == "shuffle" || name == "config";
    }

    std::string describeRequest(const PasswordRequest& request) {
        std::ostringstream ss;
        ss << "length=" << request.length
           << " symbols=" << request.symbols
           << " digits=" << request.digits
           << " uppercase=" << request.uppercase
           << " lowercase=" << request.lowercase;
        return ss.str();
    }
}

CommandLine::CommandLine(Logger& logger) : logger(logger) {}

std::string CommandLine::usage() {
    return "Usage:\n"
           "  passgen password-generate [--length N] [--numbers] [--symbols] [--capitalized]\n"
           "                            [--type random|pin|memorable] [--shuffle front-back|uniform]\n"
           "                            [--json] [--config FILE] [--verbose]\n"
           "  passgen generate ...      same as password-generate\n"
           "  passgen interactive [--length N] [--shuffle front-back|uniform] [--config FILE] [--verbose]\n"
           "  passgen --help\n"
           "\n"
           "Length must be between 0 and 255 (default 10). Without --type the password\n"
           "is lowercase plus the classes enabled by --numbers, --symbols and --capitalized.\n";
}

CommandLineOptions CommandLine::parse(const std::vector<std::string>& args) const {
    CommandLineOptions options;
    if (args.empty()) {
        throw UsageError("Please choose a valid subcommand: (password-generate)");
    }

    const std::string& subcommand = args[0];
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
        options.command = Command::Help;
        return options;
    } else if (subcommand == "password-generate" || subcommand == "generate") {
        options.command = Command::Generate;
    } else if (subcommand == "interactive") {
        options.command = Command::Interactive;
    } else {
        throw UsageError("Please choose a valid subcommand: (password-generate), got '" + subcommand + "'");
    }

    std::vector<std::pair<std::string, std::string>> flags;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.compare(0, 2, "--") != 0 || arg.size() == 2) {
            throw UsageError("Unexpected argument '" + arg + "'");
        }

        std::string name = arg.substr(2);
        std::string value;
        bool has_value = false;
        std::size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }

        if (!isKnownFlag(options.command, name)) {
            throw UsageError("Unknown option '--" + name + "'");
        }
        if (takesValue(name)) {
            if (!has_value) {
                if (i + 1 >= args.size()) {
                    throw UsageError("Option '--" + name + "' needs a value");
                }
                value = args[++i];
            }
        } else if (has_value) {
            throw UsageError("Option '--" + name + "' does not take a value");
        }
        flags.emplace_back(name, value);
    }

    for (const auto& flag : flags) {
        if (flag.first == "help") {
            options.command = Command::Help;
            return options;
        }
        if (flag.first == "config") {
            options.config_path = flag.second;
        } else if (flag.first == "verbose") {
            logger.setLevel(Logger::Level::Debug);
        }
    }

    // Defaults alone do not make a request
    if (options.command == Command::Generate) {
        bool has_arguments = false;
        for (const auto& flag : flags) {
            if (flag.first != "config" && flag.first != "verbose") {
                has_arguments = true;
            }
        }
        if (!has_arguments) {
            throw UsageError("Arguments not found for password-generate, pass --length, --type or a class flag");
        }
    }

    // Flags below override whatever the config file says
    Config config;
    if (!options.config_path.empty()) {
        config = Config(options.config_path, logger);
        if (config.getVerbose()) {
            logger.setLevel(Logger::Level::Debug);
        }
        logger.debug("Loaded config from " + options.config_path);
    }
    options.length = config.getLength();
    options.type = config.getType();
    options.shuffle = config.getShuffleMode();
    options.output = config.getOutputFormat();
    options.verbose = config.getVerbose();

    for (const auto& flag : flags) {
        const std::string& name = flag.first;
        const std::string& value = flag.second;
        try {
            if (name == "length") {
                options.length = Exceptions::parseLength(value);
            } else if (name == "numbers") {
                options.numbers = true;
            } else if (name == "symbols") {
                options.symbols = true;
            } else if (name == "capitalized") {
                options.capitalized = true;
            } else if (name == "type") {
                options.type = parsePasswordType(value);
            } else if (name == "shuffle") {
                options.shuffle = parseShuffleMode(value);
            } else if (name == "json") {
                options.output = OutputFormat::Json;
            } else if (name == "verbose") {
                options.verbose = true;
            }
        } catch (const InvalidLengthError&) {
            throw;
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }
    }
    return options;
}

PasswordRequest CommandLine::resolveRequest(const CommandLineOptions& options) {
    switch (options.type) {
        case PasswordType::Random:
            return PasswordRequest{options.length, true, true, true, true};
        case PasswordType::Pin:
            return PasswordRequest{options.length, false, true, false, false};
        case PasswordType::Memorable:
            throw UnsupportedTypeError(passwordTypeName(options.type));
        case PasswordType::Default:
            break;
    }
    return PasswordRequest{options.length, options.symbols, options.numbers, options.capitalized, true};
}

void CommandLine::printTextReport(std::ostream& out, std::ostream& err, PasswordType type,
                                  const std::string& password, double strength) const {
    std::string password_label = "Generated password: ";
    std::string strength_label = "Password's strength: ";
    if (type == PasswordType::Random) {
        password_label = "Generated fully random password: ";
        strength_label = "Fully random password's strength: ";
    } else if (type == PasswordType::Pin) {
        password_label = "Generated pin: ";
        strength_label = "Generated pin's strength: ";
    }

    out << password_label << password << std::endl;
    err << strength_label << std::fixed << std::setprecision(0) << strength << "%" << std::endl;
}

void CommandLine::printJsonReport(std::ostream& out, PasswordType type, const PasswordRequest& request,
                                  const std::string& password, double strength, double entropy) const {
    Json::Value root;
    root["password"] = password;
    root["type"] = passwordTypeName(type);
    root["length"] = request.length;
    root["strength"] = strength;
    root["entropy_bits"] = entropy;

    Json::StreamWriterBuilder builder;
    out << Json::writeString(builder, root) << std::endl;
}

int CommandLine::generate(const CommandLineOptions& options, PasswordGenerator& generator,
                          std::ostream& out, std::ostream& err) const {
    try {
        PasswordRequest request = resolveRequest(options);
        logger.debug("Generating " + passwordTypeName(options.type) + " password: " + describeRequest(request));

        std::string password = generator.generatePassword(request.length, request.symbols, request.digits,
                                                          request.uppercase, request.lowercase);
        double strength = generator.getPasswordStrength(request.length, request.symbols, request.digits,
                                                        request.uppercase, request.lowercase);
        double entropy = PasswordGenerator::getEntropyBits(request.length, request.symbols, request.digits,
                                                           request.uppercase, request.lowercase);

        if (options.output == OutputFormat::Json) {
            printJsonReport(out, options.type, request, password, strength, entropy);
        } else {
            printTextReport(out, err, options.type, password, strength);
        }
        return 0;
    } catch (const std::logic_error& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int CommandLine::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        CommandLineOptions options = parse(args);
        if (options.command == Command::Help) {
            out << usage();
            return 0;
        }
        if (options.verbose) {
            logger.setLevel(Logger::Level::Debug);
        }
        logger.debug("Shuffle mode: " + shuffleModeName(options.shuffle));
        if (options.output == OutputFormat::Text) {
            out << "Welcome to the password generator 5000" << std::endl;
        }

        PasswordGenerator generator(options.shuffle);
        if (options.command == Command::Interactive) {
            TUI tui(generator, logger, options.length);
            tui.run();
            return 0;
        }
        return generate(options, generator, out, err);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n\n" << usage();
        return 2;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}
