#include "../h/config.h"
#include "../h/exceptions.h"
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <json/json.h>

PasswordType parsePasswordType(const std::string& name) {
    if (name == "default") return PasswordType::Default;
    if (name == "random") return PasswordType::Random;
    if (name == "pin") return PasswordType::Pin;
    if (name == "memorable") return PasswordType::Memorable;
    throw std::invalid_argument("Invalid password type '" + name + "' (random, pin, memorable)");
}

std::string passwordTypeName(PasswordType type) {
    switch (type) {
        case PasswordType::Default: return "default";
        case PasswordType::Random: return "random";
        case PasswordType::Pin: return "pin";
        case PasswordType::Memorable: return "memorable";
    }
    return "unknown";
}

PasswordGenerator::ShuffleMode parseShuffleMode(const std::string& name) {
    if (name == "front-back") return PasswordGenerator::ShuffleMode::FrontBack;
    if (name == "uniform") return PasswordGenerator::ShuffleMode::Uniform;
    throw std::invalid_argument("Invalid shuffle mode '" + name + "' (front-back, uniform)");
}

std::string shuffleModeName(PasswordGenerator::ShuffleMode mode) {
    return mode == PasswordGenerator::ShuffleMode::Uniform ? "uniform" : "front-back";
}

OutputFormat parseOutputFormat(const std::string& name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    throw std::invalid_argument("Invalid output format '" + name + "' (text, json)");
}

Config::Config()
    : length(10), type(PasswordType::Default), shuffle(PasswordGenerator::ShuffleMode::FrontBack),
      output(OutputFormat::Text), verbose(false) {}

Config::Config(const std::string& path, Logger& logger) : Config() {
    config_file_path = path;
    loadConfig(logger);
}

void Config::loadConfig(Logger& logger) {
    std::ifstream file(config_file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + config_file_path);
    }
    std::string json_data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Could not read config file: " + config_file_path);
    }
    loadFromString(json_data, logger);
}

void Config::loadFromString(const std::string& json_data, Logger& logger) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;

    if (!reader->parse(json_data.c_str(), json_data.c_str() + json_data.size(), &root, &errors)) {
        throw std::runtime_error("Failed to parse JSON config: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    for (const auto& key : root.getMemberNames()) {
        const Json::Value& value = root[key];
        if (key == "length") {
            if (!value.isInt()) {
                throw std::invalid_argument("Config value 'length' must be an integer");
            }
            Exceptions::checkLength(value.asInt());
            length = value.asInt();
        } else if (key == "type" || key == "shuffle" || key == "output") {
            if (!value.isString()) {
                throw std::invalid_argument("Config value '" + key + "' must be a string");
            }
            if (key == "type") {
                type = parsePasswordType(value.asString());
            } else if (key == "shuffle") {
                shuffle = parseShuffleMode(value.asString());
            } else {
                output = parseOutputFormat(value.asString());
            }
        } else if (key == "verbose") {
            if (!value.isBool()) {
                throw std::invalid_argument("Config value 'verbose' must be true or false");
            }
            verbose = value.asBool();
        } else {
            logger.warning("Ignoring unknown config key '" + key + "'");
        }
    }
}
