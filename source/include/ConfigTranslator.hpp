#pragma once

#include "Engine.hpp"
#include "Settings.hpp"

#include <span>
#include <string>
#include <vector>
#include <stdexcept>
#include <string_view>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnknownKeyError : public ConfigError {
public:
    explicit UnknownKeyError(std::string_view key): ConfigError("Unknown config key: " + std::string(key)) {}
};

class InvalidValueError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

struct ConfigOption {
    enum class Kind { Integer, Text, Encryption };

    std::string_view key;
    std::vector<std::string_view> settings;  // engine names written by this key
    Kind kind;
    int64_t scale = 1;                      // user unit -> engine unit
    std::string_view description;
};

// user-facing configuration keys on top of the canonical settings map
class ConfigTranslator {
public:
    ConfigTranslator(SettingsMap& settings, BaseEngine& engine): _settings(settings), _engine(engine) {}

    // updates the map and the live engine together; throws UnknownKeyError / InvalidValueError
    void set(std::string_view key, std::string_view raw);
    std::string get(std::string_view key) const;

    static SettingsMap translate(std::string_view key, std::string_view raw);
    static std::string render(std::string_view key, const SettingsMap& settings);

    static std::span<const ConfigOption> options();

private:
    SettingsMap& _settings;
    BaseEngine& _engine;
};
