#include "ConfigTranslator.hpp"
#include "Utils.hpp"

#include <array>
#include <limits>
#include <charconv>

#include <boost/log/trivial.hpp>

namespace {

// libtorrent enc_policy values
constexpr int64_t ENC_FORCED = 0;
constexpr int64_t ENC_ENABLED = 1;
constexpr int64_t ENC_DISABLED = 2;

const std::array<ConfigOption, 6> OPTIONS{{
    { "cache_size_mb", { "cache_size" }, ConfigOption::Kind::Integer, 64, "disk cache in MB" },
    { "dl_limit_kb", { "download_rate_limit" }, ConfigOption::Kind::Integer, 1024, "download limit in KB/s, 0 for none" },
    { "ul_limit_kb", { "upload_rate_limit" }, ConfigOption::Kind::Integer, 1024, "upload limit in KB/s, 0 for none" },
    { "connections_limit", { "connections_limit" }, ConfigOption::Kind::Integer, 1, "global peer connection cap" },
    { "listen_port", { "listen_interfaces" }, ConfigOption::Kind::Text, 1, "listen interfaces, e.g. 0.0.0.0:6881" },
    { "encryption", { "in_enc_policy", "out_enc_policy" }, ConfigOption::Kind::Encryption, 1, "enable, force or disable" },
}};

const ConfigOption& find_option(std::string_view key) {
    for (const auto& opt: OPTIONS) {
        if (opt.key == key) return opt;
    }
    throw UnknownKeyError(key);
}

int64_t parse_scaled(const ConfigOption& opt, std::string_view raw) {
    int64_t value{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);

    if (ec != std::errc{} || ptr != raw.data() + raw.size() || raw.empty()) {
        throw InvalidValueError(std::string(opt.key) + " expects an integer, got '" + std::string(raw) + "'");
    }
    if (value < 0) throw InvalidValueError(std::string(opt.key) + " must not be negative");

    // engine integers are 32 bit
    if (value > std::numeric_limits<int32_t>::max() / opt.scale) {
        throw InvalidValueError(std::string(opt.key) + " is out of range");
    }

    return value * opt.scale;
}

int64_t parse_encryption(std::string_view raw) {
    auto mode = to_lower(raw);

    if (mode == "enable" || mode == "enabled") return ENC_ENABLED;
    if (mode == "force" || mode == "forced") return ENC_FORCED;
    if (mode == "disable" || mode == "disabled") return ENC_DISABLED;

    throw InvalidValueError("encryption must be enable, force or disable");
}

}

SettingsMap ConfigTranslator::translate(std::string_view key, std::string_view raw) {
    const auto& opt = find_option(key);
    SettingsMap out;

    switch (opt.kind) {
        case ConfigOption::Kind::Integer: {
            auto value = parse_scaled(opt, raw);
            for (auto name: opt.settings) out[std::string(name)] = value;
            break;
        }
        case ConfigOption::Kind::Text:
            if (raw.empty()) throw InvalidValueError(std::string(opt.key) + " must not be empty");
            for (auto name: opt.settings) out[std::string(name)] = std::string(raw);
            break;
        case ConfigOption::Kind::Encryption: {
            auto value = parse_encryption(raw);
            for (auto name: opt.settings) out[std::string(name)] = value;
            break;
        }
    }

    return out;
}

std::string ConfigTranslator::render(std::string_view key, const SettingsMap& settings) {
    const auto& opt = find_option(key);
    const auto name = opt.settings.front();

    switch (opt.kind) {
        case ConfigOption::Kind::Integer: {
            auto value = get_int(settings, name);
            if (!value) return {};
            return std::to_string(*value / opt.scale);
        }
        case ConfigOption::Kind::Text:
            return get_string(settings, name).value_or("");
        case ConfigOption::Kind::Encryption: {
            auto value = get_int(settings, name);
            if (!value) return {};
            switch (*value) {
                case ENC_FORCED: return "force";
                case ENC_ENABLED: return "enable";
                case ENC_DISABLED: return "disable";
            }
            return std::to_string(*value);
        }
    }

    return {};
}

std::span<const ConfigOption> ConfigTranslator::options() {
    return OPTIONS;
}

void ConfigTranslator::set(std::string_view key, std::string_view raw) {
    auto translated = translate(key, raw);

    _engine.apply_settings(translated);
    for (auto& [name, value]: translated) _settings[name] = value;

    BOOST_LOG_TRIVIAL(info) << "Config " << key << " set to " << raw;
}

std::string ConfigTranslator::get(std::string_view key) const {
    return render(key, _settings);
}
