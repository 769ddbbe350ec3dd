#include "Settings.hpp"

const SettingsMap& default_settings() {
    static const SettingsMap defaults = {
        { "user_agent", std::string(USER_AGENT) },
        { "listen_interfaces", std::string("0.0.0.0:6881,[::]:6881") },
        { "enable_dht", true },
        { "enable_upnp", true },
        { "enable_natpmp", true },
        { "alert_mask", ALL_ALERT_CATEGORIES },
    };
    return defaults;
}

SettingsMap merge_settings(const SettingsMap& defaults, const SettingsMap& overrides) {
    SettingsMap out = defaults;
    for (const auto& [name, value]: overrides) out.insert_or_assign(name, value);
    return out;
}

std::optional<int64_t> get_int(const SettingsMap& settings, std::string_view name) {
    auto it = settings.find(name);
    if (it == settings.end()) return std::nullopt;
    if (auto* v = std::get_if<int64_t>(&it->second)) return *v;
    return std::nullopt;
}

std::optional<bool> get_bool(const SettingsMap& settings, std::string_view name) {
    auto it = settings.find(name);
    if (it == settings.end()) return std::nullopt;
    if (auto* v = std::get_if<bool>(&it->second)) return *v;
    return std::nullopt;
}

std::optional<std::string> get_string(const SettingsMap& settings, std::string_view name) {
    auto it = settings.find(name);
    if (it == settings.end()) return std::nullopt;
    if (auto* v = std::get_if<std::string>(&it->second)) return *v;
    return std::nullopt;
}

std::string setting_to_string(const SettingValue& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    return std::get<std::string>(v);
}

BEncodeValue settings_to_bencode(const SettingsMap& settings) {
    BEncodeValue::Dict bools, ints, strs;

    for (const auto& [name, value]: settings) {
        if (auto* i = std::get_if<int64_t>(&value)) ints.emplace(name, BEncodeValue{ *i });
        else if (auto* b = std::get_if<bool>(&value)) bools.emplace(name, BEncodeValue{ int64_t{ *b ? 1 : 0 } });
        else strs.emplace(name, BEncodeValue{ std::get<std::string>(value) });
    }

    BEncodeValue::Dict root;
    root.emplace("bool", BEncodeValue{ std::move(bools) });
    root.emplace("int", BEncodeValue{ std::move(ints) });
    root.emplace("str", BEncodeValue{ std::move(strs) });
    return BEncodeValue{ std::move(root) };
}

SettingsMap settings_from_bencode(const BEncodeValue& v) {
    if (!v.is_dict()) throw std::runtime_error("settings must be a dictionary");

    SettingsMap out;

    if (auto* bools = v.find("bool"); bools && bools->is_dict()) {
        for (const auto& [name, item]: bools->as_dict()) {
            if (item.is_int()) out.insert_or_assign(name, item.as_int() != 0);
        }
    }

    if (auto* ints = v.find("int"); ints && ints->is_dict()) {
        for (const auto& [name, item]: ints->as_dict()) {
            if (item.is_int()) out.insert_or_assign(name, item.as_int());
        }
    }

    if (auto* strs = v.find("str"); strs && strs->is_dict()) {
        for (const auto& [name, item]: strs->as_dict()) {
            if (item.is_string()) out.insert_or_assign(name, item.as_string());
        }
    }

    return out;
}
