#pragma once

#include "BEncode.hpp"

#include <map>
#include <string>
#include <variant>
#include <cstdint>
#include <optional>

// values are engine-native: byte rates, 16 KiB cache blocks, enum integers
using SettingValue = std::variant<int64_t, bool, std::string>;
using SettingsMap = std::map<std::string, SettingValue, std::less<>>;

inline constexpr int64_t ALL_ALERT_CATEGORIES = 0x7fffffff;
inline constexpr const char* USER_AGENT = "TClient/2.0 (libtorrent/2.0)";

// the baseline every session starts from, before persisted overrides
const SettingsMap& default_settings();

SettingsMap merge_settings(const SettingsMap& defaults, const SettingsMap& overrides);

std::optional<int64_t> get_int(const SettingsMap& settings, std::string_view name);
std::optional<bool> get_bool(const SettingsMap& settings, std::string_view name);
std::optional<std::string> get_string(const SettingsMap& settings, std::string_view name);

std::string setting_to_string(const SettingValue& v);

// {"bool": {...}, "int": {...}, "str": {...}} so bools survive the round trip
BEncodeValue settings_to_bencode(const SettingsMap& settings);
SettingsMap settings_from_bencode(const BEncodeValue& v);
