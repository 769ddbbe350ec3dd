#include "Settings.hpp"

#include <gtest/gtest.h>

TEST(SettingsTest, DefaultsEnableDiscovery) {
    const auto& defaults = default_settings();

    EXPECT_EQ(get_bool(defaults, "enable_dht"), true);
    EXPECT_EQ(get_bool(defaults, "enable_upnp"), true);
    EXPECT_EQ(get_bool(defaults, "enable_natpmp"), true);
    EXPECT_EQ(get_int(defaults, "alert_mask"), ALL_ALERT_CATEGORIES);

    auto listen = get_string(defaults, "listen_interfaces");
    ASSERT_TRUE(listen);
    EXPECT_FALSE(listen->empty());
    EXPECT_EQ(get_string(defaults, "user_agent"), std::string(USER_AGENT));
}

TEST(SettingsTest, MergeLetsOverridesWin) {
    SettingsMap overrides{
        { "enable_dht", false },
        { "download_rate_limit", int64_t{ 512000 } },
    };

    auto merged = merge_settings(default_settings(), overrides);

    EXPECT_EQ(get_bool(merged, "enable_dht"), false);
    EXPECT_EQ(get_int(merged, "download_rate_limit"), 512000);
    EXPECT_EQ(get_bool(merged, "enable_upnp"), true);

    // the baseline itself is untouched
    EXPECT_EQ(get_bool(default_settings(), "enable_dht"), true);
}

TEST(SettingsTest, TypedGettersRejectOtherTypes) {
    SettingsMap settings{ { "cache_size", int64_t{ 64 } } };

    EXPECT_FALSE(get_bool(settings, "cache_size"));
    EXPECT_FALSE(get_string(settings, "cache_size"));
    EXPECT_FALSE(get_int(settings, "missing"));
}

TEST(SettingsTest, BencodeKeepsBooleansApartFromIntegers) {
    SettingsMap settings{
        { "enable_dht", true },
        { "enable_lsd", false },
        { "connections_limit", int64_t{ 1 } },
        { "listen_interfaces", std::string("0.0.0.0:7000") },
    };

    auto restored = settings_from_bencode(BEncodeParser(bencode(settings_to_bencode(settings))).parse());

    EXPECT_EQ(restored, settings);
    EXPECT_TRUE(std::holds_alternative<bool>(restored.at("enable_dht")));
    EXPECT_TRUE(std::holds_alternative<int64_t>(restored.at("connections_limit")));
}

TEST(SettingsTest, FromBencodeRejectsNonDictionary) {
    EXPECT_THROW(settings_from_bencode(BEncodeValue{ int64_t{ 3 } }), std::runtime_error);
}

TEST(SettingsTest, RendersValuesAsText) {
    EXPECT_EQ(setting_to_string(SettingValue{ int64_t{ 12 } }), "12");
    EXPECT_EQ(setting_to_string(SettingValue{ true }), "true");
    EXPECT_EQ(setting_to_string(SettingValue{ std::string("abc") }), "abc");
}
