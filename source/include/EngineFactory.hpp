#pragma once

#include "Engine.hpp"

#include <functional>
#include <memory>
#include <string>

using EngineFactory = std::function<std::unique_ptr<BaseEngine>(const SettingsMap& settings, const std::string& state)>;

// libtorrent-backed engine, seeded with the persisted session blob when there is one
std::unique_ptr<BaseEngine> make_engine(const SettingsMap& settings, const std::string& state);
