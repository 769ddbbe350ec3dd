#include "EngineFactory.hpp"
#include "LibtorrentEngine.hpp"

std::unique_ptr<BaseEngine> make_engine(const SettingsMap& settings, const std::string& state) {
    return std::make_unique<LibtorrentEngine>(settings, state);
}
