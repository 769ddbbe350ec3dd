#pragma once

#include <chrono>
#include <string>
#include <ostream>
#include <optional>
#include <filesystem>

struct ClientOptions {
    std::filesystem::path state_dir;
    std::filesystem::path save_path;

    std::chrono::minutes feed_interval{ 15 };
    std::chrono::seconds shutdown_timeout{ 10 };
    std::chrono::milliseconds alert_wait{ 500 };

    std::string log_level = "info";
    bool feeds_enabled = true;
};

// ~/.tclient_state and ~/Torrents
ClientOptions default_options();

// command line first, then <state-dir>/tclient.conf for anything not given.
// nullopt when --help was printed; throws boost::program_options::error on bad input
std::optional<ClientOptions> parse_options(int argc, const char* const argv[], std::ostream& out);
