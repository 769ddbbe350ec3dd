#include "ClientOptions.hpp"

#include <cstdlib>
#include <fstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {

std::filesystem::path home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return std::filesystem::current_path();
}

std::filesystem::path expand_user(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.starts_with("~/")) return home_dir() / path.substr(2);
    return path;
}

template <typename T>
T positive(const po::variables_map& vm, const char* name) {
    auto value = vm[name].as<T>();
    if (value <= 0) throw po::invalid_option_value(std::to_string(value));
    return value;
}

}

ClientOptions default_options() {
    ClientOptions options;
    options.state_dir = home_dir() / ".tclient_state";
    options.save_path = home_dir() / "Torrents";
    return options;
}

std::optional<ClientOptions> parse_options(int argc, const char* const argv[], std::ostream& out) {
    auto defaults = default_options();

    po::options_description desc("TClient options");
    desc.add_options()
        ("help,h", "show this help")
        ("state-dir", po::value<std::string>()->default_value(defaults.state_dir.string()), "session, resume and feed state")
        ("save-path", po::value<std::string>()->default_value(defaults.save_path.string()), "download directory")
        ("feed-interval", po::value<int>()->default_value(static_cast<int>(defaults.feed_interval.count())), "minutes between feed passes")
        ("shutdown-timeout", po::value<int>()->default_value(static_cast<int>(defaults.shutdown_timeout.count())), "seconds to wait for resume data on exit")
        ("alert-wait", po::value<int>()->default_value(static_cast<int>(defaults.alert_wait.count())), "event wait bound in milliseconds")
        ("log-level", po::value<std::string>()->default_value(defaults.log_level), "trace, debug, info, warning, error or fatal")
        ("no-feeds", po::bool_switch(), "do not run feed automation");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
        out << desc << '\n';
        return std::nullopt;
    }

    auto state_dir = expand_user(vm["state-dir"].as<std::string>());

    // values already on the command line win over the file
    if (std::ifstream conf(state_dir / "tclient.conf"); conf.is_open()) {
        po::store(po::parse_config_file(conf, desc), vm);
    }

    po::notify(vm);

    ClientOptions options;
    options.state_dir = state_dir;
    options.save_path = expand_user(vm["save-path"].as<std::string>());
    options.feed_interval = std::chrono::minutes(positive<int>(vm, "feed-interval"));
    options.shutdown_timeout = std::chrono::seconds(positive<int>(vm, "shutdown-timeout"));
    options.alert_wait = std::chrono::milliseconds(positive<int>(vm, "alert-wait"));
    options.log_level = vm["log-level"].as<std::string>();
    options.feeds_enabled = !vm["no-feeds"].as<bool>();

    return options;
}
