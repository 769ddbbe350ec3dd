#include "CommandShell.hpp"
#include "Utils.hpp"

#include <format>
#include <charconv>
#include <sstream>
#include <istream>
#include <stdexcept>

#include <boost/log/trivial.hpp>

namespace {

void require(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) throw std::invalid_argument(std::string("Usage: ") + usage);
}

template <typename T>
T parse_number(const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw std::invalid_argument("Expected a number, got '" + text + "'");
    }
    return value;
}

double parse_ratio(const std::string& text) {
    std::istringstream in(text);
    double value{};
    if (!(in >> value) || !in.eof()) throw std::invalid_argument("Expected a number, got '" + text + "'");
    return value;
}

bool parse_switch(const std::string& text) {
    auto v = to_lower(text);
    if (v == "on") return true;
    if (v == "off") return false;
    throw std::invalid_argument("Expected on or off, got '" + text + "'");
}

std::string join(const std::vector<std::string>& words, size_t from) {
    std::string out;
    for (size_t i = from; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

std::string shorten(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    return s.substr(0, width - 3) + "...";
}

std::string percent(double progress) {
    return std::format("{:.1f}%", progress * 100.0);
}

constexpr const char* HELP = R"(Manage
  add <magnet|path>               add a torrent
  pause|resume <#>                pause or resume
  remove|rm-data <#>              remove, rm-data also deletes files
  info <#>                        show details
  list                            show all torrents
Control
  queue <#> up|down|top|bottom    move in the queue
  ratio <#> <float>               set share ratio target
  conns <#> <max>                 set max connections
  superseed <#> on|off
Prioritize
  files <#>                       list files
  prio <#> file <f_idx> <0-7>
  prio <#> piece <p_idx> <0-7>
Network
  config show | config set <key> <value>
  ipfilter load <path>
  dht put <text> | dht get <hash>
  proxy set <socks4|socks5|http> <host> <port> | proxy clear
Automation (RSS)
  rss add <url> [regex]
  rss remove <#>
  rss list
help, q(uit), exit are also available.)";

}

boost::asio::awaitable<void> CommandShell::run(boost::asio::posix::stream_descriptor& input) {
    boost::asio::streambuf buffer;

    while (true) {
        _console.print("> ");

        boost::system::error_code ec;
        co_await boost::asio::async_read_until(input, buffer, '\n', boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec && ec != boost::asio::error::eof) {
            BOOST_LOG_TRIVIAL(error) << "Input error: " << ec.message();
            co_return;
        }

        // at end of input a last unterminated line still counts
        std::istream in(&buffer);
        std::string line;
        while (std::getline(in, line)) {
            if (!execute(line)) co_return;
            if (!ec) break;
        }

        if (ec) {
            _console.println("");
            co_return;
        }
    }
}

bool CommandShell::execute(const std::string& line) {
    auto words = split_words(line);
    if (words.empty()) return true;

    auto cmd = to_lower(words[0]);

    try {
        if (cmd == "q" || cmd == "quit" || cmd == "exit") return false;
        else if (cmd == "help") print_help();
        else if (cmd == "list" || cmd == "ls") print_list();
        else if (cmd == "add") cmd_add(words);
        else if (cmd == "pause") {
            require(words, 2, "pause <#>");
            _client.pause(parse_number<size_t>(words[1]));
            _console.println("Paused torrent " + words[1] + ".");
        }
        else if (cmd == "resume") {
            require(words, 2, "resume <#>");
            _client.resume(parse_number<size_t>(words[1]));
            _console.println("Resumed torrent " + words[1] + ".");
        }
        else if (cmd == "remove" || cmd == "rm-data") {
            require(words, 2, "remove|rm-data <#>");
            bool with_data = cmd == "rm-data";
            _client.remove(parse_number<size_t>(words[1]), with_data);
            _console.println(std::string("Removed torrent ") + words[1] + (with_data ? " and its data." : "."));
        }
        else if (cmd == "info") cmd_info(words);
        else if (cmd == "files") cmd_files(words);
        else if (cmd == "queue") cmd_queue(words);
        else if (cmd == "ratio") {
            require(words, 3, "ratio <#> <float>");
            auto ratio = parse_ratio(words[2]);
            _client.set_share_ratio(parse_number<size_t>(words[1]), ratio);
            _console.println("Share ratio for torrent " + words[1] + " set to " + words[2] + ".");
        }
        else if (cmd == "conns") {
            require(words, 3, "conns <#> <max>");
            _client.set_max_connections(parse_number<size_t>(words[1]), parse_number<int>(words[2]));
            _console.println("Max connections for torrent " + words[1] + " set to " + words[2] + ".");
        }
        else if (cmd == "superseed") {
            require(words, 3, "superseed <#> on|off");
            bool enable = parse_switch(words[2]);
            _client.set_super_seeding(parse_number<size_t>(words[1]), enable);
            _console.println(std::string("Super seeding ") + (enable ? "enabled" : "disabled") + " for torrent " + words[1] + ".");
        }
        else if (cmd == "prio") cmd_prio(words);
        else if (cmd == "config") cmd_config(words);
        else if (cmd == "ipfilter") cmd_ipfilter(words);
        else if (cmd == "dht") cmd_dht(words);
        else if (cmd == "proxy") cmd_proxy(words);
        else if (cmd == "rss") cmd_rss(words);
        else _console.println("Unknown command. Type 'help' for the list.");
    }
    catch (const std::exception& e) {
        _console.println(std::string("Error: ") + e.what());
    }

    return true;
}

void CommandShell::print_help() {
    _console.println(HELP);
}

void CommandShell::print_list() {
    auto out = std::format("{:<4}{:<42}{:<11}{:<9}{:<13}{:<13}{:<10}{}\n", "#", "Name", "Size", "Done", "Down", "Up", "Peers", "Status");

    for (const auto& snap: _client.job_snapshots()) {
        const auto& s = snap.status;

        std::string label = snap.label;
        if (s.queue_position >= 0 && s.state != JobState::Seeding) label += std::format(" [Q:{}]", s.queue_position);
        if (s.share_ratio) label += std::format(" (R:{:.1f})", *s.share_ratio);

        out += std::format("{:<4}{:<42}{:<11}{:<9}{:<13}{:<13}{:<10}{}\n",
            snap.index,
            shorten(s.name.empty() ? s.content_hash : s.name, 40),
            human_readable_size(s.total_wanted),
            percent(s.progress),
            format_speed(static_cast<double>(s.download_rate)),
            format_speed(static_cast<double>(s.upload_rate)),
            std::format("{}({})", s.num_peers, s.num_seeds),
            label);
    }

    out += _client.summary();
    _console.println(out);
}

void CommandShell::cmd_add(const Args& args) {
    require(args, 2, "add <magnet|path>");

    auto result = _client.add_job(join(args, 1));
    _console.println(result.success ? result.message : "Error: " + result.message);
}

void CommandShell::cmd_info(const Args& args) {
    require(args, 2, "info <#>");
    auto s = _client.info(parse_number<size_t>(args[1]));

    auto out = std::format(
        "Name:     {}\n"
        "Hash:     {}\n"
        "Status:   {}\n"
        "Progress: {} of {}\n"
        "Rates:    {} down, {} up\n"
        "Peers:    {} ({} seeds)\n"
        "Queue:    {}\n"
        "Uploaded: {}",
        s.name, s.content_hash, status_label(s),
        percent(s.progress), human_readable_size(s.total_wanted),
        format_speed(static_cast<double>(s.download_rate)), format_speed(static_cast<double>(s.upload_rate)),
        s.num_peers, s.num_seeds, s.queue_position, human_readable_size(s.all_time_upload));
    if (s.share_ratio) out += std::format("\nRatio:    {}", *s.share_ratio);

    _console.println(out);
}

void CommandShell::cmd_files(const Args& args) {
    require(args, 2, "files <#>");
    auto files = _client.files(parse_number<size_t>(args[1]));

    if (files.empty()) {
        _console.println("No file list yet, metadata is still downloading.");
        return;
    }

    auto out = std::format("{:<6}{:<11}{:<6}{}", "#", "Size", "Prio", "Path");
    for (size_t i = 0; i < files.size(); ++i) {
        out += std::format("\n{:<6}{:<11}{:<6}{}", i, human_readable_size(files[i].size), files[i].priority, files[i].path);
    }
    _console.println(out);
}

void CommandShell::cmd_queue(const Args& args) {
    require(args, 3, "queue <#> up|down|top|bottom");

    auto action = to_lower(args[2]);
    QueueMove move;
    if (action == "up") move = QueueMove::Up;
    else if (action == "down") move = QueueMove::Down;
    else if (action == "top") move = QueueMove::Top;
    else if (action == "bottom") move = QueueMove::Bottom;
    else throw std::invalid_argument("Queue action must be up, down, top or bottom.");

    _client.move_in_queue(parse_number<size_t>(args[1]), move);
    _console.println("Torrent " + args[1] + " moved " + action + " in queue.");
}

void CommandShell::cmd_prio(const Args& args) {
    require(args, 5, "prio <#> file|piece <idx> <0-7>");

    auto index = parse_number<size_t>(args[1]);
    auto kind = to_lower(args[2]);
    auto target = parse_number<int>(args[3]);
    auto priority = parse_number<int>(args[4]);

    if (kind == "file") {
        _client.set_file_priority(index, target, priority);
        _console.println("File " + args[3] + " priority set to " + args[4] + ".");
    }
    else if (kind == "piece") {
        _client.set_piece_priority(index, target, priority);
        _console.println("Piece " + args[3] + " priority set to " + args[4] + ".");
    }
    else {
        throw std::invalid_argument("Usage: prio <#> file|piece <idx> <0-7>");
    }
}

void CommandShell::cmd_config(const Args& args) {
    require(args, 2, "config show | config set <key> <value>");
    auto sub = to_lower(args[1]);

    if (sub == "show") {
        auto out = std::format("{:<20}{:<28}{}", "Key", "Value", "Description");
        for (const auto& opt: ConfigTranslator::options()) {
            auto value = _client.config().get(opt.key);
            out += std::format("\n{:<20}{:<28}{}", opt.key, value.empty() ? "N/A" : value, opt.description);
        }
        _console.println(out);
    }
    else if (sub == "set") {
        require(args, 4, "config set <key> <value>");
        auto value = join(args, 3);
        _client.config().set(args[2], value);
        _console.println("Config '" + args[2] + "' set to '" + value + "'.");
    }
    else {
        throw std::invalid_argument("Usage: config show | config set <key> <value>");
    }
}

void CommandShell::cmd_ipfilter(const Args& args) {
    require(args, 3, "ipfilter load <path>");
    if (to_lower(args[1]) != "load") throw std::invalid_argument("Usage: ipfilter load <path>");

    auto path = join(args, 2);
    auto count = _client.load_ip_filter(path);
    _console.println("IP filter loaded from " + path + ", " + std::to_string(count) + " ranges.");
}

void CommandShell::cmd_dht(const Args& args) {
    require(args, 3, "dht put <text> | dht get <hash>");
    auto sub = to_lower(args[1]);

    if (sub == "put") {
        auto data = join(args, 2);
        auto target = _client.dht_put(data);
        _console.println("Putting item into DHT: '" + data + "' as " + target);
    }
    else if (sub == "get") {
        _client.dht_get(args[2]);
        _console.println("Requesting item from DHT: " + args[2]);
    }
    else {
        throw std::invalid_argument("Usage: dht put <text> | dht get <hash>");
    }
}

void CommandShell::cmd_proxy(const Args& args) {
    require(args, 2, "proxy set <socks4|socks5|http> <host> <port> | proxy clear");
    auto sub = to_lower(args[1]);

    if (sub == "clear") {
        _client.clear_proxy();
        _console.println("Proxy cleared.");
    }
    else if (sub == "set") {
        require(args, 5, "proxy set <socks4|socks5|http> <host> <port>");
        _client.set_proxy(args[2], args[3], parse_number<int>(args[4]));
        _console.println("Proxy set to " + args[2] + " " + args[3] + ":" + args[4] + ".");
    }
    else {
        throw std::invalid_argument("Usage: proxy set <socks4|socks5|http> <host> <port> | proxy clear");
    }
}

void CommandShell::cmd_rss(const Args& args) {
    require(args, 2, "rss add <url> [regex] | rss remove <#> | rss list");
    auto sub = to_lower(args[1]);
    auto& feeds = _client.feeds();

    if (sub == "add") {
        require(args, 3, "rss add <url> [regex]");
        feeds.add_feed(args[2], join(args, 3));
        _console.println("Added RSS feed: " + args[2]);
    }
    else if (sub == "remove") {
        require(args, 3, "rss remove <#>");
        auto removed = feeds.remove_feed(parse_number<size_t>(args[2]));
        if (!removed) throw std::out_of_range("Invalid feed index.");
        _console.println("Removed RSS feed: " + removed->url);
    }
    else if (sub == "list") {
        auto list = feeds.feeds();
        if (list.empty()) {
            _console.println("No RSS feeds.");
            return;
        }

        auto out = std::format("{:<4}{:<60}{}", "#", "URL", "Filter");
        for (size_t i = 0; i < list.size(); ++i) {
            out += std::format("\n{:<4}{:<60}{}", i, list[i].url, list[i].filter);
        }
        _console.println(out);
    }
    else {
        throw std::invalid_argument("Usage: rss add <url> [regex] | rss remove <#> | rss list");
    }
}
