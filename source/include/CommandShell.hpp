#pragma once

#include "Client.hpp"

#include <string>
#include <vector>

#include <boost/asio.hpp>

class CommandShell {
public:
    explicit CommandShell(Client& client): _client(client), _console(client.console()) {}

    // false once the user asked to quit
    bool execute(const std::string& line);

    // reads lines until quit or end of input
    [[nodiscard]] boost::asio::awaitable<void> run(boost::asio::posix::stream_descriptor& input);

    void print_help();
    void print_list();

private:
    using Args = std::vector<std::string>;

    void cmd_add(const Args& args);
    void cmd_info(const Args& args);
    void cmd_files(const Args& args);
    void cmd_queue(const Args& args);
    void cmd_prio(const Args& args);
    void cmd_config(const Args& args);
    void cmd_ipfilter(const Args& args);
    void cmd_dht(const Args& args);
    void cmd_proxy(const Args& args);
    void cmd_rss(const Args& args);

    Client& _client;
    Console& _console;
};
