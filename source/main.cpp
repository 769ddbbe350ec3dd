#include "Client.hpp"
#include "CommandShell.hpp"
#include "EngineFactory.hpp"
#include "HttpFeedFetcher.hpp"
#include "Logging.hpp"

#include <csignal>
#include <iostream>

#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

int main(int argc, char* argv[]) {
    std::optional<ClientOptions> options;

    try {
        options = parse_options(argc, argv, std::cout);
    }
    catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    if (!options) return 0;

    try {
        std::filesystem::create_directories(options->state_dir);
        init_logging(options->state_dir / "tclient.log", parse_log_level(options->log_level));

        BOOST_LOG_TRIVIAL(info) << "Starting TClient, state in " << options->state_dir.string();

        boost::asio::io_context ioc;

        Client client(*options, make_engine, std::make_shared<HttpFeedFetcher>(), std::cout);
        client.start();

        std::cout << "TClient ready. Type 'help' for commands.\n";

        CommandShell shell(client);
        boost::asio::posix::stream_descriptor input(ioc, ::dup(STDIN_FILENO));

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            BOOST_LOG_TRIVIAL(info) << "Signal " << sig << " received.";
            ioc.stop();
        });

        boost::asio::co_spawn(ioc, shell.run(input), [&](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                }
                catch (const std::exception& e) {
                    BOOST_LOG_TRIVIAL(error) << "Command loop failed: " << e.what();
                }
            }
            ioc.stop();
        });

        ioc.run();

        // signal, quit command and end of input all end up here
        client.shutdown();
    }
    catch (const std::exception& ex) {
        BOOST_LOG_TRIVIAL(fatal) << ex.what();
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
