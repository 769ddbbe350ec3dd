#include "CommandShell.hpp"
#include "FakeEngine.hpp"
#include "FakeFeedFetcher.hpp"
#include "TestUtils.hpp"

#include <sstream>

#include <gtest/gtest.h>

class CommandShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineFactory factory = [this](const SettingsMap& settings, const std::string& state) {
            auto created = std::make_unique<FakeEngine>(settings, state);
            engine = created.get();
            return std::unique_ptr<BaseEngine>(std::move(created));
        };
        client = std::make_unique<Client>(test_options(dir), factory, std::make_shared<FakeFeedFetcher>(), output);
        shell = std::make_unique<CommandShell>(*client);
    }

    // output produced by one command
    std::string run(const std::string& line) {
        output.str("");
        EXPECT_TRUE(shell->execute(line));
        return output.str();
    }

    bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }

    TempDir dir;
    std::ostringstream output;
    FakeEngine* engine = nullptr;
    std::unique_ptr<Client> client;
    std::unique_ptr<CommandShell> shell;
};

TEST_F(CommandShellTest, QuitWordsEndTheShell) {
    EXPECT_FALSE(shell->execute("q"));
    EXPECT_FALSE(shell->execute("quit"));
    EXPECT_FALSE(shell->execute("  EXIT "));
    EXPECT_TRUE(shell->execute(""));
}

TEST_F(CommandShellTest, HelpListsCommandGroups) {
    auto text = run("help");
    EXPECT_TRUE(contains(text, "Automation (RSS)"));
    EXPECT_TRUE(contains(text, "proxy set"));
}

TEST_F(CommandShellTest, UnknownCommand) {
    EXPECT_TRUE(contains(run("frobnicate"), "Unknown command. Type 'help' for the list."));
}

TEST_F(CommandShellTest, ErrorsArePrintedNotThrown) {
    EXPECT_TRUE(contains(run("pause"), "Error: Usage: pause <#>"));
    EXPECT_TRUE(contains(run("pause x"), "Error: Expected a number"));
    EXPECT_TRUE(contains(run("pause 4"), "Error: Invalid torrent index."));
    EXPECT_TRUE(contains(run("queue 0 sideways"), "Error: Queue action must be"));
}

TEST_F(CommandShellTest, AddMagnet) {
    auto text = run("add magnet:?xt=urn:btih:" + make_hash(1));

    EXPECT_TRUE(contains(text, "Adding magnet link..."));
    EXPECT_EQ(engine->magnet_count(), 1u);

    EXPECT_TRUE(contains(run("add /no/such/file.torrent"), "Error: Invalid torrent source."));
}

TEST_F(CommandShellTest, ConfigSetAndShow) {
    EXPECT_TRUE(contains(run("config set ul_limit_kb 100"), "Config 'ul_limit_kb' set to '100'."));
    EXPECT_EQ(engine->applied_setting("upload_rate_limit"), SettingValue{ int64_t{ 102400 } });

    auto table = run("config show");
    EXPECT_TRUE(contains(table, "ul_limit_kb"));
    EXPECT_TRUE(contains(table, "100"));
    EXPECT_TRUE(contains(table, "N/A"));

    EXPECT_TRUE(contains(run("config set nonsense 1"), "Error: Unknown config key"));
    EXPECT_TRUE(contains(run("config set cache_size_mb lots"), "Error: cache_size_mb expects an integer"));
}

TEST_F(CommandShellTest, RssCommands) {
    EXPECT_TRUE(contains(run("rss list"), "No RSS feeds."));

    EXPECT_TRUE(contains(run("rss add https://feeds.example.org/a.xml 1080p"), "Added RSS feed"));
    auto list = run("rss list");
    EXPECT_TRUE(contains(list, "https://feeds.example.org/a.xml"));
    EXPECT_TRUE(contains(list, "1080p"));

    EXPECT_TRUE(contains(run("rss add https://feeds.example.org/a.xml"), "Error: Feed already added"));
    EXPECT_TRUE(contains(run("rss remove 3"), "Error: Invalid feed index."));
    EXPECT_TRUE(contains(run("rss remove 0"), "Removed RSS feed: https://feeds.example.org/a.xml"));
    EXPECT_TRUE(client->feeds().feeds().empty());
}

TEST_F(CommandShellTest, ProxyAndDht) {
    EXPECT_TRUE(contains(run("proxy set socks5 10.0.0.1 9050"), "Proxy set to socks5 10.0.0.1:9050."));
    EXPECT_EQ(engine->applied_setting("proxy_port"), SettingValue{ int64_t{ 9050 } });
    EXPECT_TRUE(contains(run("proxy clear"), "Proxy cleared."));

    EXPECT_TRUE(contains(run("dht put hello world"), "Putting item into DHT: 'hello world'"));
    ASSERT_EQ(engine->dht_puts.size(), 1u);
    EXPECT_EQ(engine->dht_puts[0], "hello world");
}

TEST_F(CommandShellTest, ListShowsSummary) {
    auto text = run("list");
    EXPECT_TRUE(contains(text, "Name"));
    EXPECT_TRUE(contains(text, "Torrents: 0"));
}

TEST_F(CommandShellTest, JobTablesAreFormatted) {
    client->start();
    client->add_job("magnet:?xt=urn:btih:" + make_hash(1));
    ASSERT_TRUE(wait_until([&] { return client->job_count() == 1; }));

    // no event thread writing to the console past this point
    client->shutdown();

    auto job = engine->job_list().at(0);
    JobStatus status;
    status.state = JobState::Downloading;
    status.progress = 0.5;
    status.total_wanted = 2048;
    status.download_rate = 3 * 1024;
    status.num_peers = 7;
    status.num_seeds = 2;
    status.queue_position = 0;
    status.has_metadata = true;
    job->set_status(status);
    job->file_list = { JobFile{ "dir/movie.mkv", 1024 * 1024, 4 } };

    auto list = run("list");
    EXPECT_TRUE(contains(list, "50.0%"));
    EXPECT_TRUE(contains(list, "2.00KB"));
    EXPECT_TRUE(contains(list, "3.0 KB/s"));
    EXPECT_TRUE(contains(list, "7(2)"));
    EXPECT_TRUE(contains(list, "Downloading [Q:0]"));
    EXPECT_TRUE(contains(list, "Torrents: 1"));

    auto info = run("info 0");
    EXPECT_TRUE(contains(info, "Hash:     " + make_hash(1)));
    EXPECT_TRUE(contains(info, "Peers:    7 (2 seeds)"));

    auto files = run("files 0");
    EXPECT_TRUE(contains(files, "1.00MB"));
    EXPECT_TRUE(contains(files, "dir/movie.mkv"));
}
