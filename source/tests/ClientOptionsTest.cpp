#include "ClientOptions.hpp"
#include "TestUtils.hpp"

#include <sstream>
#include <vector>

#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>

namespace {

std::optional<ClientOptions> parse(std::vector<std::string> args, std::ostream& out) {
    args.insert(args.begin(), "tclient");

    std::vector<const char*> argv;
    for (const auto& a: args) argv.push_back(a.c_str());

    return parse_options(static_cast<int>(argv.size()), argv.data(), out);
}

}

TEST(ClientOptionsTest, Defaults) {
    TempDir dir;
    std::ostringstream out;

    auto options = parse({ "--state-dir", dir.path().string() }, out);
    ASSERT_TRUE(options);

    EXPECT_EQ(options->state_dir.string(), dir.path().string());
    EXPECT_EQ(options->feed_interval, std::chrono::minutes(15));
    EXPECT_EQ(options->shutdown_timeout, std::chrono::seconds(10));
    EXPECT_EQ(options->alert_wait, std::chrono::milliseconds(500));
    EXPECT_EQ(options->log_level, "info");
    EXPECT_TRUE(options->feeds_enabled);
}

TEST(ClientOptionsTest, CommandLineValues) {
    TempDir dir;
    std::ostringstream out;

    auto options = parse({
        "--state-dir", dir.path().string(),
        "--save-path", (dir / "dl").string(),
        "--shutdown-timeout", "3",
        "--log-level", "debug",
        "--no-feeds",
    }, out);
    ASSERT_TRUE(options);

    EXPECT_EQ(options->save_path.string(), (dir / "dl").string());
    EXPECT_EQ(options->shutdown_timeout, std::chrono::seconds(3));
    EXPECT_EQ(options->log_level, "debug");
    EXPECT_FALSE(options->feeds_enabled);
}

TEST(ClientOptionsTest, ConfigFileFillsGaps) {
    TempDir dir;
    std::ostringstream out;
    write_text(dir / "tclient.conf", "feed-interval = 30\nlog-level = warning\n");

    auto options = parse({ "--state-dir", dir.path().string(), "--log-level", "error" }, out);
    ASSERT_TRUE(options);

    EXPECT_EQ(options->feed_interval, std::chrono::minutes(30));
    EXPECT_EQ(options->log_level, "error");
}

TEST(ClientOptionsTest, HelpPrintsUsage) {
    std::ostringstream out;

    EXPECT_FALSE(parse({ "--help" }, out));
    EXPECT_NE(out.str().find("--state-dir"), std::string::npos);
}

TEST(ClientOptionsTest, RejectsBadValues) {
    TempDir dir;
    std::ostringstream out;

    EXPECT_THROW(parse({ "--state-dir", dir.path().string(), "--alert-wait", "0" }, out), boost::program_options::error);
    EXPECT_THROW(parse({ "--state-dir", dir.path().string(), "--feed-interval", "soon" }, out), boost::program_options::error);
    EXPECT_THROW(parse({ "--bogus" }, out), boost::program_options::error);
}
