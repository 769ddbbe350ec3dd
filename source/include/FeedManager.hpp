#pragma once

#include "BaseFeedFetcher.hpp"
#include "FeedParser.hpp"

#include <set>
#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <filesystem>
#include <functional>

#include <boost/asio.hpp>

struct FeedSubscription {
    std::string url;
    std::string filter;
};

// what a feed hands to the client: a magnet URI, or a .torrent URL plus its downloaded body
struct JobSource {
    std::string uri;
    std::string payload;
};

// true when the job was accepted
using JobSubmitter = std::function<bool(const JobSource&)>;

class FeedManager {
public:
    FeedManager(std::filesystem::path state_file, std::shared_ptr<BaseFeedFetcher> fetcher, JobSubmitter submit, std::chrono::minutes interval);
    ~FeedManager();

    FeedManager(const FeedManager&) = delete;
    FeedManager& operator=(const FeedManager&) = delete;

    void start();

    // cancels the wait, lets the running pass finish, persists
    void stop();
    bool running() const { return _thread.joinable() && !_stopped; }

    // throws std::invalid_argument for a bad URL, a bad filter or a duplicate
    void add_feed(std::string url, std::string filter);
    std::optional<FeedSubscription> remove_feed(size_t index);
    std::vector<FeedSubscription> feeds() const;

    bool seen(const std::string& link) const;
    size_t history_size() const;

    // one pass over every feed, returns the number of accepted submissions
    [[nodiscard]] boost::asio::awaitable<size_t> poll_feeds();
    [[nodiscard]] boost::asio::awaitable<size_t> poll_feed(const FeedSubscription& feed);

private:
    [[nodiscard]] boost::asio::awaitable<void> run_loop();

    bool record_submission(const JobSource& source);

    void load_state();
    void persist_locked() const;

    std::filesystem::path _state_file;
    std::shared_ptr<BaseFeedFetcher> _fetcher;
    JobSubmitter _submit;
    std::chrono::minutes _interval;

    mutable std::mutex _mutex;
    std::vector<FeedSubscription> _feeds;
    std::set<std::string> _history;

    boost::asio::io_context _ioc;
    boost::asio::steady_timer _timer{ _ioc };
    std::thread _thread;
    std::atomic<bool> _stopped{false};
};
