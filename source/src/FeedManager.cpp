#include "FeedManager.hpp"
#include "Utils.hpp"

#include <regex>
#include <algorithm>
#include <stdexcept>

#include <boost/json.hpp>
#include <boost/url.hpp>
#include <boost/log/trivial.hpp>

namespace json = boost::json;

void tag_invoke(json::value_from_tag, json::value& jv, const FeedSubscription& feed) {
    jv = { { "url", feed.url }, { "filter", feed.filter } };
}

FeedSubscription tag_invoke(json::value_to_tag<FeedSubscription>, const json::value& jv) {
    const auto& obj = jv.as_object();

    FeedSubscription feed;
    feed.url = json::value_to<std::string>(obj.at("url"));
    if (auto* filter = obj.if_contains("filter")) feed.filter = json::value_to<std::string>(*filter);
    return feed;
}

namespace {

constexpr auto FILTER_FLAGS = std::regex::ECMAScript | std::regex::icase;

}

FeedManager::FeedManager(std::filesystem::path state_file, std::shared_ptr<BaseFeedFetcher> fetcher, JobSubmitter submit, std::chrono::minutes interval)
    : _state_file(std::move(state_file)), _fetcher(std::move(fetcher)), _submit(std::move(submit)), _interval(interval) {
    load_state();
}

FeedManager::~FeedManager() {
    stop();
}

void FeedManager::start() {
    if (_thread.joinable()) return;

    _stopped = false;
    boost::asio::co_spawn(_ioc, run_loop(), boost::asio::detached);
    _thread = std::thread([this] { _ioc.run(); });

    BOOST_LOG_TRIVIAL(info) << "Feed automation started, " << _interval.count() << " minute interval.";
}

void FeedManager::stop() {
    if (!_thread.joinable()) return;

    _stopped = true;
    boost::asio::post(_ioc, [this] { _timer.cancel(); });
    _thread.join();

    std::scoped_lock lock(_mutex);
    persist_locked();

    BOOST_LOG_TRIVIAL(info) << "Feed automation stopped.";
}

boost::asio::awaitable<void> FeedManager::run_loop() {
    while (!_stopped) {
        BOOST_LOG_TRIVIAL(info) << "Checking RSS feeds...";

        try {
            auto submitted = co_await poll_feeds();
            BOOST_LOG_TRIVIAL(info) << "Feed pass done, " << submitted << " new jobs.";
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Feed pass failed: " << e.what();
        }

        if (_stopped) break;

        boost::system::error_code ec;
        _timer.expires_after(_interval);
        co_await _timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

boost::asio::awaitable<size_t> FeedManager::poll_feeds() {
    size_t submitted = 0;

    // a snapshot, so add/remove never race the pass
    for (const auto& feed: feeds()) {
        if (_stopped) break;

        try {
            submitted += co_await poll_feed(feed);
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Error processing feed " << feed.url << ": " << e.what();
        }
    }

    co_return submitted;
}

boost::asio::awaitable<size_t> FeedManager::poll_feed(const FeedSubscription& feed) {
    auto document = co_await _fetcher->async_fetch(feed.url);
    auto entries = parse_feed(document);

    const std::regex pattern(feed.filter.empty() ? ".*" : feed.filter, FILTER_FLAGS);
    size_t submitted = 0;

    for (const auto& entry: entries) {
        if (!std::regex_search(entry.title, pattern)) continue;

        // only the first transfer link of an entry counts
        auto link = std::find_if(entry.links.begin(), entry.links.end(), is_transfer_link);
        if (link == entry.links.end() || seen(link->href)) continue;

        JobSource source{ link->href, {} };

        if (!link->href.starts_with("magnet:")) {
            try {
                source.payload = co_await _fetcher->async_fetch(link->href);
            }
            catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "Could not download " << link->href << ": " << e.what();
                continue;
            }
        }

        if (record_submission(source)) {
            ++submitted;
            BOOST_LOG_TRIVIAL(info) << "RSS: Found new torrent '" << entry.title << "'";
        }
    }

    co_return submitted;
}

bool FeedManager::record_submission(const JobSource& source) {
    std::scoped_lock lock(_mutex);

    // re-checked under the lock, history is only written after an accepted submit
    if (_history.contains(source.uri)) return false;

    try {
        if (!_submit(source)) return false;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Submission of " << source.uri << " failed: " << e.what();
        return false;
    }

    _history.insert(source.uri);
    persist_locked();
    return true;
}

void FeedManager::add_feed(std::string url, std::string filter) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed || (parsed->scheme_id() != boost::urls::scheme::http && parsed->scheme_id() != boost::urls::scheme::https)) {
        throw std::invalid_argument("Feed URL must be http or https: " + url);
    }

    if (filter.empty()) filter = ".*";

    try {
        std::regex check(filter, FILTER_FLAGS);
    }
    catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid filter '" + filter + "': " + e.what());
    }

    std::scoped_lock lock(_mutex);

    auto it = std::find_if(_feeds.begin(), _feeds.end(), [&](const auto& f) { return f.url == url; });
    if (it != _feeds.end()) throw std::invalid_argument("Feed already added: " + url);

    BOOST_LOG_TRIVIAL(info) << "Added feed " << url << " with filter '" << filter << "'";
    _feeds.push_back({ std::move(url), std::move(filter) });
    persist_locked();
}

std::optional<FeedSubscription> FeedManager::remove_feed(size_t index) {
    std::scoped_lock lock(_mutex);

    if (index >= _feeds.size()) return std::nullopt;

    auto removed = std::move(_feeds[index]);
    _feeds.erase(_feeds.begin() + static_cast<std::ptrdiff_t>(index));
    persist_locked();

    BOOST_LOG_TRIVIAL(info) << "Removed feed " << removed.url;
    return removed;
}

std::vector<FeedSubscription> FeedManager::feeds() const {
    std::scoped_lock lock(_mutex);
    return _feeds;
}

bool FeedManager::seen(const std::string& link) const {
    std::scoped_lock lock(_mutex);
    return _history.contains(link);
}

size_t FeedManager::history_size() const {
    std::scoped_lock lock(_mutex);
    return _history.size();
}

void FeedManager::load_state() {
    std::error_code ec;
    if (!std::filesystem::exists(_state_file, ec)) return;

    try {
        auto root = json::parse(read_from_file(_state_file));
        const auto& obj = root.as_object();

        std::scoped_lock lock(_mutex);

        if (auto* feeds = obj.if_contains("feeds")) _feeds = json::value_to<std::vector<FeedSubscription>>(*feeds);
        if (auto* history = obj.if_contains("history")) {
            for (const auto& link: history->as_array()) _history.insert(json::value_to<std::string>(link));
        }

        BOOST_LOG_TRIVIAL(info) << "Loaded " << _feeds.size() << " feeds and " << _history.size() << " history entries.";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Could not load feed state from " << _state_file.string() << ": " << e.what();

        std::scoped_lock lock(_mutex);
        _feeds.clear();
        _history.clear();
    }
}

void FeedManager::persist_locked() const {
    json::object root;
    root["feeds"] = json::value_from(_feeds);
    root["history"] = json::value_from(_history);

    try {
        write_file_atomic(_state_file, json::serialize(root));
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Could not save feed state: " << e.what();
    }
}
