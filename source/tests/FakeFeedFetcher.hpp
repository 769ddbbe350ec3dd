#pragma once

#include "BaseFeedFetcher.hpp"
#include "FeedParser.hpp"

#include <set>
#include <map>
#include <mutex>
#include <chrono>
#include <string>
#include <condition_variable>

// serves canned documents; unknown URLs fail like a 404
class FakeFeedFetcher : public BaseFeedFetcher {
public:
    void serve(const std::string& url, std::string body) {
        std::scoped_lock lock(_mutex);
        _documents[url] = std::move(body);
    }

    // fetches of url block inside async_fetch until release()
    void hold(const std::string& url) {
        std::scoped_lock lock(_mutex);
        _held.insert(url);
    }

    void release() {
        {
            std::scoped_lock lock(_mutex);
            _released = true;
        }
        _cv.notify_all();
    }

    // true once a fetch is blocked in hold()
    bool wait_for_held_fetch(std::chrono::milliseconds timeout) {
        std::unique_lock lock(_mutex);
        return _cv.wait_for(lock, timeout, [this] { return _waiting > 0; });
    }

    boost::asio::awaitable<std::string> async_fetch(std::string url) override {
        std::string body;
        {
            std::unique_lock lock(_mutex);
            ++_fetches[url];

            if (_held.contains(url)) {
                ++_waiting;
                _cv.notify_all();
                _cv.wait(lock, [this] { return _released; });
                --_waiting;
            }

            auto it = _documents.find(url);
            if (it == _documents.end()) throw FeedFetchError("HTTP 404 from " + url);
            body = it->second;
        }
        co_return body;
    }

    int fetches(const std::string& url) const {
        std::scoped_lock lock(_mutex);
        auto it = _fetches.find(url);
        return it == _fetches.end() ? 0 : it->second;
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<std::string, std::string> _documents;
    std::map<std::string, int> _fetches;
    std::set<std::string> _held;
    int _waiting = 0;
    bool _released = false;
};
