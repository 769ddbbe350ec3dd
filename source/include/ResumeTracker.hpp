#pragma once

#include <set>
#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <condition_variable>

struct ResumeWait {
    size_t confirmed{};
    std::vector<std::string> failed;
    std::vector<std::string> pending;   // still outstanding when the wait ended

    bool timed_out() const { return !pending.empty(); }
};

// outstanding resume requests during shutdown, written by the event thread
class ResumeTracker {
public:
    // starts a fresh collection
    void open();
    void close();
    bool is_open() const;

    void expect(const std::string& content_hash);
    bool is_expected(const std::string& content_hash) const;

    // true when the hash was outstanding
    bool confirm(const std::string& content_hash);
    bool fail(const std::string& content_hash, const std::string& reason);

    // blocks until nothing is outstanding or the timeout passes
    ResumeWait wait(std::chrono::milliseconds timeout);

    size_t confirmed() const;
    size_t outstanding() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;

    bool _open = false;
    std::set<std::string> _pending;
    std::vector<std::string> _failed;
    size_t _confirmed{};
};
