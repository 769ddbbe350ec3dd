#include "ResumeTracker.hpp"

#include <boost/log/trivial.hpp>

void ResumeTracker::open() {
    std::scoped_lock lock(_mutex);
    _open = true;
    _pending.clear();
    _failed.clear();
    _confirmed = 0;
}

void ResumeTracker::close() {
    {
        std::scoped_lock lock(_mutex);
        _open = false;
    }
    _cv.notify_all();
}

bool ResumeTracker::is_open() const {
    std::scoped_lock lock(_mutex);
    return _open;
}

void ResumeTracker::expect(const std::string& content_hash) {
    std::scoped_lock lock(_mutex);
    _pending.insert(content_hash);
}

bool ResumeTracker::is_expected(const std::string& content_hash) const {
    std::scoped_lock lock(_mutex);
    return _pending.contains(content_hash);
}

bool ResumeTracker::confirm(const std::string& content_hash) {
    {
        std::scoped_lock lock(_mutex);
        if (_pending.erase(content_hash) == 0) return false;
        ++_confirmed;
    }
    _cv.notify_all();
    return true;
}

bool ResumeTracker::fail(const std::string& content_hash, const std::string& reason) {
    {
        std::scoped_lock lock(_mutex);
        if (_pending.erase(content_hash) == 0) return false;
        _failed.push_back(content_hash);
    }
    BOOST_LOG_TRIVIAL(warning) << "Resume data for " << content_hash << " will not be saved: " << reason;
    _cv.notify_all();
    return true;
}

ResumeWait ResumeTracker::wait(std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    _cv.wait_for(lock, timeout, [this] { return _pending.empty(); });

    ResumeWait out;
    out.confirmed = _confirmed;
    out.failed = _failed;
    out.pending.assign(_pending.begin(), _pending.end());
    return out;
}

size_t ResumeTracker::confirmed() const {
    std::scoped_lock lock(_mutex);
    return _confirmed;
}

size_t ResumeTracker::outstanding() const {
    std::scoped_lock lock(_mutex);
    return _pending.size();
}
