#include "JobRegistry.hpp"

#include <limits>
#include <algorithm>
#include <stdexcept>

#include <boost/log/trivial.hpp>

bool JobRegistry::append(std::shared_ptr<BaseJob> job) {
    auto hash = job->content_hash();

    std::scoped_lock lock(_mutex);

    if (!hash.empty()) {
        auto it = std::find_if(_jobs.begin(), _jobs.end(), [&](const auto& j) { return j->content_hash() == hash; });
        if (it != _jobs.end()) return false;
    }

    _jobs.push_back(std::move(job));
    return true;
}

std::vector<std::shared_ptr<BaseJob>> JobRegistry::ordered() const {
    auto jobs = snapshot();

    // status() talks to the engine, keep it out of the lock
    std::vector<std::pair<int, std::shared_ptr<BaseJob>>> keyed;
    keyed.reserve(jobs.size());

    for (auto& job: jobs) {
        int position = std::numeric_limits<int>::max();
        try {
            auto pos = job->status().queue_position;
            if (pos >= 0) position = pos;
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(debug) << "Job status unavailable while ordering: " << e.what();
        }
        keyed.emplace_back(position, std::move(job));
    }

    // unqueued jobs (seeding, finished) keep insertion order at the end
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::shared_ptr<BaseJob>> out;
    out.reserve(keyed.size());
    for (auto& [_, job]: keyed) out.push_back(std::move(job));

    return out;
}

std::shared_ptr<BaseJob> JobRegistry::at(size_t index) const {
    auto jobs = ordered();
    if (index >= jobs.size()) throw std::out_of_range("Invalid torrent index.");
    return jobs[index];
}

bool JobRegistry::remove(const std::shared_ptr<BaseJob>& job) {
    std::scoped_lock lock(_mutex);
    return std::erase(_jobs, job) > 0;
}

bool JobRegistry::with_registered(const std::string& content_hash, const std::function<void()>& fn) const {
    std::scoped_lock lock(_mutex);

    auto it = std::find_if(_jobs.begin(), _jobs.end(), [&](const auto& j) { return j->content_hash() == content_hash; });
    if (it == _jobs.end()) return false;

    fn();
    return true;
}

std::vector<std::shared_ptr<BaseJob>> JobRegistry::snapshot() const {
    std::scoped_lock lock(_mutex);
    return _jobs;
}

size_t JobRegistry::size() const {
    std::scoped_lock lock(_mutex);
    return _jobs.size();
}
