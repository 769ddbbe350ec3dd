#pragma once

#include "Engine.hpp"

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <functional>

// jobs known to the client; appended by the event thread, removed by commands
class JobRegistry {
public:
    // false when a job with the same content hash is already registered
    bool append(std::shared_ptr<BaseJob> job);

    // jobs in engine queue order, which is also the order users index by
    std::vector<std::shared_ptr<BaseJob>> ordered() const;

    // display index into ordered(), throws std::out_of_range
    std::shared_ptr<BaseJob> at(size_t index) const;
    bool remove(const std::shared_ptr<BaseJob>& job);

    // runs fn under the registry lock when the hash is registered; a concurrent remove() waits for it
    bool with_registered(const std::string& content_hash, const std::function<void()>& fn) const;

    std::vector<std::shared_ptr<BaseJob>> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex _mutex;
    std::vector<std::shared_ptr<BaseJob>> _jobs;
};
