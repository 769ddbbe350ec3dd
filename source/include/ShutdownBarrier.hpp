#pragma once

#include "JobRegistry.hpp"
#include "ResumeTracker.hpp"

#include <chrono>
#include <string>
#include <vector>

struct ShutdownReport {
    size_t requested{};
    size_t confirmed{};
    std::vector<std::string> unconfirmed;   // failed or still pending at the deadline
    bool timed_out = false;
};

// one resume request per job with metadata, then a bounded wait for the answers
class ShutdownBarrier {
public:
    ShutdownBarrier(JobRegistry& registry, ResumeTracker& tracker, std::chrono::milliseconds timeout)
        : _registry(registry), _tracker(tracker), _timeout(timeout) {}

    // the tracker must already be open
    ShutdownReport collect();

private:
    JobRegistry& _registry;
    ResumeTracker& _tracker;
    std::chrono::milliseconds _timeout;
};
