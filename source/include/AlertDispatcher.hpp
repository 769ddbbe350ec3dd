#pragma once

#include "Engine.hpp"
#include "Console.hpp"
#include "JobRegistry.hpp"
#include "SessionStore.hpp"
#include "ResumeTracker.hpp"

#include <atomic>
#include <chrono>
#include <thread>

class AlertDispatcher {
public:
    AlertDispatcher(BaseEngine& engine, JobRegistry& registry, const SessionStore& store, ResumeTracker& tracker, Console& console, std::chrono::milliseconds wait)
        : _engine(engine), _registry(registry), _store(store), _tracker(tracker), _console(console), _wait(wait) {}

    ~AlertDispatcher();

    AlertDispatcher(const AlertDispatcher&) = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    void start();

    // the loop keeps going while a resume collection is open
    void request_stop() { _stop_requested = true; }
    void join();

    bool running() const { return _thread.joinable(); }

    // one wait plus a full drain; false when the wait timed out
    bool poll_once();
    void dispatch(const EngineEvent& event);

private:
    void run();

    void handle(const JobAddedEvent& e);
    void handle(const JobAddFailedEvent& e);
    void handle(const ResumeDataEvent& e);
    void handle(const ResumeDataFailedEvent& e);
    void handle(const JobCheckpointEvent& e);
    void handle(const DhtItemEvent& e);
    void handle(const LogEvent& e);
    void handle(const IgnoredEvent& e);

    void request_resume(BaseJob& job);

    BaseEngine& _engine;
    JobRegistry& _registry;
    const SessionStore& _store;
    ResumeTracker& _tracker;
    Console& _console;
    std::chrono::milliseconds _wait;

    std::atomic<bool> _stop_requested{false};
    std::atomic<bool> _abort{false};
    std::thread _thread;
};
