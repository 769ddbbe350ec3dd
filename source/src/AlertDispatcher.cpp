#include "AlertDispatcher.hpp"

#include <boost/log/trivial.hpp>

AlertDispatcher::~AlertDispatcher() {
    _abort = true;
    join();
}

void AlertDispatcher::start() {
    if (_thread.joinable()) return;
    _thread = std::thread([this] { run(); });
}

void AlertDispatcher::join() {
    if (_thread.joinable()) _thread.join();
}

void AlertDispatcher::run() {
    BOOST_LOG_TRIVIAL(debug) << "Event loop started.";

    while (!_abort) {
        if (_stop_requested && !_tracker.is_open()) break;

        try {
            poll_once();
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Event loop error: " << e.what();
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Event loop stopped.";
}

bool AlertDispatcher::poll_once() {
    if (!_engine.wait_for_event(_wait)) return false;

    for (const auto& event: _engine.pop_events()) {
        try {
            dispatch(event);
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Failed to handle engine event: " << e.what();
        }
    }
    return true;
}

void AlertDispatcher::dispatch(const EngineEvent& event) {
    std::visit([this](const auto& e) { handle(e); }, event);
}

void AlertDispatcher::handle(const JobAddedEvent& e) {
    e.job->set_auto_managed(true);

    if (!_registry.append(e.job)) {
        BOOST_LOG_TRIVIAL(info) << "Job already registered: " << e.name;
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "Added torrent: " << e.name;
    _console.println("Added: " + e.name);

    // magnet jobs get their first record once metadata arrives
    if (e.job->has_metadata()) request_resume(*e.job);
}

void AlertDispatcher::handle(const JobAddFailedEvent& e) {
    BOOST_LOG_TRIVIAL(error) << "Failed to add torrent " << e.name << ": " << e.error;
}

void AlertDispatcher::handle(const ResumeDataEvent& e) {
    bool saved = false;
    auto write = [&] { saved = _store.save_job_resume(e.content_hash, e.blob); };

    // a job removed while its request was in flight must stay removed
    if (!_registry.with_registered(e.content_hash, write)) {
        if (!_tracker.is_expected(e.content_hash)) {
            BOOST_LOG_TRIVIAL(debug) << "Dropping resume data for unregistered job " << e.content_hash;
            return;
        }
        write();
    }

    if (saved) _tracker.confirm(e.content_hash);
    else _tracker.fail(e.content_hash, "resume record could not be written");
}

void AlertDispatcher::handle(const ResumeDataFailedEvent& e) {
    BOOST_LOG_TRIVIAL(warning) << "Resume data failed for " << e.content_hash << ": " << e.error;
    _tracker.fail(e.content_hash, e.error);
}

void AlertDispatcher::handle(const JobCheckpointEvent& e) {
    BOOST_LOG_TRIVIAL(info) << "Checkpoint (" << e.reason << ") for " << e.job->content_hash();
    request_resume(*e.job);
}

void AlertDispatcher::handle(const DhtItemEvent& e) {
    _console.println("DHT item " + e.target + ": " + e.value);
}

void AlertDispatcher::handle(const LogEvent& e) {
    BOOST_LOG_TRIVIAL(debug) << "[" << e.source << "] " << e.message;
}

void AlertDispatcher::handle(const IgnoredEvent&) {}

void AlertDispatcher::request_resume(BaseJob& job) {
    if (!job.is_valid()) return;
    job.request_resume_data();
}
