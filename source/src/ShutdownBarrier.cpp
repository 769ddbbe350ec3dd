#include "ShutdownBarrier.hpp"

#include <boost/log/trivial.hpp>

ShutdownReport ShutdownBarrier::collect() {
    ShutdownReport report;

    for (const auto& job: _registry.snapshot()) {
        std::string hash;
        try {
            if (!job->is_valid() || !job->has_metadata()) continue;
            hash = job->content_hash();
        }
        catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "Skipping resume request for a vanished job: " << e.what();
            continue;
        }

        // registered before the request so a fast answer cannot be missed
        _tracker.expect(hash);
        ++report.requested;

        try {
            job->request_resume_data();
        }
        catch (const std::exception& e) {
            _tracker.fail(hash, e.what());
        }
    }

    BOOST_LOG_TRIVIAL(info) << "Waiting for " << report.requested << " resume records.";

    auto result = _tracker.wait(_timeout);

    report.confirmed = result.confirmed;
    report.timed_out = result.timed_out();
    report.unconfirmed = result.failed;
    report.unconfirmed.insert(report.unconfirmed.end(), result.pending.begin(), result.pending.end());

    if (report.timed_out) {
        BOOST_LOG_TRIVIAL(warning) << "Shutdown timeout reached with " << result.pending.size() << " resume records outstanding.";
    }
    for (const auto& hash: report.unconfirmed) {
        BOOST_LOG_TRIVIAL(warning) << "No resume record saved for " << hash;
    }

    return report;
}
