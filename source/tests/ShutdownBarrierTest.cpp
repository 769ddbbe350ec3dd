#include "ShutdownBarrier.hpp"
#include "FakeEngine.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

class ShutdownBarrierTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeJob> add(unsigned n, bool metadata = true) {
        auto job = std::make_shared<FakeJob>(make_hash(n), "job" + std::to_string(n), metadata);
        registry.append(job);
        return job;
    }

    JobRegistry registry;
    ResumeTracker tracker;
};

TEST_F(ShutdownBarrierTest, RequestsOncePerJobWithMetadata) {
    std::vector<std::shared_ptr<FakeJob>> with_metadata{ add(1), add(2), add(3) };
    auto magnet = add(4, false);
    auto gone = add(5);
    gone->valid = false;

    for (auto& job: with_metadata) {
        job->on_resume_request = [this](FakeJob& j) { tracker.confirm(j.content_hash()); };
    }

    tracker.open();
    auto report = ShutdownBarrier(registry, tracker, 2s).collect();

    EXPECT_EQ(report.requested, 3u);
    EXPECT_EQ(report.confirmed, 3u);
    EXPECT_TRUE(report.unconfirmed.empty());
    EXPECT_FALSE(report.timed_out);

    for (auto& job: with_metadata) EXPECT_EQ(job->resume_requests.load(), 1);
    EXPECT_EQ(magnet->resume_requests.load(), 0);
    EXPECT_EQ(gone->resume_requests.load(), 0);
}

TEST_F(ShutdownBarrierTest, AnswersFromAnotherThreadAreAwaited) {
    auto a = add(1);
    auto b = add(2);

    std::vector<std::thread> answers;
    auto answer_later = [&](FakeJob& j) {
        answers.emplace_back([this, hash = j.content_hash()] {
            std::this_thread::sleep_for(30ms);
            tracker.confirm(hash);
        });
    };
    a->on_resume_request = answer_later;
    b->on_resume_request = answer_later;

    tracker.open();
    auto report = ShutdownBarrier(registry, tracker, 5s).collect();
    for (auto& t: answers) t.join();

    EXPECT_EQ(report.requested, 2u);
    EXPECT_EQ(report.confirmed, 2u);
    EXPECT_FALSE(report.timed_out);
}

TEST_F(ShutdownBarrierTest, TimeoutListsSilentJobs) {
    auto answered = add(1);
    auto silent = add(2);
    answered->on_resume_request = [this](FakeJob& j) { tracker.confirm(j.content_hash()); };

    tracker.open();
    auto start = std::chrono::steady_clock::now();
    auto report = ShutdownBarrier(registry, tracker, 100ms).collect();

    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(report.requested, 2u);
    EXPECT_EQ(report.confirmed, 1u);
    EXPECT_TRUE(report.timed_out);
    ASSERT_EQ(report.unconfirmed.size(), 1u);
    EXPECT_EQ(report.unconfirmed[0], silent->content_hash());
}

TEST_F(ShutdownBarrierTest, FailedAnswersResolveWithoutTimeout) {
    auto job = add(1);
    job->on_resume_request = [this](FakeJob& j) { tracker.fail(j.content_hash(), "no metadata"); };

    tracker.open();
    auto report = ShutdownBarrier(registry, tracker, 5s).collect();

    EXPECT_FALSE(report.timed_out);
    EXPECT_EQ(report.confirmed, 0u);
    ASSERT_EQ(report.unconfirmed.size(), 1u);
    EXPECT_EQ(report.unconfirmed[0], job->content_hash());
}

TEST_F(ShutdownBarrierTest, NoJobsMeansNoWait) {
    tracker.open();
    auto start = std::chrono::steady_clock::now();
    auto report = ShutdownBarrier(registry, tracker, 5s).collect();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(report.requested, 0u);
}
