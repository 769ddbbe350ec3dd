#include "JobRegistry.hpp"
#include "FakeEngine.hpp"

#include <gtest/gtest.h>

namespace {

std::shared_ptr<FakeJob> job_at_position(unsigned n, int position) {
    auto job = std::make_shared<FakeJob>(make_hash(n), "job" + std::to_string(n));
    job->set_queue_position(position);
    return job;
}

}

TEST(JobRegistryTest, OrdersByQueuePosition) {
    JobRegistry registry;
    auto seeding = job_at_position(1, -1);
    auto second = job_at_position(2, 1);
    auto first = job_at_position(3, 0);
    auto finished = job_at_position(4, -1);

    registry.append(seeding);
    registry.append(second);
    registry.append(first);
    registry.append(finished);

    auto ordered = registry.ordered();
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0], first);
    EXPECT_EQ(ordered[1], second);

    // unqueued jobs keep their arrival order at the end
    EXPECT_EQ(ordered[2], seeding);
    EXPECT_EQ(ordered[3], finished);

    EXPECT_EQ(registry.at(0), first);
}

TEST(JobRegistryTest, IndexFollowsQueueMoves) {
    JobRegistry registry;
    auto a = job_at_position(1, 0);
    auto b = job_at_position(2, 1);
    registry.append(a);
    registry.append(b);

    EXPECT_EQ(registry.at(0), a);

    a->set_queue_position(1);
    b->set_queue_position(0);
    EXPECT_EQ(registry.at(0), b);
}

TEST(JobRegistryTest, RejectsDuplicateHashes) {
    JobRegistry registry;

    EXPECT_TRUE(registry.append(std::make_shared<FakeJob>(make_hash(1), "a")));
    EXPECT_FALSE(registry.append(std::make_shared<FakeJob>(make_hash(1), "again")));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(JobRegistryTest, BadIndexThrows) {
    JobRegistry registry;
    EXPECT_THROW(registry.at(0), std::out_of_range);

    registry.append(std::make_shared<FakeJob>(make_hash(1), "a"));
    EXPECT_NO_THROW(registry.at(0));
    EXPECT_THROW(registry.at(1), std::out_of_range);
}

TEST(JobRegistryTest, RemoveDropsJob) {
    JobRegistry registry;
    auto a = job_at_position(1, 0);
    auto b = job_at_position(2, 1);
    registry.append(a);
    registry.append(b);

    EXPECT_TRUE(registry.remove(a));
    EXPECT_FALSE(registry.remove(a));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.at(0), b);
}
