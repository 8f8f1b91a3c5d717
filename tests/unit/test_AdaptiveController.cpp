#include <gtest/gtest.h>
#include "thumb/AdaptiveController.hpp"

using namespace tf::thumb;

namespace {
AdaptiveSample sample(const uint64_t completed, const uint64_t failed, const uint64_t avgMs, const size_t backlog) {
    AdaptiveSample s;
    s.completed = completed;
    s.failed = failed;
    s.elapsed_us = (completed + failed) * avgMs * 1000;
    s.backlog = backlog;
    return s;
}
}

class AdaptiveDecisionTest : public ::testing::Test {
protected:
    tf::config::AdaptiveConfig cfg;
};

TEST_F(AdaptiveDecisionTest, ScalesUpOnBacklogWhenFast) {
    EXPECT_EQ(decideBudget(4, sample(20, 0, 10, 100), cfg, 2, 12), 5u);
}

TEST_F(AdaptiveDecisionTest, HoldsWhenBacklogSmall) {
    EXPECT_EQ(decideBudget(4, sample(20, 0, 10, 3), cfg, 2, 12), 4u);
}

TEST_F(AdaptiveDecisionTest, HoldsWhenNeitherFastNorSlow) {
    EXPECT_EQ(decideBudget(4, sample(20, 0, 100, 100), cfg, 2, 12), 4u);
}

TEST_F(AdaptiveDecisionTest, ScalesDownWhenSlow) {
    EXPECT_EQ(decideBudget(6, sample(10, 0, 500, 100), cfg, 2, 12), 5u);
}

TEST_F(AdaptiveDecisionTest, ScalesDownOnFailureRate) {
    EXPECT_EQ(decideBudget(6, sample(7, 3, 5, 100), cfg, 2, 12), 5u);
}

TEST_F(AdaptiveDecisionTest, NeverExceedsPoolOrDropsBelowFloor) {
    EXPECT_EQ(decideBudget(12, sample(50, 0, 1, 1000), cfg, 2, 12), 12u);
    EXPECT_EQ(decideBudget(2, sample(10, 0, 900, 0), cfg, 2, 12), 2u);
    EXPECT_EQ(decideBudget(40, sample(0, 0, 0, 0), cfg, 2, 12), 12u);
    EXPECT_EQ(decideBudget(0, sample(0, 0, 0, 0), cfg, 2, 12), 2u);
}

TEST_F(AdaptiveDecisionTest, IdleTickWithBacklogScalesUp) {
    EXPECT_EQ(decideBudget(3, sample(0, 0, 0, cfg.scale_up_backlog), cfg, 2, 12), 4u);
}

TEST(AdaptiveMinActiveTest, AutoMinimumFollowsPoolSize) {
    tf::config::ThumbnailConfig cfg;
    cfg.thumbnails.worker_threads = 12;
    EXPECT_EQ(cfg.minActiveWorkers(), 4u);
    cfg.thumbnails.worker_threads = 4;
    EXPECT_EQ(cfg.minActiveWorkers(), 2u);
    cfg.thumbnails.worker_threads = 1;
    EXPECT_EQ(cfg.minActiveWorkers(), 1u);
    cfg.adaptive.min_active_workers = 3;
    cfg.thumbnails.worker_threads = 8;
    EXPECT_EQ(cfg.minActiveWorkers(), 3u);
}
