#include <gtest/gtest.h>
#include <phm/restart_policy.hpp>
#include <chrono>

using namespace std::chrono_literals;
using phm::RestartBudget;
using phm::RestartDecision;
using phm::RestartPolicy;

static RestartPolicy make_policy(int max = 3) {
    RestartPolicy::Config cfg;
    cfg.max_restart_attempts = max;
    cfg.restart_delay = 5s;
    cfg.stability_window = 120s;
    return RestartPolicy(cfg);
}

TEST(RestartPolicy, RetriesWithFlatDelayUntilBudgetSpent) {
    auto policy = make_policy(3);
    RestartBudget budget;
    const auto t0 = std::chrono::steady_clock::time_point{} + 1000s;

    auto d1 = policy.decide(budget, 0s);
    ASSERT_TRUE(d1.retry());
    EXPECT_EQ(d1.delay, 5s);
    EXPECT_EQ(d1.restart_count, 1);
    RestartPolicy::record(budget, d1, t0);
    EXPECT_EQ(budget.cooldown_until, t0 + 5s);

    auto d2 = policy.decide(budget, 0s);
    ASSERT_TRUE(d2.retry());
    EXPECT_EQ(d2.delay, 5s);   // no backoff growth
    RestartPolicy::record(budget, d2, t0 + 10s);

    auto d3 = policy.decide(budget, 0s);
    EXPECT_EQ(d3.kind, RestartDecision::Kind::kGiveUp);
    EXPECT_EQ(d3.restart_count, 3);
}

TEST(RestartPolicy, SingleAttemptBudgetGivesUpOnFirstFailure) {
    auto policy = make_policy(1);
    RestartBudget budget;
    EXPECT_FALSE(policy.decide(budget, 0s).retry());
}

TEST(RestartPolicy, StableRunForgivesHistory) {
    auto policy = make_policy(3);
    RestartBudget budget;
    budget.restart_count = 2;   // one more failure would exhaust it

    auto d = policy.decide(budget, 121s);
    ASSERT_TRUE(d.retry());
    EXPECT_EQ(d.restart_count, 1);
}

TEST(RestartPolicy, RunExactlyAtWindowIsNotForgiven) {
    auto policy = make_policy(3);
    RestartBudget budget;
    budget.restart_count = 2;

    EXPECT_FALSE(policy.decide(budget, 120s).retry());
}

TEST(RestartPolicy, DecideDoesNotTouchBudget) {
    auto policy = make_policy(3);
    RestartBudget budget;
    budget.restart_count = 1;
    (void)policy.decide(budget, 0s);
    EXPECT_EQ(budget.restart_count, 1);
    EXPECT_FALSE(budget.last_failure_time.has_value());
}

TEST(RestartPolicy, GiveUpRecordsFailureTime) {
    auto policy = make_policy(1);
    RestartBudget budget;
    const auto t = std::chrono::steady_clock::time_point{} + 42s;
    auto d = policy.decide(budget, 0s);
    RestartPolicy::record(budget, d, t);
    EXPECT_EQ(budget.restart_count, 1);
    ASSERT_TRUE(budget.last_failure_time.has_value());
    EXPECT_EQ(*budget.last_failure_time, t);
    EXPECT_EQ(budget.cooldown_until, t);
}
