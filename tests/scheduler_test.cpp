#include "kiln/scheduler.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace kiln;

namespace {

Scheduler local_scheduler(bool parallel = true, size_t max_workers = 0) {
    Scheduler::Options opts;
    opts.parallel = parallel;
    opts.max_workers = max_workers;
    opts.environment = Environment::Local;
    return Scheduler(opts);
}

} // namespace

TEST(SchedulerTest, BelowBreakEvenIsSequential) {
    auto s = local_scheduler();
    const auto &p = s.profile(Phase::Rendering);
    auto d = s.choose(Phase::Rendering, p.break_even - 1);
    EXPECT_EQ(d.workers, 1u);
    EXPECT_FALSE(d.parallel);
}

TEST(SchedulerTest, ZeroTasksIsSequential) {
    auto d = local_scheduler().choose(Phase::Discovery, 0);
    EXPECT_EQ(d.workers, 1u);
    EXPECT_FALSE(d.parallel);
}

TEST(SchedulerTest, SmallAndLargeWorkloadsDiffer) {
    auto s = local_scheduler();
    const auto &p = s.profile(Phase::Rendering);

    auto small = s.choose(Phase::Rendering, p.break_even);
    EXPECT_EQ(small.workers, std::min({p.optimal_small, p.contention_point, p.break_even}));
    EXPECT_TRUE(small.parallel);

    auto large = s.choose(Phase::Rendering, p.large_workload);
    EXPECT_EQ(large.workers, std::min(p.optimal_large, p.contention_point));
}

TEST(SchedulerTest, ContentionPointCapsWorkers) {
    Scheduler::Options opts;
    opts.environment = Environment::Local;
    opts.overrides[Phase::Parsing] = PhaseProfile{2, 16, 32, 100, 6};
    Scheduler s(opts);
    EXPECT_EQ(s.choose(Phase::Parsing, 50).workers, 6u);
    EXPECT_EQ(s.choose(Phase::Parsing, 5000).workers, 6u);
}

TEST(SchedulerTest, NeverMoreWorkersThanTasks) {
    Scheduler::Options opts;
    opts.environment = Environment::Production;
    opts.overrides[Phase::Rendering] = PhaseProfile{2, 8, 8, 100, 8};
    Scheduler s(opts);
    auto d = s.choose(Phase::Rendering, 3);
    EXPECT_EQ(d.workers, 3u);
}

TEST(SchedulerTest, ParallelDisabledForcesSequential) {
    auto s = local_scheduler(false);
    auto d = s.choose(Phase::Rendering, 10000);
    EXPECT_EQ(d.workers, 1u);
    EXPECT_FALSE(d.parallel);
}

TEST(SchedulerTest, MaxWorkersReplacesOptimumButNotContention) {
    auto s = local_scheduler(true, 2);
    EXPECT_EQ(s.choose(Phase::Rendering, 1000).workers, 2u);

    auto wide = local_scheduler(true, 64);
    const auto &p = wide.profile(Phase::Rendering);
    EXPECT_EQ(wide.choose(Phase::Rendering, 1000).workers, p.contention_point);
}

TEST(SchedulerTest, EnvironmentsShipDifferentProfiles) {
    EXPECT_NE(calibrated_profile(Phase::Rendering, Environment::Ci),
              calibrated_profile(Phase::Rendering, Environment::Production));
    for (auto env : {Environment::Ci, Environment::Local, Environment::Production}) {
        for (auto phase : {Phase::Discovery, Phase::Parsing, Phase::Rendering, Phase::PostProcessing}) {
            auto p = calibrated_profile(phase, env);
            EXPECT_GE(p.break_even, 1u);
            EXPECT_LE(p.optimal_small, p.optimal_large);
            EXPECT_GE(p.contention_point, 1u);
        }
    }
}

TEST(SchedulerTest, KilnEnvSelectsEnvironment) {
    ::setenv("KILN_ENV", "production", 1);
    EXPECT_EQ(detect_environment(), Environment::Production);
    ::setenv("KILN_ENV", "CI", 1);
    EXPECT_EQ(detect_environment(), Environment::Ci);
    ::unsetenv("KILN_ENV");
}

TEST(SchedulerTest, PhaseNamesRoundTrip) {
    for (auto phase : {Phase::Discovery, Phase::Parsing, Phase::Rendering, Phase::PostProcessing})
        EXPECT_EQ(parse_phase(to_string(phase)), phase);
    EXPECT_FALSE(parse_phase("linking"));
}

TEST(TaskWeightTest, Formula) {
    EXPECT_DOUBLE_EQ(task_weight(0), 1.0);
    EXPECT_DOUBLE_EQ(task_weight(10000), 1.0);
    EXPECT_DOUBLE_EQ(task_weight(20000), 1.5);
    EXPECT_DOUBLE_EQ(task_weight(30000), 2.0);
    EXPECT_DOUBLE_EQ(task_weight(10'000'000), 5.0);
}

TEST(TaskWeightTest, OrderHeaviestFirstStable) {
    auto order = order_by_weight({1.0, 3.0, 1.0, 5.0, 3.0});
    EXPECT_EQ(order, (std::vector<size_t>{3, 1, 4, 0, 2}));
}
