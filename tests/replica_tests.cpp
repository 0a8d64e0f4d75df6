#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "kernel/ParameterGrid.h"
#include "kernel/Replicas.h"
#include <stdexcept>

namespace {
SimulationConfig replicaConfig() {
    SimulationConfig cfg;
    cfg.graph.type = GraphType::BarabasiAlbert;
    cfg.graph.n = 20;
    cfg.graph.m = 2;
    cfg.od.epsilon = 0.25;
    cfg.ranker = RandomRanker{};
    cfg.kPosts = 2;
    cfg.postHistory = 3;
    cfg.nSteps = 8;
    cfg.seed = 7;
    return cfg;
}
}

// A single saved replica is the plain simulation
TEST(ReplicaTest, SingleReplicaMatchesSimulate) {
    SimulationConfig cfg = replicaConfig();

    const auto set = runReplicas(cfg, 1, 1);
    const auto single = simulate(cfg);

    EXPECT_EQ(set.nSavedTrajectories, 1u);
    EXPECT_EQ(set.opinions, single.series.opinions);
    EXPECT_EQ(set.mean, single.series.mean);
}

// Replicas past the saved ones keep only their scalar series and histograms
TEST(ReplicaTest, UnsavedReplicaDropsTrajectory) {
    SimulationConfig cfg = replicaConfig();

    const auto kept = runReplica(cfg, 0, true);
    const auto dropped = runReplica(cfg, 1, false);

    EXPECT_EQ(kept.series.opinions, simulate(cfg).series.opinions);
    EXPECT_EQ(kept.postLikes.size(), 20u * 3u);
    EXPECT_TRUE(dropped.series.opinions.empty());
    EXPECT_EQ(dropped.series.opinions.capacity(), 0u);
    EXPECT_TRUE(dropped.postLikes.empty());
    EXPECT_EQ(dropped.postLikes.capacity(), 0u);
    EXPECT_EQ(dropped.series.mean.size(), 8u);
    EXPECT_EQ(dropped.nUsers, 20u);
    EXPECT_EQ(dropped.series.mean, runReplica(cfg, 1, true).series.mean);
}

TEST(ReplicaTest, ShapesAndClamping) {
    SimulationConfig cfg = replicaConfig();

    const auto set = runReplicas(cfg, 3, 5, 2);

    EXPECT_EQ(set.nReplicas, 3u);
    EXPECT_EQ(set.nSavedTrajectories, 3u);
    EXPECT_EQ(set.nSteps, 8u);
    EXPECT_EQ(set.nUsers, 20u);
    EXPECT_EQ(set.mean.size(), 3u * 8u);
    EXPECT_EQ(set.homophily.size(), 3u * 8u);
    EXPECT_EQ(set.histogram1d.size(), 3u * SuccessHistogram::kLikeBins);
    EXPECT_EQ(set.histogram2d.size(), 3u * SuccessHistogram::kOpinionBins * SuccessHistogram::kLikeBins);
    EXPECT_EQ(set.opinions.size(), 3u * 8u * 20u);
}

// Thread count does not change the outcome
TEST(ReplicaTest, IndependentOfThreadCount) {
    SimulationConfig cfg = replicaConfig();

    const auto serial = runReplicas(cfg, 4, 2, 1);
    const auto parallel = runReplicas(cfg, 4, 2, 4);

    EXPECT_EQ(serial.mean, parallel.mean);
    EXPECT_EQ(serial.opinions, parallel.opinions);
    EXPECT_EQ(serial.histogram2d, parallel.histogram2d);
}

TEST(ReplicaTest, ReplicasDiffer) {
    EXPECT_EQ(deriveReplicaSeed(7, 0), 7u);
    EXPECT_NE(deriveReplicaSeed(7, 1), deriveReplicaSeed(7, 2));

    const auto set = runReplicas(replicaConfig(), 2, 2);
    const std::size_t stride = static_cast<std::size_t>(set.nSteps) * set.nUsers;
    std::vector<double> first(set.opinions.begin(), set.opinions.begin() + stride);
    std::vector<double> second(set.opinions.begin() + stride, set.opinions.end());
    EXPECT_NE(first, second);
}

TEST(ReplicaTest, MeanOverReplicas) {
    ReplicaSet set;
    set.nReplicas = 2;
    set.nSteps = 3;
    const auto avg = set.meanOverReplicas({1.0, 2.0, 3.0, 3.0, 4.0, 5.0});

    EXPECT_EQ(avg, (std::vector<double>{2.0, 3.0, 4.0}));
}

TEST(ReplicaTest, RejectsZeroReplicas) {
    EXPECT_THROW(runReplicas(replicaConfig(), 0, 1), std::invalid_argument);
    SimulationConfig bad = replicaConfig();
    bad.nSteps = 0;
    EXPECT_THROW(runReplicas(bad, 2, 1), std::invalid_argument);
}

// Parameterised policies fan out over their own parameter only
TEST(ParameterGridTest, Enumeration) {
    ParameterGrid grid;
    grid.epsilons = {0.1, 0.2};
    grid.rankers = {"Random", "Engagement", "Narrative"};
    grid.alphas = {1.0, 2.0};
    grid.targets = {0.2, 0.8, 0.5};

    const auto combos = grid.combinations();

    ASSERT_EQ(combos.size(), 12u);
    EXPECT_DOUBLE_EQ(combos[0].epsilon, 0.1);
    EXPECT_EQ(rankerName(combos[0].ranker), "Random");
    EXPECT_DOUBLE_EQ(rankerAlpha(combos[2].ranker), 2.0);
    EXPECT_DOUBLE_EQ(rankerTarget(combos[4].ranker), 0.8);
    EXPECT_DOUBLE_EQ(combos[6].epsilon, 0.2);
    EXPECT_EQ(rankerName(grid.combination(11).ranker), "Narrative");
    EXPECT_THROW(grid.combination(12), std::out_of_range);
}

TEST(ParameterGridTest, EmptyParameterListsUseDefaults) {
    ParameterGrid grid;
    grid.epsilons = {0.3};
    grid.rankers = {"Engagement", "Evil"};

    const auto combos = grid.combinations();

    ASSERT_EQ(combos.size(), 2u);
    EXPECT_DOUBLE_EQ(rankerAlpha(combos[0].ranker), 1.0);
    EXPECT_DOUBLE_EQ(rankerTarget(combos[1].ranker), 0.5);

    grid.rankers.push_back("Loudest");
    EXPECT_THROW(grid.combinations(), std::invalid_argument);
}

TEST(ParameterGridTest, ResultNames) {
    EXPECT_EQ(resultBaseName({0.2, RandomRanker{}}), "eps0.20_Random");
    EXPECT_EQ(resultBaseName({0.15, EngagementRanker{2.0}}), "eps0.15_Engagement_alpha2.0");
    EXPECT_EQ(resultBaseName({0.25, NarrativeRanker{0.8}}), "eps0.25_Narrative_target0.8");
    EXPECT_EQ(formatParameter(1.5), "1.5");
    EXPECT_EQ(formatParameter(3.0), "3.0");
}

TEST(ParameterGridTest, ApplyCombination) {
    SimulationConfig base = replicaConfig();
    const auto cfg = applyCombination(base, {0.05, EvilRanker{0.9}});

    EXPECT_DOUBLE_EQ(cfg.od.epsilon, 0.05);
    EXPECT_EQ(rankerName(cfg.ranker), "Evil");
    EXPECT_EQ(cfg.nSteps, base.nSteps);
    EXPECT_EQ(cfg.seed, base.seed);
}
