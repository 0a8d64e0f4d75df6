#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include <stdexcept>

namespace {
SimulationConfig smallConfig() {
    SimulationConfig cfg;
    cfg.graph.type = GraphType::ErdosRenyi;
    cfg.graph.n = 25;
    cfg.graph.p = 0.2;
    cfg.od.epsilon = 0.3;
    cfg.od.mu = 0.2;
    cfg.ranker = EngagementRanker{1.5};
    cfg.kPosts = 2;
    cfg.postHistory = 4;
    cfg.nSteps = 15;
    cfg.seed = 1234;
    return cfg;
}
}

// Test kernel initialization
TEST(KernelTest, Initialization) {
    SimulationConfig cfg = smallConfig();
    Kernel kernel(cfg);

    EXPECT_EQ(kernel.network().size(), 25u);
    EXPECT_EQ(kernel.opinions().size(), 25u);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_EQ(kernel.state().currentTimeIdx, 0u);
    EXPECT_EQ(kernel.posts().history(), 4u);
    EXPECT_FALSE(kernel.finalized());
    for (std::uint32_t a = 0; a < 25; ++a) {
        for (std::uint32_t s = 0; s < 4; ++s) {
            EXPECT_DOUBLE_EQ(kernel.posts().opinion(a, s), kernel.opinions()[a]);
        }
    }
}

// Every post created is binned exactly once: n * n_steps in total
TEST(KernelTest, HistogramCountsEveryPost) {
    SimulationConfig cfg;
    cfg.postHistory = 2;
    cfg.nSteps = 5;
    cfg.kPosts = 1;
    Kernel kernel(cfg, Network::fromEdges(3, {{0, 1}, {1, 2}, {0, 2}}));

    kernel.run();

    EXPECT_EQ(kernel.histogram().total(), 15);
    const auto r = kernel.result();
    std::int64_t sum1d = 0;
    for (auto c : r.histogram1d) sum1d += c;
    std::int64_t sum2d = 0;
    for (const auto& row : r.histogram2d) {
        for (auto c : row) sum2d += c;
    }
    EXPECT_EQ(sum1d, 15);
    EXPECT_EQ(sum2d, 15);
    EXPECT_EQ(r.histogram1d[0], 0);
}

TEST(KernelTest, HistogramTotalOnGeneratedGraph) {
    SimulationConfig cfg = smallConfig();
    cfg.graph.n = 20;
    cfg.postHistory = 5;
    cfg.nSteps = 12;

    const auto r = simulate(cfg);

    std::int64_t total = 0;
    for (auto c : r.histogram1d) total += c;
    EXPECT_EQ(total, 20 * 12);
}

// Same seed, bit-identical trajectories
TEST(KernelTest, DeterministicUpdates) {
    for (const char* name : {"Random", "Engagement", "User_Success", "Diverse_Engagement"}) {
        SimulationConfig cfg = smallConfig();
        cfg.ranker = makeRanker(name, 1.5, 0.5);

        const auto a = simulate(cfg);
        const auto b = simulate(cfg);

        EXPECT_EQ(a.series.opinions, b.series.opinions) << name;
        EXPECT_EQ(a.series.giniSuccess, b.series.giniSuccess) << name;
        EXPECT_EQ(a.histogram1d, b.histogram1d) << name;
        EXPECT_EQ(a.postLikes, b.postLikes) << name;
    }
}

TEST(KernelTest, SeedChangesRun) {
    SimulationConfig cfg = smallConfig();
    const auto a = simulate(cfg);
    cfg.seed = 4321;
    const auto b = simulate(cfg);

    EXPECT_NE(a.series.opinions, b.series.opinions);
}

// Reset with the same configuration replays the run
TEST(KernelTest, ResetReplays) {
    SimulationConfig cfg = smallConfig();
    Kernel kernel(cfg);
    kernel.stepN(7);
    const auto first = kernel.series().opinions;

    kernel.reset(cfg);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_EQ(kernel.series().steps(), 0u);
    kernel.stepN(7);

    EXPECT_EQ(kernel.series().opinions, first);
}

TEST(KernelTest, SeriesShapes) {
    SimulationConfig cfg = smallConfig();
    const auto r = simulate(cfg);

    EXPECT_EQ(r.nSteps, 15u);
    EXPECT_EQ(r.nUsers, 25u);
    EXPECT_EQ(r.series.mean.size(), 15u);
    EXPECT_EQ(r.series.pol.size(), 15u);
    EXPECT_EQ(r.series.filterBubble.size(), 15u);
    EXPECT_EQ(r.series.homophily.size(), 15u);
    EXPECT_EQ(r.series.opinions.size(), 15u * 25u);
    EXPECT_EQ(r.postLikes.size(), 25u * 4u);
    for (double p : r.series.pol) EXPECT_GE(p, 0.0);
}

// Recorded mean and variance are those of the opinions after the step
TEST(KernelTest, MetricsMatchOpinions) {
    SimulationConfig cfg = smallConfig();
    Kernel kernel(cfg);
    kernel.stepN(3);

    const auto m = kernel.computeMetrics();
    EXPECT_DOUBLE_EQ(m.mean, opinionMean(kernel.opinions()));
    EXPECT_DOUBLE_EQ(m.pol, opinionVariance(kernel.opinions()));
    EXPECT_DOUBLE_EQ(kernel.series().mean.back(), m.mean);
    EXPECT_DOUBLE_EQ(kernel.series().homophily.back(), m.homophily);
}

TEST(KernelTest, CursorWrapsModuloHistory) {
    SimulationConfig cfg = smallConfig();
    cfg.postHistory = 2;
    Kernel kernel(cfg);

    kernel.stepN(5);

    EXPECT_EQ(kernel.state().currentTimeIdx, 1u);
    EXPECT_EQ(kernel.generation(), 5u);
}

TEST(KernelTest, FinalizeLifecycle) {
    SimulationConfig cfg = smallConfig();
    Kernel kernel(cfg);
    kernel.stepN(3);

    EXPECT_THROW(kernel.result(), std::logic_error);
    kernel.finalize();
    const auto total = kernel.histogram().total();
    kernel.finalize();
    EXPECT_EQ(kernel.histogram().total(), total);
    EXPECT_THROW(kernel.step(), std::logic_error);
    EXPECT_NO_THROW(kernel.result());
}

TEST(KernelTest, RejectsBadConfiguration) {
    SimulationConfig cfg = smallConfig();
    cfg.kPosts = 0;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.postHistory = 0;
    EXPECT_THROW(simulate(cfg), std::invalid_argument);

    cfg = smallConfig();
    cfg.od.mu = 2.0;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    cfg.graph.p = 1.5;
    EXPECT_THROW(Kernel{cfg}, std::invalid_argument);

    cfg = smallConfig();
    EXPECT_THROW(Kernel(cfg, Network::fromEdges(2, {{0, 1}}), {0.5}), std::invalid_argument);
    EXPECT_THROW(Kernel(cfg, Network::fromEdges(2, {{0, 1}}), {0.5, 1.5}), std::invalid_argument);
}

TEST(KernelTest, NameLookups) {
    EXPECT_EQ(rankerName(makeRanker("User_Success", 3.0)), "User_Success");
    EXPECT_DOUBLE_EQ(rankerAlpha(makeRanker("Engagement", 3.0)), 3.0);
    EXPECT_DOUBLE_EQ(rankerTarget(makeRanker("Evil", 1.0, 0.9)), 0.9);
    EXPECT_FALSE(rankerUsesAlpha(makeRanker("Closest")));
    EXPECT_TRUE(rankerUsesTarget(makeRanker("Narrative")));
    EXPECT_THROW(makeRanker("Popularity"), std::invalid_argument);
    EXPECT_THROW(parseOpinionModel("Voter"), std::invalid_argument);
    EXPECT_EQ(parseOpinionModel("BCM"), OpinionModel::BoundedConfidence);
}

// Counts wider than 32 bits are rejected instead of wrapping
TEST(KernelTest, ParseCount) {
    EXPECT_EQ(parseCount("0"), 0u);
    EXPECT_EQ(parseCount("250"), 250u);
    EXPECT_EQ(parseCount("4294967295"), 4294967295u);
    EXPECT_THROW(parseCount("4294967296"), std::invalid_argument);
    EXPECT_THROW(parseCount("4294967297"), std::invalid_argument);
    EXPECT_THROW(parseCount("99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(parseCount("-1"), std::invalid_argument);
    EXPECT_THROW(parseCount("12abc"), std::invalid_argument);
    EXPECT_THROW(parseCount(""), std::invalid_argument);
}
