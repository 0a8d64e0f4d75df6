#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "modules/BoundedConfidence.h"
#include <stdexcept>

namespace {
SimulationState stateWith(const std::vector<double>& opinions) {
    SimulationState state;
    state.reset(static_cast<std::uint32_t>(opinions.size()), 1);
    state.opinions = opinions;
    return state;
}
}

// Two users within reach of each other meet halfway with mu = 0.5
TEST(OpinionTest, TwoUsersMeetHalfway) {
    SimulationConfig cfg;
    cfg.od.epsilon = 1.0;
    cfg.od.mu = 0.5;
    cfg.kPosts = 1;
    cfg.postHistory = 1;
    cfg.nSteps = 1;
    Kernel kernel(cfg, Network::fromEdges(2, {{0, 1}}), {0.2, 0.8});

    kernel.step();

    EXPECT_NEAR(kernel.opinions()[0], 0.5, 1e-12);
    EXPECT_NEAR(kernel.opinions()[1], 0.5, 1e-12);
    EXPECT_EQ(kernel.state().authorCumulativeLikes, (std::vector<std::int64_t>{1, 1}));
    // The single slot now holds the new posts
    EXPECT_NEAR(kernel.posts().opinion(0, 0), 0.5, 1e-12);
    EXPECT_EQ(kernel.posts().likes(0, 0), 0);
}

// Posts outside epsilon are read but neither liked nor followed
TEST(OpinionTest, DistantPostsOnlyMarkedSeen) {
    BoundedConfidenceModel model(0.1, 0.5);
    PostStore posts(2, 2, {0.2, 0.8});
    SimulationState state = stateWith({0.2, 0.8});
    RankerSelection sel;
    sel.reset(2, 1);
    sel.set(0, 0, 1, 1);
    sel.set(1, 0, 0, 1);

    model.update(sel, posts, state);

    EXPECT_DOUBLE_EQ(state.opinions[0], 0.2);
    EXPECT_DOUBLE_EQ(state.opinions[1], 0.8);
    EXPECT_TRUE(posts.seenBy(1, 1, 0));
    EXPECT_TRUE(posts.seenBy(0, 1, 1));
    EXPECT_EQ(posts.likes(1, 1), 0);
    EXPECT_EQ(state.authorCumulativeLikes, (std::vector<std::int64_t>{0, 0}));
}

// Readers sharing one post each add a like
TEST(OpinionTest, SharedPostCollectsEveryLike) {
    BoundedConfidenceModel model(0.3, 0.1);
    PostStore posts(3, 2, {0.5, 0.4, 0.6});
    SimulationState state = stateWith({0.5, 0.4, 0.6});
    RankerSelection sel;
    sel.reset(3, 1);
    sel.set(1, 0, 0, 1);
    sel.set(2, 0, 0, 1);

    model.update(sel, posts, state);

    EXPECT_EQ(posts.likes(0, 1), 2);
    EXPECT_EQ(posts.viewCount(0, 1), 2u);
    EXPECT_EQ(state.authorCumulativeLikes[0], 2);
    EXPECT_NEAR(state.opinions[1], 0.41, 1e-12);
    EXPECT_NEAR(state.opinions[2], 0.59, 1e-12);
}

// The second post is judged against the opinion left by the first
TEST(OpinionTest, SlotsReadSequentially) {
    BoundedConfidenceModel model(0.2, 0.5);
    PostStore posts(3, 2, {0.2, 0.35, 0.45});
    SimulationState state = stateWith({0.2, 0.35, 0.45});
    RankerSelection sel;
    sel.reset(3, 2);
    sel.set(0, 0, 1, 1);
    sel.set(0, 1, 2, 1);

    model.update(sel, posts, state);

    EXPECT_NEAR(state.opinions[0], 0.3625, 1e-12);
    EXPECT_EQ(posts.likes(1, 1), 1);
    EXPECT_EQ(posts.likes(2, 1), 1);
}

// New posts land in the shared cursor slot, which then advances modulo H
TEST(OpinionTest, PublishesAndAdvancesCursor) {
    BoundedConfidenceModel model(0.2, 0.5);
    PostStore posts(2, 3, {0.3, 0.7});
    SimulationState state = stateWith({0.3, 0.7});
    state.currentTimeIdx = 2;
    posts.markSeen(0, 2, 1);
    RankerSelection sel;
    sel.reset(2, 1);

    model.update(sel, posts, state);

    EXPECT_EQ(state.currentTimeIdx, 0u);
    EXPECT_DOUBLE_EQ(posts.opinion(0, 2), 0.3);
    EXPECT_FALSE(posts.seenBy(0, 2, 1));
}

TEST(OpinionTest, InitialOpinionsInUnitInterval) {
    BoundedConfidenceModel model;
    std::mt19937_64 rng(3);
    auto ops = model.initialOpinions(500, rng);

    ASSERT_EQ(ops.size(), 500u);
    for (double o : ops) {
        EXPECT_GE(o, 0.0);
        EXPECT_LT(o, 1.0);
    }
}

TEST(OpinionTest, RejectsBadParameters) {
    EXPECT_THROW(BoundedConfidenceModel(-0.1, 0.5), std::invalid_argument);
    EXPECT_THROW(BoundedConfidenceModel(0.2, 1.5), std::invalid_argument);
    EXPECT_NO_THROW(BoundedConfidenceModel(0.0, 0.0));

    BoundedConfidenceModel model(0.2, 0.1);
    PostStore posts(2, 1, {0.3, 0.7});
    SimulationState state = stateWith({0.3, 0.7, 0.5});
    RankerSelection sel;
    sel.reset(2, 1);
    EXPECT_THROW(model.update(sel, posts, state), std::invalid_argument);
}

// Opinions stay in [0, 1] under every policy
TEST(OpinionTest, OpinionsStayBounded) {
    for (const char* name : {"Random", "Closest", "Engagement", "User_Success", "Narrative", "Evil", "Diverse_Engagement"}) {
        SimulationConfig cfg;
        cfg.graph.type = GraphType::WattsStrogatz;
        cfg.graph.n = 40;
        cfg.graph.k = 3;
        cfg.graph.p = 0.2;
        cfg.od.epsilon = 0.4;
        cfg.od.mu = 0.5;
        cfg.ranker = makeRanker(name, 2.0, 0.9);
        cfg.kPosts = 3;
        cfg.postHistory = 5;
        cfg.nSteps = 25;
        Kernel kernel(cfg);
        kernel.run();

        for (double o : kernel.series().opinions) {
            EXPECT_GE(o, 0.0) << name;
            EXPECT_LE(o, 1.0) << name;
        }
    }
}
