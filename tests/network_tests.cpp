#include <gtest/gtest.h>
#include "kernel/Network.h"
#include <algorithm>
#include <random>
#include <stdexcept>

namespace {
void expectConsistent(const Network& net) {
    std::size_t degreeSum = 0;
    for (std::uint32_t i = 0; i < net.size(); ++i) {
        EXPECT_FALSE(net.isNeighbor(i, i)) << "self-loop at " << i;
        for (std::uint32_t j = 0; j < net.size(); ++j) {
            EXPECT_EQ(net.isNeighbor(i, j), net.isNeighbor(j, i));
        }
        const auto& nbrs = net.neighbors(i);
        EXPECT_TRUE(std::is_sorted(nbrs.begin(), nbrs.end()));
        for (auto j : nbrs) {
            EXPECT_TRUE(net.isNeighbor(i, j));
        }
        degreeSum += nbrs.size();
    }
    EXPECT_EQ(degreeSum, 2 * net.edgeCount());
}
}

// Erdos-Renyi graphs are symmetric, loop-free and match their matrix
TEST(NetworkTest, ErdosRenyiConsistent) {
    GraphSpec spec;
    spec.type = GraphType::ErdosRenyi;
    spec.n = 60;
    spec.p = 0.1;
    std::mt19937_64 rng(7);

    Network net = Network::build(spec, rng);

    EXPECT_EQ(net.size(), 60u);
    EXPECT_GT(net.edgeCount(), 0u);
    expectConsistent(net);
}

// p = 1 gives the complete graph, p = 0 the empty one
TEST(NetworkTest, ErdosRenyiExtremes) {
    GraphSpec spec;
    spec.type = GraphType::ErdosRenyi;
    spec.n = 12;
    std::mt19937_64 rng(1);

    spec.p = 1.0;
    EXPECT_EQ(Network::build(spec, rng).edgeCount(), 12u * 11u / 2u);
    spec.p = 0.0;
    EXPECT_EQ(Network::build(spec, rng).edgeCount(), 0u);
}

// Every new Barabasi-Albert vertex brings min(m, v) distinct edges
TEST(NetworkTest, BarabasiAlbertEdgeCount) {
    GraphSpec spec;
    spec.type = GraphType::BarabasiAlbert;
    spec.n = 50;
    spec.m = 2;
    std::mt19937_64 rng(3);

    Network net = Network::build(spec, rng);

    EXPECT_EQ(net.edgeCount(), 1u + 2u * 48u);
    expectConsistent(net);
    for (std::uint32_t v = 1; v < net.size(); ++v) {
        EXPECT_GE(net.neighbors(v).size(), 1u);
    }
}

// Without rewiring the Watts-Strogatz graph is the plain ring lattice
TEST(NetworkTest, WattsStrogatzLattice) {
    GraphSpec spec;
    spec.type = GraphType::WattsStrogatz;
    spec.n = 20;
    spec.k = 2;
    spec.p = 0.0;
    std::mt19937_64 rng(5);

    Network net = Network::build(spec, rng);

    EXPECT_EQ(net.edgeCount(), 40u);
    for (std::uint32_t i = 0; i < net.size(); ++i) {
        EXPECT_EQ(net.neighbors(i).size(), 4u);
        EXPECT_TRUE(net.isNeighbor(i, (i + 1) % 20));
        EXPECT_TRUE(net.isNeighbor(i, (i + 2) % 20));
    }
}

// Rewiring moves edges but never creates or destroys them
TEST(NetworkTest, WattsStrogatzRewiringKeepsEdgeCount) {
    GraphSpec spec;
    spec.type = GraphType::WattsStrogatz;
    spec.n = 40;
    spec.k = 3;
    spec.p = 0.3;
    std::mt19937_64 rng(11);

    Network net = Network::build(spec, rng);

    EXPECT_EQ(net.edgeCount(), 120u);
    expectConsistent(net);
}

// The NULL topology is the default 100-vertex random graph
TEST(NetworkTest, NullTopologyDefaults) {
    GraphSpec spec;
    spec.type = GraphType::Null;
    std::mt19937_64 rng(2);

    Network net = Network::build(spec, rng);

    EXPECT_EQ(net.size(), 100u);
    expectConsistent(net);
}

// Explicit edge lists drop loops and duplicates and reject bad vertices
TEST(NetworkTest, FromEdges) {
    Network net = Network::fromEdges(4, {{0, 1}, {1, 0}, {2, 2}, {3, 1}});

    EXPECT_EQ(net.edgeCount(), 2u);
    EXPECT_TRUE(net.isNeighbor(1, 3));
    EXPECT_FALSE(net.isNeighbor(2, 2));
    EXPECT_EQ(net.neighbors(1), (std::vector<std::uint32_t>{0, 3}));
    expectConsistent(net);

    EXPECT_THROW(Network::fromEdges(3, {{0, 3}}), std::out_of_range);
}

// Same seed, same graph
TEST(NetworkTest, DeterministicBuild) {
    GraphSpec spec;
    spec.type = GraphType::WattsStrogatz;
    spec.n = 30;
    spec.k = 2;
    spec.p = 0.2;
    std::mt19937_64 rngA(99);
    std::mt19937_64 rngB(99);

    EXPECT_EQ(Network::build(spec, rngA).neighborMatrix(), Network::build(spec, rngB).neighborMatrix());
}

TEST(NetworkTest, UnknownTopologyName) {
    EXPECT_EQ(parseGraphType("BA"), GraphType::BarabasiAlbert);
    EXPECT_THROW(parseGraphType("Lattice"), std::invalid_argument);
}
