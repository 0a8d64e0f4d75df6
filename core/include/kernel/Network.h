#ifndef NETWORK_H
#define NETWORK_H

#include "kernel/Config.h"
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

/**
 * Fixed undirected social graph.
 *
 * Holds sorted adjacency lists and a dense n*n neighbour matrix (row = viewer,
 * column = author). The matrix is symmetric with an empty diagonal and is the
 * only source of "who can see whom" for the rankers. Topology never changes
 * after construction.
 */
class Network {
public:
    using Edge = std::pair<std::uint32_t, std::uint32_t>;

    Network() = default;

    // Build a topology from its descriptor. Draws from rng.
    static Network build(const GraphSpec& spec, std::mt19937_64& rng);

    // Build from an explicit edge list; self-loops and duplicates are dropped.
    static Network fromEdges(std::uint32_t n, const std::vector<Edge>& edges);

    std::uint32_t size() const { return n_; }
    std::size_t edgeCount() const { return edges_; }

    const std::vector<std::uint32_t>& neighbors(std::uint32_t node) const { return adj_[node]; }
    bool isNeighbor(std::uint32_t viewer, std::uint32_t author) const {
        return matrix_[static_cast<std::size_t>(viewer) * n_ + author] != 0;
    }
    const std::vector<std::uint8_t>& neighborMatrix() const { return matrix_; }

private:
    explicit Network(std::uint32_t n);

    bool addEdge(std::uint32_t a, std::uint32_t b);
    void removeEdge(std::uint32_t a, std::uint32_t b);
    void sortAdjacency();

    void buildErdosRenyi(double p, std::mt19937_64& rng);
    void buildBarabasiAlbert(std::uint32_t m, std::mt19937_64& rng);
    void buildWattsStrogatz(std::uint32_t halfK, double p, std::mt19937_64& rng);

    std::uint32_t n_ = 0;
    std::size_t edges_ = 0;
    std::vector<std::vector<std::uint32_t>> adj_;
    std::vector<std::uint8_t> matrix_;
};

#endif
