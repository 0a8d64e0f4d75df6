#include "kernel/Network.h"
#include "utils/Sampling.h"
#include <algorithm>
#include <stdexcept>
#include <string>

Network::Network(std::uint32_t n)
    : n_(n), adj_(n), matrix_(static_cast<std::size_t>(n) * n, 0) {}

Network Network::build(const GraphSpec& spec, std::mt19937_64& rng) {
    switch (spec.type) {
        case GraphType::Null: {
            Network net(userCount(spec));
            net.buildErdosRenyi(0.1, rng);
            net.sortAdjacency();
            return net;
        }
        case GraphType::ErdosRenyi: {
            Network net(spec.n);
            net.buildErdosRenyi(spec.p, rng);
            net.sortAdjacency();
            return net;
        }
        case GraphType::BarabasiAlbert: {
            Network net(spec.n);
            net.buildBarabasiAlbert(spec.m, rng);
            net.sortAdjacency();
            return net;
        }
        case GraphType::WattsStrogatz: {
            Network net(spec.n);
            net.buildWattsStrogatz(spec.k, spec.p, rng);
            net.sortAdjacency();
            return net;
        }
    }
    throw std::invalid_argument("Unknown graph type");
}

Network Network::fromEdges(std::uint32_t n, const std::vector<Edge>& edges) {
    Network net(n);
    for (const auto& [a, b] : edges) {
        if (a >= n || b >= n) {
            throw std::out_of_range("Edge (" + std::to_string(a) + ", " + std::to_string(b) +
                                    ") outside graph of " + std::to_string(n) + " vertices");
        }
        net.addEdge(a, b);
    }
    net.sortAdjacency();
    return net;
}

bool Network::addEdge(std::uint32_t a, std::uint32_t b) {
    if (a == b) return false;
    auto& ab = matrix_[static_cast<std::size_t>(a) * n_ + b];
    if (ab) return false;
    ab = 1;
    matrix_[static_cast<std::size_t>(b) * n_ + a] = 1;
    adj_[a].push_back(b);
    adj_[b].push_back(a);
    ++edges_;
    return true;
}

void Network::removeEdge(std::uint32_t a, std::uint32_t b) {
    auto& ab = matrix_[static_cast<std::size_t>(a) * n_ + b];
    if (!ab) return;
    ab = 0;
    matrix_[static_cast<std::size_t>(b) * n_ + a] = 0;
    auto& na = adj_[a];
    auto& nb = adj_[b];
    na.erase(std::remove(na.begin(), na.end(), b), na.end());
    nb.erase(std::remove(nb.begin(), nb.end(), a), nb.end());
    --edges_;
}

void Network::sortAdjacency() {
    for (auto& nbrs : adj_) {
        std::sort(nbrs.begin(), nbrs.end());
    }
}

void Network::buildErdosRenyi(double p, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> U(0.0, 1.0);
    for (std::uint32_t i = 0; i < n_; ++i) {
        for (std::uint32_t j = i + 1; j < n_; ++j) {
            if (U(rng) < p) addEdge(i, j);
        }
    }
}

void Network::buildBarabasiAlbert(std::uint32_t m, std::mt19937_64& rng) {
    // Each new vertex attaches to min(m, v) distinct earlier vertices, chosen
    // with probability proportional to (degree + 1)
    std::vector<double> weights;
    weights.reserve(n_);
    for (std::uint32_t v = 1; v < n_; ++v) {
        weights.assign(v, 0.0);
        for (std::uint32_t u = 0; u < v; ++u) {
            weights[u] = static_cast<double>(adj_[u].size()) + 1.0;
        }
        auto targets = weightedSampleWithoutReplacement(weights, m, rng);
        for (auto t : targets) {
            addEdge(v, static_cast<std::uint32_t>(t));
        }
    }
}

void Network::buildWattsStrogatz(std::uint32_t halfK, double p, std::mt19937_64& rng) {
    const std::uint32_t N = n_;
    if (N < 2) return;

    std::uniform_real_distribution<double> uniDist(0.0, 1.0);
    std::uniform_int_distribution<std::uint32_t> nodeDist(0, N - 1);

    // Ring lattice; wrap-around duplicates collapse when halfK >= N/2
    for (std::uint32_t i = 0; i < N; ++i) {
        for (std::uint32_t d = 1; d <= halfK; ++d) {
            addEdge(i, (i + d) % N);
        }
    }

    // Rewire the forward lattice edges
    for (std::uint32_t i = 0; i < N; ++i) {
        for (std::uint32_t d = 1; d <= halfK; ++d) {
            if (uniDist(rng) >= p) continue;

            const std::uint32_t oldJ = (i + d) % N;
            if (!isNeighbor(i, oldJ)) continue;

            // Saturated vertex: nowhere left to rewire to
            if (adj_[i].size() + 1 >= N) continue;

            std::uint32_t newJ;
            int attempts = 0;
            const int maxAttempts = static_cast<int>(N) * 2;
            do {
                newJ = nodeDist(rng);
                if (++attempts > maxAttempts) break;
            } while (newJ == i || isNeighbor(i, newJ));

            if (attempts > maxAttempts) continue;

            removeEdge(i, oldJ);
            addEdge(i, newJ);
        }
    }
}
