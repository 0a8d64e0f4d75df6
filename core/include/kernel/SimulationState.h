#ifndef SIMULATION_STATE_H
#define SIMULATION_STATE_H

#include <cstdint>
#include <random>
#include <vector>

// Mutable per-run state. Owned by one Kernel; opinions are only written by the
// opinion model.
struct SimulationState {
    std::vector<double> opinions;                  // one per user, in [0, 1]
    std::vector<std::int64_t> authorCumulativeLikes; // every like ever received, per author
    std::uint32_t currentTimeIdx = 0;              // next buffer slot written (shared by all authors)
    std::uint64_t step = 0;                        // completed steps
    std::mt19937_64 rng;

    void reset(std::uint32_t users, std::uint64_t seed) {
        opinions.assign(users, 0.0);
        authorCumulativeLikes.assign(users, 0);
        currentTimeIdx = 0;
        step = 0;
        rng.seed(seed);
    }
};

#endif
