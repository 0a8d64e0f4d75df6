#ifndef REPLICAS_H
#define REPLICAS_H

#include "kernel/Config.h"
#include "kernel/Kernel.h"
#include "modules/Metrics.h"
#include <cstdint>
#include <vector>

/**
 * Results of many independent runs of one configuration.
 *
 * Series are stored row-major as replicas x steps. Only the first
 * nSavedTrajectories replicas keep their full opinion trajectories
 * (saved x steps x users).
 */
struct ReplicaSet {
    SimulationConfig config;
    std::uint32_t nReplicas = 0;
    std::uint32_t nSavedTrajectories = 0;
    std::uint32_t nSteps = 0;
    std::uint32_t nUsers = 0;

    std::vector<double> mean;
    std::vector<double> pol;
    std::vector<double> filterBubble;
    std::vector<double> giniSuccess;
    std::vector<double> giniReach;
    std::vector<double> homophily;
    std::vector<std::int64_t> histogram1d;   // replicas x like bins
    std::vector<std::int64_t> histogram2d;   // replicas x opinion bins x like bins
    std::vector<double> opinions;

    // Per-step average of a replicas x steps series.
    std::vector<double> meanOverReplicas(const std::vector<double>& series) const;
};

// Seed of replica r; replica 0 runs with the base seed itself.
std::uint64_t deriveReplicaSeed(std::uint64_t baseSeed, std::uint32_t replica);

// Runs replica `replica` of cfg. Without keepTrajectory the per-user opinion
// rows and the final post likes are released before returning, leaving the
// scalar series and histograms.
SimulationResult runReplica(const SimulationConfig& cfg, std::uint32_t replica, bool keepTrajectory);

// Runs nReplicas simulations, up to `threads` at a time (0 = OpenMP default).
// Throws std::invalid_argument for a bad configuration or replica count.
ReplicaSet runReplicas(const SimulationConfig& cfg,
                       std::uint32_t nReplicas,
                       std::uint32_t nSaveTrajectories,
                       int threads = 0);

#endif
