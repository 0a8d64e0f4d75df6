#include "kernel/Replicas.h"
#include "utils/Sampling.h"
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <omp.h>

std::vector<double> ReplicaSet::meanOverReplicas(const std::vector<double>& series) const {
    std::vector<double> out(nSteps, 0.0);
    if (nReplicas == 0) return out;
    for (std::uint32_t r = 0; r < nReplicas; ++r) {
        for (std::uint32_t t = 0; t < nSteps; ++t) {
            out[t] += series[static_cast<std::size_t>(r) * nSteps + t];
        }
    }
    for (auto& v : out) v /= static_cast<double>(nReplicas);
    return out;
}

std::uint64_t deriveReplicaSeed(std::uint64_t baseSeed, std::uint32_t replica) {
    return replica == 0 ? baseSeed : mixSeed(baseSeed, replica);
}

SimulationResult runReplica(const SimulationConfig& cfg, std::uint32_t replica, bool keepTrajectory) {
    SimulationConfig replicaCfg = cfg;
    replicaCfg.seed = deriveReplicaSeed(cfg.seed, replica);
    SimulationResult result = simulate(replicaCfg);
    if (!keepTrajectory) {
        std::vector<double>().swap(result.series.opinions);
        std::vector<std::int64_t>().swap(result.postLikes);
    }
    return result;
}

ReplicaSet runReplicas(const SimulationConfig& cfg,
                       std::uint32_t nReplicas,
                       std::uint32_t nSaveTrajectories,
                       int threads) {
    if (nReplicas == 0) {
        throw std::invalid_argument("n_replicas must be > 0");
    }
    validateConfig(cfg);

    std::cerr << "Running " << nReplicas << " replicas...\n";

    // Every replica is complete before anything is aggregated; only the first
    // nSave replicas hold on to their trajectories meanwhile
    const std::uint32_t nSave = std::min(nSaveTrajectories, nReplicas);
    std::vector<SimulationResult> results(nReplicas);
    std::vector<std::exception_ptr> errors(nReplicas);
    const int nThreads = threads > 0 ? threads : omp_get_max_threads();
    int finished = 0;

    #pragma omp parallel for schedule(dynamic) num_threads(nThreads)
    for (std::int64_t r = 0; r < static_cast<std::int64_t>(nReplicas); ++r) {
        try {
            const auto replica = static_cast<std::uint32_t>(r);
            results[r] = runReplica(cfg, replica, replica < nSave);
        } catch (...) {
            errors[r] = std::current_exception();
        }
        #pragma omp critical(replica_log)
        {
            ++finished;
            std::cerr << "  Replica " << finished << "/" << nReplicas << "\n";
        }
    }

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    ReplicaSet set;
    set.config = cfg;
    set.nReplicas = nReplicas;
    set.nSavedTrajectories = nSave;
    set.nSteps = results[0].nSteps;
    set.nUsers = results[0].nUsers;

    const std::size_t T = set.nSteps;
    const std::size_t N = set.nUsers;
    const std::size_t L = SuccessHistogram::kLikeBins;
    const std::size_t O = SuccessHistogram::kOpinionBins;

    set.mean.reserve(nReplicas * T);
    set.pol.reserve(nReplicas * T);
    set.filterBubble.reserve(nReplicas * T);
    set.giniSuccess.reserve(nReplicas * T);
    set.giniReach.reserve(nReplicas * T);
    set.homophily.reserve(nReplicas * T);
    set.histogram1d.reserve(nReplicas * L);
    set.histogram2d.reserve(nReplicas * O * L);
    set.opinions.reserve(set.nSavedTrajectories * T * N);

    for (std::uint32_t r = 0; r < nReplicas; ++r) {
        const auto& res = results[r];
        const auto& s = res.series;
        set.mean.insert(set.mean.end(), s.mean.begin(), s.mean.end());
        set.pol.insert(set.pol.end(), s.pol.begin(), s.pol.end());
        set.filterBubble.insert(set.filterBubble.end(), s.filterBubble.begin(), s.filterBubble.end());
        set.giniSuccess.insert(set.giniSuccess.end(), s.giniSuccess.begin(), s.giniSuccess.end());
        set.giniReach.insert(set.giniReach.end(), s.giniReach.begin(), s.giniReach.end());
        set.homophily.insert(set.homophily.end(), s.homophily.begin(), s.homophily.end());
        set.histogram1d.insert(set.histogram1d.end(), res.histogram1d.begin(), res.histogram1d.end());
        for (const auto& row : res.histogram2d) {
            set.histogram2d.insert(set.histogram2d.end(), row.begin(), row.end());
        }
        if (r < set.nSavedTrajectories) {
            set.opinions.insert(set.opinions.end(), s.opinions.begin(), s.opinions.end());
        }
    }

    std::cerr << "Completed " << nReplicas << " replicas!\n";
    return set;
}
