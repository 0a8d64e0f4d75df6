#ifndef KERNEL_H
#define KERNEL_H

#include "kernel/Config.h"
#include "kernel/Network.h"
#include "kernel/PostStore.h"
#include "kernel/SimulationState.h"
#include "modules/BoundedConfidence.h"
#include "modules/Metrics.h"
#include "modules/Ranking.h"
#include <array>
#include <cstdint>
#include <vector>

// ---------- Recorded time series ----------
struct SimulationSeries {
    std::vector<double> mean;          // mean opinion
    std::vector<double> pol;           // population variance of opinions
    std::vector<double> filterBubble;
    std::vector<double> giniSuccess;
    std::vector<double> giniReach;
    std::vector<double> homophily;
    std::vector<double> opinions;      // steps x users, row-major

    std::size_t steps() const { return mean.size(); }
    void clear();
    void reserve(std::size_t steps, std::size_t users);
};

// Everything that survives a finished run.
struct SimulationResult {
    SimulationConfig config;
    std::uint32_t nUsers = 0;
    std::uint32_t nSteps = 0;
    std::uint32_t postHistory = 0;
    SimulationSeries series;
    std::array<std::int64_t, SuccessHistogram::kLikeBins> histogram1d{};
    std::array<std::array<std::int64_t, SuccessHistogram::kLikeBins>, SuccessHistogram::kOpinionBins> histogram2d{};
    std::vector<std::int64_t> postLikes;   // final buffer, users x postHistory
};

// ---------- Kernel Engine ----------
/**
 * One simulation run: network, post buffer, opinion model and ranker.
 *
 * Each step
 *   1. bins the posts about to be overwritten (once the buffer has wrapped),
 *   2. ranks eligible posts for every user,
 *   3. applies the opinion model (which publishes the new posts),
 *   4. records the step metrics.
 * finalize() bins the posts still in the buffer; no further steps are allowed
 * afterwards.
 */
class Kernel {
public:
    explicit Kernel(const SimulationConfig& cfg);
    Kernel(const SimulationConfig& cfg, Network network);
    Kernel(const SimulationConfig& cfg, Network network, const std::vector<double>& initialOpinions);

    // Lifecycle
    void reset(const SimulationConfig& cfg);
    void step();
    void stepN(int n);
    void run();          // remaining steps up to config().nSteps, then finalize()
    void finalize();     // idempotent
    bool finalized() const { return finalized_; }

    // Access
    const SimulationConfig& config() const { return cfg_; }
    const Network& network() const { return network_; }
    const PostStore& posts() const { return posts_; }
    const SimulationState& state() const { return state_; }
    const std::vector<double>& opinions() const { return state_.opinions; }
    std::uint64_t generation() const { return state_.step; }
    const RankerSelection& lastSelection() const { return lastSelection_; }
    const SimulationSeries& series() const { return series_; }
    const SuccessHistogram& histogram() const { return histogram_; }

    // Snapshot of the current opinions plus the most recent step metrics
    struct Metrics {
        double mean = 0.0;
        double pol = 0.0;
        double filterBubble = 0.0;
        double giniSuccess = 0.0;
        double giniReach = 0.0;
        double homophily = 0.0;
    };
    Metrics computeMetrics() const;

    // Throws std::logic_error unless finalized.
    SimulationResult result() const;

private:
    void initRun(const std::vector<double>* initialOpinions);
    void recordStep(const StepMetrics& m);

    SimulationConfig cfg_;
    Network network_;
    PostStore posts_;
    SimulationState state_;
    BoundedConfidenceModel model_;
    RankerSelection lastSelection_;
    StepMetrics lastMetrics_;
    SimulationSeries series_;
    SuccessHistogram histogram_;
    bool finalized_ = false;
};

// Runs cfg.nSteps steps from cfg.seed and finalizes.
SimulationResult simulate(const SimulationConfig& cfg);

double opinionMean(const std::vector<double>& opinions);
double opinionVariance(const std::vector<double>& opinions);

#endif // KERNEL_H
