#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

void SimulationSeries::clear() {
    mean.clear();
    pol.clear();
    filterBubble.clear();
    giniSuccess.clear();
    giniReach.clear();
    homophily.clear();
    opinions.clear();
}

void SimulationSeries::reserve(std::size_t steps, std::size_t users) {
    mean.reserve(steps);
    pol.reserve(steps);
    filterBubble.reserve(steps);
    giniSuccess.reserve(steps);
    giniReach.reserve(steps);
    homophily.reserve(steps);
    opinions.reserve(steps * users);
}

double opinionMean(const std::vector<double>& opinions) {
    if (opinions.empty()) return 0.0;
    return std::accumulate(opinions.begin(), opinions.end(), 0.0) / static_cast<double>(opinions.size());
}

double opinionVariance(const std::vector<double>& opinions) {
    if (opinions.empty()) return 0.0;
    const double mu = opinionMean(opinions);
    double acc = 0.0;
    for (double o : opinions) {
        const double d = o - mu;
        acc += d * d;
    }
    return acc / static_cast<double>(opinions.size());
}

Kernel::Kernel(const SimulationConfig& cfg) {
    reset(cfg);
}

Kernel::Kernel(const SimulationConfig& cfg, Network network) : cfg_(cfg), network_(std::move(network)) {
    validateConfig(cfg_);
    state_.reset(network_.size(), cfg_.seed);
    initRun(nullptr);
}

Kernel::Kernel(const SimulationConfig& cfg, Network network, const std::vector<double>& initialOpinions)
    : cfg_(cfg), network_(std::move(network)) {
    validateConfig(cfg_);
    if (initialOpinions.size() != network_.size()) {
        throw std::invalid_argument("expected " + std::to_string(network_.size()) +
                                    " initial opinions (got " + std::to_string(initialOpinions.size()) + ")");
    }
    for (double o : initialOpinions) {
        if (!(o >= 0.0 && o <= 1.0)) {
            throw std::invalid_argument("initial opinions must lie in [0, 1] (got " + std::to_string(o) + ")");
        }
    }
    state_.reset(network_.size(), cfg_.seed);
    initRun(&initialOpinions);
}

void Kernel::reset(const SimulationConfig& cfg) {
    // Configuration errors surface before any simulation work
    validateConfig(cfg);
    cfg_ = cfg;

    state_.reset(0, cfg_.seed);
    network_ = Network::build(cfg_.graph, state_.rng);
    state_.opinions.assign(network_.size(), 0.0);
    state_.authorCumulativeLikes.assign(network_.size(), 0);
    initRun(nullptr);
}

void Kernel::initRun(const std::vector<double>* initialOpinions) {
    switch (cfg_.od.model) {
        case OpinionModel::BoundedConfidence:
            model_.configure(cfg_.od.epsilon, cfg_.od.mu);
            break;
    }

    const std::uint32_t n = network_.size();
    state_.opinions = initialOpinions ? *initialOpinions : model_.initialOpinions(n, state_.rng);
    posts_.initialize(n, cfg_.postHistory, state_.opinions);

    lastSelection_.reset(n, cfg_.kPosts);
    lastMetrics_ = StepMetrics{};
    series_.clear();
    series_.reserve(cfg_.nSteps, n);
    histogram_.clear();
    finalized_ = false;
}

void Kernel::step() {
    if (finalized_) {
        throw std::logic_error("kernel already finalized at generation " + std::to_string(state_.step));
    }

    // Slot about to be rewritten holds a real post only after the first wrap
    if (state_.step >= cfg_.postHistory) {
        histogram_.recordDyingPosts(posts_, state_.currentTimeIdx);
    }

    const RankingContext ctx{network_, posts_, state_, cfg_.od.epsilon, cfg_.kPosts, state_.rng()};
    lastSelection_ = rankPosts(cfg_.ranker, ctx);

    model_.update(lastSelection_, posts_, state_);

    lastMetrics_ = computeStepMetrics(network_, posts_, lastSelection_, state_.opinions);
    recordStep(lastMetrics_);
    ++state_.step;
}

void Kernel::stepN(int n) {
    for (int i = 0; i < n; ++i) step();
}

void Kernel::run() {
    while (state_.step < cfg_.nSteps) {
        step();
    }
    finalize();
}

void Kernel::finalize() {
    if (finalized_) return;
    histogram_.recordSurvivors(posts_);
    finalized_ = true;
}

void Kernel::recordStep(const StepMetrics& m) {
    series_.mean.push_back(opinionMean(state_.opinions));
    series_.pol.push_back(opinionVariance(state_.opinions));
    series_.filterBubble.push_back(m.filterBubble);
    series_.giniSuccess.push_back(m.giniSuccess);
    series_.giniReach.push_back(m.giniReach);
    series_.homophily.push_back(m.homophily);
    series_.opinions.insert(series_.opinions.end(), state_.opinions.begin(), state_.opinions.end());

    validation::checkFinite(series_.pol.back(), "Kernel::recordStep (pol)");
    validation::checkNonNegative(m.giniSuccess, "Kernel::recordStep (gini success)");
}

Kernel::Metrics Kernel::computeMetrics() const {
    Metrics m;
    m.mean = opinionMean(state_.opinions);
    m.pol = opinionVariance(state_.opinions);
    m.filterBubble = lastMetrics_.filterBubble;
    m.giniSuccess = lastMetrics_.giniSuccess;
    m.giniReach = lastMetrics_.giniReach;
    m.homophily = lastMetrics_.homophily;
    return m;
}

SimulationResult Kernel::result() const {
    if (!finalized_) {
        throw std::logic_error("result requested before finalize()");
    }
    SimulationResult r;
    r.config = cfg_;
    r.nUsers = network_.size();
    r.nSteps = static_cast<std::uint32_t>(series_.steps());
    r.postHistory = cfg_.postHistory;
    r.series = series_;
    r.histogram1d = histogram_.counts1d();
    r.histogram2d = histogram_.counts2d();
    r.postLikes = posts_.likes();
    return r;
}

SimulationResult simulate(const SimulationConfig& cfg) {
    Kernel kernel(cfg);
    kernel.run();
    return kernel.result();
}
