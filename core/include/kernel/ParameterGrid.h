#ifndef PARAMETER_GRID_H
#define PARAMETER_GRID_H

#include "kernel/Config.h"
#include <cstddef>
#include <string>
#include <vector>

// One point of a sweep: a confidence bound and a fully parameterised ranker.
struct ParameterCombination {
    double epsilon = 0.2;
    RankerSpec ranker = RandomRanker{};
};

/**
 * Sweep over epsilon x ranker. Rankers with an alpha expand over `alphas`,
 * rankers with a target opinion over `targets`; the others appear once per
 * epsilon. An empty alpha/target list means the policy default.
 */
struct ParameterGrid {
    std::vector<double> epsilons;
    std::vector<std::string> rankers;
    std::vector<double> alphas;
    std::vector<double> targets;

    // Throws std::invalid_argument for unknown ranker names.
    std::vector<ParameterCombination> combinations() const;
    std::size_t size() const { return combinations().size(); }

    // Throws std::out_of_range when jobIndex >= size().
    ParameterCombination combination(std::size_t jobIndex) const;
};

SimulationConfig applyCombination(const SimulationConfig& base, const ParameterCombination& combo);

// e.g. eps0.20_Random, eps0.15_Engagement_alpha2.0, eps0.25_Narrative_target0.8
std::string resultBaseName(const ParameterCombination& combo);

// Shortest round-trip text for a double, always with a decimal point ("2.0", "0.8").
std::string formatParameter(double value);

#endif
