#include "kernel/ParameterGrid.h"
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::vector<ParameterCombination> ParameterGrid::combinations() const {
    std::vector<ParameterCombination> out;
    for (double eps : epsilons) {
        for (const auto& name : rankers) {
            const RankerSpec base = makeRanker(name);
            if (rankerUsesAlpha(base) && !alphas.empty()) {
                for (double a : alphas) {
                    out.push_back({eps, makeRanker(name, a, rankerTarget(base))});
                }
            } else if (rankerUsesTarget(base) && !targets.empty()) {
                for (double t : targets) {
                    out.push_back({eps, makeRanker(name, rankerAlpha(base), t)});
                }
            } else {
                out.push_back({eps, base});
            }
        }
    }
    return out;
}

ParameterCombination ParameterGrid::combination(std::size_t jobIndex) const {
    const auto all = combinations();
    if (jobIndex >= all.size()) {
        throw std::out_of_range("job_id " + std::to_string(jobIndex) + " exceeds combinations (" +
                                std::to_string(all.size()) + ")");
    }
    return all[jobIndex];
}

SimulationConfig applyCombination(const SimulationConfig& base, const ParameterCombination& combo) {
    SimulationConfig cfg = base;
    cfg.od.epsilon = combo.epsilon;
    cfg.ranker = combo.ranker;
    return cfg;
}

std::string formatParameter(double value) {
    std::ostringstream os;
    os << std::setprecision(15) << value;
    std::string s = os.str();
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string resultBaseName(const ParameterCombination& combo) {
    char eps[32];
    std::snprintf(eps, sizeof(eps), "eps%.2f_", combo.epsilon);
    std::string name = eps + rankerName(combo.ranker);
    if (rankerUsesAlpha(combo.ranker)) {
        name += "_alpha" + formatParameter(rankerAlpha(combo.ranker));
    } else if (rankerUsesTarget(combo.ranker)) {
        name += "_target" + formatParameter(rankerTarget(combo.ranker));
    }
    return name;
}
