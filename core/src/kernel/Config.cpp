#include "kernel/Config.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool isProbability(double p) {
        return std::isfinite(p) && p >= 0.0 && p <= 1.0;
    }
}

std::uint32_t userCount(const GraphSpec& spec) {
    return spec.type == GraphType::Null ? 100u : spec.n;
}

std::uint32_t parseCount(const std::string& text) {
    const auto bad = [&text] {
        return std::invalid_argument("expected a count in [0, " +
                                     std::to_string(std::numeric_limits<std::uint32_t>::max()) +
                                     "] (got '" + text + "')");
    };
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::logic_error&) {
        throw bad();
    }
    if (used != text.size() || v < 0 || v > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
        throw bad();
    }
    return static_cast<std::uint32_t>(v);
}

GraphType parseGraphType(const std::string& name) {
    if (name == "NULL") return GraphType::Null;
    if (name == "ER") return GraphType::ErdosRenyi;
    if (name == "BA") return GraphType::BarabasiAlbert;
    if (name == "WS") return GraphType::WattsStrogatz;
    throw std::invalid_argument("Unknown graph type: " + name);
}

std::string graphTypeName(GraphType type) {
    switch (type) {
        case GraphType::Null: return "NULL";
        case GraphType::ErdosRenyi: return "ER";
        case GraphType::BarabasiAlbert: return "BA";
        case GraphType::WattsStrogatz: return "WS";
    }
    throw std::invalid_argument("Unknown graph type");
}

OpinionModel parseOpinionModel(const std::string& name) {
    if (name == "BCM") return OpinionModel::BoundedConfidence;
    throw std::invalid_argument("Unknown opinion model: " + name);
}

std::string opinionModelName(OpinionModel model) {
    switch (model) {
        case OpinionModel::BoundedConfidence: return "BCM";
    }
    throw std::invalid_argument("Unknown opinion model");
}

RankerSpec makeRanker(const std::string& name, double alpha, double target) {
    if (name == "Random") return RandomRanker{};
    if (name == "Closest") return ClosestRanker{};
    if (name == "Engagement") return EngagementRanker{alpha};
    if (name == "User_Success") return UserSuccessRanker{alpha};
    if (name == "Narrative") return NarrativeRanker{target};
    if (name == "Evil") return EvilRanker{target};
    if (name == "Diverse_Engagement") return DiverseEngagementRanker{};
    throw std::invalid_argument("Unknown ranker: " + name);
}

std::string rankerName(const RankerSpec& spec) {
    return std::visit(overloaded{
        [](const RandomRanker&) { return std::string("Random"); },
        [](const ClosestRanker&) { return std::string("Closest"); },
        [](const EngagementRanker&) { return std::string("Engagement"); },
        [](const UserSuccessRanker&) { return std::string("User_Success"); },
        [](const NarrativeRanker&) { return std::string("Narrative"); },
        [](const EvilRanker&) { return std::string("Evil"); },
        [](const DiverseEngagementRanker&) { return std::string("Diverse_Engagement"); }
    }, spec);
}

bool rankerUsesAlpha(const RankerSpec& spec) {
    return std::holds_alternative<EngagementRanker>(spec) ||
           std::holds_alternative<UserSuccessRanker>(spec);
}

bool rankerUsesTarget(const RankerSpec& spec) {
    return std::holds_alternative<NarrativeRanker>(spec) ||
           std::holds_alternative<EvilRanker>(spec);
}

double rankerAlpha(const RankerSpec& spec) {
    if (const auto* r = std::get_if<EngagementRanker>(&spec)) return r->alpha;
    if (const auto* r = std::get_if<UserSuccessRanker>(&spec)) return r->alpha;
    return 0.0;
}

double rankerTarget(const RankerSpec& spec) {
    if (const auto* r = std::get_if<NarrativeRanker>(&spec)) return r->target;
    if (const auto* r = std::get_if<EvilRanker>(&spec)) return r->target;
    return 0.0;
}

void validateConfig(const SimulationConfig& cfg) {
    const auto& g = cfg.graph;
    if (g.type != GraphType::Null && g.n == 0) {
        throw std::invalid_argument("Graph.n must be > 0");
    }
    if ((g.type == GraphType::ErdosRenyi || g.type == GraphType::WattsStrogatz) && !isProbability(g.p)) {
        throw std::invalid_argument("Graph.p must be in [0, 1] (got " + std::to_string(g.p) + ")");
    }
    if (g.type == GraphType::BarabasiAlbert && g.m == 0) {
        throw std::invalid_argument("Graph.m must be > 0");
    }
    if (g.type == GraphType::WattsStrogatz && g.k == 0) {
        throw std::invalid_argument("Graph.k must be > 0");
    }

    if (!std::isfinite(cfg.od.epsilon) || cfg.od.epsilon < 0.0) {
        throw std::invalid_argument("OD.epsilon must be >= 0 (got " + std::to_string(cfg.od.epsilon) + ")");
    }
    if (!isProbability(cfg.od.mu)) {
        throw std::invalid_argument("OD.mu must be in [0, 1] (got " + std::to_string(cfg.od.mu) + ")");
    }

    if (rankerUsesAlpha(cfg.ranker) && !std::isfinite(rankerAlpha(cfg.ranker))) {
        throw std::invalid_argument("Ranker.alpha must be finite");
    }
    if (rankerUsesTarget(cfg.ranker) && !std::isfinite(rankerTarget(cfg.ranker))) {
        throw std::invalid_argument("Ranker.target_opinion must be finite");
    }

    if (cfg.nSteps == 0) {
        throw std::invalid_argument("Simulation_details.n_steps must be > 0");
    }
    if (cfg.kPosts == 0) {
        throw std::invalid_argument("k_posts must be > 0");
    }
    if (cfg.postHistory == 0) {
        throw std::invalid_argument("post_history must be > 0");
    }
}
