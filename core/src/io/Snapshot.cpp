#include "io/Snapshot.h"
#include "kernel/Kernel.h"
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace {
    json parseJson(const std::string& text, const char* what) {
        try {
            return json::parse(text);
        } catch (const json::parse_error& e) {
            throw std::invalid_argument(std::string("Malformed ") + what + " JSON: " + e.what());
        }
    }

    std::string readTextFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Could not open '" + path + "'");
        }
        std::ostringstream os;
        os << in.rdbuf();
        return os.str();
    }

    const json& section(const json& parent, const char* key) {
        static const json empty = json::object();
        if (!parent.contains(key)) return empty;
        const json& s = parent.at(key);
        if (!s.is_object()) {
            throw std::invalid_argument(std::string(key) + " must be an object");
        }
        return s;
    }

    std::uint32_t readCount(const json& obj, const char* key, std::uint32_t fallback) {
        if (!obj.contains(key)) return fallback;
        const json& v = obj.at(key);
        if (!v.is_number_integer() || v.get<long long>() < 0 ||
            v.get<long long>() > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
            throw std::invalid_argument(std::string(key) + " must be a count (got " + v.dump() + ")");
        }
        return v.get<std::uint32_t>();
    }

    double readNumber(const json& obj, const char* key, double fallback) {
        if (!obj.contains(key)) return fallback;
        const json& v = obj.at(key);
        if (!v.is_number()) {
            throw std::invalid_argument(std::string(key) + " must be a number (got " + v.dump() + ")");
        }
        return v.get<double>();
    }

    std::string readName(const json& obj, const char* key, const std::string& fallback) {
        if (!obj.contains(key)) return fallback;
        const json& v = obj.at(key);
        if (!v.is_string()) {
            throw std::invalid_argument(std::string(key) + " must be a string (got " + v.dump() + ")");
        }
        return v.get<std::string>();
    }

    std::vector<double> readNumberList(const json& obj, const char* key) {
        std::vector<double> out;
        if (!obj.contains(key)) return out;
        const json& v = obj.at(key);
        if (!v.is_array()) {
            throw std::invalid_argument(std::string(key) + " must be a list");
        }
        for (const auto& item : v) {
            if (!item.is_number()) {
                throw std::invalid_argument(std::string(key) + " holds a non-number (" + item.dump() + ")");
            }
            out.push_back(item.get<double>());
        }
        return out;
    }
}

std::string configToJson(const SimulationConfig& cfg) {
    const auto& g = cfg.graph;
    json graph;
    graph["type"] = graphTypeName(g.type);
    graph["n"] = userCount(g);
    switch (g.type) {
        case GraphType::Null:
            break;
        case GraphType::ErdosRenyi:
            graph["p"] = g.p;
            break;
        case GraphType::BarabasiAlbert:
            graph["m"] = g.m;
            break;
        case GraphType::WattsStrogatz:
            graph["k"] = g.k;
            graph["p"] = g.p;
            break;
    }

    json ranker;
    ranker["rule"] = rankerName(cfg.ranker);
    if (rankerUsesAlpha(cfg.ranker)) ranker["alpha"] = rankerAlpha(cfg.ranker);
    if (rankerUsesTarget(cfg.ranker)) ranker["target_opinion"] = rankerTarget(cfg.ranker);

    json j;
    j["Graph"] = graph;
    j["OD"] = {{"model", opinionModelName(cfg.od.model)}, {"epsilon", cfg.od.epsilon}, {"mu", cfg.od.mu}};
    j["Ranker"] = ranker;
    j["Simulation_details"] = {{"n_steps", cfg.nSteps}};
    j["k_posts"] = cfg.kPosts;
    j["post_history"] = cfg.postHistory;
    j["seed"] = cfg.seed;
    return j.dump(2) + "\n";
}

SimulationConfig configFromJson(const std::string& text) {
    const json j = parseJson(text, "configuration");
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    SimulationConfig cfg;
    const json& graph = section(j, "Graph");
    cfg.graph.type = parseGraphType(readName(graph, "type", "NULL"));
    cfg.graph.n = readCount(graph, "n", cfg.graph.n);
    cfg.graph.p = readNumber(graph, "p", cfg.graph.p);
    cfg.graph.m = readCount(graph, "m", cfg.graph.m);
    cfg.graph.k = readCount(graph, "k", cfg.graph.k);

    const json& od = section(j, "OD");
    cfg.od.model = parseOpinionModel(readName(od, "model", "BCM"));
    cfg.od.epsilon = readNumber(od, "epsilon", cfg.od.epsilon);
    cfg.od.mu = readNumber(od, "mu", cfg.od.mu);

    const json& ranker = section(j, "Ranker");
    cfg.ranker = makeRanker(readName(ranker, "rule", "Random"),
                            readNumber(ranker, "alpha", 1.0),
                            readNumber(ranker, "target_opinion", 0.5));

    cfg.nSteps = readCount(section(j, "Simulation_details"), "n_steps", cfg.nSteps);
    cfg.kPosts = readCount(j, "k_posts", cfg.kPosts);
    cfg.postHistory = readCount(j, "post_history", cfg.postHistory);
    if (j.contains("seed")) {
        const json& seed = j.at("seed");
        if (!seed.is_number_unsigned()) {
            throw std::invalid_argument("seed must be a non-negative integer (got " + seed.dump() + ")");
        }
        cfg.seed = seed.get<std::uint64_t>();
    }

    validateConfig(cfg);
    return cfg;
}

SimulationConfig loadConfig(const std::string& path) {
    return configFromJson(readTextFile(path));
}

ParameterGrid parameterGridFromJson(const std::string& text) {
    const json j = parseJson(text, "parameter grid");
    if (!j.is_object() || !j.contains("grid")) {
        throw std::invalid_argument("parameter grid needs a \"grid\" object");
    }
    const json& grid = section(j, "grid");

    ParameterGrid out;
    out.epsilons = readNumberList(grid, "OD.epsilon");
    out.alphas = readNumberList(grid, "Ranker.alpha");
    out.targets = readNumberList(grid, "Ranker.target_opinion");
    if (grid.contains("Ranker.rule")) {
        const json& rules = grid.at("Ranker.rule");
        if (!rules.is_array()) {
            throw std::invalid_argument("Ranker.rule must be a list");
        }
        for (const auto& r : rules) {
            if (!r.is_string()) {
                throw std::invalid_argument("Ranker.rule holds a non-string (" + r.dump() + ")");
            }
            out.rankers.push_back(r.get<std::string>());
        }
    }
    if (out.epsilons.empty() || out.rankers.empty()) {
        throw std::invalid_argument("parameter grid needs OD.epsilon and Ranker.rule lists");
    }
    // Unknown ranker names surface here rather than at job time
    out.combinations();
    return out;
}

ParameterGrid loadParameterGrid(const std::string& path) {
    return parameterGridFromJson(readTextFile(path));
}

std::string kernelToJson(const Kernel& kernel, bool includePosts) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    auto m = kernel.computeMetrics();

    os << "{";
    os << "\"generation\":" << kernel.generation() << ",";
    os << "\"current_time_idx\":" << kernel.state().currentTimeIdx << ",";
    os << "\"metrics\":{";
    os << "\"mean\":" << m.mean << ",";
    os << "\"pol\":" << m.pol << ",";
    os << "\"filter_bubble\":" << m.filterBubble << ",";
    os << "\"gini_success\":" << m.giniSuccess << ",";
    os << "\"gini_reach\":" << m.giniReach << ",";
    os << "\"homophily\":" << m.homophily;
    os << "},";

    os << "\"users\":[";
    const auto& opinions = kernel.opinions();
    const auto& likes = kernel.state().authorCumulativeLikes;
    for (std::size_t i = 0; i < opinions.size(); ++i) {
        os << "{";
        os << "\"id\":" << i << ",";
        os << "\"opinion\":" << opinions[i] << ",";
        os << "\"degree\":" << kernel.network().neighbors(static_cast<std::uint32_t>(i)).size() << ",";
        os << "\"total_likes\":" << likes[i];

        if (includePosts) {
            const auto& posts = kernel.posts();
            os << ",\"posts\":[";
            for (std::uint32_t s = 0; s < posts.history(); ++s) {
                const auto a = static_cast<std::uint32_t>(i);
                os << "{\"opinion\":" << posts.opinion(a, s)
                   << ",\"likes\":" << posts.likes(a, s)
                   << ",\"views\":" << posts.viewCount(a, s) << "}";
                if (s + 1 < posts.history()) os << ",";
            }
            os << "]";
        }

        os << "}";
        if (i + 1 < opinions.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

void logMetricsHeader(std::ostream& out) {
    out << "gen,mean,pol,filter_bubble,gini_success,gini_reach,homophily\n";
}

void logMetrics(const Kernel& kernel, std::ostream& out) {
    auto m = kernel.computeMetrics();
    out << kernel.generation() << ","
        << m.mean << ","
        << m.pol << ","
        << m.filterBubble << ","
        << m.giniSuccess << ","
        << m.giniReach << ","
        << m.homophily << "\n";
}
