#ifndef SIMULATION_CONFIG_H
#define SIMULATION_CONFIG_H

#include <cstdint>
#include <string>
#include <variant>

// ---------- Topology ----------
enum class GraphType : std::uint8_t {
    Null = 0,        // default Erdos-Renyi graph (n = 100, p = 0.1)
    ErdosRenyi,
    BarabasiAlbert,
    WattsStrogatz
};

struct GraphSpec {
    GraphType type = GraphType::Null;
    std::uint32_t n = 100;
    double p = 0.1;            // ER edge probability, WS rewiring probability
    std::uint32_t m = 2;       // BA edges attached per new vertex
    std::uint32_t k = 4;       // WS lattice neighbours on each side
};

// ---------- Opinion dynamics ----------
enum class OpinionModel : std::uint8_t {
    BoundedConfidence = 0
};

struct OpinionModelSpec {
    OpinionModel model = OpinionModel::BoundedConfidence;
    double epsilon = 0.2;      // confidence bound
    double mu = 0.1;           // convergence rate
};

// ---------- Ranking policies ----------
// Each policy carries only the parameters it reads. The confidence bound used
// by Evil and DiverseEngagement comes from the opinion model.
struct RandomRanker {};
struct ClosestRanker {};
struct EngagementRanker { double alpha = 1.0; };
struct UserSuccessRanker { double alpha = 1.0; };
struct NarrativeRanker { double target = 0.5; };
struct EvilRanker { double target = 0.5; };
struct DiverseEngagementRanker {};

using RankerSpec = std::variant<RandomRanker,
                                ClosestRanker,
                                EngagementRanker,
                                UserSuccessRanker,
                                NarrativeRanker,
                                EvilRanker,
                                DiverseEngagementRanker>;

// ---------- Configuration ----------
struct SimulationConfig {
    GraphSpec graph;
    OpinionModelSpec od;
    RankerSpec ranker = RandomRanker{};
    std::uint32_t nSteps = 100;
    std::uint32_t kPosts = 1;          // posts shown to each user per step
    std::uint32_t postHistory = 50;    // circular buffer length per author
    std::uint64_t seed = 42;
};

// Vertices the topology actually has; NULL is always the 100-vertex default.
std::uint32_t userCount(const GraphSpec& spec);

// Name lookups. Unknown names throw std::invalid_argument.
GraphType parseGraphType(const std::string& name);
std::string graphTypeName(GraphType type);

OpinionModel parseOpinionModel(const std::string& name);
std::string opinionModelName(OpinionModel model);

RankerSpec makeRanker(const std::string& name, double alpha = 1.0, double target = 0.5);
std::string rankerName(const RankerSpec& spec);

// Ranker parameter accessors; policies without the parameter report false.
bool rankerUsesAlpha(const RankerSpec& spec);
bool rankerUsesTarget(const RankerSpec& spec);
double rankerAlpha(const RankerSpec& spec);
double rankerTarget(const RankerSpec& spec);

// Decimal count in [0, 2^32 - 1]; anything else throws std::invalid_argument.
std::uint32_t parseCount(const std::string& text);

// Throws std::invalid_argument describing the first bad field.
void validateConfig(const SimulationConfig& cfg);

#endif
