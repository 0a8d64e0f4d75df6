#include "kernel/Kernel.h"
#include "kernel/ParameterGrid.h"
#include "kernel/Replicas.h"
#include "io/ResultArchive.h"
#include "io/Snapshot.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct BatchOptions {
    bool batch = false;
    std::uint32_t replicas = 100;
    std::uint32_t saveTrajectories = 5;
    int threads = 0;
    std::string out = "results";
    ParameterGrid grid;
    bool sweep = false;
    long long job = -1;
};

void printHelp() {
    std::cerr << "Kernel Commands:\n"
              << "  step N             # advance N steps\n"
              << "  state [posts]      # print JSON snapshot (optional: include post buffer)\n"
              << "  metrics            # print current metrics\n"
              << "  reset [seed]       # rebuild network, opinions and posts\n"
              << "  run T log          # run T steps, log metrics every 'log' steps to metrics.csv\n"
              << "  finalize           # bin surviving posts and print histograms\n"
              << "  save BASE          # finalize and write BASE.arrays.gz + BASE_config.json\n"
              << "  replicas R S BASE  # run R replicas, keep S trajectories, save under BASE\n"
              << "  config             # print configuration JSON\n"
              << "  load PATH          # reset with the configuration in PATH (e.g. BASE_config.json)\n"
              << "  quit               # exit\n"
              << "\nOptions:\n"
              << "  --config=PATH      # start from a JSON configuration; later flags override it\n"
              << "  --graph=NULL|ER|BA|WS --n=N --p=P --m=M --k=K\n"
              << "  --model=BCM --epsilon=E --mu=MU\n"
              << "  --ranker=Random|Closest|Engagement|User_Success|Narrative|Evil|Diverse_Engagement\n"
              << "  --alpha=A --target=T\n"
              << "  --steps=N --k-posts=K --history=H --seed=S (or FEEDSIM_SEED)\n"
              << "  --batch --replicas=R --save-trajectories=S --threads=T --out=BASE\n"
              << "  --sweep-epsilon=a,b --sweep-rankers=A,B --sweep-alpha=a,b --sweep-target=a,b --job=I\n"
              << "  --param-grid=PATH  # sweep lists from a {\"grid\": {...}} JSON file\n";
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::vector<double> parseDoubleList(const std::string& text) {
    std::vector<double> out;
    for (const auto& item : splitList(text)) out.push_back(std::stod(item));
    return out;
}

// Ranker name and parameters arrive in separate flags; resolved once at the end
struct RankerOptions {
    std::string rule = "Random";
    double alpha = 1.0;
    double target = 0.5;
};

// Returns false for an unrecognised option.
bool applyOption(const std::string& arg, SimulationConfig& cfg, RankerOptions& ranker, BatchOptions& batch) {
    const auto eq = arg.find('=');
    const std::string key = arg.substr(0, eq);
    const std::string value = eq == std::string::npos ? "" : arg.substr(eq + 1);

    if (key == "--config") {
        // Replaces everything set so far; later flags still override
        cfg = loadConfig(value);
        ranker.rule = rankerName(cfg.ranker);
        ranker.alpha = rankerUsesAlpha(cfg.ranker) ? rankerAlpha(cfg.ranker) : 1.0;
        ranker.target = rankerUsesTarget(cfg.ranker) ? rankerTarget(cfg.ranker) : 0.5;
    }
    else if (key == "--param-grid") { batch.grid = loadParameterGrid(value); batch.sweep = true; }
    else if (key == "--graph") cfg.graph.type = parseGraphType(value);
    else if (key == "--n") cfg.graph.n = parseCount(value);
    else if (key == "--p") cfg.graph.p = std::stod(value);
    else if (key == "--m") cfg.graph.m = parseCount(value);
    else if (key == "--k") cfg.graph.k = parseCount(value);
    else if (key == "--model") cfg.od.model = parseOpinionModel(value);
    else if (key == "--epsilon") cfg.od.epsilon = std::stod(value);
    else if (key == "--mu") cfg.od.mu = std::stod(value);
    else if (key == "--ranker") ranker.rule = value;
    else if (key == "--alpha") ranker.alpha = std::stod(value);
    else if (key == "--target") ranker.target = std::stod(value);
    else if (key == "--steps") cfg.nSteps = parseCount(value);
    else if (key == "--k-posts") cfg.kPosts = parseCount(value);
    else if (key == "--history") cfg.postHistory = parseCount(value);
    else if (key == "--seed") cfg.seed = std::stoull(value);
    else if (key == "--batch") batch.batch = true;
    else if (key == "--replicas") batch.replicas = parseCount(value);
    else if (key == "--save-trajectories") batch.saveTrajectories = parseCount(value);
    else if (key == "--threads") batch.threads = static_cast<int>(parseCount(value));
    else if (key == "--out") batch.out = value;
    else if (key == "--sweep-epsilon") { batch.grid.epsilons = parseDoubleList(value); batch.sweep = true; }
    else if (key == "--sweep-rankers") { batch.grid.rankers = splitList(value); batch.sweep = true; }
    else if (key == "--sweep-alpha") { batch.grid.alphas = parseDoubleList(value); batch.sweep = true; }
    else if (key == "--sweep-target") { batch.grid.targets = parseDoubleList(value); batch.sweep = true; }
    else if (key == "--job") batch.job = std::stoll(value);
    else return false;
    return true;
}

void printHistogram(const SuccessHistogram& h) {
    static const char* likeLabels[SuccessHistogram::kLikeBins] = {
        "<0", "0", "1", "2-4", "5-9", "10-19", "20-49", "50-99", ">=100"};
    std::cout << "--- SUCCESS HISTOGRAM (" << h.total() << " posts) ---\n";
    for (std::size_t b = 0; b < SuccessHistogram::kLikeBins; ++b) {
        std::cout << std::setw(6) << likeLabels[b] << " likes: " << h.counts1d()[b] << "\n";
    }
    std::cout << "opinion bin x like bin:\n";
    for (std::size_t o = 0; o < SuccessHistogram::kOpinionBins; ++o) {
        std::cout << "  [" << std::fixed << std::setprecision(1) << o * 0.1 << ", " << (o + 1) * 0.1 << ")";
        for (auto c : h.counts2d()[o]) std::cout << " " << std::setw(6) << c;
        std::cout << "\n";
    }
    std::cout.flush();
}

int runBatch(const SimulationConfig& cfg, const BatchOptions& batch) {
    SimulationConfig jobCfg = cfg;
    std::string base = batch.out;

    if (batch.sweep) {
        if (batch.grid.epsilons.empty() || batch.grid.rankers.empty()) {
            std::cerr << "Error: a sweep needs --sweep-epsilon and --sweep-rankers\n";
            return 1;
        }
        const auto combos = batch.grid.combinations();
        std::cerr << "Total combinations: " << combos.size() << "\n";
        if (batch.job < 0) {
            std::cerr << "Error: a sweep needs --job=<index>\n";
            return 1;
        }
        const auto combo = batch.grid.combination(static_cast<std::size_t>(batch.job));
        std::cerr << "\nJob " << batch.job << " parameters:\n"
                  << "  OD.epsilon: " << combo.epsilon << "\n"
                  << "  Ranker.rule: " << rankerName(combo.ranker) << "\n";
        jobCfg = applyCombination(cfg, combo);
        base = (std::filesystem::path(batch.out) / resultBaseName(combo)).string();
    }

    auto replicas = runReplicas(jobCfg, batch.replicas, batch.saveTrajectories, batch.threads);
    saveResults(replicas, base);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    SimulationConfig cfg;
    RankerOptions rankerOpts;
    BatchOptions batch;

    if (const char* envSeed = std::getenv("FEEDSIM_SEED")) {
        try {
            cfg.seed = std::stoull(envSeed);
        } catch (const std::exception&) {
            std::cerr << "Ignoring malformed FEEDSIM_SEED '" << envSeed << "'\n";
        }
    }

    const char* scriptArg = nullptr;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
                if (!applyOption(arg, cfg, rankerOpts, batch)) {
                    std::cerr << "Unknown option: " << arg << "\n";
                    return 1;
                }
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }
        cfg.ranker = makeRanker(rankerOpts.rule, rankerOpts.alpha, rankerOpts.target);
        validateConfig(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (batch.batch) {
        try {
            return runBatch(cfg, batch);
        } catch (const std::exception& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    }

    Kernel kernel(cfg);

    // Check if there's a script file argument
    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) continue;

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                for (int i = 0; i < n; ++i) {
                    kernel.step();
                    if ((i + 1) % 100 == 0 || i == n - 1) {
                        std::cerr << "Tick " << (i + 1) << "/" << n << "\r";
                        std::cerr.flush();
                    }
                }
                std::cerr << "\n";
                std::cout << kernelToJson(kernel) << "\n";
                std::cout.flush();

            } else if (cmd == "state") {
                std::string opt;
                iss >> opt;
                std::cout << kernelToJson(kernel, opt == "posts") << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                auto m = kernel.computeMetrics();
                std::cout << "Generation: " << kernel.generation() << "\n"
                          << "Mean opinion: " << m.mean << "\n"
                          << "Polarization: " << m.pol << "\n"
                          << "Filter bubble: " << m.filterBubble << "\n"
                          << "Gini (success): " << m.giniSuccess << "\n"
                          << "Gini (reach): " << m.giniReach << "\n"
                          << "Homophily: " << m.homophily << "\n";
                std::cout.flush();

            } else if (cmd == "reset") {
                std::uint64_t seed = 0;
                if (!(iss >> seed)) seed = cfg.seed;
                cfg.seed = seed;
                kernel.reset(cfg);
                std::cout << "Reset: " << kernel.network().size() << " users, "
                          << kernel.network().edgeCount() << " edges (seed=" << seed << ")\n";
                std::cout.flush();

            } else if (cmd == "run") {
                int ticks = 0;
                int logFreq = 1;
                iss >> ticks >> logFreq;
                if (logFreq < 1) logFreq = 1;

                bool isNewFile = !std::filesystem::exists("metrics.csv");
                std::ofstream metricsFile("metrics.csv", std::ios::app);
                if (!metricsFile) {
                    throw std::runtime_error("Could not open metrics.csv");
                }
                if (isNewFile) logMetricsHeader(metricsFile);

                for (int t = 0; t < ticks; ++t) {
                    kernel.step();
                    if ((t + 1) % logFreq == 0) {
                        logMetrics(kernel, metricsFile);
                    }
                }
                std::cerr << "Ran " << ticks << " steps (generation " << kernel.generation() << ")\n";

            } else if (cmd == "finalize") {
                kernel.finalize();
                printHistogram(kernel.histogram());

            } else if (cmd == "save") {
                std::string base;
                if (!(iss >> base)) {
                    std::cerr << "Usage: save BASE\n";
                    continue;
                }
                kernel.finalize();
                saveResults(kernel.result(), base);

            } else if (cmd == "replicas") {
                std::uint32_t r = 0;
                std::uint32_t s = 0;
                std::string base;
                if (!(iss >> r)) r = batch.replicas;
                if (!(iss >> s)) s = batch.saveTrajectories;
                if (!(iss >> base)) base = batch.out;
                auto set = runReplicas(cfg, r, s, batch.threads);
                saveResults(set, base);

            } else if (cmd == "config") {
                std::cout << configToJson(cfg);
                std::cout.flush();

            } else if (cmd == "load") {
                std::string path;
                if (!(iss >> path)) {
                    std::cerr << "Usage: load PATH\n";
                    continue;
                }
                SimulationConfig loaded = loadConfig(path);
                kernel.reset(loaded);
                cfg = loaded;
                std::cout << "Loaded " << path << ": " << kernel.network().size() << " users, "
                          << rankerName(cfg.ranker) << " ranker (seed=" << cfg.seed << ")\n";
                std::cout.flush();

            } else if (cmd == "quit" || cmd == "exit") {
                break;

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "Error in " << cmd << " command: " << e.what() << "\n";
        }
    }

    return 0;
}
