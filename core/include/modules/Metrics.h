#ifndef METRICS_H
#define METRICS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

class Network;
class PostStore;
struct RankerSelection;

// Gini coefficient of the strictly positive entries of `values`:
//   G = 2 * sum(i * v_i) / (m * T) - (m + 1) / m, v sorted ascending, i from 1.
// Returns 0 when fewer than two positive values remain.
double giniCoefficient(std::vector<double> values);

// 1 - mean |viewer opinion - post opinion| over the valid cells of `selection`;
// 0 when no cell is valid.
double filterBubble(const RankerSelection& selection, const PostStore& posts, const std::vector<double>& opinions);

// Gini of per-post like counts / view counts across the whole buffer.
double successGini(const PostStore& posts);
double reachGini(const PostStore& posts);

// Mean of 1 - |o_i - o_j| over ordered adjacent pairs; 0 for an edgeless graph.
double homophily(const Network& network, const std::vector<double>& opinions);

struct StepMetrics {
    double filterBubble = 0.0;
    double giniSuccess = 0.0;
    double giniReach = 0.0;
    double homophily = 0.0;
};

StepMetrics computeStepMetrics(const Network& network,
                               const PostStore& posts,
                               const RankerSelection& selection,
                               const std::vector<double>& opinions);

/**
 * Final (opinion, likes) distribution of every post a run created.
 *
 * Like bins follow the edges {0, 1, 2, 5, 10, 20, 50, 100}: bin b counts
 * likes with edges[b-1] <= likes < edges[b], bin 0 holds negative counts (never
 * populated) and the last bin holds likes >= 100. Opinions fall into ten equal
 * bins over [0, 1], with 1.0 in the top bin.
 *
 * A post is recorded either when its slot is about to be overwritten or, if it
 * survives to the end, by recordSurvivors. Each post is therefore counted once.
 */
class SuccessHistogram {
public:
    static constexpr std::array<std::int64_t, 8> kLikeEdges{0, 1, 2, 5, 10, 20, 50, 100};
    static constexpr std::size_t kLikeBins = 9;      // one per edge plus the >= 100 overflow
    static constexpr std::size_t kOpinionBins = 10;

    static std::size_t likeBin(std::int64_t likes);
    static std::size_t opinionBin(double opinion);

    void clear();
    void record(double opinion, std::int64_t likes);

    // Every author's post in `slot`, just before the slot is rewritten.
    void recordDyingPosts(const PostStore& posts, std::uint32_t slot);
    // Every post still in the buffer at the end of the run.
    void recordSurvivors(const PostStore& posts);

    const std::array<std::int64_t, kLikeBins>& counts1d() const { return hist1d_; }
    const std::array<std::array<std::int64_t, kLikeBins>, kOpinionBins>& counts2d() const { return hist2d_; }
    std::int64_t total() const;

private:
    std::array<std::int64_t, kLikeBins> hist1d_{};
    std::array<std::array<std::int64_t, kLikeBins>, kOpinionBins> hist2d_{};
};

#endif
