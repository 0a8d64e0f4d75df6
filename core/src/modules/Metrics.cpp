#include "modules/Metrics.h"
#include "kernel/Network.h"
#include "kernel/PostStore.h"
#include "modules/Ranking.h"
#include <algorithm>
#include <cmath>
#include <numeric>

double giniCoefficient(std::vector<double> values) {
    values.erase(std::remove_if(values.begin(), values.end(), [](double v) { return !(v > 0.0); }),
                 values.end());
    const std::size_t m = values.size();
    if (m < 2) return 0.0;

    std::sort(values.begin(), values.end());
    double total = 0.0;
    double weighted = 0.0;
    for (std::size_t i = 0; i < m; ++i) {
        total += values[i];
        weighted += static_cast<double>(i + 1) * values[i];
    }
    const double md = static_cast<double>(m);
    return (2.0 * weighted) / (md * total) - (md + 1.0) / md;
}

double filterBubble(const RankerSelection& selection, const PostStore& posts, const std::vector<double>& opinions) {
    double sum = 0.0;
    std::size_t count = 0;
    for (std::uint32_t i = 0; i < selection.users; ++i) {
        for (std::uint32_t j = 0; j < selection.k; ++j) {
            if (!selection.valid(i, j)) continue;
            const double post = posts.opinion(static_cast<std::uint32_t>(selection.author(i, j)),
                                              static_cast<std::uint32_t>(selection.time(i, j)));
            sum += std::abs(opinions[i] - post);
            ++count;
        }
    }
    if (count == 0) return 0.0;
    return 1.0 - sum / static_cast<double>(count);
}

double successGini(const PostStore& posts) {
    const auto& likes = posts.likes();
    std::vector<double> values;
    values.reserve(likes.size());
    for (auto l : likes) {
        if (l > 0) values.push_back(static_cast<double>(l));
    }
    return giniCoefficient(std::move(values));
}

double reachGini(const PostStore& posts) {
    const auto& views = posts.viewCounts();
    std::vector<double> values;
    values.reserve(views.size());
    for (auto v : views) {
        if (v > 0) values.push_back(static_cast<double>(v));
    }
    return giniCoefficient(std::move(values));
}

double homophily(const Network& network, const std::vector<double>& opinions) {
    double sum = 0.0;
    std::size_t pairs = 0;
    for (std::uint32_t i = 0; i < network.size(); ++i) {
        for (std::uint32_t j : network.neighbors(i)) {
            sum += 1.0 - std::abs(opinions[i] - opinions[j]);
            ++pairs;
        }
    }
    if (pairs == 0) return 0.0;
    return sum / static_cast<double>(pairs);
}

StepMetrics computeStepMetrics(const Network& network,
                               const PostStore& posts,
                               const RankerSelection& selection,
                               const std::vector<double>& opinions) {
    StepMetrics m;
    m.filterBubble = filterBubble(selection, posts, opinions);
    m.giniSuccess = successGini(posts);
    m.giniReach = reachGini(posts);
    m.homophily = homophily(network, opinions);
    return m;
}

// ---------- SuccessHistogram ----------

std::size_t SuccessHistogram::likeBin(std::int64_t likes) {
    return static_cast<std::size_t>(std::upper_bound(kLikeEdges.begin(), kLikeEdges.end(), likes) -
                                    kLikeEdges.begin());
}

std::size_t SuccessHistogram::opinionBin(double opinion) {
    // Edges 0.0, 0.1, ..., 1.0; values at or past the last edge go to the top bin
    static const std::array<double, kOpinionBins + 1> edges = [] {
        std::array<double, kOpinionBins + 1> e{};
        for (std::size_t i = 0; i < e.size(); ++i) e[i] = static_cast<double>(i) * 0.1;
        e.back() = 1.0;
        return e;
    }();
    const auto above = std::upper_bound(edges.begin(), edges.end(), opinion) - edges.begin();
    const std::ptrdiff_t bin = std::clamp<std::ptrdiff_t>(above - 1, 0, static_cast<std::ptrdiff_t>(kOpinionBins) - 1);
    return static_cast<std::size_t>(bin);
}

void SuccessHistogram::clear() {
    hist1d_.fill(0);
    for (auto& row : hist2d_) row.fill(0);
}

void SuccessHistogram::record(double opinion, std::int64_t likes) {
    const std::size_t lb = likeBin(likes);
    ++hist1d_[lb];
    ++hist2d_[opinionBin(opinion)][lb];
}

void SuccessHistogram::recordDyingPosts(const PostStore& posts, std::uint32_t slot) {
    for (std::uint32_t a = 0; a < posts.users(); ++a) {
        record(posts.opinion(a, slot), posts.likes(a, slot));
    }
}

void SuccessHistogram::recordSurvivors(const PostStore& posts) {
    for (std::uint32_t a = 0; a < posts.users(); ++a) {
        for (std::uint32_t s = 0; s < posts.history(); ++s) {
            record(posts.opinion(a, s), posts.likes(a, s));
        }
    }
}

std::int64_t SuccessHistogram::total() const {
    return std::accumulate(hist1d_.begin(), hist1d_.end(), std::int64_t{0});
}
