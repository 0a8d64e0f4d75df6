#include "modules/Ranking.h"
#include "kernel/Network.h"
#include "kernel/PostStore.h"
#include "kernel/SimulationState.h"
#include "utils/Sampling.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

std::size_t RankerSelection::validCount() const {
    return static_cast<std::size_t>(std::count_if(authors.begin(), authors.end(),
                                                  [](std::int32_t a) { return a != kNoPost; }));
}

std::vector<Candidate> eligiblePosts(const Network& network, const PostStore& posts, std::uint32_t viewer) {
    std::vector<Candidate> out;
    const std::uint32_t H = posts.history();
    const auto& nbrs = network.neighbors(viewer);
    out.reserve(nbrs.size() * H);
    for (std::uint32_t author : nbrs) {
        for (std::uint32_t slot = 0; slot < H; ++slot) {
            if (posts.seenBy(author, slot, viewer)) continue;
            out.push_back(Candidate{author, slot, posts.opinion(author, slot)});
        }
    }
    return out;
}

namespace {

// The k members of `pool` closest to `reference`; ties keep pool order.
std::vector<std::size_t> closestTo(const std::vector<Candidate>& cands,
                                   std::vector<std::size_t> pool,
                                   double reference,
                                   std::size_t k) {
    std::stable_sort(pool.begin(), pool.end(), [&](std::size_t a, std::size_t b) {
        return std::abs(cands[a].opinion - reference) < std::abs(cands[b].opinion - reference);
    });
    if (pool.size() > k) pool.resize(k);
    return pool;
}

// Uniform subset of `pool`, taken whole (in order) when it fits.
std::vector<std::size_t> randomSubset(const std::vector<std::size_t>& pool,
                                      std::size_t k,
                                      std::mt19937_64& rng) {
    if (pool.size() <= k) return pool;
    std::vector<std::size_t> out;
    out.reserve(k);
    for (auto i : sampleWithoutReplacement(pool.size(), k, rng)) {
        out.push_back(pool[i]);
    }
    return out;
}

// (count + 1)^alpha for every count, scaled so the largest weight is 1. Worked
// in log space so a large alpha cannot overflow.
std::vector<double> powerWeights(const std::vector<double>& counts, double alpha) {
    std::vector<double> logs(counts.size());
    double maxLog = -std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < counts.size(); ++i) {
        logs[i] = alpha * std::log1p(counts[i]);
        maxLog = std::max(maxLog, logs[i]);
    }
    for (auto& l : logs) {
        if (std::isfinite(maxLog)) {
            l = std::exp(l - maxLog);
        } else {
            l = (l == maxLog) ? 1.0 : 0.0;
        }
    }
    return logs;
}

std::vector<std::size_t> allIndices(std::size_t n) {
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    return idx;
}

// Chooses indices into one viewer's candidate list. Every overload returns at
// most k indices and only ever indexes `cands`, so ineligible posts cannot be
// picked.
struct ViewerRanker {
    const RankingContext& ctx;
    std::uint32_t viewer;
    const std::vector<Candidate>& cands;
    std::mt19937_64& rng;

    double viewerOpinion() const { return ctx.state.opinions[viewer]; }

    bool withinEpsilon(const Candidate& c) const {
        return std::abs(c.opinion - viewerOpinion()) < ctx.epsilon;
    }

    std::vector<std::size_t> operator()(const RandomRanker&) const {
        return randomSubset(allIndices(cands.size()), ctx.k, rng);
    }

    std::vector<std::size_t> operator()(const ClosestRanker&) const {
        return closestTo(cands, allIndices(cands.size()), viewerOpinion(), ctx.k);
    }

    std::vector<std::size_t> operator()(const EngagementRanker& r) const {
        std::vector<double> likes(cands.size());
        for (std::size_t i = 0; i < cands.size(); ++i) {
            likes[i] = static_cast<double>(ctx.posts.likes(cands[i].author, cands[i].slot));
        }
        return weightedSampleWithoutReplacement(powerWeights(likes, r.alpha), ctx.k, rng);
    }

    std::vector<std::size_t> operator()(const UserSuccessRanker& r) const {
        const auto& success = ctx.state.authorCumulativeLikes;
        std::vector<double> authorLikes(cands.size());
        for (std::size_t i = 0; i < cands.size(); ++i) {
            authorLikes[i] = static_cast<double>(success[cands[i].author]);
        }
        return weightedSampleWithoutReplacement(powerWeights(authorLikes, r.alpha), ctx.k, rng);
    }

    std::vector<std::size_t> operator()(const NarrativeRanker& r) const {
        return closestTo(cands, allIndices(cands.size()), r.target, ctx.k);
    }

    // Engagement-safe posts only, pulled toward the target. No fallback.
    std::vector<std::size_t> operator()(const EvilRanker& r) const {
        std::vector<std::size_t> inside;
        for (std::size_t i = 0; i < cands.size(); ++i) {
            if (withinEpsilon(cands[i])) inside.push_back(i);
        }
        if (inside.empty()) return {};
        return closestTo(cands, std::move(inside), r.target, ctx.k);
    }

    // Random engagement-safe posts first, topped up with random outside ones.
    std::vector<std::size_t> operator()(const DiverseEngagementRanker&) const {
        std::vector<std::size_t> inside, outside;
        for (std::size_t i = 0; i < cands.size(); ++i) {
            (withinEpsilon(cands[i]) ? inside : outside).push_back(i);
        }
        auto chosen = randomSubset(inside, ctx.k, rng);
        if (chosen.size() < ctx.k) {
            auto fill = randomSubset(outside, ctx.k - chosen.size(), rng);
            chosen.insert(chosen.end(), fill.begin(), fill.end());
        }
        return chosen;
    }
};

} // namespace

RankerSelection rankPosts(const RankerSpec& spec, const RankingContext& ctx) {
    const std::uint32_t n = ctx.network.size();
    RankerSelection sel;
    sel.reset(n, ctx.k);

    #pragma omp parallel for schedule(dynamic)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        const auto viewer = static_cast<std::uint32_t>(i);
        const auto cands = eligiblePosts(ctx.network, ctx.posts, viewer);
        if (cands.empty()) continue;

        std::mt19937_64 rng(mixSeed(ctx.stepSeed, viewer));
        const auto chosen = std::visit(ViewerRanker{ctx, viewer, cands, rng}, spec);

        for (std::size_t j = 0; j < chosen.size() && j < ctx.k; ++j) {
            const auto& c = cands[chosen[j]];
            sel.set(viewer, static_cast<std::uint32_t>(j), c.author, c.slot);
        }
    }
    return sel;
}
