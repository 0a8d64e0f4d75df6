#include "utils/Sampling.h"
#include <algorithm>
#include <cmath>
#include <numeric>

std::uint64_t mixSeed(std::uint64_t base, std::uint64_t stream) {
    std::uint64_t z = base ^ (stream * 0x9e3779b97f4a7c15ULL);
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

std::vector<std::size_t> sampleWithoutReplacement(std::size_t population,
                                                  std::size_t count,
                                                  std::mt19937_64& rng) {
    count = std::min(count, population);
    std::vector<std::size_t> idx(population);
    std::iota(idx.begin(), idx.end(), std::size_t{0});

    // Partial Fisher-Yates: the first `count` entries end up uniformly chosen
    for (std::size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, population - 1);
        std::swap(idx[i], idx[pick(rng)]);
    }
    idx.resize(count);
    return idx;
}

std::vector<std::size_t> weightedSampleWithoutReplacement(const std::vector<double>& weights,
                                                          std::size_t count,
                                                          std::mt19937_64& rng) {
    const std::size_t n = weights.size();
    count = std::min(count, n);

    std::vector<std::size_t> remaining(n);
    std::iota(remaining.begin(), remaining.end(), std::size_t{0});
    // Rescale so the largest weight is 1; infinite weights share the whole mass
    std::vector<double> w(n, 0.0);
    double maxW = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double wi = weights[i];
        if (wi > 0.0) maxW = std::max(maxW, wi);  // also skips NaN
    }
    for (std::size_t i = 0; i < n; ++i) {
        const double wi = weights[i];
        if (!(wi > 0.0)) continue;
        if (std::isinf(maxW)) {
            w[i] = std::isinf(wi) ? 1.0 : 0.0;
        } else {
            w[i] = wi / maxW;
        }
    }

    std::vector<std::size_t> chosen;
    chosen.reserve(count);

    for (std::size_t draw = 0; draw < count; ++draw) {
        double total = 0.0;
        for (std::size_t r = 0; r < remaining.size(); ++r) {
            total += w[remaining[r]];
        }

        std::size_t pos = 0;
        if (total > 0.0) {
            std::uniform_real_distribution<double> U(0.0, total);
            const double u = U(rng);
            double acc = 0.0;
            std::size_t lastPositive = remaining.size();
            bool found = false;
            for (std::size_t r = 0; r < remaining.size(); ++r) {
                const double wr = w[remaining[r]];
                if (wr <= 0.0) continue;
                lastPositive = r;
                acc += wr;
                if (u < acc) {
                    pos = r;
                    found = true;
                    break;
                }
            }
            // Rounding can leave u just above the accumulated mass
            if (!found) pos = lastPositive;
        } else {
            std::uniform_int_distribution<std::size_t> pick(0, remaining.size() - 1);
            pos = pick(rng);
        }

        chosen.push_back(remaining[pos]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(pos));
    }
    return chosen;
}
