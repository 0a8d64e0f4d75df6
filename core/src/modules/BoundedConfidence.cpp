#include "modules/BoundedConfidence.h"
#include "kernel/PostStore.h"
#include "kernel/SimulationState.h"
#include "modules/Ranking.h"
#include "utils/Validation.h"
#include <cmath>
#include <stdexcept>
#include <string>

BoundedConfidenceModel::BoundedConfidenceModel(double epsilon, double mu) {
    configure(epsilon, mu);
}

void BoundedConfidenceModel::configure(double epsilon, double mu) {
    if (!std::isfinite(epsilon) || epsilon < 0.0) {
        throw std::invalid_argument("epsilon must be >= 0 (got " + std::to_string(epsilon) + ")");
    }
    if (!std::isfinite(mu) || mu < 0.0 || mu > 1.0) {
        throw std::invalid_argument("mu must be in [0, 1] (got " + std::to_string(mu) + ")");
    }
    epsilon_ = epsilon;
    mu_ = mu;
}

std::vector<double> BoundedConfidenceModel::initialOpinions(std::uint32_t users, std::mt19937_64& rng) const {
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<double> out(users);
    for (auto& o : out) o = U(rng);
    return out;
}

void BoundedConfidenceModel::readSlot(std::uint32_t slot,
                                      const RankerSelection& selection,
                                      PostStore& posts,
                                      std::vector<double>& current,
                                      std::vector<std::int64_t>& authorLikes) const {
    const std::uint32_t n = selection.users;
    std::vector<std::uint8_t> liked(n, 0);

    // Readers are independent within a slot; post opinions do not change until publish
    #pragma omp parallel for schedule(static)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        const auto user = static_cast<std::uint32_t>(i);
        if (!selection.valid(user, slot)) continue;

        const auto a = static_cast<std::uint32_t>(selection.author(user, slot));
        const auto t = static_cast<std::uint32_t>(selection.time(user, slot));
        const double diff = posts.opinion(a, t) - current[user];
        if (std::abs(diff) < epsilon_) {
            current[user] += mu_ * diff;
            liked[user] = 1;
        }
    }

    // Several readers may share a post; counters are applied serially
    for (std::uint32_t user = 0; user < n; ++user) {
        if (!selection.valid(user, slot)) continue;
        const auto a = static_cast<std::uint32_t>(selection.author(user, slot));
        const auto t = static_cast<std::uint32_t>(selection.time(user, slot));
        if (liked[user]) {
            validation::checkOpinion(current[user], "BoundedConfidenceModel::readSlot");
            posts.addLikes(a, t, 1);
            ++authorLikes[a];
        }
        posts.markSeen(a, t, user);
    }
}

void BoundedConfidenceModel::update(const RankerSelection& selection, PostStore& posts, SimulationState& state) const {
    const std::uint32_t n = posts.users();
    if (selection.users != n || state.opinions.size() != n) {
        throw std::invalid_argument("selection, post store and state disagree on user count");
    }

    std::vector<double> current = state.opinions;

    // Slot order matters: each read sees the drift caused by the previous one
    for (std::uint32_t slot = 0; slot < selection.k; ++slot) {
        readSlot(slot, selection, posts, current, state.authorCumulativeLikes);
    }

    state.opinions = std::move(current);

    const std::uint32_t t = state.currentTimeIdx;
    for (std::uint32_t user = 0; user < n; ++user) {
        posts.write(user, t, state.opinions[user]);
    }
    state.currentTimeIdx = (t + 1) % posts.history();
}
