#ifndef RANKING_H
#define RANKING_H

#include "kernel/Config.h"
#include <cstdint>
#include <vector>

class Network;
class PostStore;
struct SimulationState;

// Marks an empty selection cell.
constexpr std::int32_t kNoPost = -1;

/**
 * Posts chosen for every user in one step: an (users x k) pair of author and
 * slot indices, row-major. Cells past the number of eligible posts hold kNoPost
 * in both arrays.
 */
struct RankerSelection {
    std::uint32_t users = 0;
    std::uint32_t k = 0;
    std::vector<std::int32_t> authors;
    std::vector<std::int32_t> times;

    void reset(std::uint32_t nUsers, std::uint32_t kPosts) {
        users = nUsers;
        k = kPosts;
        authors.assign(static_cast<std::size_t>(nUsers) * kPosts, kNoPost);
        times.assign(static_cast<std::size_t>(nUsers) * kPosts, kNoPost);
    }

    std::int32_t author(std::uint32_t user, std::uint32_t slot) const { return authors[cell(user, slot)]; }
    std::int32_t time(std::uint32_t user, std::uint32_t slot) const { return times[cell(user, slot)]; }
    bool valid(std::uint32_t user, std::uint32_t slot) const { return authors[cell(user, slot)] != kNoPost; }

    void set(std::uint32_t user, std::uint32_t slot, std::uint32_t a, std::uint32_t t) {
        authors[cell(user, slot)] = static_cast<std::int32_t>(a);
        times[cell(user, slot)] = static_cast<std::int32_t>(t);
    }

    std::size_t validCount() const;

private:
    std::size_t cell(std::uint32_t user, std::uint32_t slot) const {
        return static_cast<std::size_t>(user) * k + slot;
    }
};

// An (author, slot) post a viewer may be shown.
struct Candidate {
    std::uint32_t author = 0;
    std::uint32_t slot = 0;
    double opinion = 0.0;
};

// Read-only inputs to one ranking pass. Not retained past the call.
struct RankingContext {
    const Network& network;
    const PostStore& posts;
    const SimulationState& state;
    double epsilon = 0.0;         // confidence bound of the opinion model
    std::uint32_t k = 1;
    std::uint64_t stepSeed = 0;   // per-viewer streams are derived from this
};

// Posts by the viewer's neighbours the viewer has not seen yet, ordered by
// author then slot.
std::vector<Candidate> eligiblePosts(const Network& network, const PostStore& posts, std::uint32_t viewer);

// Runs the policy for every user. Rows are independent and ranked in parallel;
// the outcome depends only on the context, not on the thread count.
RankerSelection rankPosts(const RankerSpec& spec, const RankingContext& ctx);

#endif
