#ifndef POST_STORE_H
#define POST_STORE_H

#include <cstdint>
#include <vector>

/**
 * Per-author circular post buffer.
 *
 * A post is addressed by (author, slot) with slot in [0, history). Each slot
 * holds the author's opinion when the post was written, its like count and a
 * viewer bitmap of length n. Writing a slot replaces all three; the previous
 * occupant is gone afterwards, so anything that must survive it (histograms)
 * has to read it first.
 *
 * All slots start out holding each author's initial opinion with zero likes
 * and no viewers.
 */
class PostStore {
public:
    PostStore() = default;
    PostStore(std::uint32_t users, std::uint32_t history, const std::vector<double>& initialOpinions);

    void initialize(std::uint32_t users, std::uint32_t history, const std::vector<double>& initialOpinions);

    std::uint32_t users() const { return users_; }
    std::uint32_t history() const { return history_; }
    std::size_t postCount() const { return opinions_.size(); }

    // Unchecked point queries (hot path for rankers and metrics)
    double opinion(std::uint32_t author, std::uint32_t slot) const { return opinions_[post(author, slot)]; }
    std::int64_t likes(std::uint32_t author, std::uint32_t slot) const { return likes_[post(author, slot)]; }
    std::uint32_t viewCount(std::uint32_t author, std::uint32_t slot) const { return views_[post(author, slot)]; }
    bool seenBy(std::uint32_t author, std::uint32_t slot, std::uint32_t viewer) const {
        return seen_[post(author, slot) * users_ + viewer] != 0;
    }

    // Mutators check their coordinates and throw std::out_of_range.
    void write(std::uint32_t author, std::uint32_t slot, double opinion);
    void markSeen(std::uint32_t author, std::uint32_t slot, std::uint32_t viewer);
    void addLikes(std::uint32_t author, std::uint32_t slot, std::int64_t delta);

    // Flat [author * history + slot] views of the whole buffer
    const std::vector<double>& opinions() const { return opinions_; }
    const std::vector<std::int64_t>& likes() const { return likes_; }
    const std::vector<std::uint32_t>& viewCounts() const { return views_; }

private:
    std::size_t post(std::uint32_t author, std::uint32_t slot) const {
        return static_cast<std::size_t>(author) * history_ + slot;
    }
    void checkPost(std::uint32_t author, std::uint32_t slot) const;

    std::uint32_t users_ = 0;
    std::uint32_t history_ = 0;
    std::vector<double> opinions_;
    std::vector<std::int64_t> likes_;
    std::vector<std::uint32_t> views_;     // cached row sums of seen_
    std::vector<std::uint8_t> seen_;       // [author][slot][viewer]
};

#endif
