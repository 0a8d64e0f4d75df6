#include "kernel/PostStore.h"
#include <algorithm>
#include <stdexcept>
#include <string>

PostStore::PostStore(std::uint32_t users, std::uint32_t history, const std::vector<double>& initialOpinions) {
    initialize(users, history, initialOpinions);
}

void PostStore::initialize(std::uint32_t users, std::uint32_t history, const std::vector<double>& initialOpinions) {
    if (history == 0) {
        throw std::invalid_argument("post history must be > 0");
    }
    if (initialOpinions.size() != users) {
        throw std::invalid_argument("expected " + std::to_string(users) + " initial opinions (got " +
                                    std::to_string(initialOpinions.size()) + ")");
    }

    users_ = users;
    history_ = history;
    const std::size_t posts = static_cast<std::size_t>(users) * history;

    opinions_.resize(posts);
    for (std::uint32_t a = 0; a < users; ++a) {
        std::fill_n(opinions_.begin() + static_cast<std::ptrdiff_t>(post(a, 0)), history, initialOpinions[a]);
    }
    likes_.assign(posts, 0);
    views_.assign(posts, 0);
    seen_.assign(posts * users, 0);
}

void PostStore::checkPost(std::uint32_t author, std::uint32_t slot) const {
    if (author >= users_ || slot >= history_) {
        throw std::out_of_range("post (" + std::to_string(author) + ", " + std::to_string(slot) +
                                ") outside store of " + std::to_string(users_) + "x" + std::to_string(history_));
    }
}

void PostStore::write(std::uint32_t author, std::uint32_t slot, double opinion) {
    checkPost(author, slot);
    const std::size_t p = post(author, slot);
    opinions_[p] = opinion;
    likes_[p] = 0;
    views_[p] = 0;
    std::fill_n(seen_.begin() + static_cast<std::ptrdiff_t>(p * users_), users_, std::uint8_t{0});
}

void PostStore::markSeen(std::uint32_t author, std::uint32_t slot, std::uint32_t viewer) {
    checkPost(author, slot);
    if (viewer >= users_) {
        throw std::out_of_range("viewer " + std::to_string(viewer) + " outside store of " +
                                std::to_string(users_) + " users");
    }
    const std::size_t p = post(author, slot);
    auto& bit = seen_[p * users_ + viewer];
    if (!bit) {
        bit = 1;
        ++views_[p];
    }
}

void PostStore::addLikes(std::uint32_t author, std::uint32_t slot, std::int64_t delta) {
    checkPost(author, slot);
    if (delta < 0) {
        throw std::invalid_argument("like counts only grow (delta " + std::to_string(delta) + ")");
    }
    likes_[post(author, slot)] += delta;
}
