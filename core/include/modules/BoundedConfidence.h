#ifndef BOUNDED_CONFIDENCE_H
#define BOUNDED_CONFIDENCE_H

#include <cstdint>
#include <random>
#include <vector>

class PostStore;
struct RankerSelection;
struct SimulationState;

/**
 * Bounded confidence opinion update driven by ranked posts.
 *
 * Every user reads its k selected posts in slot order. A post within epsilon
 * of the reader's *current* opinion is liked and pulls the reader by
 * mu * (post - opinion); the shift is visible when the next slot is read.
 * Posts outside epsilon are only marked seen. After all slots each user
 * publishes its new opinion into the shared current buffer slot.
 */
class BoundedConfidenceModel {
public:
    BoundedConfidenceModel() = default;
    BoundedConfidenceModel(double epsilon, double mu);

    void configure(double epsilon, double mu);

    // Uniform initial opinions in [0, 1).
    std::vector<double> initialOpinions(std::uint32_t users, std::mt19937_64& rng) const;

    // One step: read, like, update, publish, advance the buffer cursor.
    void update(const RankerSelection& selection, PostStore& posts, SimulationState& state) const;

    double epsilon() const { return epsilon_; }
    double mu() const { return mu_; }

private:
    void readSlot(std::uint32_t slot,
                  const RankerSelection& selection,
                  PostStore& posts,
                  std::vector<double>& current,
                  std::vector<std::int64_t>& authorLikes) const;

    double epsilon_ = 0.2;
    double mu_ = 0.1;
};

#endif
