#ifndef SAMPLING_H
#define SAMPLING_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Derives an independent stream seed from a base seed (splitmix64 finaliser).
std::uint64_t mixSeed(std::uint64_t base, std::uint64_t stream);

// Uniformly random ordered subset of {0..population-1} of size min(count, population).
std::vector<std::size_t> sampleWithoutReplacement(std::size_t population,
                                                  std::size_t count,
                                                  std::mt19937_64& rng);

/**
 * Draws min(count, weights.size()) distinct indices, one at a time, each with
 * probability proportional to its weight among the indices not drawn yet.
 *
 * Negative and NaN weights count as zero. Weights are taken relative to the
 * largest one, so huge finite weights keep their ratios; infinite weights split
 * the mass evenly among themselves. Only when the remaining mass is zero is the
 * draw uniform over the remaining indices.
 */
std::vector<std::size_t> weightedSampleWithoutReplacement(const std::vector<double>& weights,
                                                          std::size_t count,
                                                          std::mt19937_64& rng);

#endif
