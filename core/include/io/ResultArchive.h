#ifndef RESULT_ARCHIVE_H
#define RESULT_ARCHIVE_H

#include "kernel/Config.h"
#include <cstdint>
#include <string>
#include <vector>

struct SimulationResult;
struct ReplicaSet;

// A named, shaped numeric array. Exactly one of f64 / i64 is populated.
struct ArchiveArray {
    enum class Type : std::uint8_t { Float64 = 'f', Int64 = 'i' };

    std::string name;
    Type type = Type::Float64;
    std::vector<std::uint64_t> shape;
    std::vector<double> f64;
    std::vector<std::int64_t> i64;

    std::uint64_t elementCount() const;
};

/**
 * In-memory set of named arrays, written as a gzip-compressed container:
 *
 *   "FEEDSIM1" | u32 count | count x { u32 name length | name | u8 type |
 *   u32 ndim | u64 dims[ndim] | element data }
 *
 * Every integer and double is stored little-endian, so archives move between
 * hosts unchanged.
 */
class ResultArchive {
public:
    void add(const std::string& name, std::vector<std::uint64_t> shape, std::vector<double> data);
    void add(const std::string& name, std::vector<std::uint64_t> shape, std::vector<std::int64_t> data);

    const ArchiveArray* find(const std::string& name) const;
    const std::vector<ArchiveArray>& arrays() const { return arrays_; }

private:
    void checkShape(const std::string& name, const std::vector<std::uint64_t>& shape, std::size_t size) const;

    std::vector<ArchiveArray> arrays_;
};

// Throws std::runtime_error on I/O or format errors.
void writeResultArchive(const ResultArchive& archive, const std::string& path);
ResultArchive readResultArchive(const std::string& path);

// Arrays named mean, pol, opinions, filter_bubble, gini_success, gini_reach,
// homophily, histogram_1d, histogram_2d (and post_likes / n_replicas where they apply)
ResultArchive toArchive(const SimulationResult& result);
ResultArchive toArchive(const ReplicaSet& replicas);

// A saved run read back from its two files.
struct SavedResults {
    SimulationConfig config;
    ResultArchive arrays;
};

// Writes <base>.arrays.gz and <base>_config.json, creating parent directories.
void saveResults(const ReplicaSet& replicas, const std::string& basePath);
void saveResults(const SimulationResult& result, const std::string& basePath);
SavedResults loadResults(const std::string& basePath);

#endif
