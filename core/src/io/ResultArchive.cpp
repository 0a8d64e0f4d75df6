#include "io/ResultArchive.h"
#include "io/Snapshot.h"
#include "kernel/Kernel.h"
#include "kernel/Replicas.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <zlib.h>

namespace {
    constexpr char kMagic[8] = {'F', 'E', 'E', 'D', 'S', 'I', 'M', '1'};
    constexpr std::size_t kChunkElements = 1u << 16;

    // Every multi-byte value is stored little-endian, whatever the host order
    template <class U>
    void storeLe(U bits, unsigned char* out) {
        for (std::size_t b = 0; b < sizeof(U); ++b) {
            out[b] = static_cast<unsigned char>(static_cast<std::uint64_t>(bits) >> (8 * b));
        }
    }

    template <class U>
    U loadLe(const unsigned char* in) {
        std::uint64_t bits = 0;
        for (std::size_t b = 0; b < sizeof(U); ++b) {
            bits |= static_cast<std::uint64_t>(in[b]) << (8 * b);
        }
        return static_cast<U>(bits);
    }

    std::uint64_t toBits(double v) {
        std::uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        return bits;
    }
    std::uint64_t toBits(std::int64_t v) { return static_cast<std::uint64_t>(v); }

    template <class T>
    T fromBits(std::uint64_t bits);
    template <>
    double fromBits<double>(std::uint64_t bits) {
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }
    template <>
    std::int64_t fromBits<std::int64_t>(std::uint64_t bits) { return static_cast<std::int64_t>(bits); }

    // Owns a gzFile for the duration of one read or write
    class GzHandle {
    public:
        GzHandle(const std::string& path, const char* mode) : path_(path), file_(gzopen(path.c_str(), mode)) {
            if (!file_) {
                throw std::runtime_error("Could not open archive '" + path + "'");
            }
        }
        ~GzHandle() {
            if (file_) gzclose(file_);
        }
        GzHandle(const GzHandle&) = delete;
        GzHandle& operator=(const GzHandle&) = delete;

        void write(const void* data, std::size_t bytes) {
            const auto* p = static_cast<const char*>(data);
            while (bytes > 0) {
                const unsigned chunk = static_cast<unsigned>(std::min<std::size_t>(bytes, 1u << 30));
                if (gzwrite(file_, p, chunk) != static_cast<int>(chunk)) {
                    throw std::runtime_error("Write failed for archive '" + path_ + "'");
                }
                p += chunk;
                bytes -= chunk;
            }
        }

        void read(void* data, std::size_t bytes) {
            auto* p = static_cast<char*>(data);
            while (bytes > 0) {
                const unsigned chunk = static_cast<unsigned>(std::min<std::size_t>(bytes, 1u << 30));
                if (gzread(file_, p, chunk) != static_cast<int>(chunk)) {
                    throw std::runtime_error("Truncated or corrupt archive '" + path_ + "'");
                }
                p += chunk;
                bytes -= chunk;
            }
        }

        template <class U>
        void put(U value) {
            unsigned char buf[sizeof(U)];
            storeLe(value, buf);
            write(buf, sizeof(buf));
        }

        template <class U>
        U get() {
            unsigned char buf[sizeof(U)];
            read(buf, sizeof(buf));
            return loadLe<U>(buf);
        }

        // 8-byte elements (double or int64), encoded a chunk at a time
        template <class T>
        void putArray(const std::vector<T>& values) {
            std::vector<unsigned char> buf;
            for (std::size_t i = 0; i < values.size(); i += kChunkElements) {
                const std::size_t m = std::min(kChunkElements, values.size() - i);
                buf.resize(m * sizeof(std::uint64_t));
                for (std::size_t j = 0; j < m; ++j) {
                    storeLe(toBits(values[i + j]), &buf[j * sizeof(std::uint64_t)]);
                }
                write(buf.data(), buf.size());
            }
        }

        template <class T>
        std::vector<T> getArray(std::uint64_t count) {
            std::vector<T> values;
            values.reserve(static_cast<std::size_t>(count));
            std::vector<unsigned char> buf;
            while (values.size() < count) {
                const std::size_t m = static_cast<std::size_t>(
                    std::min<std::uint64_t>(kChunkElements, count - values.size()));
                buf.resize(m * sizeof(std::uint64_t));
                read(buf.data(), buf.size());
                for (std::size_t j = 0; j < m; ++j) {
                    values.push_back(fromBits<T>(loadLe<std::uint64_t>(&buf[j * sizeof(std::uint64_t)])));
                }
            }
            return values;
        }

        void close() {
            const int rc = gzclose(file_);
            file_ = nullptr;
            if (rc != Z_OK) {
                throw std::runtime_error("Could not finish archive '" + path_ + "'");
            }
        }

    private:
        std::string path_;
        gzFile file_;
    };

    void ensureParentDirectory(const std::string& path) {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    void writeTextFile(const std::string& path, const std::string& text) {
        ensureParentDirectory(path);
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error("Could not open '" + path + "' for writing");
        }
        out << text;
        if (!out) {
            throw std::runtime_error("Write failed for '" + path + "'");
        }
    }

    std::vector<std::int64_t> flattenHistogram2d(const SimulationResult& r) {
        std::vector<std::int64_t> out;
        out.reserve(SuccessHistogram::kOpinionBins * SuccessHistogram::kLikeBins);
        for (const auto& row : r.histogram2d) {
            out.insert(out.end(), row.begin(), row.end());
        }
        return out;
    }
}

std::uint64_t ArchiveArray::elementCount() const {
    std::uint64_t count = 1;
    for (auto d : shape) count *= d;
    return count;
}

void ResultArchive::checkShape(const std::string& name, const std::vector<std::uint64_t>& shape, std::size_t size) const {
    std::uint64_t count = 1;
    for (auto d : shape) count *= d;
    if (count != size) {
        throw std::invalid_argument("array '" + name + "' holds " + std::to_string(size) +
                                    " values but its shape needs " + std::to_string(count));
    }
    if (find(name)) {
        throw std::invalid_argument("duplicate array name '" + name + "'");
    }
}

void ResultArchive::add(const std::string& name, std::vector<std::uint64_t> shape, std::vector<double> data) {
    checkShape(name, shape, data.size());
    ArchiveArray a;
    a.name = name;
    a.type = ArchiveArray::Type::Float64;
    a.shape = std::move(shape);
    a.f64 = std::move(data);
    arrays_.push_back(std::move(a));
}

void ResultArchive::add(const std::string& name, std::vector<std::uint64_t> shape, std::vector<std::int64_t> data) {
    checkShape(name, shape, data.size());
    ArchiveArray a;
    a.name = name;
    a.type = ArchiveArray::Type::Int64;
    a.shape = std::move(shape);
    a.i64 = std::move(data);
    arrays_.push_back(std::move(a));
}

const ArchiveArray* ResultArchive::find(const std::string& name) const {
    for (const auto& a : arrays_) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

void writeResultArchive(const ResultArchive& archive, const std::string& path) {
    ensureParentDirectory(path);
    GzHandle gz(path, "wb9");
    gz.write(kMagic, sizeof(kMagic));
    gz.put(static_cast<std::uint32_t>(archive.arrays().size()));
    for (const auto& a : archive.arrays()) {
        gz.put(static_cast<std::uint32_t>(a.name.size()));
        gz.write(a.name.data(), a.name.size());
        gz.put(static_cast<std::uint8_t>(a.type));
        gz.put(static_cast<std::uint32_t>(a.shape.size()));
        for (auto d : a.shape) gz.put(d);
        if (a.type == ArchiveArray::Type::Float64) {
            gz.putArray(a.f64);
        } else {
            gz.putArray(a.i64);
        }
    }
    gz.close();
}

ResultArchive readResultArchive(const std::string& path) {
    GzHandle gz(path, "rb");
    char magic[sizeof(kMagic)];
    gz.read(magic, sizeof(magic));
    if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw std::runtime_error("'" + path + "' is not a result archive");
    }

    ResultArchive archive;
    const auto count = gz.get<std::uint32_t>();
    for (std::uint32_t i = 0; i < count; ++i) {
        const auto nameLen = gz.get<std::uint32_t>();
        std::string name(nameLen, '\0');
        gz.read(name.data(), nameLen);
        const auto type = gz.get<std::uint8_t>();
        const auto ndim = gz.get<std::uint32_t>();
        std::vector<std::uint64_t> shape(ndim);
        std::uint64_t elements = 1;
        for (auto& d : shape) {
            d = gz.get<std::uint64_t>();
            elements *= d;
        }

        if (type == static_cast<std::uint8_t>(ArchiveArray::Type::Float64)) {
            archive.add(name, std::move(shape), gz.getArray<double>(elements));
        } else if (type == static_cast<std::uint8_t>(ArchiveArray::Type::Int64)) {
            archive.add(name, std::move(shape), gz.getArray<std::int64_t>(elements));
        } else {
            throw std::runtime_error("Unknown element type in '" + path + "' (array '" + name + "')");
        }
    }
    return archive;
}

ResultArchive toArchive(const SimulationResult& r) {
    const std::uint64_t T = r.nSteps;
    const std::uint64_t N = r.nUsers;
    const std::uint64_t O = SuccessHistogram::kOpinionBins;
    const std::uint64_t L = SuccessHistogram::kLikeBins;
    const auto& s = r.series;

    ResultArchive archive;
    archive.add("mean", {T}, s.mean);
    archive.add("pol", {T}, s.pol);
    archive.add("opinions", {T, N}, s.opinions);
    archive.add("filter_bubble", {T}, s.filterBubble);
    archive.add("gini_success", {T}, s.giniSuccess);
    archive.add("gini_reach", {T}, s.giniReach);
    archive.add("homophily", {T}, s.homophily);
    archive.add("histogram_1d", {L}, std::vector<std::int64_t>(r.histogram1d.begin(), r.histogram1d.end()));
    archive.add("histogram_2d", {O, L}, flattenHistogram2d(r));
    archive.add("post_likes", {N, static_cast<std::uint64_t>(r.postHistory)}, r.postLikes);
    return archive;
}

ResultArchive toArchive(const ReplicaSet& set) {
    const std::uint64_t R = set.nReplicas;
    const std::uint64_t S = set.nSavedTrajectories;
    const std::uint64_t T = set.nSteps;
    const std::uint64_t N = set.nUsers;
    const std::uint64_t O = SuccessHistogram::kOpinionBins;
    const std::uint64_t L = SuccessHistogram::kLikeBins;

    ResultArchive archive;
    archive.add("n_replicas", {1}, std::vector<std::int64_t>{static_cast<std::int64_t>(R)});
    archive.add("n_saved_trajectories", {1}, std::vector<std::int64_t>{static_cast<std::int64_t>(S)});
    archive.add("mean", {R, T}, set.mean);
    archive.add("pol", {R, T}, set.pol);
    archive.add("filter_bubble", {R, T}, set.filterBubble);
    archive.add("gini_success", {R, T}, set.giniSuccess);
    archive.add("gini_reach", {R, T}, set.giniReach);
    archive.add("homophily", {R, T}, set.homophily);
    archive.add("histogram_1d", {R, L}, set.histogram1d);
    archive.add("histogram_2d", {R, O, L}, set.histogram2d);
    archive.add("opinions", {S, T, N}, set.opinions);
    return archive;
}

void saveResults(const ReplicaSet& replicas, const std::string& basePath) {
    const std::string dataPath = basePath + ".arrays.gz";
    const std::string configPath = basePath + "_config.json";
    writeResultArchive(toArchive(replicas), dataPath);
    writeTextFile(configPath, configToJson(replicas.config));
    std::cerr << "Saved data: " << dataPath << "\n";
    std::cerr << "Saved config: " << configPath << "\n";
}

void saveResults(const SimulationResult& result, const std::string& basePath) {
    const std::string dataPath = basePath + ".arrays.gz";
    const std::string configPath = basePath + "_config.json";
    writeResultArchive(toArchive(result), dataPath);
    writeTextFile(configPath, configToJson(result.config));
    std::cerr << "Saved data: " << dataPath << "\n";
    std::cerr << "Saved config: " << configPath << "\n";
}

SavedResults loadResults(const std::string& basePath) {
    SavedResults saved;
    saved.config = loadConfig(basePath + "_config.json");
    saved.arrays = readResultArchive(basePath + ".arrays.gz");
    return saved;
}
