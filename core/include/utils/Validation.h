#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <stdexcept>
#include <string>

// Invariant checks for debug builds. Compiled out under NDEBUG.
namespace validation {

constexpr double kOpinionTolerance = 1e-12;

inline void checkFinite(double value, const char* where) {
#ifndef NDEBUG
    if (!std::isfinite(value)) {
        throw std::logic_error(std::string("non-finite value in ") + where);
    }
#else
    (void)value;
    (void)where;
#endif
}

inline void checkOpinion(double value, const char* where) {
#ifndef NDEBUG
    if (!std::isfinite(value) || value < -kOpinionTolerance || value > 1.0 + kOpinionTolerance) {
        throw std::logic_error(std::string("opinion ") + std::to_string(value) +
                               " left [0, 1] in " + where);
    }
#else
    (void)value;
    (void)where;
#endif
}

inline void checkNonNegative(double value, const char* where) {
#ifndef NDEBUG
    if (!(value >= 0.0)) {
        throw std::logic_error(std::string("negative value in ") + where);
    }
#else
    (void)value;
    (void)where;
#endif
}

} // namespace validation

#endif
