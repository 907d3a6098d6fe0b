#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Numeric guards for the simulation core.
// Unlike debug asserts these are always on: a NaN or Inf in the resource
// state is a fatal error that must reach the caller.
namespace validation {

inline void checkFinite(double value, const char* context) {
    if (!std::isfinite(value)) {
        throw std::runtime_error(std::string("non-finite value in ") + context +
                                 " (got " + std::to_string(value) + ")");
    }
}

inline void checkFinite(const std::vector<double>& values, const char* context) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw std::runtime_error(std::string("non-finite value in ") + context +
                                     " at index " + std::to_string(i));
        }
    }
}

inline void checkNonNegative(double value, const char* context) {
    if (value < 0.0) {
        throw std::runtime_error(std::string("negative value in ") + context +
                                 " (got " + std::to_string(value) + ")");
    }
}

// Config-time variants raise invalid_argument so construction fails fast.
inline void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be > 0 (got " +
                                    std::to_string(value) + ")");
    }
}

inline void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be finite");
    }
}

inline void requireSize(std::size_t actual, std::size_t expected, const char* name) {
    if (actual != expected) {
        throw std::invalid_argument(std::string(name) + " has " + std::to_string(actual) +
                                    " entries, expected " + std::to_string(expected));
    }
}

}  // namespace validation

#endif
