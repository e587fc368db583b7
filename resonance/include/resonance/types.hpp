#pragma once
// Core types: components, bounds, errors
//
// A vector is a plain sequence of doubles. Every component
// lives in [COMPONENT_MIN, COMPONENT_MAX].

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace resonance {

// Default dimensionality of a resonance vector
constexpr size_t DEFAULT_DIM = 11;

// Default per-step pull strength
constexpr double DEFAULT_FACTOR = 0.1;

// Hard bounds for every component
constexpr double COMPONENT_MIN = -1.0;
constexpr double COMPONENT_MAX = 1.0;

using Components = std::vector<double>;

// Base for all resonance errors
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad construction parameters (dimensionality, out-of-range components, config values)
class InvalidConfiguration : public Error {
public:
    explicit InvalidConfiguration(const std::string& what)
        : Error("invalid configuration: " + what) {}
};

// Source length differs from the vector length
class DimensionMismatch : public Error {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : Error("dimension mismatch: expected " + std::to_string(expected) +
                ", got " + std::to_string(actual))
        , expected_(expected)
        , actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Inner product; callers check lengths
inline double dot(const Components& a, const Components& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

// L2 distance between equal-length sequences
inline double distance(const Components& a, const Components& b) {
    double sum_sq = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = a[i] - b[i];
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq);
}

inline bool in_bounds(double x) {
    return x >= COMPONENT_MIN && x <= COMPONENT_MAX;
}

// Clamp every component into bounds, returns how many were moved.
// Components must be finite; stabilize rejects non-finite input first.
inline size_t clamp_components(Components& v) {
    size_t clamped = 0;
    for (double& x : v) {
        double bounded = std::clamp(x, COMPONENT_MIN, COMPONENT_MAX);
        if (bounded != x) {
            x = bounded;
            ++clamped;
        }
    }
    return clamped;
}

// "a,b,c" for logs and CLI output
inline std::string format_components(const Components& v, int precision = 4) {
    std::string out;
    char buf[32];
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out += ",";
        snprintf(buf, sizeof(buf), "%.*f", precision, v[i]);
        out += buf;
    }
    return out;
}

} // namespace resonance
