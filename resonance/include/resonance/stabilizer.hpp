#pragma once
// Stabilizer: pull a bounded vector toward a source
//
// One step:
//   coherence  = dot(v, s)
//   stability  = 1 - clamp(coherence, 0, 1) / 2      in [0.5, 1]
//   v         += (s - v) * stability * factor
//   v          = clamp(v, -1, 1)
//
// Poorly aligned vectors move at the full step, well aligned ones at
// half of it. Stability never drops below 0.5, so repeated steps approach
// the source without ever landing on it in one move.

#include "types.hpp"
#include <cstdint>
#include <random>
#include <string>

namespace resonance {

// How the raw dot product is turned into the clipped coherence
enum class CoherenceMode {
    Raw,           // clamp(dot, 0, 1)
    PerDimension,  // clamp(dot / dim, 0, 1)
};

inline const char* coherence_mode_name(CoherenceMode mode) {
    switch (mode) {
        case CoherenceMode::Raw: return "raw";
        case CoherenceMode::PerDimension: return "per_dimension";
    }
    return "raw";
}

// Stabilizer configuration
struct StabilizerConfig {
    int dimensionality = static_cast<int>(DEFAULT_DIM);
    double factor = DEFAULT_FACTOR;  // Not validated: values outside [0,1] overshoot
    CoherenceMode coherence_mode = CoherenceMode::Raw;
};

// What one update did
struct StepReport {
    double coherence = 0.0;         // Raw dot product
    double clipped = 0.0;           // Coherence after mode scaling and clamp
    double stability_factor = 1.0;  // 1 - clipped / 2
    double displacement = 0.0;      // L2 length of the step before clamping
    size_t clamped = 0;             // Components truncated to the bounds
};

// Stability multiplier for a clipped coherence in [0, 1]
inline double stability_factor(double clipped) {
    return 1.0 - clipped / 2.0;
}

// Clip a raw coherence according to mode
inline double clip_coherence(double coherence, size_t dim, CoherenceMode mode) {
    if (mode == CoherenceMode::PerDimension && dim > 0) {
        coherence /= static_cast<double>(dim);
    }
    return std::clamp(coherence, 0.0, 1.0);
}

// Unit-factor update field at v: (s - v) * stability(v). One step
// moves v by factor times this, before clamping.
inline Components update_field(const Components& v, const Components& source,
                               CoherenceMode mode = CoherenceMode::Raw) {
    double sf = stability_factor(clip_coherence(dot(v, source), v.size(), mode));
    Components field(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        field[i] = (source[i] - v[i]) * sf;
    }
    return field;
}

// A fixed-length vector with components in [-1, 1], owned by its holder
class StabilizingVector {
public:
    // Uniform random components in [-1, 1] drawn from rng
    static StabilizingVector random(int dimensionality, std::mt19937_64& rng,
                                    CoherenceMode mode = CoherenceMode::Raw) {
        check_dimensionality(dimensionality);
        std::uniform_real_distribution<double> dist(COMPONENT_MIN, COMPONENT_MAX);
        Components c(static_cast<size_t>(dimensionality));
        for (double& x : c) x = dist(rng);
        return StabilizingVector(std::move(c), mode);
    }

    // Reproducible construction
    static StabilizingVector seeded(int dimensionality, uint64_t seed,
                                    CoherenceMode mode = CoherenceMode::Raw) {
        std::mt19937_64 rng(seed);
        return random(dimensionality, rng, mode);
    }

    // Explicit starting state; every component must already be in bounds
    static StabilizingVector from_components(Components c,
                                             CoherenceMode mode = CoherenceMode::Raw) {
        if (c.empty()) {
            throw InvalidConfiguration("dimensionality must be positive, got 0");
        }
        for (size_t i = 0; i < c.size(); ++i) {
            if (!in_bounds(c[i])) {
                throw InvalidConfiguration("component " + std::to_string(i) +
                                           " out of [-1, 1]: " + std::to_string(c[i]));
            }
        }
        return StabilizingVector(std::move(c), mode);
    }

    static StabilizingVector from_config(const StabilizerConfig& config, std::mt19937_64& rng) {
        return random(config.dimensionality, rng, config.coherence_mode);
    }

    // Apply one step toward source and report the intermediate values.
    // Throws DimensionMismatch, or InvalidConfiguration for a non-finite
    // factor or source component, before touching any component.
    StepReport stabilize(const Components& source, double factor = DEFAULT_FACTOR) {
        if (source.size() != components_.size()) {
            throw DimensionMismatch(components_.size(), source.size());
        }
        if (!std::isfinite(factor)) {
            throw InvalidConfiguration("factor must be finite");
        }
        check_finite(source, "source");

        StepReport report;
        report.coherence = dot(components_, source);
        report.clipped = clip_coherence(report.coherence, components_.size(), mode_);
        report.stability_factor = stability_factor(report.clipped);

        double step_sq = 0.0;
        for (size_t i = 0; i < components_.size(); ++i) {
            double direction = source[i] - components_[i];
            double step = direction * report.stability_factor * factor;
            components_[i] += step;
            step_sq += step * step;
        }
        report.displacement = std::sqrt(step_sq);
        report.clamped = clamp_components(components_);
        return report;
    }

    void update(const Components& source, double factor = DEFAULT_FACTOR) {
        stabilize(source, factor);
    }

    const Components& components() const { return components_; }
    size_t size() const { return components_.size(); }
    double operator[](size_t i) const { return components_[i]; }

    CoherenceMode coherence_mode() const { return mode_; }

    // Raw coherence with a source, without moving
    double coherence(const Components& source) const {
        if (source.size() != components_.size()) {
            throw DimensionMismatch(components_.size(), source.size());
        }
        return dot(components_, source);
    }

    double distance_to(const Components& source) const {
        if (source.size() != components_.size()) {
            throw DimensionMismatch(components_.size(), source.size());
        }
        return distance(components_, source);
    }

    // Divergence of the update field at the current state, by central
    // differences. Negative means the flow contracts around this point.
    double divergence(const Components& source, double eps = 1e-6) const {
        if (source.size() != components_.size()) {
            throw DimensionMismatch(components_.size(), source.size());
        }
        if (!(eps > 0.0) || !std::isfinite(eps)) {
            throw InvalidConfiguration("divergence step must be positive and finite");
        }
        check_finite(source, "source");

        double div = 0.0;
        Components point = components_;
        for (size_t i = 0; i < point.size(); ++i) {
            double x = point[i];
            point[i] = x + eps;
            double plus = update_field(point, source, mode_)[i];
            point[i] = x - eps;
            double minus = update_field(point, source, mode_)[i];
            point[i] = x;
            div += (plus - minus) / (2.0 * eps);
        }
        return div;
    }

    double mean() const {
        double sum = 0.0;
        for (double x : components_) sum += x;
        return sum / static_cast<double>(components_.size());
    }

    std::string to_string() const {
        char buf[64];
        snprintf(buf, sizeof(buf), "StabilizingVector(dim=%zu, mean=%.4f)",
                 components_.size(), mean());
        return buf;
    }

private:
    StabilizingVector(Components c, CoherenceMode mode)
        : components_(std::move(c)), mode_(mode) {}

    static void check_finite(const Components& v, const char* what) {
        for (size_t i = 0; i < v.size(); ++i) {
            if (!std::isfinite(v[i])) {
                throw InvalidConfiguration(std::string(what) + " component " +
                                           std::to_string(i) + " is not finite");
            }
        }
    }

    static void check_dimensionality(int dimensionality) {
        if (dimensionality <= 0) {
            throw InvalidConfiguration("dimensionality must be positive, got " +
                                       std::to_string(dimensionality));
        }
    }

    Components components_;
    CoherenceMode mode_;
};

// ═══════════════════════════════════════════════════════════════════
// Free-function surface
// ═══════════════════════════════════════════════════════════════════

inline StabilizingVector create(int dimensionality, std::mt19937_64& rng) {
    return StabilizingVector::random(dimensionality, rng);
}

inline StabilizingVector create(int dimensionality = static_cast<int>(DEFAULT_DIM)) {
    static std::random_device rd;
    std::mt19937_64 rng(rd());
    return StabilizingVector::random(dimensionality, rng);
}

inline void update(StabilizingVector& vector, const Components& source,
                   double factor = DEFAULT_FACTOR) {
    vector.update(source, factor);
}

// Source with every component set to value (0.5 is the classic target)
inline Components filled_source(int dimensionality, double value) {
    if (dimensionality <= 0) {
        throw InvalidConfiguration("dimensionality must be positive, got " +
                                   std::to_string(dimensionality));
    }
    return Components(static_cast<size_t>(dimensionality), value);
}

// Unit-length copy of a source (direction only)
inline Components normalized_source(const Components& source) {
    double norm = 0.0;
    for (double x : source) norm += x * x;
    norm = std::sqrt(norm);
    if (!std::isfinite(norm) || norm == 0.0) {
        throw InvalidConfiguration("cannot normalize a zero or non-finite source");
    }
    Components out(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        out[i] = source[i] / norm;
    }
    return out;
}

// Source drawn uniformly from [lo, hi)
inline Components random_source(int dimensionality, double lo, double hi,
                                std::mt19937_64& rng) {
    if (dimensionality <= 0) {
        throw InvalidConfiguration("dimensionality must be positive, got " +
                                   std::to_string(dimensionality));
    }
    if (!(lo < hi)) {
        throw InvalidConfiguration("source range must satisfy lo < hi");
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    Components s(static_cast<size_t>(dimensionality));
    for (double& x : s) x = dist(rng);
    return s;
}

} // namespace resonance
