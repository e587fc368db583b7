#pragma once
// Run: drive one vector toward a source for a number of steps
//
// The CLI is a thin printer over these; everything it reports
// comes from RunResult / StepResult.

#include "config.hpp"
#include "version.hpp"
#include <random>
#include <vector>

namespace resonance {

struct StepRecord {
    int step = 0;
    StepReport report;
    double distance = 0.0;  // To the source, after the step
    double mean = 0.0;
};

struct RunResult {
    uint64_t seed = 0;
    Components source;
    Components initial;
    double initial_distance = 0.0;
    std::vector<StepRecord> steps;
    bool converged = false;
    Components final_state;
    double distance = 0.0;

    int steps_taken() const { return static_cast<int>(steps.size()); }
};

// Validate, seed, then step until config.steps or tolerance is reached
inline RunResult run_stabilization(const RunConfig& config) {
    config.validate();

    RunResult result;
    result.source = config.resolve_source();
    result.seed = config.seed ? *config.seed : std::random_device{}();

    std::mt19937_64 rng(result.seed);
    StabilizingVector vector = StabilizingVector::from_config(config.stabilizer, rng);
    result.initial = vector.components();
    result.initial_distance = vector.distance_to(result.source);

    double dist = result.initial_distance;
    bool converged = config.tolerance > 0.0 && dist <= config.tolerance;
    for (int i = 0; i < config.steps && !converged; ++i) {
        StepRecord rec;
        rec.step = i + 1;
        rec.report = vector.stabilize(result.source, config.stabilizer.factor);
        dist = vector.distance_to(result.source);
        rec.distance = dist;
        rec.mean = vector.mean();
        result.steps.push_back(rec);
        converged = config.tolerance > 0.0 && dist <= config.tolerance;
    }

    result.converged = converged;
    result.final_state = vector.components();
    result.distance = dist;
    return result;
}

struct StepResult {
    StepReport report;
    Components before;
    Components after;
    Components source;
    double divergence = 0.0;  // Of the update field at the starting vector
};

// One update on an explicit vector; source from config or filled to its length
inline StepResult step_once(const Components& start, const RunConfig& config) {
    if (!std::isfinite(config.stabilizer.factor)) {
        throw InvalidConfiguration("factor must be finite");
    }
    StabilizingVector vector =
        StabilizingVector::from_components(start, config.stabilizer.coherence_mode);

    StepResult result;
    result.before = vector.components();
    result.source = config.source
        ? *config.source
        : filled_source(static_cast<int>(vector.size()), config.fill);
    if (config.normalize_source) {
        result.source = normalized_source(result.source);
    }
    result.divergence = vector.divergence(result.source);
    result.report = vector.stabilize(result.source, config.stabilizer.factor);
    result.after = vector.components();
    return result;
}

inline json to_json(const RunResult& r, const RunConfig& c) {
    json steps = json::array();
    for (const auto& rec : r.steps) {
        json entry = to_json(rec.report);
        entry["step"] = rec.step;
        entry["distance"] = rec.distance;
        entry["mean"] = rec.mean;
        steps.push_back(entry);
    }
    return {
        {"version", RESONANCE_VERSION},
        {"config", to_json(c)},
        {"seed", r.seed},
        {"source", r.source},
        {"initial", r.initial},
        {"steps", steps},
        {"steps_taken", r.steps_taken()},
        {"converged", r.converged},
        {"final", r.final_state},
        {"distance", r.distance}
    };
}

inline json to_json(const StepResult& r) {
    json out = to_json(r.report);
    out["vector"] = r.after;
    out["divergence"] = r.divergence;
    return out;
}

} // namespace resonance
