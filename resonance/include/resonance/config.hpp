#pragma once
// Run configuration: what the CLI drives
//
// JSON, every key optional:
//   {"dimensionality": 11, "factor": 0.1, "coherence_mode": "raw",
//    "steps": 10, "seed": 42, "source": [...], "fill": 0.5,
//    "normalize_source": false, "tolerance": 0.0}

#include "stabilizer.hpp"
#include <nlohmann/json.hpp>
#include <climits>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace resonance {

using json = nlohmann::json;

struct RunConfig {
    StabilizerConfig stabilizer;
    int steps = 10;
    std::optional<uint64_t> seed;    // Unset: nondeterministic
    std::optional<Components> source;
    double fill = 0.5;               // Source value when no explicit source
    bool normalize_source = false;   // Pull toward s / ||s|| instead of s
    double tolerance = 0.0;          // Stop once distance <= tolerance (0 = never)

    // Source the run pulls toward; validated against dimensionality
    Components resolve_source() const {
        Components s;
        if (!source) {
            s = filled_source(stabilizer.dimensionality, fill);
        } else {
            if (static_cast<int>(source->size()) != stabilizer.dimensionality) {
                throw DimensionMismatch(static_cast<size_t>(std::max(stabilizer.dimensionality, 0)),
                                        source->size());
            }
            s = *source;
        }
        return normalize_source ? resonance::normalized_source(s) : s;
    }

    void validate() const {
        if (stabilizer.dimensionality <= 0) {
            throw InvalidConfiguration("dimensionality must be positive, got " +
                                       std::to_string(stabilizer.dimensionality));
        }
        if (!std::isfinite(stabilizer.factor)) {
            throw InvalidConfiguration("factor must be finite");
        }
        if (steps < 0) {
            throw InvalidConfiguration("steps must be non-negative, got " +
                                       std::to_string(steps));
        }
        if (!std::isfinite(fill)) {
            throw InvalidConfiguration("fill must be finite");
        }
        if (!std::isfinite(tolerance) || tolerance < 0.0) {
            throw InvalidConfiguration("tolerance must be finite and non-negative");
        }
        if (source) {
            for (double x : *source) {
                if (!std::isfinite(x)) {
                    throw InvalidConfiguration("source components must be finite");
                }
            }
        }
    }
};

inline CoherenceMode parse_coherence_mode(const std::string& name) {
    if (name == "raw") return CoherenceMode::Raw;
    if (name == "per_dimension") return CoherenceMode::PerDimension;
    throw InvalidConfiguration("unknown coherence_mode: " + name);
}

// Whole string must be one finite number
inline double parse_double(const std::string& text, const char* what) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(std::string(what) + " is not a number: " + text);
    }
    if (used != text.size()) {
        throw InvalidConfiguration(std::string(what) + " is not a number: " + text);
    }
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(std::string(what) + " must be finite: " + text);
    }
    return value;
}

// Whole string must be one integer in int range
inline int parse_int(const std::string& text, const char* what) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(std::string(what) + " is not an integer: " + text);
    }
    if (used != text.size()) {
        throw InvalidConfiguration(std::string(what) + " is not an integer: " + text);
    }
    if (value < INT_MIN || value > INT_MAX) {
        throw InvalidConfiguration(std::string(what) + " out of range: " + text);
    }
    return static_cast<int>(value);
}

// Unsigned 64-bit; a sign is rejected rather than wrapped
inline uint64_t parse_seed(const std::string& text) {
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        throw InvalidConfiguration("seed must be a non-negative integer: " + text);
    }
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration("seed out of range: " + text);
    }
    if (used != text.size()) {
        throw InvalidConfiguration("seed must be a non-negative integer: " + text);
    }
    return static_cast<uint64_t>(value);
}

// "0.5,0.5,-1" -> {0.5, 0.5, -1}
inline Components parse_components(const std::string& csv) {
    if (csv.empty()) {
        throw InvalidConfiguration("empty component list");
    }
    if (csv.back() == ',') {
        throw InvalidConfiguration("trailing separator in list: " + csv);
    }
    Components out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            throw InvalidConfiguration("empty component in list: " + csv);
        }
        out.push_back(parse_double(item, "component"));
    }
    return out;
}

namespace detail {

inline int json_int(const json& j, const char* key, int current) {
    if (!j.contains(key)) return current;
    const json& v = j[key];
    if (!v.is_number_integer()) {
        throw InvalidConfiguration(std::string(key) + " must be an integer");
    }
    if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT_MAX)) {
        throw InvalidConfiguration(std::string(key) + " out of range");
    }
    int64_t value = v.get<int64_t>();
    if (value < INT_MIN || value > INT_MAX) {
        throw InvalidConfiguration(std::string(key) + " out of range");
    }
    return static_cast<int>(value);
}

inline double json_double(const json& j, const char* key, double current) {
    if (!j.contains(key)) return current;
    const json& v = j[key];
    if (!v.is_number()) {
        throw InvalidConfiguration(std::string(key) + " must be a number");
    }
    double value = v.get<double>();
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(std::string(key) + " must be finite");
    }
    return value;
}

} // namespace detail

// Overlay JSON keys onto config; absent keys keep their current values
inline void apply_json(RunConfig& config, const json& j) {
    if (!j.is_object()) {
        throw InvalidConfiguration("run configuration must be a JSON object");
    }
    try {
        config.stabilizer.dimensionality =
            detail::json_int(j, "dimensionality", config.stabilizer.dimensionality);
        config.stabilizer.factor = detail::json_double(j, "factor", config.stabilizer.factor);
        if (j.contains("coherence_mode")) {
            config.stabilizer.coherence_mode =
                parse_coherence_mode(j["coherence_mode"].get<std::string>());
        }
        config.steps = detail::json_int(j, "steps", config.steps);
        if (j.contains("seed")) {
            if (!j["seed"].is_number_unsigned()) {
                throw InvalidConfiguration("seed must be a non-negative integer");
            }
            config.seed = j["seed"].get<uint64_t>();
        }
        if (j.contains("source")) {
            const json& src = j["source"];
            if (!src.is_array()) {
                throw InvalidConfiguration("source must be an array of numbers");
            }
            Components s;
            for (const auto& x : src) {
                if (!x.is_number()) {
                    throw InvalidConfiguration("source must be an array of numbers");
                }
                s.push_back(x.get<double>());
            }
            config.source = std::move(s);
        }
        config.fill = detail::json_double(j, "fill", config.fill);
        config.normalize_source = j.value("normalize_source", config.normalize_source);
        config.tolerance = detail::json_double(j, "tolerance", config.tolerance);
    } catch (const json::exception& e) {
        throw InvalidConfiguration(std::string("bad JSON value: ") + e.what());
    }
}

inline RunConfig parse_run_config(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw InvalidConfiguration(std::string("cannot parse JSON: ") + e.what());
    }
    RunConfig config;
    apply_json(config, j);
    return config;
}

inline RunConfig load_run_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidConfiguration("cannot open config file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return parse_run_config(oss.str());
}

inline json to_json(const StepReport& r) {
    return {
        {"coherence", r.coherence},
        {"clipped", r.clipped},
        {"stability_factor", r.stability_factor},
        {"displacement", r.displacement},
        {"clamped", r.clamped}
    };
}

inline json to_json(const RunConfig& c) {
    json j = {
        {"dimensionality", c.stabilizer.dimensionality},
        {"factor", c.stabilizer.factor},
        {"coherence_mode", coherence_mode_name(c.stabilizer.coherence_mode)},
        {"steps", c.steps},
        {"fill", c.fill},
        {"normalize_source", c.normalize_source},
        {"tolerance", c.tolerance}
    };
    if (c.seed) j["seed"] = *c.seed;
    if (c.source) j["source"] = *c.source;
    return j;
}

} // namespace resonance
