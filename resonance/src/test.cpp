#include <resonance/resonance.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <random>
#include <limits>
#include <cstdint>

using namespace resonance;

bool near(double a, double b, double eps = 1e-12) {
    return std::abs(a - b) <= eps;
}

bool all_in_bounds(const StabilizingVector& v) {
    for (double x : v.components()) {
        if (!in_bounds(x)) return false;
    }
    return true;
}

// Deterministic source inside [-1, 1]
Components test_source(size_t dim, double seed) {
    Components s(dim);
    for (size_t i = 0; i < dim; ++i) {
        s[i] = std::sin((static_cast<double>(i) + seed) * 0.7);
    }
    return s;
}

void test_construction_range() {
    std::cout << "Testing construction range..." << std::endl;

    std::mt19937_64 rng(7);
    for (int dim : {1, 2, 3, 11, 64, 384}) {
        auto v = StabilizingVector::random(dim, rng);
        assert(v.size() == static_cast<size_t>(dim));
        assert(all_in_bounds(v));
    }

    auto def = create();
    assert(def.size() == DEFAULT_DIM);
    assert(all_in_bounds(def));

    std::cout << "  PASS" << std::endl;
}

void test_seeded_reproducible() {
    std::cout << "Testing seeded construction..." << std::endl;

    auto a = StabilizingVector::seeded(11, 42);
    auto b = StabilizingVector::seeded(11, 42);
    auto c = StabilizingVector::seeded(11, 43);
    assert(a.components() == b.components());
    assert(a.components() != c.components());

    std::mt19937_64 rng1(99), rng2(99);
    assert(create(5, rng1).components() == create(5, rng2).components());

    std::cout << "  PASS" << std::endl;
}

void test_invalid_dimensionality() {
    std::cout << "Testing invalid dimensionality..." << std::endl;

    std::mt19937_64 rng(1);
    for (int dim : {0, -1, -11}) {
        bool thrown = false;
        try {
            StabilizingVector::random(dim, rng);
        } catch (const InvalidConfiguration&) {
            thrown = true;
        }
        assert(thrown);
    }

    bool thrown = false;
    try {
        StabilizingVector::from_components({});
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        StabilizingVector::from_components({0.0, 1.5});
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_concrete_step() {
    std::cout << "Testing concrete step..." << std::endl;

    auto v = StabilizingVector::from_components({0.0, 0.0, 0.0});
    StepReport r = v.stabilize({1.0, 1.0, 1.0}, 0.1);

    assert(r.coherence == 0.0);
    assert(r.clipped == 0.0);
    assert(r.stability_factor == 1.0);
    assert(r.clamped == 0);
    for (double x : v.components()) {
        assert(x == 0.1);
    }

    std::cout << "  PASS" << std::endl;
}

void test_partial_alignment_step() {
    std::cout << "Testing partially aligned step..." << std::endl;

    auto v = StabilizingVector::from_components({0.95, 0.0});
    StepReport r = v.stabilize({1.0, 1.0}, 1.0);

    assert(near(r.coherence, 0.95));
    assert(near(r.clipped, 0.95));
    assert(near(r.stability_factor, 0.525));
    assert(r.clamped == 0);
    assert(near(v[0], 0.97625));
    assert(near(v[1], 0.525));

    std::cout << "  PASS" << std::endl;
}

void test_clamp_saturates() {
    std::cout << "Testing clamp saturation..." << std::endl;

    auto v = StabilizingVector::from_components({0.0, 0.0, 0.5});
    StepReport r = v.stabilize({1.0, -1.0, 0.5}, 5.0);

    // coherence 0.25 -> stability 0.875, step 4.375 on the first two
    assert(near(r.stability_factor, 0.875));
    assert(r.clamped == 2);
    assert(v[0] == 1.0);
    assert(v[1] == -1.0);
    assert(v[2] == 0.5);

    std::cout << "  PASS" << std::endl;
}

void test_bounds_invariant() {
    std::cout << "Testing bounds invariant..." << std::endl;

    std::mt19937_64 rng(2024);
    std::uniform_real_distribution<double> factor_dist(-20.0, 20.0);
    for (int trial = 0; trial < 50; ++trial) {
        auto v = StabilizingVector::random(11, rng);
        for (int step = 0; step < 40; ++step) {
            Components s = random_source(11, -1.0, 1.0, rng);
            v.update(s, factor_dist(rng));
            assert(all_in_bounds(v));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_zero_factor_idempotent() {
    std::cout << "Testing zero factor..." << std::endl;

    auto v = StabilizingVector::seeded(11, 5);
    Components before = v.components();
    for (double seed : {0.0, 1.3, 7.7}) {
        v.update(test_source(11, seed), 0.0);
        assert(v.components() == before);
    }

    std::cout << "  PASS" << std::endl;
}

void test_damping_boundary() {
    std::cout << "Testing damping boundary..." << std::endl;

    Components source = {1.0, 0.0};

    // dot = -0.5: full step
    auto misaligned = StabilizingVector::from_components({-0.5, 0.5});
    // dot = 1.0: half step
    auto aligned = StabilizingVector::from_components({1.0, -0.5});

    StepReport low = misaligned.stabilize(source, 0.1);
    StepReport high = aligned.stabilize(source, 0.1);

    assert(low.clipped == 0.0);
    assert(low.stability_factor == 1.0);
    assert(high.clipped == 1.0);
    assert(high.stability_factor == 0.5);
    assert(low.displacement >= high.displacement);
    assert(near(low.displacement, 0.1 * std::sqrt(2.5)));
    assert(near(high.displacement, 0.025));

    std::cout << "  PASS" << std::endl;
}

void test_coherence_saturates() {
    std::cout << "Testing coherence saturation..." << std::endl;

    // dot = 11 for an all-ones pair: treated the same as coherence 1
    auto v = StabilizingVector::from_components(Components(11, 1.0));
    StepReport r = v.stabilize(Components(11, 1.0), 0.1);
    assert(near(r.coherence, 11.0));
    assert(r.clipped == 1.0);
    assert(r.stability_factor == 0.5);

    std::cout << "  PASS" << std::endl;
}

void test_per_dimension_mode() {
    std::cout << "Testing per-dimension coherence..." << std::endl;

    Components start(11, 0.5);
    Components source(11, 0.5);

    auto raw = StabilizingVector::from_components(start);
    auto scaled = StabilizingVector::from_components(start, CoherenceMode::PerDimension);

    StepReport r1 = raw.stabilize(source, 0.1);
    StepReport r2 = scaled.stabilize(source, 0.1);

    // dot = 2.75: raw saturates, per-dimension gives 0.25
    assert(r1.clipped == 1.0);
    assert(near(r2.clipped, 0.25));
    assert(near(r2.stability_factor, 0.875));

    std::cout << "  PASS" << std::endl;
}

void test_dimension_mismatch() {
    std::cout << "Testing dimension mismatch..." << std::endl;

    auto v = StabilizingVector::seeded(3, 11);
    Components before = v.components();

    bool thrown = false;
    try {
        v.update({0.5, 0.5}, 0.1);
    } catch (const DimensionMismatch& e) {
        thrown = true;
        assert(e.expected() == 3);
        assert(e.actual() == 2);
    }
    assert(thrown);
    assert(v.components() == before);

    thrown = false;
    try {
        update(v, Components(4, 0.0), 0.1);
    } catch (const Error&) {
        thrown = true;
    }
    assert(thrown);
    assert(v.components() == before);

    std::cout << "  PASS" << std::endl;
}

void test_asymptotic_approach() {
    std::cout << "Testing asymptotic approach..." << std::endl;

    auto v = StabilizingVector::seeded(11, 3);
    Components source = filled_source(11, 0.5);

    double dist = v.distance_to(source);
    for (int i = 0; i < 200; ++i) {
        v.update(source, 0.2);
        double next = v.distance_to(source);
        assert(next <= dist);
        dist = next;
    }
    assert(dist < 1e-3);
    assert(near(v.mean(), 0.5, 1e-3));

    // Each step covers at most half the gap once aligned
    auto w = StabilizingVector::from_components({0.9, 0.9});
    w.update({1.0, 1.0}, 1.0);
    assert(w[0] < 1.0);
    assert(near(w[0], 0.95));

    std::cout << "  PASS" << std::endl;
}

void test_summary() {
    std::cout << "Testing summary..." << std::endl;

    auto v = StabilizingVector::from_components({0.5, -0.5, 1.0, 0.0});
    assert(near(v.mean(), 0.25));
    assert(v.to_string() == "StabilizingVector(dim=4, mean=0.2500)");
    assert(near(v.coherence({1.0, 1.0, 1.0, 1.0}), 1.0));
    assert(format_components({0.5, -1.0}, 2) == "0.50,-1.00");

    std::cout << "  PASS" << std::endl;
}

void test_sources() {
    std::cout << "Testing source helpers..." << std::endl;

    Components fill = filled_source(11, 0.5);
    assert(fill.size() == 11);
    for (double x : fill) assert(x == 0.5);

    std::mt19937_64 rng(8);
    Components s = random_source(11, -0.5, 0.5, rng);
    assert(s.size() == 11);
    for (double x : s) assert(x >= -0.5 && x < 0.5);

    bool thrown = false;
    try {
        random_source(11, 0.5, 0.5, rng);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_run_config() {
    std::cout << "Testing run config..." << std::endl;

    RunConfig c = parse_run_config(R"({
        "dimensionality": 3,
        "factor": 0.25,
        "coherence_mode": "per_dimension",
        "steps": 4,
        "seed": 17,
        "source": [1.0, 0.0, -1.0],
        "tolerance": 0.01
    })");
    c.validate();
    assert(c.stabilizer.dimensionality == 3);
    assert(c.stabilizer.factor == 0.25);
    assert(c.stabilizer.coherence_mode == CoherenceMode::PerDimension);
    assert(c.steps == 4);
    assert(c.seed && *c.seed == 17);
    assert(c.resolve_source() == Components({1.0, 0.0, -1.0}));
    assert(c.tolerance == 0.01);

    RunConfig defaults = parse_run_config("{}");
    assert(defaults.stabilizer.dimensionality == 11);
    assert(defaults.stabilizer.factor == DEFAULT_FACTOR);
    assert(!defaults.seed);
    assert(defaults.resolve_source() == filled_source(11, 0.5));

    json round = to_json(c);
    assert(round["coherence_mode"] == "per_dimension");
    assert(round["seed"] == 17);

    std::cout << "  PASS" << std::endl;
}

void test_run_config_errors() {
    std::cout << "Testing run config errors..." << std::endl;

    auto rejects = [](const std::string& text) {
        try {
            parse_run_config(text).validate();
        } catch (const InvalidConfiguration&) {
            return true;
        }
        return false;
    };

    assert(rejects("not json"));
    assert(rejects("[1, 2]"));
    assert(rejects(R"({"coherence_mode": "cosine"})"));
    assert(rejects(R"({"source": 0.5})"));
    assert(rejects(R"({"dimensionality": "eleven"})"));
    assert(rejects(R"({"dimensionality": 0})"));
    assert(rejects(R"({"steps": -1})"));

    RunConfig c = parse_run_config(R"({"dimensionality": 3, "source": [0.5, 0.5]})");
    bool thrown = false;
    try {
        c.resolve_source();
    } catch (const DimensionMismatch&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        load_run_config("/nonexistent/resonance.json");
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_parse_components() {
    std::cout << "Testing component parsing..." << std::endl;

    assert(parse_components("0.5,-1,0") == Components({0.5, -1.0, 0.0}));
    assert(parse_components("1e-1") == Components({0.1}));

    for (const char* bad : {"", "0.5,,1", "0.5,abc", "1.0x"}) {
        bool thrown = false;
        try {
            parse_components(bad);
        } catch (const InvalidConfiguration&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "  PASS" << std::endl;
}

void test_non_finite_rejected() {
    std::cout << "Testing non-finite input..." << std::endl;

    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    auto v = StabilizingVector::from_components({0.5, 0.2});
    Components before = v.components();

    for (double factor : {inf, -inf, nan}) {
        bool thrown = false;
        try {
            v.stabilize({0.5, 0.9}, factor);
        } catch (const InvalidConfiguration&) {
            thrown = true;
        }
        assert(thrown);
        assert(v.components() == before);
    }

    bool thrown = false;
    try {
        v.update({nan, 0.9}, 0.1);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);
    assert(v.components() == before);

    // Huge but finite factor saturates instead of producing NaN
    StepReport r = v.stabilize({0.5, 0.9}, 1e308);
    assert(all_in_bounds(v));
    assert(v[0] == 0.5);
    assert(v[1] == 1.0);
    assert(r.clamped == 1);

    std::cout << "  PASS" << std::endl;
}

void test_strict_number_parsing() {
    std::cout << "Testing strict number parsing..." << std::endl;

    assert(parse_int("12", "--dim") == 12);
    assert(parse_int("-4", "--steps") == -4);
    assert(parse_double("0.25", "--factor") == 0.25);
    assert(parse_seed("0") == 0);
    assert(parse_seed("18446744073709551615") == UINT64_MAX);

    auto rejects = [](auto fn) {
        try {
            fn();
        } catch (const InvalidConfiguration&) {
            return true;
        }
        return false;
    };

    assert(rejects([] { parse_int("3abc", "--dim"); }));
    assert(rejects([] { parse_int("", "--dim"); }));
    assert(rejects([] { parse_int("99999999999", "--steps"); }));
    assert(rejects([] { parse_int("2.5", "--steps"); }));
    assert(rejects([] { parse_double("0.1x", "--factor"); }));
    assert(rejects([] { parse_double("nan", "--factor"); }));
    assert(rejects([] { parse_double("inf", "--fill"); }));
    assert(rejects([] { parse_double("-inf", "--tolerance"); }));
    assert(rejects([] { parse_seed("-1"); }));
    assert(rejects([] { parse_seed("+1"); }));
    assert(rejects([] { parse_seed("12a"); }));
    assert(rejects([] { parse_seed("99999999999999999999999"); }));
    assert(rejects([] { parse_components("0.5,"); }));
    assert(rejects([] { parse_components(","); }));
    assert(rejects([] { parse_components("nan,0.5"); }));
    assert(rejects([] { parse_components("0.5,inf"); }));

    std::cout << "  PASS" << std::endl;
}

void test_run_config_integer_keys() {
    std::cout << "Testing run config integer keys..." << std::endl;

    auto rejects = [](const std::string& text) {
        try {
            parse_run_config(text);
        } catch (const InvalidConfiguration&) {
            return true;
        }
        return false;
    };

    assert(rejects(R"({"steps": 2.9})"));
    assert(rejects(R"({"steps": 1e12})"));
    assert(rejects(R"({"steps": 1000000000000})"));
    assert(rejects(R"({"dimensionality": 3.0})"));
    assert(rejects(R"({"dimensionality": 4294967297})"));
    assert(rejects(R"({"seed": -1})"));
    assert(rejects(R"({"seed": 1.5})"));
    assert(rejects(R"({"factor": "fast"})"));
    assert(rejects(R"({"fill": 1e999})"));
    assert(rejects(R"({"source": [0.5, "x"]})"));
    assert(rejects(R"({"normalize_source": "yes"})"));

    RunConfig c = parse_run_config(R"({"steps": 3, "seed": 0, "normalize_source": true})");
    assert(c.steps == 3);
    assert(c.seed && *c.seed == 0);
    assert(c.normalize_source);

    std::cout << "  PASS" << std::endl;
}

void test_divergence() {
    std::cout << "Testing divergence..." << std::endl;

    // Anti-aligned: stability 1, field = s - v, div = -dim
    auto anti = StabilizingVector::from_components({-0.5, -0.5, -0.5});
    assert(near(anti.divergence({1.0, 1.0, 1.0}), -3.0, 1e-6));

    // Saturated: stability 0.5, div = -dim / 2
    auto aligned = StabilizingVector::from_components(Components(11, 1.0));
    assert(near(aligned.divergence(Components(11, 1.0)), -5.5, 1e-6));

    // Between: c = 0.3, div = -d(1 - c/2) - sum s_i(s_i - v_i) / 2
    auto mid = StabilizingVector::from_components({0.2, 0.1});
    double div = mid.divergence({1.0, 1.0});
    assert(near(div, -2.55, 1e-6));
    assert(div < 0.0);

    // Contracting flow everywhere along a run
    auto v = StabilizingVector::seeded(11, 21);
    Components source = filled_source(11, 0.5);
    for (int i = 0; i < 20; ++i) {
        assert(v.divergence(source) < 0.0);
        v.update(source, 0.2);
    }

    Components before = mid.components();
    bool thrown = false;
    try {
        mid.divergence({1.0, 1.0, 1.0});
    } catch (const DimensionMismatch&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        mid.divergence({1.0, 1.0}, 0.0);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);
    assert(mid.components() == before);

    std::cout << "  PASS" << std::endl;
}

void test_normalized_source() {
    std::cout << "Testing normalized source..." << std::endl;

    Components unit = normalized_source({3.0, 4.0});
    assert(near(unit[0], 0.6));
    assert(near(unit[1], 0.8));

    Components fill = normalized_source(filled_source(11, 0.5));
    double norm_sq = dot(fill, fill);
    assert(near(norm_sq, 1.0));
    for (double x : fill) assert(near(x, 1.0 / std::sqrt(11.0)));

    bool thrown = false;
    try {
        normalized_source({0.0, 0.0});
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    RunConfig c;
    c.stabilizer.dimensionality = 2;
    c.source = Components{3.0, 4.0};
    c.normalize_source = true;
    Components resolved = c.resolve_source();
    assert(near(resolved[0], 0.6));
    assert(near(resolved[1], 0.8));

    std::cout << "  PASS" << std::endl;
}

void test_query_dimension_mismatch() {
    std::cout << "Testing query dimension mismatch..." << std::endl;

    auto v = StabilizingVector::seeded(4, 2);

    bool thrown = false;
    try {
        v.coherence({0.5, 0.5});
    } catch (const DimensionMismatch& e) {
        thrown = true;
        assert(e.expected() == 4);
        assert(e.actual() == 2);
    }
    assert(thrown);

    thrown = false;
    try {
        v.distance_to(Components(5, 0.0));
    } catch (const DimensionMismatch& e) {
        thrown = true;
        assert(e.expected() == 4);
        assert(e.actual() == 5);
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_run_tolerance() {
    std::cout << "Testing run tolerance..." << std::endl;

    RunConfig c;
    c.stabilizer.dimensionality = 3;
    c.stabilizer.factor = 0.5;
    c.seed = 1;
    c.steps = 100;
    c.tolerance = 0.01;

    RunResult r = run_stabilization(c);
    assert(r.seed == 1);
    assert(r.converged);
    assert(r.steps_taken() > 0);
    assert(r.steps_taken() < 100);
    assert(r.distance <= 0.01);
    assert(r.steps.back().distance == r.distance);
    // Stopped at the first step inside tolerance
    for (size_t i = 0; i + 1 < r.steps.size(); ++i) {
        assert(r.steps[i].distance > 0.01);
    }

    json out = to_json(r, c);
    assert(out["steps_taken"] == r.steps_taken());
    assert(out["converged"] == true);
    assert(out["steps"].size() == r.steps.size());

    // Same seed, same trajectory
    RunResult again = run_stabilization(c);
    assert(again.final_state == r.final_state);

    // No tolerance: every step runs
    c.tolerance = 0.0;
    c.steps = 7;
    RunResult all = run_stabilization(c);
    assert(all.steps_taken() == 7);
    assert(!all.converged);

    c.steps = 0;
    RunResult none = run_stabilization(c);
    assert(none.steps_taken() == 0);
    assert(none.final_state == none.initial);

    std::cout << "  PASS" << std::endl;
}

void test_run_errors() {
    std::cout << "Testing run errors..." << std::endl;

    RunConfig c;
    c.stabilizer.dimensionality = 3;
    c.seed = 4;
    c.source = Components{0.5, 0.5};

    bool thrown = false;
    try {
        run_stabilization(c);
    } catch (const DimensionMismatch&) {
        thrown = true;
    }
    assert(thrown);

    c.source.reset();
    c.stabilizer.factor = std::numeric_limits<double>::quiet_NaN();
    thrown = false;
    try {
        run_stabilization(c);
    } catch (const InvalidConfiguration&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_step_once() {
    std::cout << "Testing single explicit step..." << std::endl;

    RunConfig c;
    c.stabilizer.factor = 0.1;
    c.source = Components{1.0, 1.0, 1.0};

    StepResult r = step_once({-0.5, -0.5, -0.5}, c);
    assert(r.report.stability_factor == 1.0);
    assert(near(r.divergence, -3.0, 1e-6));
    for (double x : r.after) assert(near(x, -0.35));
    assert(r.before == Components({-0.5, -0.5, -0.5}));

    json out = to_json(r);
    assert(out["vector"].size() == 3);

    // Fill source sized to the vector
    RunConfig fill;
    fill.stabilizer.factor = 1.0;
    StepResult f = step_once({0.0}, fill);
    assert(f.source == Components({0.5}));
    assert(near(f.after[0], 0.5));

    bool thrown = false;
    try {
        step_once({0.0, 0.0}, c);
    } catch (const DimensionMismatch&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Resonance Tests ===" << std::endl;

    test_construction_range();
    test_seeded_reproducible();
    test_invalid_dimensionality();
    test_concrete_step();
    test_partial_alignment_step();
    test_clamp_saturates();
    test_bounds_invariant();
    test_zero_factor_idempotent();
    test_damping_boundary();
    test_coherence_saturates();
    test_per_dimension_mode();
    test_dimension_mismatch();
    test_asymptotic_approach();
    test_summary();
    test_sources();
    test_run_config();
    test_run_config_errors();
    test_parse_components();
    test_non_finite_rejected();
    test_strict_number_parsing();
    test_run_config_integer_keys();
    test_divergence();
    test_normalized_source();
    test_query_dimension_mismatch();
    test_run_tolerance();
    test_run_errors();
    test_step_once();

    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
