// resonance: drive a stabilizing vector from the command line
//
// Usage: resonance <command> [options]
//
// Commands:
//   run        Create a vector and pull it toward a source for N steps
//   step       Apply one update to an explicit vector
//   help       Show this help

#include <resonance/resonance.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>

using namespace resonance;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Global verbose flag for debug logging
static bool verbose_mode = false;

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count() << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "resonance " << RESONANCE_VERSION << " - Vector stabilization\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Pull a random vector toward a source for N steps\n"
              << "  step               Apply one update to --vector toward --source\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      JSON run configuration (flags override it)\n"
              << "  --dim N            Dimensionality (default: 11)\n"
              << "  --factor F         Step factor (default: 0.1)\n"
              << "  --steps N          Number of updates for run (default: 10)\n"
              << "  --seed N           Seed for the initial vector\n"
              << "  --source CSV       Source vector, e.g. 0.5,0.5,0.5\n"
              << "  --fill V           Fill value when no --source (default: 0.5)\n"
              << "  --vector CSV       Starting vector for step\n"
              << "  --tolerance T      Stop run once distance <= T (default: 0, never)\n"
              << "  --per-dimension    Divide coherence by dimensionality before clipping\n"
              << "  --normalize        Pull toward the unit-length source direction\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static void print_step(const StepRecord& rec) {
    const StepReport& r = rec.report;
    std::cout << std::fixed << std::setprecision(4)
              << "step " << std::setw(3) << rec.step
              << "  coherence=" << r.coherence
              << "  stability=" << r.stability_factor
              << "  moved=" << r.displacement
              << "  clamped=" << r.clamped
              << "  distance=" << rec.distance
              << "  mean=" << rec.mean << "\n";
}

int cmd_run(const RunConfig& config, bool json_output) {
    RunResult result = run_stabilization(config);

    log_debug("run", "dim=%d factor=%.4f mode=%s seed=%llu steps=%d",
              config.stabilizer.dimensionality, config.stabilizer.factor,
              coherence_mode_name(config.stabilizer.coherence_mode),
              static_cast<unsigned long long>(result.seed), config.steps);
    log_debug("run", "initial=[%s]", format_components(result.initial).c_str());
    for (const auto& rec : result.steps) {
        if (rec.report.clamped > 0) {
            log_debug("run", "step %d clamped %zu component(s)", rec.step, rec.report.clamped);
        }
    }

    if (json_output) {
        std::cout << to_json(result, config).dump(2) << "\n";
        return 0;
    }

    std::cout << "StabilizingVector(dim=" << result.initial.size() << ")  distance="
              << std::fixed << std::setprecision(4) << result.initial_distance << "\n";
    for (const auto& rec : result.steps) {
        print_step(rec);
    }
    std::cout << "final [" << format_components(result.final_state) << "]\n";
    std::cout << "steps_taken " << result.steps_taken() << "\n";
    if (result.converged) {
        std::cout << "converged after " << result.steps_taken() << " step(s)\n";
    }
    return 0;
}

int cmd_step(const std::string& vector_csv, const RunConfig& config, bool json_output) {
    if (vector_csv.empty()) {
        std::cerr << "Usage: resonance step --vector CSV [--source CSV | --fill V] [--factor F]\n";
        return 1;
    }

    StepResult result = step_once(parse_components(vector_csv), config);

    log_debug("step", "before=[%s] source=[%s]",
              format_components(result.before).c_str(),
              format_components(result.source).c_str());

    if (json_output) {
        std::cout << to_json(result).dump(2) << "\n";
    } else {
        const StepReport& report = result.report;
        std::cout << std::fixed << std::setprecision(4)
                  << "coherence=" << report.coherence
                  << "  clipped=" << report.clipped
                  << "  stability=" << report.stability_factor
                  << "  moved=" << report.displacement
                  << "  clamped=" << report.clamped
                  << "  divergence=" << result.divergence << "\n"
                  << "[" << format_components(result.after, 6) << "]\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command;
    std::string config_path;
    std::string vector_csv;
    bool json_output = false;

    // Flag values are applied after the config file is loaded
    std::optional<std::string> dim_arg, factor_arg, steps_arg, seed_arg,
                               source_arg, fill_arg, tolerance_arg;
    bool per_dimension = false;
    bool normalize = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--dim") == 0 && i + 1 < argc) {
            dim_arg = argv[++i];
        } else if (strcmp(argv[i], "--factor") == 0 && i + 1 < argc) {
            factor_arg = argv[++i];
        } else if (strcmp(argv[i], "--steps") == 0 && i + 1 < argc) {
            steps_arg = argv[++i];
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed_arg = argv[++i];
        } else if (strcmp(argv[i], "--source") == 0 && i + 1 < argc) {
            source_arg = argv[++i];
        } else if (strcmp(argv[i], "--fill") == 0 && i + 1 < argc) {
            fill_arg = argv[++i];
        } else if (strcmp(argv[i], "--vector") == 0 && i + 1 < argc) {
            vector_csv = argv[++i];
        } else if (strcmp(argv[i], "--tolerance") == 0 && i + 1 < argc) {
            tolerance_arg = argv[++i];
        } else if (strcmp(argv[i], "--per-dimension") == 0) {
            per_dimension = true;
        } else if (strcmp(argv[i], "--normalize") == 0) {
            normalize = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "resonance " << version::string() << "\n";
            return 0;
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        RunConfig config;
        if (!config_path.empty()) {
            config = load_run_config(config_path);
            log_debug("config", "loaded %s", config_path.c_str());
        }
        if (dim_arg) config.stabilizer.dimensionality = parse_int(*dim_arg, "--dim");
        if (factor_arg) config.stabilizer.factor = parse_double(*factor_arg, "--factor");
        if (steps_arg) config.steps = parse_int(*steps_arg, "--steps");
        if (seed_arg) config.seed = parse_seed(*seed_arg);
        if (fill_arg) config.fill = parse_double(*fill_arg, "--fill");
        if (tolerance_arg) config.tolerance = parse_double(*tolerance_arg, "--tolerance");
        if (source_arg) config.source = parse_components(*source_arg);
        if (per_dimension) config.stabilizer.coherence_mode = CoherenceMode::PerDimension;
        if (normalize) config.normalize_source = true;

        if (command == "run") {
            return cmd_run(config, json_output);
        } else if (command == "step") {
            return cmd_step(vector_csv, config, json_output);
        }
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
