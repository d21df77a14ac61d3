#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "comparison.hpp"
#include "logger.hpp"
#include "simulation_engine.hpp"
#include "io/json_writer.hpp"
#include "io/model_loader.hpp"

namespace {

const char* const DEFAULT_SCENARIO = "Base";

struct CLIArgs {
    std::string model_path;
    std::string scenario = DEFAULT_SCENARIO;
    std::string compare_scenario;
    long max_iterations = 100;
    double threshold = 0.001;
    long deadline_ms = 0;
    bool sequential = false;
    std::string output_path;
    std::string log_level = "INFO";
    bool log_json = true;
    bool list_scenarios = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LoopCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --model <path> [options]\n\n";
    std::cerr << "Model options:\n";
    std::cerr << "  --model <path>              JSON model file (blocks, attributes, scenarios)\n";
    std::cerr << "  --scenario <name>           Scenario to run (default: Base, the model defaults)\n";
    std::cerr << "  --compare <name>            Also run <name> and write its changes against --scenario\n";
    std::cerr << "  --list-scenarios            Print the scenario names and exit\n\n";
    std::cerr << "Solver options:\n";
    std::cerr << "  --max-iterations <n>        Iteration cap per cyclic group (default: 100)\n";
    std::cerr << "  --threshold <t>             Convergence threshold (default: 0.001)\n";
    std::cerr << "  --deadline-ms <ms>          Cancel the run after <ms> milliseconds\n";
    std::cerr << "  --sequential                Evaluate each level on one thread\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Structured JSON log lines on stderr (default)\n";
    std::cerr << "  --log-text                  Plain text log lines on stderr\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit status: 0 converged, 2 finished without converging, 1 on error.\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Run the model defaults:\n";
    std::cerr << "     " << program_name << " --model examples/stk_model.json\n\n";
    std::cerr << "  2. Compare a scenario against the defaults:\n";
    std::cerr << "     " << program_name << " --model examples/stk_model.json \\\n";
    std::cerr << "         --compare HighEnergyPrices --output changes.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--model" && i + 1 < argc) {
            args.model_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario = argv[++i];
        } else if (arg == "--compare" && i + 1 < argc) {
            args.compare_scenario = argv[++i];
        } else if (arg == "--max-iterations" && i + 1 < argc) {
            args.max_iterations = std::stol(argv[++i]);
        } else if (arg == "--threshold" && i + 1 < argc) {
            args.threshold = std::stod(argv[++i]);
        } else if (arg == "--deadline-ms" && i + 1 < argc) {
            args.deadline_ms = std::stol(argv[++i]);
        } else if (arg == "--sequential") {
            args.sequential = true;
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else if (arg == "--log-text") {
            args.log_json = false;
        } else if (arg == "--list-scenarios") {
            args.list_scenarios = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.model_path.empty()) {
        std::cerr << "Error: --model is required\n";
        valid = false;
    } else if (!file_exists(args.model_path)) {
        std::cerr << "Error: Model file not found: " << args.model_path << "\n";
        valid = false;
    }

    if (args.max_iterations <= 0) {
        std::cerr << "Error: --max-iterations must be greater than 0\n";
        valid = false;
    }

    if (args.threshold <= 0) {
        std::cerr << "Error: --threshold must be positive\n";
        valid = false;
    }

    if (args.deadline_ms < 0) {
        std::cerr << "Error: --deadline-ms must be non-negative\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (!args.compare_scenario.empty() && args.compare_scenario == args.scenario) {
        std::cerr << "Error: --compare must name a different scenario than --scenario\n";
        valid = false;
    }

    return valid;
}

// The default scenario exists even when the model file does not define it
loopcalc::RunResult run_scenario(const loopcalc::SimulationEngine& engine,
                                 const std::string& name,
                                 const loopcalc::RunOptions& options) {
    if (name == DEFAULT_SCENARIO && !engine.scenarios().contains(name)) {
        return engine.run_defaults(name, options);
    }
    return engine.run(name, options);
}

int exit_code(const loopcalc::RunResult& result) {
    switch (result.status) {
        case loopcalc::RunState::DONE: return 0;
        case loopcalc::RunState::EXHAUSTED: return 2;
        default: return 1;
    }
}

void report(const loopcalc::RunResult& result) {
    std::cerr << "\nScenario " << result.scenario << ": " << loopcalc::state_to_string(result.status);
    if (result.from_cache) {
        std::cerr << " (cached)";
    }
    std::cerr << "\n";

    for (const auto& group : result.diagnostics.per_group) {
        std::cerr << "  Group";
        for (const auto& member : group.members) {
            std::cerr << " " << member;
        }
        std::cerr << ": " << (group.converged ? "converged" : "not converged")
                  << " in " << group.iterations << " iterations"
                  << " (max delta " << group.max_delta << ")\n";
    }
    if (!result.error_message.empty()) {
        std::cerr << "  Error: " << result.error_message << "\n";
    }
    std::cerr << "  Execution: " << result.execution_time_ms << " ms\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    bool parsed = false;
    try {
        parsed = parse_args(argc, argv, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << "\n\n";
    }
    if (!parsed) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    loopcalc::LoggerConfig log_config;
    log_config.min_level = loopcalc::string_to_level(args.log_level);
    log_config.enable_json = args.log_json;
    loopcalc::Logger::get_instance().configure(log_config);

    try {
        loopcalc::io::LoadedModel model = loopcalc::io::load_model_from_file(args.model_path);

        if (args.list_scenarios) {
            if (!model.scenarios.contains(DEFAULT_SCENARIO)) {
                std::cout << DEFAULT_SCENARIO << "\n";
            }
            for (const auto& name : model.scenarios.names()) {
                std::cout << name << "\n";
            }
            return 0;
        }

        std::cerr << "LoopCalc Engine v1.0.0\n";
        std::cerr << "Configuration:\n";
        std::cerr << "  Model:          " << args.model_path << " (version " << model.registry.version() << ")\n";
        if (!model.description.empty()) {
            std::cerr << "  Description:    " << model.description << "\n";
        }
        std::cerr << "  Attributes:     " << model.registry.size() << "\n";
        std::cerr << "  Scenario:       " << args.scenario << "\n";
        if (!args.compare_scenario.empty()) {
            std::cerr << "  Compare with:   " << args.compare_scenario << "\n";
        }
        std::cerr << "  Max iterations: " << args.max_iterations << "\n";
        std::cerr << "  Threshold:      " << args.threshold << "\n";

        loopcalc::SimulationEngine engine(model.registry, model.scenarios);
        std::cerr << "  Cyclic groups:  " << engine.analysis().cyclic_count() << "\n";
        std::cerr << "  Levels:         " << engine.analysis().levels.size() << "\n";

        loopcalc::RunOptions options;
        options.max_iterations = static_cast<size_t>(args.max_iterations);
        options.threshold = args.threshold;
        options.parallel = !args.sequential;
        if (args.deadline_ms > 0) {
            options.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(args.deadline_ms);
        }

        loopcalc::RunResult result = run_scenario(engine, args.scenario, options);
        report(result);

        if (args.compare_scenario.empty()) {
            if (args.output_path.empty()) {
                loopcalc::io::write_run_result_json(std::cout, result);
            } else {
                loopcalc::io::write_run_result_json(args.output_path, result);
                std::cerr << "\nOutput written to: " << args.output_path << "\n";
            }
            return exit_code(result);
        }

        loopcalc::RunResult other = run_scenario(engine, args.compare_scenario, options);
        report(other);

        if (!result.success() || !other.success()) {
            std::cerr << "\nError: Cannot compare scenarios, a run did not complete\n";
            return 1;
        }

        loopcalc::ScenarioComparison comparison = loopcalc::compare_results(result, other);
        std::cerr << "\nChanged attributes: " << comparison.changed().size() << " of "
                  << comparison.changes.size() << "\n";

        if (args.output_path.empty()) {
            loopcalc::io::write_comparison_json(std::cout, comparison);
        } else {
            loopcalc::io::write_comparison_json(args.output_path, comparison);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        return std::max(exit_code(result), exit_code(other));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
