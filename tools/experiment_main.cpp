#include "core/cfg_parser.h"
#include "core/config.h"
#include "core/error.h"
#include "core/logger.h"
#include "env/environment.h"
#include "experiment/experiment.h"
#include "kernel/kernel_simulation_runtime.h"
#include "network/network_importer.h"
#include "script/policy_script.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

struct ExperimentOptions final {
    std::filesystem::path config_path;
    std::optional<int> runs;
    std::optional<int> steps;
    bool convert_to_csv = false;
    bool quiet = false;
};

bool ParseCount(std::string_view text, int& out_value) {
    int parsed = 0;
    if (!flowsim::core::cfg::ParseInt(text, parsed) || parsed <= 0) {
        return false;
    }
    out_value = parsed;
    return true;
}

bool ParseArguments(
    int argc,
    char** argv,
    ExperimentOptions& out_options,
    std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        auto read_value = [&](const char* key) -> std::string {
            if (index + 1 >= argc) {
                out_error = std::string("Missing value for option: ") + key;
                return {};
            }
            ++index;
            return argv[index];
        };

        if (arg == "--config") {
            const std::string value = read_value("--config");
            if (value.empty()) {
                return false;
            }
            out_options.config_path = value;
            continue;
        }

        if (arg == "--runs") {
            const std::string value = read_value("--runs");
            if (value.empty()) {
                return false;
            }
            int runs = 0;
            if (!ParseCount(value, runs)) {
                out_error = "Invalid --runs value";
                return false;
            }
            out_options.runs = runs;
            continue;
        }

        if (arg == "--steps") {
            const std::string value = read_value("--steps");
            if (value.empty()) {
                return false;
            }
            int steps = 0;
            if (!ParseCount(value, steps)) {
                out_error = "Invalid --steps value";
                return false;
            }
            out_options.steps = steps;
            continue;
        }

        if (arg == "--convert-to-csv") {
            out_options.convert_to_csv = true;
            continue;
        }

        if (arg == "--quiet") {
            out_options.quiet = true;
            continue;
        }

        out_error = "Unknown option: " + arg;
        return false;
    }

    if (out_options.config_path.empty()) {
        out_error = "--config is required";
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  flowsim_experiment --config <path> [--runs <count>] [--steps <count>] "
        << "[--convert-to-csv] [--quiet]\n"
        << "\n"
        << "Examples:\n"
        << "  flowsim_experiment --config config/ring_traci.cfg --runs 3 --steps 1500\n"
        << "  flowsim_experiment --config config/i210_native.cfg --convert-to-csv\n";
}

std::filesystem::path ResolveAgainst(
    const std::filesystem::path& root,
    const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return (root / path).lexically_normal();
}

}  // namespace

int main(int argc, char** argv) {
    ExperimentOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    flowsim::core::ExperimentConfig config{};
    if (!flowsim::core::ConfigLoader::Load(options.config_path, config, error)) {
        flowsim::core::Logger::Error("experiment", "Config load failed: " + error);
        return 1;
    }
    flowsim::core::Logger::Info("experiment", "Config loaded: " + options.config_path.string());

    if (options.runs.has_value()) {
        config.run.num_runs = *options.runs;
    }
    if (options.steps.has_value()) {
        config.run.num_steps = *options.steps;
    }
    if (options.convert_to_csv) {
        config.run.convert_to_csv = true;
    }
    if (options.quiet) {
        config.run.output_to_terminal = false;
        flowsim::core::Logger::SetMinimumLevel(flowsim::core::LogLevel::Warn);
    }
    if (!flowsim::core::ConfigLoader::Validate(config, error)) {
        flowsim::core::Logger::Error("experiment", "Invalid configuration: " + error);
        return 1;
    }

    flowsim::network::NetworkDescription network{};
    if (!flowsim::network::NetworkImporter::Import(config.network, network, error)) {
        flowsim::core::Logger::Error("experiment", "Network import failed: " + error);
        return 1;
    }

    flowsim::script::LuaPolicyScript policy_script;
    flowsim::env::RewardFunction reward_function = flowsim::env::ZeroReward;
    flowsim::env::ActionFunction action_function = flowsim::env::NoOpAction;
    if (!config.run.policy_script.empty()) {
        const std::filesystem::path script_path =
            ResolveAgainst(config.network.project_root, config.run.policy_script);
        if (!policy_script.LoadFile(script_path, error)) {
            flowsim::core::Logger::Error("experiment", "Policy script load failed: " + error);
            return 1;
        }
        if (policy_script.HasRewardFunction()) {
            reward_function = policy_script.MakeRewardFunction();
        }
        if (policy_script.HasActionFunction()) {
            action_function = policy_script.MakeActionFunction();
        }
    }

    flowsim::kernel::KernelSimulationRuntime kernel;
    flowsim::env::Environment environment(
        std::move(network),
        config.sim,
        kernel,
        std::move(reward_function));

    flowsim::experiment::RunOptions run_options{};
    run_options.num_runs = config.run.num_runs;
    run_options.num_steps = config.run.num_steps;
    run_options.action_function = std::move(action_function);
    run_options.convert_to_csv = config.run.convert_to_csv;
    run_options.output_to_terminal = config.run.output_to_terminal;

    flowsim::experiment::Experiment experiment(environment);
    flowsim::experiment::AggregateMetrics metrics{};
    flowsim::core::Error run_error{};
    if (!experiment.Run(run_options, metrics, run_error)) {
        flowsim::core::Logger::Error(
            "experiment",
            "Experiment failed after " + std::to_string(metrics.runs.size()) +
                " completed run(s): " + run_error.Describe());
        return 1;
    }

    std::cout
        << "runs=" << metrics.runs.size()
        << " avg_speed=" << metrics.avg_speed
        << " avg_throughput=" << metrics.avg_throughput << '\n';
    if (!metrics.emission_csv_path.empty()) {
        std::cout << "emission_csv=" << metrics.emission_csv_path.string() << '\n';
    }
    return 0;
}
