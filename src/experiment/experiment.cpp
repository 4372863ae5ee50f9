#include "experiment/experiment.h"

#include "core/logger.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace flowsim::experiment {
namespace {

const env::ActionFunction kNoOpActionFunction = env::NoOpAction;

std::string FormatHundredths(double value) {
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(2) << RoundToHundredths(value);
    return stream.str();
}

std::string FormatStats(const MeanAndDeviation& stats) {
    return FormatHundredths(stats.mean) + " (avg), " + FormatHundredths(stats.deviation) + " (std)";
}

MeanAndDeviation Describe(const std::vector<double>& values) {
    return MeanAndDeviation{
        .mean = Mean(values),
        .deviation = PopulationDeviation(values),
    };
}

}  // namespace

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    double total = 0.0;
    for (const double value : values) {
        total += value;
    }
    return total / static_cast<double>(values.size());
}

double PopulationDeviation(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    const double mean = Mean(values);
    double squared_total = 0.0;
    for (const double value : values) {
        squared_total += (value - mean) * (value - mean);
    }
    return std::sqrt(squared_total / static_cast<double>(values.size()));
}

double RoundToHundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

double RunMetrics::MeanReturn() const {
    return Mean(step_rewards);
}

double RunMetrics::MeanSpeed() const {
    return Mean(step_mean_speeds);
}

double RunMetrics::SpeedDeviation() const {
    return PopulationDeviation(step_mean_speeds);
}

Experiment::Experiment(env::Environment& environment) : environment_(environment) {}

bool Experiment::Run(const RunOptions& options, AggregateMetrics& out_metrics, core::Error& out_error) {
    out_metrics = {};

    if (options.num_runs <= 0 || options.num_steps <= 0) {
        out_error.Set(core::ErrorKind::Configuration, "num_runs and num_steps must be positive");
        return false;
    }
    if (options.convert_to_csv && !environment_.SimConfig().emission_path.has_value()) {
        out_error.Set(
            core::ErrorKind::Configuration,
            "convert_to_csv was requested but no emission_path is configured, so no emission "
            "file will be produced");
        return false;
    }

    core::Logger::Info(
        "experiment",
        "Starting experiment " + environment_.Network().name + ": runs=" +
            std::to_string(options.num_runs) + ", steps=" + std::to_string(options.num_steps));

    core::Error run_error{};
    for (int run_index = 0; run_index < options.num_runs; ++run_index) {
        RunMetrics run{};
        if (!RunOnce(run_index, options, run, run_error)) {
            out_metrics.aborted = true;
            core::Logger::Error(
                "experiment",
                "Run " + std::to_string(run_index) + " abandoned: " + run_error.Describe());
            break;
        }

        if (options.output_to_terminal) {
            core::Logger::Info(
                "experiment",
                "Round " + std::to_string(run_index) + " -- Return: " + std::to_string(run.total_return));
        }
        out_metrics.runs.push_back(std::move(run));
    }

    Summarize(out_metrics);
    if (options.output_to_terminal && !out_metrics.runs.empty()) {
        PrintSummary(out_metrics);
    }

    environment_.Terminate();

    if (run_error.HasError()) {
        out_error = run_error;
        return false;
    }

    if (options.convert_to_csv && !ConvertEmissions(options, out_metrics, out_error)) {
        return false;
    }

    out_error.Clear();
    return true;
}

bool Experiment::RunOnce(
    int run_index,
    const RunOptions& options,
    RunMetrics& out_run,
    core::Error& out_error) {
    core::Logger::Info("experiment", "Iter #" + std::to_string(run_index));

    const env::ActionFunction& action_function =
        options.action_function ? options.action_function : kNoOpActionFunction;

    env::Observation observation;
    if (!environment_.Reset(observation, out_error)) {
        return false;
    }

    for (int step_index = 0; step_index < options.num_steps; ++step_index) {
        env::Action action{};
        std::string action_error;
        if (!action_function(observation, environment_.Vehicles(), action, action_error)) {
            out_error.Set(core::ErrorKind::Policy, "action function failed: " + action_error);
            return false;
        }

        env::StepResult result{};
        if (!environment_.Step(action, result, out_error)) {
            if (out_error.kind != core::ErrorKind::UnknownEntity) {
                return false;
            }
            // Commands are queued all or nothing, so the rejected action never reached the kernel.
            core::Logger::Warn(
                "experiment",
                "Step " + std::to_string(step_index) + " action dropped: " + out_error.message);
            ++out_run.dropped_actions;
            if (!environment_.Step(env::Action{}, result, out_error)) {
                return false;
            }
        }

        out_run.step_mean_speeds.push_back(environment_.Vehicles().MeanSpeed());
        out_run.total_return += result.reward;
        out_run.step_rewards.push_back(result.reward);
        ++out_run.completed_steps;
        observation = std::move(result.observation);

        if (result.done) {
            out_run.terminated_early = step_index + 1 < options.num_steps;
            break;
        }
    }

    // A history shorter than the window degrades to the whole run.
    out_run.outflow_rate = environment_.Vehicles().OutflowRate(options.flow_window_seconds);
    out_run.inflow_rate = environment_.Vehicles().InflowRate(options.flow_window_seconds);
    out_error.Clear();
    return true;
}

void Experiment::Summarize(AggregateMetrics& metrics) const {
    bool all_inflows_positive = true;
    for (const RunMetrics& run : metrics.runs) {
        metrics.returns.push_back(run.total_return);
        metrics.velocities.push_back(run.step_mean_speeds);
        metrics.mean_returns.push_back(run.MeanReturn());
        metrics.per_step_returns.push_back(run.step_rewards);
        metrics.mean_speeds.push_back(run.MeanSpeed());
        metrics.outflows.push_back(run.outflow_rate);
        metrics.inflows.push_back(run.inflow_rate);
        all_inflows_positive = all_inflows_positive && run.inflow_rate > kMinimumInflowRate;
    }

    // One run with negligible inflow zeroes the throughput of every run.
    for (std::size_t index = 0; index < metrics.runs.size(); ++index) {
        metrics.throughputs.push_back(
            all_inflows_positive ? metrics.outflows[index] / metrics.inflows[index] : 0.0);
    }

    metrics.mean_outflows = Mean(metrics.outflows);
    metrics.return_stats = Describe(metrics.returns);
    metrics.speed_stats = Describe(metrics.mean_speeds);
    metrics.throughput_stats = Describe(metrics.throughputs);
    metrics.avg_speed = RoundToHundredths(metrics.speed_stats.mean);
    metrics.avg_throughput = RoundToHundredths(metrics.throughput_stats.mean);
}

void Experiment::PrintSummary(const AggregateMetrics& metrics) const {
    core::Logger::Info("experiment", "Return: " + FormatStats(metrics.return_stats));
    core::Logger::Info("experiment", "Speed (m/s): " + FormatStats(metrics.speed_stats));
    core::Logger::Info("experiment", "Throughput (veh/hr): " + FormatStats(metrics.throughput_stats));
}

bool Experiment::ConvertEmissions(
    const RunOptions& options,
    AggregateMetrics& metrics,
    core::Error& out_error) const {
    const std::filesystem::path xml_path =
        core::EmissionXmlPath(environment_.SimConfig(), environment_.Network().name);

    std::string error;
    if (!EmissionConverter::ConvertAndRemove(
            xml_path,
            options.emission_readiness,
            metrics.emission_csv_path,
            error)) {
        out_error.Set(core::ErrorKind::EmissionConversion, error);
        return false;
    }

    out_error.Clear();
    return true;
}

}  // namespace flowsim::experiment
