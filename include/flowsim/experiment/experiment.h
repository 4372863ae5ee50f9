#pragma once

#include "core/error.h"
#include "env/environment.h"
#include "experiment/emission_converter.h"

#include <filesystem>
#include <vector>

namespace flowsim::experiment {

inline constexpr double kDefaultFlowWindowSeconds = 500.0;
inline constexpr double kMinimumInflowRate = 1e-5;

struct RunOptions final {
    int num_runs = 1;
    int num_steps = 100;
    env::ActionFunction action_function = env::NoOpAction;
    bool convert_to_csv = false;
    bool output_to_terminal = true;
    double flow_window_seconds = kDefaultFlowWindowSeconds;
    EmissionReadiness emission_readiness{};
};

struct RunMetrics final {
    double total_return = 0.0;
    std::vector<double> step_rewards;
    std::vector<double> step_mean_speeds;
    double outflow_rate = 0.0;
    double inflow_rate = 0.0;
    int completed_steps = 0;
    // Steps whose action named a vehicle that was no longer present.
    int dropped_actions = 0;
    bool terminated_early = false;

    double MeanReturn() const;
    double MeanSpeed() const;
    double SpeedDeviation() const;
};

struct MeanAndDeviation final {
    double mean = 0.0;
    double deviation = 0.0;
};

struct AggregateMetrics final {
    std::vector<RunMetrics> runs;

    std::vector<double> returns;
    std::vector<std::vector<double>> velocities;
    std::vector<double> mean_returns;
    std::vector<std::vector<double>> per_step_returns;
    std::vector<double> mean_speeds;
    std::vector<double> outflows;
    std::vector<double> inflows;
    // All zero unless every run saw inflow above kMinimumInflowRate.
    std::vector<double> throughputs;

    double mean_outflows = 0.0;
    MeanAndDeviation return_stats{};
    MeanAndDeviation speed_stats{};
    MeanAndDeviation throughput_stats{};
    // Rounded to two decimals.
    double avg_speed = 0.0;
    double avg_throughput = 0.0;

    // Set when a step failed and the remaining runs were abandoned.
    bool aborted = false;
    std::filesystem::path emission_csv_path;
};

double Mean(const std::vector<double>& values);
double PopulationDeviation(const std::vector<double>& values);
double RoundToHundredths(double value);

// Drives repeated runs of a fixed number of steps against one environment
// and summarizes them.
class Experiment final {
public:
    explicit Experiment(env::Environment& environment);

    bool Run(const RunOptions& options, AggregateMetrics& out_metrics, core::Error& out_error);

private:
    bool RunOnce(
        int run_index,
        const RunOptions& options,
        RunMetrics& out_run,
        core::Error& out_error);
    void Summarize(AggregateMetrics& metrics) const;
    void PrintSummary(const AggregateMetrics& metrics) const;
    bool ConvertEmissions(
        const RunOptions& options,
        AggregateMetrics& metrics,
        core::Error& out_error) const;

    env::Environment& environment_;
};

}  // namespace flowsim::experiment
