#pragma once

#include "kernel/kernel_simulation.h"
#include "kernel/pending_speed_commands.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace flowsim::testing {

// In-process kernel with a fixed traffic script. Within a run, vehicle k
// departs on step k+1 (up to vehicle_cap) at base_speed + k, and the oldest
// vehicle arrives on arrival_step.
struct ScriptedScenario final {
    int vehicle_cap = 2;
    double base_speed = 10.0;
    int arrival_step = 0;
    int terminal_step = 0;
    // Counted over all runs; 0 disables.
    int fail_on_advance = 0;
    bool fail_start = false;
    // Runs past the end of the list carry traffic.
    std::vector<bool> run_has_traffic;
};

class ScriptedKernel final : public kernel::IKernelSimulation {
public:
    explicit ScriptedKernel(ScriptedScenario scenario) : scenario_(std::move(scenario)) {}

    const char* BackendName() const override {
        return "scripted";
    }

    bool Start(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) override {
        (void)network;
        (void)config;
        ++starts;
        if (scenario_.fail_start) {
            out_error.Set(core::ErrorKind::Connection, "scripted backend refused to start");
            return false;
        }
        started_ = true;
        BeginRun();
        out_error.Clear();
        return true;
    }

    bool Reset(core::Error& out_error) override {
        ++resets;
        if (!started_) {
            out_error.Set(core::ErrorKind::Initialization, "scripted kernel is not started");
            return false;
        }
        BeginRun();
        out_error.Clear();
        return true;
    }

    bool ApplyVehicleCommands(
        const std::vector<kernel::VehicleCommand>& commands,
        core::Error& out_error) override {
        if (!pending_.Queue(vehicles_, commands, out_error)) {
            return false;
        }
        applied_commands.insert(applied_commands.end(), commands.begin(), commands.end());
        return true;
    }

    bool Advance(double step_size, bool& out_terminal, core::Error& out_error) override {
        out_terminal = false;
        if (!started_) {
            out_error.Set(core::ErrorKind::SimulationCommunication, "scripted kernel is not started");
            return false;
        }
        ++advances;
        if (scenario_.fail_on_advance > 0 && advances == scenario_.fail_on_advance) {
            out_error.Set(core::ErrorKind::SimulationCommunication, "scripted connection lost");
            return false;
        }

        ++step_;
        simulation_time_ += step_size;
        for (const auto& [vehicle_id, speed] : pending_.Take()) {
            for (kernel::VehicleSample& vehicle : active_) {
                if (vehicle.id == vehicle_id) {
                    vehicle.speed = speed;
                }
            }
        }

        int departed = 0;
        int arrived = 0;
        if (RunHasTraffic() && step_ <= scenario_.vehicle_cap) {
            const int index = step_ - 1;
            active_.push_back(kernel::VehicleSample{
                .id = "veh_" + std::to_string(index),
                .speed = scenario_.base_speed + static_cast<double>(index),
                .position = kernel::RoadPosition{.edge_id = "edge_a"},
            });
            ++departed;
        }
        if (step_ == scenario_.arrival_step && !active_.empty()) {
            active_.erase(active_.begin());
            ++arrived;
        }

        vehicles_.ReplaceSnapshot(active_);
        vehicles_.RecordStep(step_size, departed, arrived);
        out_terminal = scenario_.terminal_step > 0 && step_ >= scenario_.terminal_step;
        out_error.Clear();
        return true;
    }

    void Terminate() override {
        ++terminates;
        started_ = false;
    }

    bool IsStarted() const override {
        return started_;
    }

    bool IsFailed() const override {
        return false;
    }

    double SimulationTime() const override {
        return simulation_time_;
    }

    const kernel::VehicleStateCache& Vehicles() const override {
        return vehicles_;
    }

    int starts = 0;
    int resets = 0;
    int advances = 0;
    int terminates = 0;
    std::vector<kernel::VehicleCommand> applied_commands;

private:
    void BeginRun() {
        ++run_index_;
        step_ = 0;
        simulation_time_ = 0.0;
        active_.clear();
        pending_.Clear();
        vehicles_.Clear();
    }

    bool RunHasTraffic() const {
        const std::size_t index = static_cast<std::size_t>(run_index_ - 1);
        return index >= scenario_.run_has_traffic.size() || scenario_.run_has_traffic[index];
    }

    ScriptedScenario scenario_;
    kernel::VehicleStateCache vehicles_;
    kernel::PendingSpeedCommands pending_;
    std::vector<kernel::VehicleSample> active_;
    int run_index_ = 0;
    int step_ = 0;
    double simulation_time_ = 0.0;
    bool started_ = false;
};

}  // namespace flowsim::testing
