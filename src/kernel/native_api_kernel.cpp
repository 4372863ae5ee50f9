#include "kernel/native_api_kernel.h"

#include "core/logger.h"

namespace flowsim::kernel {

NativeApiKernel::~NativeApiKernel() {
    Terminate();
}

const char* NativeApiKernel::BackendName() const {
    return "native";
}

bool NativeApiKernel::Start(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config,
    core::Error& out_error) {
    Terminate();

    network_ = network;
    config_ = config;
    if (!ConnectAndLoad(out_error)) {
        return false;
    }

    started_ = true;
    core::Logger::Info("kernel", "Native kernel started for network '" + network_.name + "'.");
    return true;
}

bool NativeApiKernel::Reset(core::Error& out_error) {
    if (!started_) {
        out_error.Set(core::ErrorKind::Initialization, "native kernel is not started");
        return false;
    }

    pending_speeds_.Clear();
    vehicles_.Clear();
    simulation_time_ = 0.0;

    if (failed_ || !handle_.IsConnected()) {
        core::Logger::Warn("kernel", "Reloading native backend after failure.");
        handle_.Close();
        if (!ConnectAndLoad(out_error)) {
            failed_ = true;
            return false;
        }
        failed_ = false;
        return true;
    }

    std::string error;
    if (!handle_.Reset(error)) {
        failed_ = true;
        out_error.Set(core::ErrorKind::Initialization, error);
        return false;
    }

    std::vector<VehicleSample> samples;
    if (!handle_.ReadVehicles(samples, error)) {
        failed_ = true;
        out_error.Set(core::ErrorKind::Initialization, error);
        return false;
    }
    vehicles_.ReplaceSnapshot(std::move(samples));

    out_error.Clear();
    return true;
}

bool NativeApiKernel::ApplyVehicleCommands(
    const std::vector<VehicleCommand>& commands,
    core::Error& out_error) {
    return pending_speeds_.Queue(vehicles_, commands, out_error);
}

bool NativeApiKernel::Advance(double step_size, bool& out_terminal, core::Error& out_error) {
    out_terminal = false;
    if (!started_) {
        out_error.Set(core::ErrorKind::SimulationCommunication, "native kernel is not started");
        return false;
    }
    if (failed_) {
        out_error.Set(
            core::ErrorKind::SimulationCommunication,
            "native kernel failed earlier; reset required");
        return false;
    }

    std::string error;
    for (const auto& [vehicle_id, speed] : pending_speeds_.Take()) {
        if (!handle_.SetSpeed(vehicle_id, speed, error)) {
            MarkFailed(error, out_error);
            return false;
        }
    }

    flowsim_native_step_result result{};
    if (!handle_.Step(step_size, result, error)) {
        MarkFailed(error, out_error);
        return false;
    }

    std::vector<VehicleSample> samples;
    if (!handle_.ReadVehicles(samples, error)) {
        MarkFailed(error, out_error);
        return false;
    }

    vehicles_.ReplaceSnapshot(std::move(samples));
    vehicles_.RecordStep(result.simulation_time - simulation_time_, result.departed, result.arrived);
    simulation_time_ = result.simulation_time;
    out_terminal = result.terminal != 0;
    out_error.Clear();
    return true;
}

void NativeApiKernel::Terminate() {
    if (!started_ && !handle_.IsConnected()) {
        return;
    }

    handle_.Close();
    pending_speeds_.Clear();
    started_ = false;
    failed_ = false;
    core::Logger::Info("kernel", "Native kernel terminated.");
}

bool NativeApiKernel::IsStarted() const {
    return started_;
}

bool NativeApiKernel::IsFailed() const {
    return failed_;
}

double NativeApiKernel::SimulationTime() const {
    return simulation_time_;
}

const VehicleStateCache& NativeApiKernel::Vehicles() const {
    return vehicles_;
}

bool NativeApiKernel::ConnectAndLoad(core::Error& out_error) {
    if (!handle_.Connect(network_, config_, out_error)) {
        return false;
    }

    std::string error;
    if (!handle_.LoadNetwork(error)) {
        handle_.Close();
        out_error.Set(core::ErrorKind::Initialization, error);
        return false;
    }

    std::vector<VehicleSample> samples;
    if (!handle_.ReadVehicles(samples, error)) {
        handle_.Close();
        out_error.Set(core::ErrorKind::Initialization, error);
        return false;
    }

    vehicles_.Clear();
    vehicles_.ReplaceSnapshot(std::move(samples));
    simulation_time_ = 0.0;
    out_error.Clear();
    return true;
}

void NativeApiKernel::MarkFailed(const std::string& message, core::Error& out_error) {
    failed_ = true;
    core::Logger::Error("kernel", "Native kernel failed: " + message);
    out_error.Set(core::ErrorKind::SimulationCommunication, message);
}

}  // namespace flowsim::kernel
