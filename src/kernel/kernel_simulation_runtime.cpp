#include "kernel/kernel_simulation_runtime.h"

#include "core/logger.h"

#include <string>

namespace flowsim::kernel {

const char* KernelBackendKindName(KernelBackendKind backend_kind) {
    switch (backend_kind) {
        case KernelBackendKind::None:
            return "none";
        case KernelBackendKind::Traci:
            return "traci";
        case KernelBackendKind::Native:
            return "native";
    }

    return "unknown";
}

KernelBackendKind KernelSimulationRuntime::ActiveBackend() const {
    return active_backend_;
}

const char* KernelSimulationRuntime::BackendName() const {
    return KernelBackendKindName(active_backend_);
}

bool KernelSimulationRuntime::Start(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config,
    core::Error& out_error) {
    Terminate();

    IKernelSimulation* kernel = nullptr;
    KernelBackendKind backend_kind = KernelBackendKind::None;
    switch (config.simulator) {
        case core::SimulatorKind::Traci:
            kernel = &traci_kernel_;
            backend_kind = KernelBackendKind::Traci;
            break;
        case core::SimulatorKind::Native:
            kernel = &native_kernel_;
            backend_kind = KernelBackendKind::Native;
            break;
    }

    if (kernel == nullptr) {
        out_error.Set(core::ErrorKind::Configuration, "unsupported simulator selection");
        return false;
    }

    if (!kernel->Start(network, config, out_error)) {
        return false;
    }

    active_kernel_ = kernel;
    active_backend_ = backend_kind;
    core::Logger::Info(
        "kernel",
        std::string("Kernel runtime backend: ") + KernelBackendKindName(active_backend_) + ".");
    return true;
}

bool KernelSimulationRuntime::Reset(core::Error& out_error) {
    if (active_kernel_ == nullptr) {
        out_error.Set(core::ErrorKind::Initialization, "kernel runtime has no active backend");
        return false;
    }

    return active_kernel_->Reset(out_error);
}

bool KernelSimulationRuntime::ApplyVehicleCommands(
    const std::vector<VehicleCommand>& commands,
    core::Error& out_error) {
    if (active_kernel_ == nullptr) {
        out_error.Set(core::ErrorKind::SimulationCommunication, "kernel runtime has no active backend");
        return false;
    }

    return active_kernel_->ApplyVehicleCommands(commands, out_error);
}

bool KernelSimulationRuntime::Advance(double step_size, bool& out_terminal, core::Error& out_error) {
    out_terminal = false;
    if (active_kernel_ == nullptr) {
        out_error.Set(core::ErrorKind::SimulationCommunication, "kernel runtime has no active backend");
        return false;
    }

    return active_kernel_->Advance(step_size, out_terminal, out_error);
}

void KernelSimulationRuntime::Terminate() {
    if (active_kernel_ == nullptr) {
        return;
    }

    active_kernel_->Terminate();
    active_kernel_ = nullptr;
    active_backend_ = KernelBackendKind::None;
}

bool KernelSimulationRuntime::IsStarted() const {
    return active_kernel_ != nullptr && active_kernel_->IsStarted();
}

bool KernelSimulationRuntime::IsFailed() const {
    return active_kernel_ != nullptr && active_kernel_->IsFailed();
}

double KernelSimulationRuntime::SimulationTime() const {
    if (active_kernel_ == nullptr) {
        return 0.0;
    }

    return active_kernel_->SimulationTime();
}

const VehicleStateCache& KernelSimulationRuntime::Vehicles() const {
    if (active_kernel_ == nullptr) {
        return empty_vehicles_;
    }

    return active_kernel_->Vehicles();
}

}  // namespace flowsim::kernel
