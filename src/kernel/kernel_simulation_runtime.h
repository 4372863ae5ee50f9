#pragma once

#include "kernel/kernel_simulation.h"
#include "kernel/native_api_kernel.h"
#include "kernel/socket_protocol_kernel.h"

namespace flowsim::kernel {

enum class KernelBackendKind {
    None,
    Traci,
    Native,
};

const char* KernelBackendKindName(KernelBackendKind backend_kind);

// Dispatches to the backend named by SimulationConfig::simulator. Start()
// selects the backend; every other call forwards to it.
class KernelSimulationRuntime final : public IKernelSimulation {
public:
    KernelBackendKind ActiveBackend() const;

    const char* BackendName() const override;
    bool Start(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) override;
    bool Reset(core::Error& out_error) override;
    bool ApplyVehicleCommands(
        const std::vector<VehicleCommand>& commands,
        core::Error& out_error) override;
    bool Advance(double step_size, bool& out_terminal, core::Error& out_error) override;
    void Terminate() override;

    bool IsStarted() const override;
    bool IsFailed() const override;
    double SimulationTime() const override;
    const VehicleStateCache& Vehicles() const override;

private:
    KernelBackendKind active_backend_ = KernelBackendKind::None;
    IKernelSimulation* active_kernel_ = nullptr;
    SocketProtocolKernel traci_kernel_;
    NativeApiKernel native_kernel_;
    VehicleStateCache empty_vehicles_;
};

}  // namespace flowsim::kernel
