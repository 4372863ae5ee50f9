#pragma once

#include "kernel/kernel_simulation.h"
#include "kernel/native_module_handle.h"
#include "kernel/pending_speed_commands.h"

#include <string>

namespace flowsim::kernel {

class NativeApiKernel final : public IKernelSimulation {
public:
    ~NativeApiKernel() override;

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
    bool ConnectAndLoad(core::Error& out_error);
    void MarkFailed(const std::string& message, core::Error& out_error);

    NativeModuleHandle handle_;
    network::NetworkDescription network_;
    core::SimulationConfig config_;
    VehicleStateCache vehicles_;
    PendingSpeedCommands pending_speeds_;
    double simulation_time_ = 0.0;
    bool started_ = false;
    bool failed_ = false;
};

}  // namespace flowsim::kernel
