#pragma once

#include "kernel/kernel_simulation.h"
#include "kernel/pending_speed_commands.h"
#include "kernel/traci_connection.h"

#include <string>

namespace flowsim::kernel {

class SocketProtocolKernel final : public IKernelSimulation {
public:
    ~SocketProtocolKernel() override;

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

    const TraciConnection& Connection() const;

private:
    bool ConnectAndLoad(core::Error& out_error);
    // Replaces the vehicle snapshot; records a flow log entry when the
    // refresh follows a step.
    bool RefreshState(bool after_step, bool& out_terminal, std::string& out_error);
    void MarkFailed(const std::string& message, core::Error& out_error);

    TraciConnection connection_;
    network::NetworkDescription network_;
    core::SimulationConfig config_;
    VehicleStateCache vehicles_;
    PendingSpeedCommands pending_speeds_;
    double simulation_time_ = 0.0;
    bool started_ = false;
    bool failed_ = false;
};

}  // namespace flowsim::kernel
