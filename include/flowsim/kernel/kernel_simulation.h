#pragma once

#include "core/config.h"
#include "core/error.h"
#include "kernel/vehicle_state_cache.h"
#include "network/network_description.h"

#include <string>
#include <vector>

namespace flowsim::kernel {

struct VehicleCommand final {
    std::string vehicle_id;
    double target_speed = 0.0;
};

// Capability set shared by every simulator backend. Calls are made from one
// thread; at most one step is in flight.
class IKernelSimulation {
public:
    virtual ~IKernelSimulation() = default;

    virtual const char* BackendName() const = 0;

    // Connects the backend and loads the network. Connection failures report
    // ErrorKind::Connection, network load failures ErrorKind::Initialization.
    virtual bool Start(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) = 0;

    // Reloads the network in the running backend and clears cached state.
    virtual bool Reset(core::Error& out_error) = 0;

    // Queued commands are delivered before the next step.
    virtual bool ApplyVehicleCommands(
        const std::vector<VehicleCommand>& commands,
        core::Error& out_error) = 0;

    // Blocks until the backend confirms the step. An I/O failure leaves the
    // kernel failed until the next Reset.
    virtual bool Advance(double step_size, bool& out_terminal, core::Error& out_error) = 0;

    // Never fails; safe to call repeatedly.
    virtual void Terminate() = 0;

    virtual bool IsStarted() const = 0;
    virtual bool IsFailed() const = 0;
    virtual double SimulationTime() const = 0;
    virtual const VehicleStateCache& Vehicles() const = 0;
};

}  // namespace flowsim::kernel
