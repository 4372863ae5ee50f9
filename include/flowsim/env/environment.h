#pragma once

#include "core/config.h"
#include "core/error.h"
#include "kernel/kernel_simulation.h"
#include "network/network_description.h"

#include <functional>
#include <string>
#include <vector>

namespace flowsim::env {

// Vehicle speeds in kernel id order.
using Observation = std::vector<double>;

struct Action final {
    std::vector<kernel::VehicleCommand> commands;
};

struct StepResult final {
    Observation observation;
    double reward = 0.0;
    bool done = false;
};

using RewardFunction = std::function<bool(
    const kernel::IKernelSimulation& kernel,
    double& out_reward,
    std::string& out_error)>;

using ActionFunction = std::function<bool(
    const Observation& observation,
    const kernel::VehicleStateCache& vehicles,
    Action& out_action,
    std::string& out_error)>;

bool ZeroReward(const kernel::IKernelSimulation& kernel, double& out_reward, std::string& out_error);
bool NoOpAction(
    const Observation& observation,
    const kernel::VehicleStateCache& vehicles,
    Action& out_action,
    std::string& out_error);

class Environment final {
public:
    Environment(
        network::NetworkDescription network,
        core::SimulationConfig config,
        kernel::IKernelSimulation& kernel,
        RewardFunction reward_function = ZeroReward);
    ~Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    // The first reset starts the kernel; later resets reload the network.
    bool Reset(Observation& out_observation, core::Error& out_error);
    bool Step(const Action& action, StepResult& out_result, core::Error& out_error);
    void Terminate();

    bool IsTerminated() const;
    int StepCount() const;
    const kernel::VehicleStateCache& Vehicles() const;
    const kernel::IKernelSimulation& Kernel() const;
    const network::NetworkDescription& Network() const;
    const core::SimulationConfig& SimConfig() const;

private:
    network::NetworkDescription network_;
    core::SimulationConfig config_;
    kernel::IKernelSimulation& kernel_;
    RewardFunction reward_function_;
    int step_count_ = 0;
    bool terminated_ = false;
};

}  // namespace flowsim::env
