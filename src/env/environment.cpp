#include "env/environment.h"

#include "core/logger.h"

#include <utility>

namespace flowsim::env {

bool ZeroReward(const kernel::IKernelSimulation& kernel, double& out_reward, std::string& out_error) {
    (void)kernel;
    out_reward = 0.0;
    out_error.clear();
    return true;
}

bool NoOpAction(
    const Observation& observation,
    const kernel::VehicleStateCache& vehicles,
    Action& out_action,
    std::string& out_error) {
    (void)observation;
    (void)vehicles;
    out_action.commands.clear();
    out_error.clear();
    return true;
}

Environment::Environment(
    network::NetworkDescription network,
    core::SimulationConfig config,
    kernel::IKernelSimulation& kernel,
    RewardFunction reward_function)
    : network_(std::move(network)),
      config_(std::move(config)),
      kernel_(kernel),
      reward_function_(reward_function ? std::move(reward_function) : RewardFunction(ZeroReward)) {}

Environment::~Environment() {
    Terminate();
}

bool Environment::Reset(Observation& out_observation, core::Error& out_error) {
    out_observation.clear();
    step_count_ = 0;

    if (!kernel_.IsStarted()) {
        if (!kernel_.Start(network_, config_, out_error)) {
            return false;
        }
        terminated_ = false;
    } else if (!kernel_.Reset(out_error)) {
        return false;
    }

    out_observation = kernel_.Vehicles().AllSpeeds();
    out_error.Clear();
    return true;
}

bool Environment::Step(const Action& action, StepResult& out_result, core::Error& out_error) {
    out_result = {};

    if (!action.commands.empty() && !kernel_.ApplyVehicleCommands(action.commands, out_error)) {
        return false;
    }

    bool terminal = false;
    if (!kernel_.Advance(config_.sim_step, terminal, out_error)) {
        return false;
    }
    ++step_count_;

    std::string reward_error;
    if (!reward_function_(kernel_, out_result.reward, reward_error)) {
        out_error.Set(core::ErrorKind::Policy, "reward function failed: " + reward_error);
        return false;
    }

    out_result.observation = kernel_.Vehicles().AllSpeeds();
    out_result.done = terminal;
    out_error.Clear();
    return true;
}

void Environment::Terminate() {
    if (terminated_) {
        return;
    }

    terminated_ = true;
    kernel_.Terminate();
    core::Logger::Info("env", "Environment for '" + network_.name + "' terminated.");
}

bool Environment::IsTerminated() const {
    return terminated_;
}

int Environment::StepCount() const {
    return step_count_;
}

const kernel::VehicleStateCache& Environment::Vehicles() const {
    return kernel_.Vehicles();
}

const kernel::IKernelSimulation& Environment::Kernel() const {
    return kernel_;
}

const network::NetworkDescription& Environment::Network() const {
    return network_;
}

const core::SimulationConfig& Environment::SimConfig() const {
    return config_;
}

}  // namespace flowsim::env
