#include "core/logger.h"
#include "script/policy_script.h"

#include "fixtures/scripted_kernel.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

#if !defined(FLOWSIM_WITH_LUAJIT)

bool TestDisabledBuild() {
    bool passed = true;
    flowsim::script::LuaPolicyScript script;
    std::string error;
    passed &= Expect(
        !script.LoadSource("policy", "function flowsim_reward() return 1 end", error),
        "Load should fail without LuaJIT.");
    passed &= Expect(
        error == "LuaJIT support is disabled at build time.",
        "Disabled build should say so.");
    passed &= Expect(!script.IsLoaded(), "Script should not report loaded.");

    double reward = 1.0;
    passed &= Expect(!script.ComputeReward(0.0, {}, reward, error), "Reward should fail without LuaJIT.");
    passed &= Expect(reward == 0.0, "Failed reward should be zero.");
    return passed;
}

#else

const char* const kRingPolicy =
    "local function mean(values)\n"
    "  if #values == 0 then return 0 end\n"
    "  local total = 0\n"
    "  for i = 1, #values do total = total + values[i] end\n"
    "  return total / #values\n"
    "end\n"
    "function flowsim_reward(time, speeds)\n"
    "  return mean(speeds) + time\n"
    "end\n"
    "function flowsim_actions(ids, speeds)\n"
    "  local commands = {}\n"
    "  for i = 1, #ids do\n"
    "    if speeds[i] > 10.5 then commands[ids[i]] = 10.5 end\n"
    "  end\n"
    "  commands['veh_0'] = 4\n"
    "  return commands\n"
    "end\n";

bool TestRewardAndActions() {
    bool passed = true;
    flowsim::script::LuaPolicyScript script;
    std::string error;

    passed &= Expect(script.LoadSource("ring_policy", kRingPolicy, error), "Policy script should load.");
    passed &= Expect(script.IsLoaded(), "Loaded script should report loaded.");
    passed &= Expect(script.HasRewardFunction() && script.HasActionFunction(), "Both hooks should be found.");

    double reward = 0.0;
    passed &= Expect(script.ComputeReward(2.0, {10.0, 20.0}, reward, error), "Reward should evaluate.");
    passed &= Expect(reward == 17.0, "Reward should see time and speeds.");
    passed &= Expect(script.ComputeReward(0.0, {}, reward, error) && reward == 0.0, "Empty speeds should work.");

    std::vector<flowsim::kernel::VehicleCommand> commands;
    passed &= Expect(
        script.ComputeActions({"veh_2", "veh_1", "veh_0"}, {12.0, 9.0, 11.0}, commands, error),
        "Actions should evaluate.");
    passed &= Expect(commands.size() == 2, "Only the vehicles named by the script should be commanded.");
    if (commands.size() == 2) {
        passed &= Expect(
            commands[0].vehicle_id == "veh_0" && commands[0].target_speed == 4.0,
            "Commands should be sorted by vehicle id.");
        passed &= Expect(
            commands[1].vehicle_id == "veh_2" && commands[1].target_speed == 10.5,
            "Commanded speed should come from the script.");
    }

    flowsim::testing::ScriptedKernel kernel(flowsim::testing::ScriptedScenario{});
    flowsim::core::SimulationConfig config{};
    config.sim_step = 1.0;
    flowsim::network::NetworkDescription network{};
    network.name = "ring";
    flowsim::env::Environment environment(network, config, kernel, script.MakeRewardFunction());
    flowsim::env::Observation observation;
    flowsim::env::StepResult result{};
    flowsim::core::Error step_error{};
    passed &= Expect(environment.Reset(observation, step_error), "Environment should start.");
    passed &= Expect(environment.Step(flowsim::env::Action{}, result, step_error), "Step should succeed.");
    passed &= Expect(result.reward == 11.0, "Bound reward should use kernel time and speeds.");

    flowsim::env::Action action{};
    const flowsim::env::ActionFunction policy = script.MakeActionFunction();
    passed &= Expect(policy(result.observation, environment.Vehicles(), action, error), "Bound policy should run.");
    passed &= Expect(
        action.commands.size() == 1 && action.commands[0].vehicle_id == "veh_0",
        "Bound policy should command visible vehicles.");
    passed &= Expect(environment.Step(action, result, step_error), "Scripted command should apply.");
    passed &= Expect(
        result.observation == std::vector<double>({4.0, 11.0}),
        "Scripted command should reach the kernel.");
    return passed;
}

bool TestSandboxAndBudget() {
    bool passed = true;
    flowsim::script::LuaPolicyScript script;
    std::string error;

    passed &= Expect(
        script.LoadSource(
            "sandbox",
            "assert(io == nil and os == nil and require == nil and loadstring == nil)\n"
            "assert(string.dump == nil and collectgarbage == nil)\n"
            "function flowsim_reward(time, speeds)\n"
            "  while true do end\n"
            "end\n",
            error),
        "Sandboxed script should load.");
    passed &= Expect(!script.HasActionFunction(), "Missing action hook should be reported.");

    double reward = 5.0;
    passed &= Expect(!script.ComputeReward(0.0, {1.0}, reward, error), "Endless reward should be stopped.");
    passed &= Expect(
        error.find("instruction budget exceeded") != std::string::npos,
        "Budget error should be reported.");

    std::vector<flowsim::kernel::VehicleCommand> commands{
        flowsim::kernel::VehicleCommand{.vehicle_id = "stale", .target_speed = 1.0}};
    passed &= Expect(
        script.ComputeActions({"veh_0"}, {1.0}, commands, error) && commands.empty(),
        "Missing action hook should produce no commands.");
    return passed;
}

bool TestScriptErrors() {
    bool passed = true;
    flowsim::script::LuaPolicyScript script;
    std::string error;

    passed &= Expect(!script.LoadSource("broken", "function flowsim_reward(", error), "Syntax error should fail.");
    passed &= Expect(error.find("compile failed (broken)") != std::string::npos, "Compile error should name the chunk.");
    passed &= Expect(!script.IsLoaded(), "Failed load should leave nothing loaded.");

    passed &= Expect(!script.LoadSource("raising", "error('boom')", error), "Chunk error should fail.");
    passed &= Expect(error.find("boom") != std::string::npos, "Chunk error should carry its message.");

    passed &= Expect(
        script.LoadSource(
            "misbehaving",
            "function flowsim_reward() return 0 / 0 end\n"
            "function flowsim_actions() return { 5, 6 } end\n",
            error),
        "Misbehaving script should still load.");
    double reward = 0.0;
    passed &= Expect(!script.ComputeReward(0.0, {}, reward, error), "NaN reward should fail.");
    passed &= Expect(error.find("non-finite") != std::string::npos, "NaN reward error should say why.");

    std::vector<flowsim::kernel::VehicleCommand> commands;
    passed &= Expect(!script.ComputeActions({}, {}, commands, error), "Array actions should fail.");
    passed &= Expect(commands.empty(), "Failed actions should produce no commands.");

    passed &= Expect(
        script.LoadSource("quiet", "function flowsim_actions() return nil end\n", error),
        "Quiet script should load.");
    passed &= Expect(
        script.ComputeReward(3.0, {1.0}, reward, error) && reward == 0.0,
        "Missing reward hook should give zero.");
    passed &= Expect(script.ComputeActions({"veh_0"}, {1.0}, commands, error), "Nil actions should be accepted.");

    const std::filesystem::path missing =
        std::filesystem::temp_directory_path() /
        ("flowsim_missing_policy_" +
         std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + ".lua");
    passed &= Expect(!script.LoadFile(missing, error), "Missing script file should fail.");
    return passed;
}

#endif

}  // namespace

int main() {
    flowsim::core::Logger::SetMinimumLevel(flowsim::core::LogLevel::Warn);

    bool passed = true;
#if !defined(FLOWSIM_WITH_LUAJIT)
    passed &= TestDisabledBuild();
#else
    passed &= TestRewardAndActions();
    passed &= TestSandboxAndBudget();
    passed &= TestScriptErrors();
#endif

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] flowsim_script_policy_script_tests\n";
    return 0;
}
