#include "kernel/kernel_simulation_runtime.h"
#include "kernel/native_api_kernel.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#ifndef FLOWSIM_TEST_NATIVE_BACKEND_PATH
#error "FLOWSIM_TEST_NATIVE_BACKEND_PATH must name the corridor test backend module"
#endif

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::filesystem::path BuildTestDirectory() {
    const auto unique_seed =
        std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        ("flowsim_native_api_kernel_test_" + std::to_string(unique_seed));
}

flowsim::core::SimulationConfig CorridorConfig() {
    flowsim::core::SimulationConfig config{};
    config.simulator = flowsim::core::SimulatorKind::Native;
    config.sim_step = 0.5;
    config.native.module_path = FLOWSIM_TEST_NATIVE_BACKEND_PATH;
    config.native.subnetwork_name = "Subnetwork 8028981";
    config.native.replication_name = "Replication 8050315";
    config.native.centroid_config_name = "Centroid Configuration 910";
    return config;
}

flowsim::network::NetworkDescription CorridorNetwork(const std::filesystem::path& template_path) {
    flowsim::network::NetworkDescription network{};
    network.name = "corridor";
    network.template_path = template_path;
    return network;
}

struct StepTrace final {
    bool terminal = false;
    double time = 0.0;
    std::vector<std::string> ids;
    std::vector<double> speeds;
    std::vector<double> lane_positions;

    bool operator==(const StepTrace&) const = default;
};

bool TraceSteps(
    flowsim::kernel::NativeApiKernel& kernel,
    int steps,
    std::vector<StepTrace>& out_trace,
    flowsim::core::Error& out_error) {
    out_trace.clear();
    for (int step = 0; step < steps; ++step) {
        StepTrace trace{};
        if (!kernel.Advance(0.5, trace.terminal, out_error)) {
            return false;
        }
        trace.time = kernel.SimulationTime();
        trace.ids = kernel.Vehicles().Ids();
        trace.speeds = kernel.Vehicles().AllSpeeds();
        for (const std::string& vehicle_id : trace.ids) {
            flowsim::kernel::RoadPosition position{};
            if (!kernel.Vehicles().Position(vehicle_id, position, out_error)) {
                return false;
            }
            trace.lane_positions.push_back(position.lane_position);
        }
        out_trace.push_back(std::move(trace));
    }
    return true;
}

bool TestCorridorRun(const std::filesystem::path& template_path) {
    bool passed = true;
    flowsim::kernel::NativeApiKernel kernel;
    flowsim::core::Error error{};

    passed &= Expect(
        kernel.Start(CorridorNetwork(template_path), CorridorConfig(), error),
        "Native kernel should load the corridor backend.");
    passed &= Expect(std::string(kernel.BackendName()) == "native", "Backend name should be native.");
    passed &= Expect(kernel.Vehicles().Count() == 0, "Corridor should start empty.");

    bool terminal = false;
    passed &= Expect(kernel.Advance(0.5, terminal, error), "First step should succeed.");
    passed &= Expect(!terminal, "Corridor never ends on its own.");
    passed &= Expect(kernel.SimulationTime() == 0.5, "Simulation time should follow the step.");
    passed &= Expect(
        kernel.Vehicles().Ids() == std::vector<std::string>({"corridor_0"}),
        "First vehicle should enter on the first step.");

    double speed = 0.0;
    passed &= Expect(
        kernel.Vehicles().Speed("corridor_0", speed, error) && speed == 10.0,
        "Entering vehicle should drive at 10 m/s.");

    passed &= Expect(
        kernel.ApplyVehicleCommands(
            {flowsim::kernel::VehicleCommand{.vehicle_id = "corridor_0", .target_speed = 4.0}},
            error),
        "Speed command should queue.");
    passed &= Expect(kernel.Advance(0.5, terminal, error), "Second step should succeed.");
    passed &= Expect(
        kernel.Vehicles().Speed("corridor_0", speed, error) && speed == 4.0,
        "Commanded speed should be applied before the step.");
    flowsim::kernel::RoadPosition position{};
    passed &= Expect(
        kernel.Vehicles().Position("corridor_0", position, error) && position.edge_id == "corridor" &&
            position.lane_position == 2.0,
        "Vehicle should advance at the commanded speed.");

    for (int step = 0; step < 38; ++step) {
        if (!kernel.Advance(0.5, terminal, error)) {
            passed &= Expect(false, "Corridor steps should succeed.");
            break;
        }
    }
    passed &= Expect(kernel.SimulationTime() == 20.0, "Forty half-second steps should reach 20 s.");
    passed &= Expect(
        kernel.Vehicles().InflowRate(500.0) == 3600.0 * 11.0 / 20.0,
        "One vehicle every two seconds, starting at t=0, should enter over 20 s.");
    passed &= Expect(kernel.Vehicles().OutflowRate(500.0) == 0.0, "No vehicle covers 200 m within 20 s.");

    passed &= Expect(kernel.Reset(error), "Reset should rewind the backend.");
    passed &= Expect(
        kernel.SimulationTime() == 0.0 && kernel.Vehicles().Count() == 0 && kernel.Vehicles().FlowLog().empty(),
        "Reset should clear the kernel state.");

    std::vector<StepTrace> first_pass;
    std::vector<StepTrace> second_pass;
    passed &= Expect(TraceSteps(kernel, 12, first_pass, error), "First traced pass should succeed.");
    passed &= Expect(kernel.Reset(error), "Reset between passes should succeed.");
    passed &= Expect(TraceSteps(kernel, 12, second_pass, error), "Second traced pass should succeed.");
    passed &= Expect(
        first_pass.size() == 12 && first_pass == second_pass,
        "Same step sizes after reset should reproduce the same run.");
    passed &= Expect(
        !first_pass.empty() && first_pass.back().ids.size() == 4,
        "Six seconds should see the vehicles spawned at 0, 2, 4 and 6 s.");

    kernel.Terminate();
    passed &= Expect(!kernel.IsStarted(), "Terminated kernel should not report started.");
    kernel.Terminate();
    return passed;
}

bool TestStartFailures(const std::filesystem::path& test_dir, const std::filesystem::path& template_path) {
    bool passed = true;
    flowsim::core::Error error{};

    flowsim::kernel::NativeApiKernel missing_template;
    passed &= Expect(
        !missing_template.Start(CorridorNetwork(test_dir / "missing.ang"), CorridorConfig(), error),
        "Missing template should fail start.");
    passed &= Expect(
        error.kind == flowsim::core::ErrorKind::Initialization,
        "Missing template should be an initialization error.");
    passed &= Expect(error.message.find("missing.ang") != std::string::npos, "Error should name the template.");

    flowsim::core::SimulationConfig no_subnetwork = CorridorConfig();
    no_subnetwork.native.subnetwork_name.clear();
    flowsim::kernel::NativeApiKernel unselected;
    passed &= Expect(
        !unselected.Start(CorridorNetwork(template_path), no_subnetwork, error),
        "Empty subnetwork should fail start.");
    passed &= Expect(
        error.kind == flowsim::core::ErrorKind::Initialization,
        "Empty subnetwork should be an initialization error.");

    flowsim::core::SimulationConfig missing_module = CorridorConfig();
    missing_module.native.module_path = test_dir / "libmissing_backend.so";
    flowsim::kernel::NativeApiKernel unloadable;
    passed &= Expect(
        !unloadable.Start(CorridorNetwork(template_path), missing_module, error),
        "Missing module should fail start.");
    passed &= Expect(
        error.kind == flowsim::core::ErrorKind::Connection,
        "Missing module should be a connection error.");
    passed &= Expect(!unloadable.IsStarted(), "Failed start should leave the kernel stopped.");
    return passed;
}

bool TestBackendFailureMidRun(const std::filesystem::path& template_path) {
    bool passed = true;
    flowsim::core::Error error{};
    flowsim::core::SimulationConfig config = CorridorConfig();
    config.native.replication_name = "unstable";

    flowsim::kernel::NativeApiKernel kernel;
    passed &= Expect(kernel.Start(CorridorNetwork(template_path), config, error), "Unstable corridor should load.");

    bool terminal = false;
    int completed = 0;
    while (kernel.Advance(0.5, terminal, error)) {
        ++completed;
    }
    passed &= Expect(completed == 3, "Unstable replication should fail on its fourth step.");
    passed &= Expect(
        error.kind == flowsim::core::ErrorKind::SimulationCommunication,
        "Backend step failure should be a communication error.");
    passed &= Expect(error.message.find("replication diverged") != std::string::npos, "Backend error should surface.");
    passed &= Expect(kernel.IsFailed(), "Kernel should be marked failed.");

    passed &= Expect(kernel.Reset(error), "Reset should reload the module after a failure.");
    passed &= Expect(!kernel.IsFailed(), "Reloaded kernel should be healthy.");
    passed &= Expect(kernel.Advance(0.5, terminal, error), "Stepping after reload should succeed.");
    kernel.Terminate();
    return passed;
}

bool TestEmissionOutput(const std::filesystem::path& test_dir, const std::filesystem::path& template_path) {
    bool passed = true;
    flowsim::core::Error error{};
    flowsim::core::SimulationConfig config = CorridorConfig();
    config.emission_path = test_dir / "emissions";

    flowsim::kernel::KernelSimulationRuntime runtime;
    passed &= Expect(
        runtime.Start(CorridorNetwork(template_path), config, error),
        "Runtime should start the native backend.");
    passed &= Expect(
        runtime.ActiveBackend() == flowsim::kernel::KernelBackendKind::Native,
        "Runtime should select the native backend.");
    bool terminal = false;
    for (int step = 0; step < 4; ++step) {
        passed &= Expect(runtime.Advance(0.5, terminal, error), "Runtime steps should succeed.");
    }
    runtime.Terminate();

    const std::filesystem::path emission_file = test_dir / "emissions" / "corridor-emission.xml";
    passed &= Expect(std::filesystem::exists(emission_file), "Backend should write the emission file.");
    std::ifstream file(emission_file);
    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    passed &= Expect(content.find("<timestep time=\"2.00\">") != std::string::npos, "Every step should be written.");
    passed &= Expect(content.find("</emission-export>") != std::string::npos, "Terminate should close the file.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    const std::filesystem::path test_dir = BuildTestDirectory();
    std::error_code ec;
    std::filesystem::create_directories(test_dir, ec);
    const std::filesystem::path template_path = test_dir / "corridor.ang";
    {
        std::ofstream template_file(template_path);
        template_file << "corridor template\n";
    }

    passed &= TestCorridorRun(template_path);
    passed &= TestStartFailures(test_dir, template_path);
    passed &= TestBackendFailureMidRun(template_path);
    passed &= TestEmissionOutput(test_dir, template_path);

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] flowsim_kernel_native_api_kernel_tests\n";
    return 0;
}
