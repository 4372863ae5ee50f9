#include "core/config.h"
#include "core/error.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

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
        ("flowsim_config_loader_test_" + std::to_string(unique_seed));
}

bool WriteConfigFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.close();
    return true;
}

}  // namespace

int main() {
    bool passed = true;

    const std::filesystem::path test_dir = BuildTestDirectory();
    const std::filesystem::path config_path = test_dir / "experiment.cfg";
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
    std::filesystem::create_directories(test_dir, ec);

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "# ring road over TraCI\n"
            "[simulation]\n"
            "simulator = \"traci\"\n"
            "sim_step = 0.5\n"
            "render = true\n"
            "emission_path = \"out/emissions\"\n"
            "seed = 7\n"
            "traci_port = 8813\n"
            "\n"
            "[network]\n"
            "network_name = \"ring\"\n"
            "project_root = \"data/ring\"\n"
            "net_file = \"ring.net.xml\"\n"
            "route_files = [\"a.rou.xml\", \"b.rou.xml\"]\n"
            "\n"
            "[run]\n"
            "num_runs = 3\n"
            "num_steps = 250\n"
            "convert_to_csv = true\n"
            "output_to_terminal = false\n"
            "policy_script = \"policy.lua\"\n"
            "unknown_key = 12\n"),
        "Config file write should succeed.");

    flowsim::core::ExperimentConfig config{};
    std::string error;
    passed &= Expect(
        flowsim::core::ConfigLoader::Load(config_path, config, error),
        "Config load should succeed.");
    passed &= Expect(error.empty(), "Successful config load should not return error.");
    passed &= Expect(
        config.sim.simulator == flowsim::core::SimulatorKind::Traci,
        "Simulator should parse as traci.");
    passed &= Expect(config.sim.sim_step == 0.5, "sim_step should be loaded.");
    passed &= Expect(config.sim.render, "render should be loaded.");
    passed &= Expect(
        config.sim.emission_path.has_value() &&
            *config.sim.emission_path == std::filesystem::path("out/emissions"),
        "emission_path should be loaded.");
    passed &= Expect(config.sim.seed == 7, "seed should be loaded.");
    passed &= Expect(config.sim.traci.port == 8813, "traci_port should be loaded.");
    passed &= Expect(config.sim.traci.binary == "sumo", "sumo binary should keep its default.");
    passed &= Expect(config.network.name == "ring", "network_name should be loaded.");
    passed &= Expect(
        config.network.route_files.size() == 2 &&
            config.network.route_files[1] == std::filesystem::path("b.rou.xml"),
        "route_files array should be loaded in order.");
    passed &= Expect(config.run.num_runs == 3, "num_runs should be loaded.");
    passed &= Expect(config.run.num_steps == 250, "num_steps should be loaded.");
    passed &= Expect(config.run.convert_to_csv, "convert_to_csv should be loaded.");
    passed &= Expect(!config.run.output_to_terminal, "output_to_terminal should be loaded.");
    passed &= Expect(
        config.run.policy_script == std::filesystem::path("policy.lua"),
        "policy_script should be loaded.");

    passed &= Expect(
        flowsim::core::EmissionXmlPath(config.sim, config.network.name) ==
            std::filesystem::path("out/emissions") / "ring-emission.xml",
        "Emission path should follow <path>/<name>-emission.xml.");
    flowsim::core::SimulationConfig no_emission{};
    passed &= Expect(
        flowsim::core::EmissionXmlPath(no_emission, "ring").empty(),
        "Emission path should be empty without emission_path.");

    flowsim::core::ExperimentConfig native_config{};
    passed &= Expect(
        flowsim::core::ConfigLoader::LoadFromText(
            "simulator = \"native\"\n"
            "native_module = \"lib/backend.so\"\n"
            "subnetwork_name = \"Subnetwork 8028981\"\n"
            "replication_name = \"Replication 8050315\"\n"
            "centroid_config_name = \"Centroid Configuration 910\"\n"
            "network_name = \"i210\"\n"
            "template_path = \"i210.ang\"\n",
            native_config,
            error),
        "Native config should load without a net file.");
    passed &= Expect(
        native_config.sim.simulator == flowsim::core::SimulatorKind::Native,
        "Simulator should parse as native.");
    passed &= Expect(
        native_config.sim.native.subnetwork_name == "Subnetwork 8028981",
        "subnetwork_name should keep embedded spaces.");
    passed &= Expect(
        std::string(flowsim::core::SimulatorKindName(native_config.sim.simulator)) == "native",
        "Simulator kind name should round-trip.");

    flowsim::core::ExperimentConfig rejected{};
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText(
            "simulator = \"aimsun\"\nnet_file = \"x.net.xml\"\n",
            rejected,
            error),
        "Unknown simulator kind should fail.");
    passed &= Expect(error.find("line 1") != std::string::npos, "Error should name the line.");

    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("sim_step = 0\nnet_file = \"x\"\n", rejected, error),
        "Non-positive sim_step should fail.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("traci_port = 70000\nnet_file = \"x\"\n", rejected, error),
        "Out-of-range port should fail.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("num_runs = 0\nnet_file = \"x\"\n", rejected, error),
        "Zero runs should fail.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("simulator = \"traci\"\n", rejected, error),
        "TraCI without net_file should fail validation.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText(
            "net_file = \"x\"\nsumo_binary = \"\"\n",
            rejected,
            error),
        "Attach mode without a port should fail validation.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("simulator = \"native\"\n", rejected, error),
        "Native without module should fail validation.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText(
            "net_file = \"x\"\nconvert_to_csv = true\n",
            rejected,
            error),
        "convert_to_csv without emission_path should fail validation.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::LoadFromText("this line has no separator\n", rejected, error),
        "Line without '=' should fail parsing.");
    passed &= Expect(
        !flowsim::core::ConfigLoader::Load(test_dir / "missing.cfg", rejected, error),
        "Missing config file should fail.");

    flowsim::core::Error failure{};
    passed &= Expect(!failure.HasError(), "Default error should be empty.");
    failure.Set(flowsim::core::ErrorKind::UnknownEntity, "unknown vehicle id 'veh_9'");
    passed &= Expect(failure.HasError(), "Set error should report HasError.");
    passed &= Expect(
        failure.Describe().find("unknown vehicle id 'veh_9'") != std::string::npos,
        "Describe should include the message.");
    failure.Clear();
    passed &= Expect(
        !failure.HasError() && failure.kind == flowsim::core::ErrorKind::None,
        "Clear should reset the error.");
    passed &= Expect(
        std::string(flowsim::core::ErrorKindName(flowsim::core::ErrorKind::SimulationCommunication)) !=
            "unknown",
        "Every error kind should have a name.");

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] flowsim_core_config_tests\n";
    return 0;
}
