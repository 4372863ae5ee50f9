#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowsim::core {

enum class SimulatorKind : std::uint8_t {
    Traci = 0,
    Native = 1,
};

const char* SimulatorKindName(SimulatorKind kind);
bool TryParseSimulatorKind(std::string_view text, SimulatorKind& out_kind);

struct TraciOptions final {
    // Empty binary attaches to an already running server at host:port.
    std::string binary = "sumo";
    std::string gui_binary = "sumo-gui";
    std::string host = "127.0.0.1";
    int port = 0;
    int connect_timeout_ms = 10000;
};

struct NativeOptions final {
    std::filesystem::path module_path;
    std::string subnetwork_name;
    std::string replication_name;
    std::string centroid_config_name;
};

struct SimulationConfig final {
    SimulatorKind simulator = SimulatorKind::Traci;
    double sim_step = 0.1;
    bool render = false;
    std::optional<std::filesystem::path> emission_path;
    int seed = 0;
    TraciOptions traci;
    NativeOptions native;
};

struct NetworkConfig final {
    std::string name = "network";
    std::filesystem::path project_root = ".";
    std::filesystem::path net_file;
    std::vector<std::filesystem::path> route_files;
    std::filesystem::path template_path;
};

struct RunConfig final {
    int num_runs = 1;
    int num_steps = 100;
    bool convert_to_csv = false;
    bool output_to_terminal = true;
    std::filesystem::path policy_script;
};

// <emission_path>/<network_name>-emission.xml, or empty without an
// emission path.
std::filesystem::path EmissionXmlPath(const SimulationConfig& sim, std::string_view network_name);

struct ExperimentConfig final {
    SimulationConfig sim;
    NetworkConfig network;
    RunConfig run;
};

class ConfigLoader final {
public:
    static bool Load(
        const std::filesystem::path& file_path,
        ExperimentConfig& out_config,
        std::string& out_error);
    static bool LoadFromText(
        std::string_view text,
        ExperimentConfig& out_config,
        std::string& out_error);
    static bool Validate(const ExperimentConfig& config, std::string& out_error);
};

}  // namespace flowsim::core
