#include "core/config.h"

#include "core/cfg_parser.h"
#include "core/logger.h"

#include <string>
#include <vector>

namespace flowsim::core {
namespace {

std::string AtLine(int line_number) {
    return ": line " + std::to_string(line_number);
}

bool ParsePort(std::string_view value, int& out_port) {
    int parsed_port = 0;
    if (!cfg::ParseInt(value, parsed_port) || parsed_port < 0 || parsed_port > 65535) {
        return false;
    }
    out_port = parsed_port;
    return true;
}

bool ParsePositiveInt(std::string_view value, int& out_value) {
    int parsed = 0;
    if (!cfg::ParseInt(value, parsed) || parsed <= 0) {
        return false;
    }
    out_value = parsed;
    return true;
}

bool ParsePath(std::string_view value, std::filesystem::path& out_path) {
    std::string text;
    if (!cfg::ParseQuotedString(value, text)) {
        return false;
    }
    out_path = text;
    return true;
}

bool ApplySimulationKey(
    const cfg::KeyValueLine& line,
    SimulationConfig& sim,
    bool& out_matched,
    std::string& out_error) {
    out_matched = true;
    const std::string& key = line.key;
    const std::string& value = line.value;

    if (key == "simulator") {
        std::string text;
        if (!cfg::ParseQuotedString(value, text) || !TryParseSimulatorKind(text, sim.simulator)) {
            out_error = "simulator expects one of \"traci\"|\"native\"" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "sim_step") {
        if (!cfg::ParseDouble(value, sim.sim_step) || sim.sim_step <= 0.0) {
            out_error = "sim_step expects positive number" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "render") {
        if (!cfg::ParseBool(value, sim.render)) {
            out_error = "render expects boolean" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "emission_path") {
        std::filesystem::path emission_path;
        if (!ParsePath(value, emission_path)) {
            out_error = "emission_path expects string" + AtLine(line.line_number);
            return false;
        }
        if (emission_path.empty()) {
            sim.emission_path.reset();
        } else {
            sim.emission_path = emission_path;
        }
        return true;
    }

    if (key == "seed") {
        if (!cfg::ParseInt(value, sim.seed)) {
            out_error = "seed expects integer" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "sumo_binary") {
        if (!cfg::ParseQuotedString(value, sim.traci.binary)) {
            out_error = "sumo_binary expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "sumo_gui_binary") {
        if (!cfg::ParseQuotedString(value, sim.traci.gui_binary)) {
            out_error = "sumo_gui_binary expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "traci_host") {
        if (!cfg::ParseQuotedString(value, sim.traci.host)) {
            out_error = "traci_host expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "traci_port") {
        if (!ParsePort(value, sim.traci.port)) {
            out_error = "traci_port expects integer within [0,65535]" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "connect_timeout_ms") {
        if (!ParsePositiveInt(value, sim.traci.connect_timeout_ms)) {
            out_error = "connect_timeout_ms expects positive integer" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "native_module") {
        if (!ParsePath(value, sim.native.module_path)) {
            out_error = "native_module expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "subnetwork_name") {
        if (!cfg::ParseQuotedString(value, sim.native.subnetwork_name)) {
            out_error = "subnetwork_name expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "replication_name") {
        if (!cfg::ParseQuotedString(value, sim.native.replication_name)) {
            out_error = "replication_name expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "centroid_config_name") {
        if (!cfg::ParseQuotedString(value, sim.native.centroid_config_name)) {
            out_error = "centroid_config_name expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    out_matched = false;
    return true;
}

bool ApplyNetworkKey(
    const cfg::KeyValueLine& line,
    NetworkConfig& network,
    bool& out_matched,
    std::string& out_error) {
    out_matched = true;
    const std::string& key = line.key;
    const std::string& value = line.value;

    if (key == "network_name") {
        if (!cfg::ParseQuotedString(value, network.name) || network.name.empty()) {
            out_error = "network_name expects non-empty string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "project_root") {
        if (!ParsePath(value, network.project_root)) {
            out_error = "project_root expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "net_file") {
        if (!ParsePath(value, network.net_file)) {
            out_error = "net_file expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "route_files") {
        std::vector<std::string> items;
        if (!cfg::ParseQuotedStringArray(value, items)) {
            out_error = "route_files expects quoted string array" + AtLine(line.line_number);
            return false;
        }
        network.route_files.assign(items.begin(), items.end());
        return true;
    }

    if (key == "template_path") {
        if (!ParsePath(value, network.template_path)) {
            out_error = "template_path expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    out_matched = false;
    return true;
}

bool ApplyRunKey(
    const cfg::KeyValueLine& line,
    RunConfig& run,
    bool& out_matched,
    std::string& out_error) {
    out_matched = true;
    const std::string& key = line.key;
    const std::string& value = line.value;

    if (key == "num_runs") {
        if (!ParsePositiveInt(value, run.num_runs)) {
            out_error = "num_runs expects positive integer" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "num_steps") {
        if (!ParsePositiveInt(value, run.num_steps)) {
            out_error = "num_steps expects positive integer" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "convert_to_csv") {
        if (!cfg::ParseBool(value, run.convert_to_csv)) {
            out_error = "convert_to_csv expects boolean" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "output_to_terminal") {
        if (!cfg::ParseBool(value, run.output_to_terminal)) {
            out_error = "output_to_terminal expects boolean" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    if (key == "policy_script") {
        if (!ParsePath(value, run.policy_script)) {
            out_error = "policy_script expects string" + AtLine(line.line_number);
            return false;
        }
        return true;
    }

    out_matched = false;
    return true;
}

bool ApplyLines(
    const std::vector<cfg::KeyValueLine>& lines,
    ExperimentConfig& out_config,
    std::string& out_error) {
    for (const cfg::KeyValueLine& line : lines) {
        bool matched = false;
        if (!ApplySimulationKey(line, out_config.sim, matched, out_error)) {
            return false;
        }
        if (matched) {
            continue;
        }

        if (!ApplyNetworkKey(line, out_config.network, matched, out_error)) {
            return false;
        }
        if (matched) {
            continue;
        }

        if (!ApplyRunKey(line, out_config.run, matched, out_error)) {
            return false;
        }
        if (matched) {
            continue;
        }

        Logger::Warn(
            "config",
            "Ignoring unknown key '" + line.key + "' at line " + std::to_string(line.line_number));
    }

    return ConfigLoader::Validate(out_config, out_error);
}

}  // namespace

const char* SimulatorKindName(SimulatorKind kind) {
    switch (kind) {
        case SimulatorKind::Traci:
            return "traci";
        case SimulatorKind::Native:
            return "native";
    }

    return "unknown";
}

bool TryParseSimulatorKind(std::string_view text, SimulatorKind& out_kind) {
    if (text == "traci") {
        out_kind = SimulatorKind::Traci;
        return true;
    }
    if (text == "native") {
        out_kind = SimulatorKind::Native;
        return true;
    }
    return false;
}

std::filesystem::path EmissionXmlPath(const SimulationConfig& sim, std::string_view network_name) {
    if (!sim.emission_path.has_value()) {
        return {};
    }
    return *sim.emission_path / (std::string(network_name) + "-emission.xml");
}

bool ConfigLoader::Load(
    const std::filesystem::path& file_path,
    ExperimentConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }

    return ApplyLines(lines, out_config, out_error);
}

bool ConfigLoader::LoadFromText(
    std::string_view text,
    ExperimentConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseText(text, lines, out_error)) {
        return false;
    }

    return ApplyLines(lines, out_config, out_error);
}

bool ConfigLoader::Validate(const ExperimentConfig& config, std::string& out_error) {
    if (config.sim.sim_step <= 0.0) {
        out_error = "sim_step must be greater than zero.";
        return false;
    }

    if (config.network.name.empty()) {
        out_error = "network_name must not be empty.";
        return false;
    }

    if (config.sim.simulator == SimulatorKind::Traci) {
        if (config.network.net_file.empty()) {
            out_error = "traci simulator requires net_file.";
            return false;
        }
        if (config.sim.traci.binary.empty() && config.sim.traci.port == 0) {
            out_error = "attaching to a running traci server requires traci_port.";
            return false;
        }
    }

    if (config.sim.simulator == SimulatorKind::Native &&
        config.sim.native.module_path.empty()) {
        out_error = "native simulator requires native_module.";
        return false;
    }

    if (config.run.convert_to_csv && !config.sim.emission_path.has_value()) {
        out_error = "convert_to_csv requires emission_path.";
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace flowsim::core
