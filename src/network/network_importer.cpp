#include "network/network_importer.h"

#include "core/cfg_parser.h"
#include "core/logger.h"
#include "xml/xml_scanner.h"

#include <algorithm>
#include <sstream>

namespace flowsim::network {
namespace {

std::filesystem::path ResolvePath(
    const std::filesystem::path& project_root,
    const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return project_root / path;
}

bool ReadDoubleAttribute(
    const xml::Event& event,
    std::string_view attribute_name,
    double default_value,
    double& out_value,
    std::string& out_error) {
    const std::string* text = event.FindAttribute(attribute_name);
    if (text == nullptr) {
        out_value = default_value;
        return true;
    }
    if (!core::cfg::ParseDouble(*text, out_value)) {
        out_error = "<" + event.name + "> attribute '" + std::string(attribute_name) +
            "' expects number: line " + std::to_string(event.line);
        return false;
    }
    return true;
}

bool ReadIntAttribute(
    const xml::Event& event,
    std::string_view attribute_name,
    int default_value,
    int& out_value,
    std::string& out_error) {
    const std::string* text = event.FindAttribute(attribute_name);
    if (text == nullptr) {
        out_value = default_value;
        return true;
    }
    if (!core::cfg::ParseInt(*text, out_value)) {
        out_error = "<" + event.name + "> attribute '" + std::string(attribute_name) +
            "' expects integer: line " + std::to_string(event.line);
        return false;
    }
    return true;
}

std::string AttributeOrEmpty(const xml::Event& event, std::string_view attribute_name) {
    const std::string* value = event.FindAttribute(attribute_name);
    return value != nullptr ? *value : std::string();
}

Route SplitEdges(const std::string& edges_text) {
    Route edges;
    std::istringstream stream(edges_text);
    std::string edge_id;
    while (stream >> edge_id) {
        edges.push_back(edge_id);
    }
    return edges;
}

void AddRoute(NetworkDescription& network, Route edges) {
    if (edges.empty()) {
        return;
    }

    std::vector<Route>& group = network.routes[edges.front()];
    if (std::find(group.begin(), group.end(), edges) == group.end()) {
        group.push_back(std::move(edges));
    }
}

}  // namespace

const Edge* NetworkDescription::FindEdge(const std::string& edge_id) const {
    for (const Edge& edge : edges) {
        if (edge.id == edge_id) {
            return &edge;
        }
    }
    return nullptr;
}

bool NetworkImporter::Import(
    const core::NetworkConfig& config,
    NetworkDescription& out_network,
    std::string& out_error) {
    NetworkDescription network{};
    network.name = config.name;
    network.net_file = ResolvePath(config.project_root, config.net_file);
    network.template_path = ResolvePath(config.project_root, config.template_path);
    for (const std::filesystem::path& route_file : config.route_files) {
        network.route_files.push_back(ResolvePath(config.project_root, route_file));
    }

    std::string document;
    if (!network.net_file.empty()) {
        if (!xml::ReadDocument(network.net_file, document, out_error)) {
            return false;
        }
        if (!ParseNetText(document, network, out_error)) {
            out_error = network.net_file.string() + ": " + out_error;
            return false;
        }
    }

    for (const std::filesystem::path& route_file : network.route_files) {
        if (!xml::ReadDocument(route_file, document, out_error)) {
            return false;
        }
        if (!ParseRouteText(document, network, out_error)) {
            out_error = route_file.string() + ": " + out_error;
            return false;
        }
    }

    core::Logger::Info(
        "network",
        "Imported network '" + network.name + "': edges=" + std::to_string(network.edges.size()) +
            ", traffic_lights=" + std::to_string(network.traffic_lights.size()) +
            ", route_groups=" + std::to_string(network.routes.size()));
    out_network = std::move(network);
    out_error.clear();
    return true;
}

bool NetworkImporter::ParseNetText(
    std::string_view document,
    NetworkDescription& out_network,
    std::string& out_error) {
    xml::Scanner scanner(document);
    xml::Event event{};
    TrafficLight* open_traffic_light = nullptr;

    while (scanner.Next(event, out_error)) {
        if (event.type == xml::EventType::EndOfDocument) {
            out_error.clear();
            return true;
        }

        if (event.type == xml::EventType::EndElement) {
            if (event.name == "tlLogic") {
                open_traffic_light = nullptr;
            }
            continue;
        }

        // Only direct children of <net> describe the network itself.
        if (event.name == "edge" && scanner.Depth() == 2) {
            const std::string* function = event.FindAttribute("function");
            if (function != nullptr && *function == "internal") {
                continue;
            }

            Edge edge{};
            edge.id = AttributeOrEmpty(event, "id");
            if (edge.id.empty()) {
                out_error = "<edge> without id: line " + std::to_string(event.line);
                return false;
            }
            edge.from_node = AttributeOrEmpty(event, "from");
            edge.to_node = AttributeOrEmpty(event, "to");
            if (!ReadIntAttribute(event, "priority", 0, edge.priority, out_error) ||
                !ReadIntAttribute(event, "numLanes", 1, edge.lane_count, out_error) ||
                !ReadDoubleAttribute(event, "length", 0.0, edge.length, out_error) ||
                !ReadDoubleAttribute(event, "speed", 0.0, edge.speed, out_error)) {
                return false;
            }
            out_network.edges.push_back(std::move(edge));
            continue;
        }

        // Lanes carry the length and speed when the edge does not.
        if (event.name == "lane" && scanner.Depth() == 3 && !out_network.edges.empty()) {
            Edge& edge = out_network.edges.back();
            const std::string lane_id = AttributeOrEmpty(event, "id");
            if (lane_id.rfind(edge.id + "_", 0) != 0) {
                continue;
            }
            double lane_length = 0.0;
            double lane_speed = 0.0;
            if (!ReadDoubleAttribute(event, "length", 0.0, lane_length, out_error) ||
                !ReadDoubleAttribute(event, "speed", 0.0, lane_speed, out_error)) {
                return false;
            }
            edge.length = std::max(edge.length, lane_length);
            edge.speed = std::max(edge.speed, lane_speed);
            if (event.FindAttribute("index") != nullptr) {
                int lane_index = 0;
                if (!ReadIntAttribute(event, "index", 0, lane_index, out_error)) {
                    return false;
                }
                edge.lane_count = std::max(edge.lane_count, lane_index + 1);
            }
            continue;
        }

        if (event.name == "tlLogic" && scanner.Depth() == 2) {
            TrafficLight traffic_light{};
            traffic_light.id = AttributeOrEmpty(event, "id");
            traffic_light.type = AttributeOrEmpty(event, "type");
            traffic_light.program_id = AttributeOrEmpty(event, "programID");
            if (!ReadDoubleAttribute(event, "offset", 0.0, traffic_light.offset, out_error)) {
                return false;
            }
            out_network.traffic_lights.push_back(std::move(traffic_light));
            open_traffic_light = &out_network.traffic_lights.back();
            continue;
        }

        if (event.name == "phase" && open_traffic_light != nullptr) {
            TrafficLightPhase phase{};
            phase.state = AttributeOrEmpty(event, "state");
            if (!ReadDoubleAttribute(event, "duration", 0.0, phase.duration, out_error) ||
                !ReadDoubleAttribute(event, "minDur", phase.duration, phase.min_duration, out_error) ||
                !ReadDoubleAttribute(event, "maxDur", phase.duration, phase.max_duration, out_error)) {
                return false;
            }
            open_traffic_light->phases.push_back(std::move(phase));
            continue;
        }
    }

    return false;
}

bool NetworkImporter::ParseRouteText(
    std::string_view document,
    NetworkDescription& out_network,
    std::string& out_error) {
    xml::Scanner scanner(document);
    xml::Event event{};
    bool inside_vehicle = false;

    while (scanner.Next(event, out_error)) {
        if (event.type == xml::EventType::EndOfDocument) {
            out_error.clear();
            return true;
        }

        if (event.type == xml::EventType::EndElement) {
            if (event.name == "vehicle") {
                inside_vehicle = false;
            }
            continue;
        }

        if (event.name == "vehicle") {
            inside_vehicle = true;
            continue;
        }

        if (event.name != "route") {
            continue;
        }

        // Top-level routes are named route definitions; vehicle routes are
        // embedded in their vehicle.
        if (!inside_vehicle && scanner.Depth() != 2) {
            continue;
        }

        const std::string* edges_text = event.FindAttribute("edges");
        if (edges_text == nullptr) {
            out_error = "<route> without edges: line " + std::to_string(event.line);
            return false;
        }
        AddRoute(out_network, SplitEdges(*edges_text));
    }

    return false;
}

}  // namespace flowsim::network
