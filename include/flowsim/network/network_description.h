#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace flowsim::network {

struct Edge final {
    std::string id;
    std::string from_node;
    std::string to_node;
    int priority = 0;
    int lane_count = 1;
    double length = 0.0;
    double speed = 0.0;
};

struct TrafficLightPhase final {
    double duration = 0.0;
    std::string state;
    double min_duration = 0.0;
    double max_duration = 0.0;
};

struct TrafficLight final {
    std::string id;
    std::string type;
    std::string program_id;
    double offset = 0.0;
    std::vector<TrafficLightPhase> phases;
};

using Route = std::vector<std::string>;

// Control-agnostic view of a road network. Routes are grouped by their first
// edge; each group holds distinct routes in file order.
struct NetworkDescription final {
    std::string name;
    std::filesystem::path net_file;
    std::vector<std::filesystem::path> route_files;
    std::filesystem::path template_path;
    std::vector<Edge> edges;
    std::vector<TrafficLight> traffic_lights;
    std::map<std::string, std::vector<Route>> routes;

    const Edge* FindEdge(const std::string& edge_id) const;
};

}  // namespace flowsim::network
