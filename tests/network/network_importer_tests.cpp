#include "network/network_importer.h"

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
        ("flowsim_network_importer_test_" + std::to_string(unique_seed));
}

bool WriteTextFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return true;
}

constexpr const char* kNetDocument =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<net version=\"1.9\">\n"
    "    <edge id=\":center_0\" function=\"internal\">\n"
    "        <lane id=\":center_0_0\" index=\"0\" speed=\"13.89\" length=\"9.03\"/>\n"
    "    </edge>\n"
    "    <edge id=\"in\" from=\"west\" to=\"center\" priority=\"2\" numLanes=\"2\">\n"
    "        <lane id=\"in_0\" index=\"0\" speed=\"13.89\" length=\"96.00\"/>\n"
    "        <lane id=\"in_1\" index=\"1\" speed=\"13.89\" length=\"96.00\"/>\n"
    "    </edge>\n"
    "    <edge id=\"out\" from=\"center\" to=\"east\" speed=\"30\" length=\"120.5\"/>\n"
    "    <tlLogic id=\"center\" type=\"static\" programID=\"0\" offset=\"5\">\n"
    "        <phase duration=\"31\" state=\"GGrr\"/>\n"
    "        <phase duration=\"4\" state=\"yyrr\" minDur=\"3\" maxDur=\"6\"/>\n"
    "    </tlLogic>\n"
    "</net>\n";

constexpr const char* kRouteDocument =
    "<routes>\n"
    "    <route id=\"main\" edges=\"in out\"/>\n"
    "    <route id=\"duplicate\" edges=\"in out\"/>\n"
    "    <vehicle id=\"v0\" depart=\"0\">\n"
    "        <route edges=\"in\"/>\n"
    "    </vehicle>\n"
    "    <flow id=\"f0\" begin=\"0\" end=\"100\" probability=\"0.1\" route=\"main\"/>\n"
    "</routes>\n";

}  // namespace

int main() {
    bool passed = true;
    std::string error;

    flowsim::network::NetworkDescription parsed{};
    passed &= Expect(
        flowsim::network::NetworkImporter::ParseNetText(kNetDocument, parsed, error),
        "Net document should parse.");
    passed &= Expect(parsed.edges.size() == 2, "Internal edges should be skipped.");
    const flowsim::network::Edge* in_edge = parsed.FindEdge("in");
    passed &= Expect(in_edge != nullptr, "Edge 'in' should be found.");
    if (in_edge != nullptr) {
        passed &= Expect(in_edge->from_node == "west" && in_edge->to_node == "center", "Edge nodes should load.");
        passed &= Expect(in_edge->priority == 2, "Edge priority should load.");
        passed &= Expect(in_edge->lane_count == 2, "Edge lane count should load.");
        passed &= Expect(in_edge->length == 96.0, "Edge length should come from its lanes.");
        passed &= Expect(in_edge->speed == 13.89, "Edge speed should come from its lanes.");
    }
    const flowsim::network::Edge* out_edge = parsed.FindEdge("out");
    passed &= Expect(
        out_edge != nullptr && out_edge->length == 120.5 && out_edge->speed == 30.0 && out_edge->lane_count == 1,
        "Edge attributes should load without lane children.");
    passed &= Expect(parsed.FindEdge(":center_0") == nullptr, "Internal edge should not be findable.");

    passed &= Expect(parsed.traffic_lights.size() == 1, "Traffic light should load.");
    if (parsed.traffic_lights.size() == 1) {
        const flowsim::network::TrafficLight& light = parsed.traffic_lights.front();
        passed &= Expect(light.id == "center" && light.type == "static", "Traffic light identity should load.");
        passed &= Expect(light.offset == 5.0, "Traffic light offset should load.");
        passed &= Expect(light.phases.size() == 2, "Both phases should load.");
        if (light.phases.size() == 2) {
            passed &= Expect(
                light.phases[0].min_duration == 31.0 && light.phases[0].max_duration == 31.0,
                "Phase bounds should default to the duration.");
            passed &= Expect(
                light.phases[1].min_duration == 3.0 && light.phases[1].max_duration == 6.0,
                "Explicit phase bounds should load.");
        }
    }

    passed &= Expect(
        flowsim::network::NetworkImporter::ParseRouteText(kRouteDocument, parsed, error),
        "Route document should parse.");
    passed &= Expect(parsed.routes.size() == 1, "Routes should be grouped by first edge.");
    passed &= Expect(
        parsed.routes.count("in") == 1 && parsed.routes.at("in").size() == 2,
        "Duplicate routes should be collapsed.");

    flowsim::network::NetworkDescription broken{};
    passed &= Expect(
        !flowsim::network::NetworkImporter::ParseNetText(
            "<net>\n<edge id=\"e\" length=\"long\"/>\n</net>\n",
            broken,
            error),
        "Non-numeric edge length should fail.");
    passed &= Expect(error.find("line 2") != std::string::npos, "Attribute error should name the line.");
    passed &= Expect(
        !flowsim::network::NetworkImporter::ParseRouteText("<routes><route id=\"r\"/></routes>", broken, error),
        "Route without edges should fail.");

    const std::filesystem::path test_dir = BuildTestDirectory();
    std::error_code ec;
    std::filesystem::create_directories(test_dir, ec);
    passed &= Expect(WriteTextFile(test_dir / "grid.net.xml", kNetDocument), "Net file write should succeed.");
    passed &= Expect(WriteTextFile(test_dir / "grid.rou.xml", kRouteDocument), "Route file write should succeed.");

    flowsim::core::NetworkConfig config{};
    config.name = "grid";
    config.project_root = test_dir;
    config.net_file = "grid.net.xml";
    config.route_files = {"grid.rou.xml"};
    flowsim::network::NetworkDescription imported{};
    passed &= Expect(
        flowsim::network::NetworkImporter::Import(config, imported, error),
        "Import from project root should succeed.");
    passed &= Expect(imported.name == "grid", "Imported network should keep its name.");
    passed &= Expect(imported.net_file == test_dir / "grid.net.xml", "Net file should resolve against the root.");
    passed &= Expect(
        imported.route_files.size() == 1 && imported.route_files.front() == test_dir / "grid.rou.xml",
        "Route files should resolve against the root.");
    passed &= Expect(imported.edges.size() == 2 && imported.routes.size() == 1, "Import should parse both files.");

    flowsim::core::NetworkConfig native_config{};
    native_config.name = "i210";
    native_config.project_root = test_dir;
    native_config.template_path = "i210.ang";
    flowsim::network::NetworkDescription native_network{};
    passed &= Expect(
        flowsim::network::NetworkImporter::Import(native_config, native_network, error),
        "Template-only network should import without a net file.");
    passed &= Expect(
        native_network.template_path == test_dir / "i210.ang" && native_network.edges.empty(),
        "Template path should resolve and no edges should be read.");

    config.route_files = {"missing.rou.xml"};
    passed &= Expect(
        !flowsim::network::NetworkImporter::Import(config, imported, error),
        "Missing route file should fail import.");
    passed &= Expect(error.find("missing.rou.xml") != std::string::npos, "Import error should name the file.");

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] flowsim_network_importer_tests\n";
    return 0;
}
