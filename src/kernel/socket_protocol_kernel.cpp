#include "kernel/socket_protocol_kernel.h"

#include "core/logger.h"

#include <foreign/tcpip/socket.h>
#include <libsumo/TraCIDefs.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace flowsim::kernel {
namespace {

// Runs library calls that report failures by throwing.
template <typename Call>
bool CallTraci(Call&& call, std::string& out_error) {
    try {
        call();
    } catch (const tcpip::SocketException& exception) {
        out_error = exception.what();
        return false;
    } catch (const libsumo::TraCIException& exception) {
        out_error = exception.what();
        return false;
    }
    out_error.clear();
    return true;
}

bool CheckInputFile(const std::filesystem::path& path, const char* role, core::Error& out_error) {
    std::error_code status_error;
    if (path.empty() || !std::filesystem::is_regular_file(path, status_error)) {
        out_error.Set(
            core::ErrorKind::Initialization,
            std::string(role) + " not found: '" + path.string() + "'");
        return false;
    }
    return true;
}

}  // namespace

SocketProtocolKernel::~SocketProtocolKernel() {
    Terminate();
}

const char* SocketProtocolKernel::BackendName() const {
    return "traci";
}

bool SocketProtocolKernel::Start(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config,
    core::Error& out_error) {
    Terminate();

    // Attached servers were started with their own network.
    if (!config.traci.binary.empty()) {
        if (!CheckInputFile(network.net_file, "network file", out_error)) {
            return false;
        }
        for (const std::filesystem::path& route_file : network.route_files) {
            if (!CheckInputFile(route_file, "route file", out_error)) {
                return false;
            }
        }
    }

    network_ = network;
    config_ = config;
    if (!ConnectAndLoad(out_error)) {
        return false;
    }

    started_ = true;
    core::Logger::Info("kernel", "TraCI kernel started for network '" + network_.name + "'.");
    return true;
}

bool SocketProtocolKernel::Reset(core::Error& out_error) {
    if (!started_) {
        out_error.Set(core::ErrorKind::Initialization, "TraCI kernel is not started");
        return false;
    }

    pending_speeds_.Clear();
    vehicles_.Clear();
    simulation_time_ = 0.0;

    if (failed_ || !connection_.IsConnected()) {
        core::Logger::Warn("kernel", "Restarting TraCI backend after failure.");
        connection_.Close();
        if (!ConnectAndLoad(out_error)) {
            failed_ = true;
            return false;
        }
        failed_ = false;
        return true;
    }

    std::string error;
    TraCIAPI& client = connection_.Client();
    if (!CallTraci([&]() { client.load(connection_.LoadArguments()); }, error)) {
        failed_ = true;
        connection_.Drop();
        out_error.Set(core::ErrorKind::Initialization, "TraCI reload failed: " + error);
        return false;
    }

    bool terminal = false;
    if (!RefreshState(false, terminal, error)) {
        failed_ = true;
        connection_.Drop();
        out_error.Set(core::ErrorKind::Initialization, "state refresh after reload failed: " + error);
        return false;
    }

    out_error.Clear();
    return true;
}

bool SocketProtocolKernel::ApplyVehicleCommands(
    const std::vector<VehicleCommand>& commands,
    core::Error& out_error) {
    return pending_speeds_.Queue(vehicles_, commands, out_error);
}

bool SocketProtocolKernel::Advance(double step_size, bool& out_terminal, core::Error& out_error) {
    out_terminal = false;
    if (!started_) {
        out_error.Set(core::ErrorKind::SimulationCommunication, "TraCI kernel is not started");
        return false;
    }
    if (failed_) {
        out_error.Set(
            core::ErrorKind::SimulationCommunication,
            "TraCI kernel failed earlier; reset required");
        return false;
    }

    std::string error;
    TraCIAPI& client = connection_.Client();
    const std::vector<PendingSpeedCommands::SpeedCommand> speeds = pending_speeds_.Take();
    if (!CallTraci(
            [&]() {
                for (const auto& [vehicle_id, speed] : speeds) {
                    client.vehicle.setSpeed(vehicle_id, speed);
                }
            },
            error)) {
        MarkFailed("setSpeed failed: " + error, out_error);
        return false;
    }

    const double target_time = simulation_time_ + step_size;
    if (!CallTraci([&]() { client.simulationStep(target_time); }, error)) {
        MarkFailed("simulation step failed: " + error, out_error);
        return false;
    }

    if (!RefreshState(true, out_terminal, error)) {
        MarkFailed("state refresh failed: " + error, out_error);
        return false;
    }

    out_error.Clear();
    return true;
}

void SocketProtocolKernel::Terminate() {
    if (!started_ && !connection_.IsConnected()) {
        return;
    }

    connection_.Close();
    pending_speeds_.Clear();
    started_ = false;
    failed_ = false;
    core::Logger::Info("kernel", "TraCI kernel terminated.");
}

bool SocketProtocolKernel::IsStarted() const {
    return started_;
}

bool SocketProtocolKernel::IsFailed() const {
    return failed_;
}

double SocketProtocolKernel::SimulationTime() const {
    return simulation_time_;
}

const VehicleStateCache& SocketProtocolKernel::Vehicles() const {
    return vehicles_;
}

const TraciConnection& SocketProtocolKernel::Connection() const {
    return connection_;
}

bool SocketProtocolKernel::ConnectAndLoad(core::Error& out_error) {
    if (!connection_.Connect(network_, config_, out_error)) {
        return false;
    }

    vehicles_.Clear();
    simulation_time_ = 0.0;
    bool terminal = false;
    std::string error;
    if (!RefreshState(false, terminal, error)) {
        connection_.Drop();
        out_error.Set(core::ErrorKind::Initialization, "initial state query failed: " + error);
        return false;
    }

    out_error.Clear();
    return true;
}

bool SocketProtocolKernel::RefreshState(bool after_step, bool& out_terminal, std::string& out_error) {
    TraCIAPI& client = connection_.Client();

    double time = 0.0;
    std::vector<std::string> departed;
    std::vector<std::string> arrived;
    std::vector<std::string> colliding;
    int min_expected = 0;
    std::vector<std::string> vehicle_ids;
    if (!CallTraci(
            [&]() {
                time = client.simulation.getTime();
                departed = client.simulation.getDepartedIDList();
                arrived = client.simulation.getArrivedIDList();
                colliding = client.simulation.getCollidingVehiclesIDList();
                min_expected = client.simulation.getMinExpectedNumber();
                vehicle_ids = client.vehicle.getIDList();
            },
            out_error)) {
        return false;
    }

    std::vector<VehicleSample> samples;
    samples.reserve(vehicle_ids.size());
    for (const std::string& vehicle_id : vehicle_ids) {
        VehicleSample sample{};
        sample.id = vehicle_id;
        const bool read = CallTraci(
            [&]() {
                sample.speed = client.vehicle.getSpeed(vehicle_id);
                sample.position.edge_id = client.vehicle.getRoadID(vehicle_id);
                sample.position.lane_position = client.vehicle.getLanePosition(vehicle_id);
                const libsumo::TraCIPosition position = client.vehicle.getPosition(vehicle_id);
                sample.position.x = position.x;
                sample.position.y = position.y;
            },
            out_error);
        if (!read) {
            out_error = "vehicle '" + vehicle_id + "': " + out_error;
            return false;
        }
        samples.push_back(std::move(sample));
    }

    vehicles_.ReplaceSnapshot(std::move(samples));
    if (after_step) {
        vehicles_.RecordStep(
            time - simulation_time_,
            static_cast<int>(departed.size()),
            static_cast<int>(arrived.size()));
    }
    simulation_time_ = time;

    out_terminal = !colliding.empty() || (vehicle_ids.empty() && min_expected == 0);
    if (!colliding.empty()) {
        core::Logger::Warn(
            "kernel",
            "Collision reported at t=" + std::to_string(time) + " involving " +
                std::to_string(colliding.size()) + " vehicle(s).");
    }
    out_error.clear();
    return true;
}

void SocketProtocolKernel::MarkFailed(const std::string& message, core::Error& out_error) {
    failed_ = true;
    connection_.Drop();
    core::Logger::Error("kernel", "TraCI kernel failed: " + message);
    out_error.Set(core::ErrorKind::SimulationCommunication, message);
}

}  // namespace flowsim::kernel
