#include "kernel/traci_connection.h"

#include "core/logger.h"

#include <foreign/tcpip/socket.h>
#include <libsumo/TraCIDefs.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace flowsim::kernel {
namespace {

using Clock = std::chrono::steady_clock;

std::string FormatStepLength(double sim_step) {
    std::ostringstream stream;
    stream.precision(17);
    stream << sim_step;
    return stream.str();
}

std::string JoinPaths(const std::vector<std::filesystem::path>& paths) {
    std::string joined;
    for (const std::filesystem::path& path : paths) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += path.string();
    }
    return joined;
}

}  // namespace

TraciConnection::~TraciConnection() {
    Close();
}

std::vector<std::string> TraciConnection::BuildSimulatorOptions(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config) {
    std::vector<std::string> options;
    options.push_back("-n");
    options.push_back(network.net_file.string());
    if (!network.route_files.empty()) {
        options.push_back("-r");
        options.push_back(JoinPaths(network.route_files));
    }
    options.push_back("--step-length");
    options.push_back(FormatStepLength(config.sim_step));
    options.push_back("--no-step-log");
    options.push_back("true");
    options.push_back("--time-to-teleport");
    options.push_back("-1");

    const std::filesystem::path emission_file = core::EmissionXmlPath(config, network.name);
    if (!emission_file.empty()) {
        options.push_back("--emission-output");
        options.push_back(emission_file.string());
    }
    if (config.seed != 0) {
        options.push_back("--seed");
        options.push_back(std::to_string(config.seed));
    }
    if (config.render) {
        options.push_back("--start");
    }
    return options;
}

bool TraciConnection::Connect(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config,
    core::Error& out_error) {
    Close();

    const core::TraciOptions& options = config.traci;
    load_arguments_ = BuildSimulatorOptions(network, config);

    if (config.emission_path.has_value()) {
        std::error_code directory_error;
        std::filesystem::create_directories(*config.emission_path, directory_error);
        if (directory_error) {
            out_error.Set(
                core::ErrorKind::Configuration,
                "cannot create emission_path '" + config.emission_path->string() + "': " +
                    directory_error.message());
            return false;
        }
    }

    int port = options.port;
    std::string error;
    if (!options.binary.empty()) {
        if (port == 0 && !ReserveLocalPort(port, error)) {
            out_error.Set(core::ErrorKind::Connection, "cannot reserve TraCI port: " + error);
            return false;
        }

        std::vector<std::string> command_line;
        command_line.push_back(config.render ? options.gui_binary : options.binary);
        command_line.insert(command_line.end(), load_arguments_.begin(), load_arguments_.end());
        command_line.push_back("--remote-port");
        command_line.push_back(std::to_string(port));
        if (!process_.Launch(command_line, error)) {
            out_error.Set(core::ErrorKind::Connection, error);
            return false;
        }
    } else if (port == 0) {
        out_error.Set(core::ErrorKind::Configuration, "attach mode requires traci_port.");
        return false;
    }

    if (!ConnectWithRetry(options.host, port, options, error)) {
        Close();
        out_error.Set(core::ErrorKind::Connection, error);
        return false;
    }

    std::string server_identifier;
    try {
        const std::pair<int, std::string> version = client_->getVersion();
        api_version_ = version.first;
        server_identifier = version.second;
    } catch (const tcpip::SocketException& exception) {
        Drop();
        out_error.Set(core::ErrorKind::Connection, std::string("TraCI handshake failed: ") + exception.what());
        return false;
    } catch (const libsumo::TraCIException& exception) {
        Drop();
        out_error.Set(core::ErrorKind::Connection, std::string("TraCI handshake failed: ") + exception.what());
        return false;
    }

    core::Logger::Info(
        "traci",
        "Connected to " + server_identifier + " (api " + std::to_string(api_version_) + ") on " +
            options.host + ":" + std::to_string(port) + ".");
    out_error.Clear();
    return true;
}

void TraciConnection::Close() {
    if (client_) {
        try {
            client_->close();
        } catch (const tcpip::SocketException& exception) {
            core::Logger::Warn("traci", std::string("Close command not acknowledged: ") + exception.what());
        } catch (const libsumo::TraCIException& exception) {
            core::Logger::Warn("traci", std::string("Close command not acknowledged: ") + exception.what());
        }
    }
    Drop();
}

void TraciConnection::Drop() {
    client_.reset();
    process_.Close();
    api_version_ = 0;
}

bool TraciConnection::IsConnected() const {
    return client_ != nullptr;
}

TraCIAPI& TraciConnection::Client() {
    return *client_;
}

const std::vector<std::string>& TraciConnection::LoadArguments() const {
    return load_arguments_;
}

int TraciConnection::ApiVersion() const {
    return api_version_;
}

bool TraciConnection::ReserveLocalPort(int& out_port, std::string& out_error) {
    out_port = 0;
    const int socket_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        out_error = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    socklen_t address_length = sizeof(address);
    if (::bind(socket_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
        ::getsockname(socket_fd, reinterpret_cast<sockaddr*>(&address), &address_length) != 0) {
        out_error = std::string("bind failed: ") + std::strerror(errno);
        ::close(socket_fd);
        return false;
    }

    ::close(socket_fd);
    out_port = ntohs(address.sin_port);
    out_error.clear();
    return true;
}

bool TraciConnection::ConnectWithRetry(
    const std::string& host,
    int port,
    const core::TraciOptions& options,
    std::string& out_error) {
    const Clock::time_point deadline =
        Clock::now() + std::chrono::milliseconds(options.connect_timeout_ms);
    std::string attempt_error;
    while (true) {
        if (process_.IsLaunched() && !process_.IsRunning()) {
            out_error = "backend exited before accepting connections: " + process_.CommandLine();
            return false;
        }
        if (Clock::now() >= deadline) {
            out_error = "no TraCI server at " + host + ":" + std::to_string(port) + " within " +
                std::to_string(options.connect_timeout_ms) + " ms (" + attempt_error + ")";
            return false;
        }

        auto client = std::make_unique<TraCIAPI>();
        try {
            client->connect(host, port);
            client_ = std::move(client);
            out_error.clear();
            return true;
        } catch (const tcpip::SocketException& exception) {
            attempt_error = exception.what();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kConnectRetryMillis));
    }
}

}  // namespace flowsim::kernel
