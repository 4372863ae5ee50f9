#pragma once

#include "kernel/backend_handle.h"
#include "kernel/backend_process.h"

#include <utils/traci/TraCIAPI.h>

#include <memory>
#include <string>
#include <vector>

namespace flowsim::kernel {

// A TraCI server: either a launched child simulator or, with an empty binary,
// an already running one reached at traci_host:traci_port.
class TraciConnection final : public IBackendHandle {
public:
    static constexpr int kConnectRetryMillis = 50;

    ~TraciConnection() override;

    bool Connect(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) override;
    // Sends the close command, then stops the child.
    void Close() override;
    bool IsConnected() const override;
    // Discards a broken session without talking to the server again.
    void Drop();

    TraCIAPI& Client();
    // Simulator options without the binary, as accepted by TraCI load.
    const std::vector<std::string>& LoadArguments() const;
    int ApiVersion() const;

    static std::vector<std::string> BuildSimulatorOptions(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config);
    // Binds an ephemeral loopback port and releases it for the simulator.
    static bool ReserveLocalPort(int& out_port, std::string& out_error);

private:
    bool ConnectWithRetry(
        const std::string& host,
        int port,
        const core::TraciOptions& options,
        std::string& out_error);

    BackendProcess process_;
    std::unique_ptr<TraCIAPI> client_;
    std::vector<std::string> load_arguments_;
    int api_version_ = 0;
};

}  // namespace flowsim::kernel
