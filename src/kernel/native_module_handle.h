#pragma once

#include "kernel/backend_handle.h"
#include "kernel/native_backend_api.h"
#include "kernel/vehicle_state_cache.h"

#include <filesystem>
#include <string>
#include <vector>

namespace flowsim::kernel {

// A simulator loaded in-process from a shared module exporting the
// flowsim_native_* entry points.
class NativeModuleHandle final : public IBackendHandle {
public:
    NativeModuleHandle() = default;
    ~NativeModuleHandle() override;

    NativeModuleHandle(const NativeModuleHandle&) = delete;
    NativeModuleHandle& operator=(const NativeModuleHandle&) = delete;

    bool Connect(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) override;
    void Close() override;
    bool IsConnected() const override;

    bool LoadNetwork(std::string& out_error);
    bool Reset(std::string& out_error);
    bool Step(double step_size, flowsim_native_step_result& out_result, std::string& out_error);
    bool ReadVehicles(std::vector<VehicleSample>& out_samples, std::string& out_error);
    bool SetSpeed(const std::string& vehicle_id, double speed, std::string& out_error);

private:
    struct EntryPoints final {
        flowsim_native_abi_version_fn abi_version = nullptr;
        flowsim_native_create_fn create = nullptr;
        flowsim_native_destroy_fn destroy = nullptr;
        flowsim_native_last_error_fn last_error = nullptr;
        flowsim_native_load_network_fn load_network = nullptr;
        flowsim_native_reset_fn reset = nullptr;
        flowsim_native_step_fn step = nullptr;
        flowsim_native_vehicle_count_fn vehicle_count = nullptr;
        flowsim_native_vehicle_at_fn vehicle_at = nullptr;
        flowsim_native_set_speed_fn set_speed = nullptr;
    };

    bool OpenLibrary(const std::filesystem::path& module_path, std::string& out_error);
    bool ResolveEntryPoints(std::string& out_error);
    std::string InstanceError(const char* operation) const;

    void* library_ = nullptr;
    EntryPoints entry_points_{};
    flowsim_native_instance* instance_ = nullptr;

    // Backing storage for the strings handed to flowsim_native_create.
    std::string network_name_;
    std::string template_path_;
    std::string subnetwork_name_;
    std::string replication_name_;
    std::string centroid_config_name_;
    std::string emission_file_;
};

}  // namespace flowsim::kernel
