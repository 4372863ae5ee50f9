#include "kernel/native_module_handle.h"

#include "core/logger.h"

#include <dlfcn.h>

namespace flowsim::kernel {
namespace {

std::string LastDlError(const char* fallback) {
    const char* message = dlerror();
    return message != nullptr ? std::string(message) : std::string(fallback);
}

template <typename Function>
bool ResolveSymbol(void* library, const char* name, Function& out_function, std::string& out_error) {
    dlerror();
    void* symbol = dlsym(library, name);
    if (symbol == nullptr) {
        out_error = "native module is missing symbol '" + std::string(name) + "': " +
            LastDlError("symbol not found");
        return false;
    }

    out_function = reinterpret_cast<Function>(symbol);
    return true;
}

}  // namespace

NativeModuleHandle::~NativeModuleHandle() {
    Close();
}

bool NativeModuleHandle::Connect(
    const network::NetworkDescription& network,
    const core::SimulationConfig& config,
    core::Error& out_error) {
    Close();

    std::string error;
    if (!OpenLibrary(config.native.module_path, error) || !ResolveEntryPoints(error)) {
        Close();
        out_error.Set(core::ErrorKind::Connection, error);
        return false;
    }

    const std::int32_t abi_version = entry_points_.abi_version();
    if (abi_version != FLOWSIM_NATIVE_ABI_VERSION) {
        Close();
        out_error.Set(
            core::ErrorKind::Connection,
            "native module ABI mismatch: expected " + std::to_string(FLOWSIM_NATIVE_ABI_VERSION) +
                ", found " + std::to_string(abi_version));
        return false;
    }

    const std::filesystem::path emission_file = core::EmissionXmlPath(config, network.name);
    if (!emission_file.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(emission_file.parent_path(), directory_error);
        if (directory_error) {
            Close();
            out_error.Set(
                core::ErrorKind::Configuration,
                "cannot create emission_path '" + emission_file.parent_path().string() + "': " +
                    directory_error.message());
            return false;
        }
    }

    network_name_ = network.name;
    template_path_ = network.template_path.string();
    subnetwork_name_ = config.native.subnetwork_name;
    replication_name_ = config.native.replication_name;
    centroid_config_name_ = config.native.centroid_config_name;
    emission_file_ = emission_file.string();

    const flowsim_native_options options{
        .network_name = network_name_.c_str(),
        .template_path = template_path_.c_str(),
        .subnetwork_name = subnetwork_name_.c_str(),
        .replication_name = replication_name_.c_str(),
        .centroid_config_name = centroid_config_name_.c_str(),
        .emission_file = emission_file_.empty() ? nullptr : emission_file_.c_str(),
        .sim_step = config.sim_step,
        .render = config.render ? 1 : 0,
        .seed = config.seed,
    };
    instance_ = entry_points_.create(&options);
    if (instance_ == nullptr) {
        Close();
        out_error.Set(core::ErrorKind::Connection, "native module refused to create a backend instance");
        return false;
    }

    core::Logger::Info(
        "native",
        "Loaded native backend " + config.native.module_path.string() + " (abi " +
            std::to_string(abi_version) + ").");
    out_error.Clear();
    return true;
}

void NativeModuleHandle::Close() {
    if (instance_ != nullptr && entry_points_.destroy != nullptr) {
        entry_points_.destroy(instance_);
    }
    instance_ = nullptr;
    entry_points_ = {};

    if (library_ != nullptr) {
        if (dlclose(library_) != 0) {
            core::Logger::Warn("native", "dlclose failed: " + LastDlError("unknown error"));
        }
        library_ = nullptr;
        core::Logger::Info("native", "Native backend unloaded.");
    }
}

bool NativeModuleHandle::IsConnected() const {
    return instance_ != nullptr;
}

bool NativeModuleHandle::LoadNetwork(std::string& out_error) {
    if (instance_ == nullptr) {
        out_error = "native backend is not connected";
        return false;
    }
    if (entry_points_.load_network(instance_) != 0) {
        out_error = InstanceError("load_network");
        return false;
    }

    out_error.clear();
    return true;
}

bool NativeModuleHandle::Reset(std::string& out_error) {
    if (instance_ == nullptr) {
        out_error = "native backend is not connected";
        return false;
    }
    if (entry_points_.reset(instance_) != 0) {
        out_error = InstanceError("reset");
        return false;
    }

    out_error.clear();
    return true;
}

bool NativeModuleHandle::Step(
    double step_size,
    flowsim_native_step_result& out_result,
    std::string& out_error) {
    if (instance_ == nullptr) {
        out_error = "native backend is not connected";
        return false;
    }

    out_result = {};
    if (entry_points_.step(instance_, step_size, &out_result) != 0) {
        out_error = InstanceError("step");
        return false;
    }

    out_error.clear();
    return true;
}

bool NativeModuleHandle::ReadVehicles(std::vector<VehicleSample>& out_samples, std::string& out_error) {
    out_samples.clear();
    if (instance_ == nullptr) {
        out_error = "native backend is not connected";
        return false;
    }

    const std::int32_t vehicle_count = entry_points_.vehicle_count(instance_);
    if (vehicle_count < 0) {
        out_error = InstanceError("vehicle_count");
        return false;
    }

    out_samples.reserve(static_cast<std::size_t>(vehicle_count));
    for (std::int32_t index = 0; index < vehicle_count; ++index) {
        flowsim_native_vehicle vehicle{};
        if (entry_points_.vehicle_at(instance_, index, &vehicle) != 0 || vehicle.id == nullptr) {
            out_samples.clear();
            out_error = InstanceError("vehicle_at");
            return false;
        }

        out_samples.push_back(VehicleSample{
            .id = vehicle.id,
            .speed = vehicle.speed,
            .position = RoadPosition{
                .edge_id = vehicle.edge_id != nullptr ? vehicle.edge_id : "",
                .lane_position = vehicle.lane_position,
                .x = vehicle.x,
                .y = vehicle.y,
            },
        });
    }

    out_error.clear();
    return true;
}

bool NativeModuleHandle::SetSpeed(const std::string& vehicle_id, double speed, std::string& out_error) {
    if (instance_ == nullptr) {
        out_error = "native backend is not connected";
        return false;
    }
    if (entry_points_.set_speed(instance_, vehicle_id.c_str(), speed) != 0) {
        out_error = InstanceError("set_speed");
        return false;
    }

    out_error.clear();
    return true;
}

bool NativeModuleHandle::OpenLibrary(const std::filesystem::path& module_path, std::string& out_error) {
    if (module_path.empty()) {
        out_error = "native module path is empty";
        return false;
    }

    library_ = dlopen(module_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (library_ == nullptr) {
        out_error = "cannot load native module " + module_path.string() + ": " +
            LastDlError("dlopen failed");
        return false;
    }
    return true;
}

bool NativeModuleHandle::ResolveEntryPoints(std::string& out_error) {
    return ResolveSymbol(library_, "flowsim_native_abi_version", entry_points_.abi_version, out_error) &&
        ResolveSymbol(library_, "flowsim_native_create", entry_points_.create, out_error) &&
        ResolveSymbol(library_, "flowsim_native_destroy", entry_points_.destroy, out_error) &&
        ResolveSymbol(library_, "flowsim_native_last_error", entry_points_.last_error, out_error) &&
        ResolveSymbol(library_, "flowsim_native_load_network", entry_points_.load_network, out_error) &&
        ResolveSymbol(library_, "flowsim_native_reset", entry_points_.reset, out_error) &&
        ResolveSymbol(library_, "flowsim_native_step", entry_points_.step, out_error) &&
        ResolveSymbol(library_, "flowsim_native_vehicle_count", entry_points_.vehicle_count, out_error) &&
        ResolveSymbol(library_, "flowsim_native_vehicle_at", entry_points_.vehicle_at, out_error) &&
        ResolveSymbol(library_, "flowsim_native_set_speed", entry_points_.set_speed, out_error);
}

std::string NativeModuleHandle::InstanceError(const char* operation) const {
    const char* message = entry_points_.last_error != nullptr ? entry_points_.last_error(instance_) : nullptr;
    return std::string("native ") + operation + " failed: " +
        (message != nullptr && message[0] != '\0' ? message : "no error message");
}

}  // namespace flowsim::kernel
