#pragma once

#include "core/error.h"

#include <entt/entt.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowsim::kernel {

struct VehicleIdentity final {
    std::string id;
};

struct VehicleSpeed final {
    double meters_per_second = 0.0;
};

struct RoadPosition final {
    std::string edge_id;
    double lane_position = 0.0;
    double x = 0.0;
    double y = 0.0;
};

// One vehicle as reported by a backend after a step.
struct VehicleSample final {
    std::string id;
    double speed = 0.0;
    RoadPosition position{};
};

struct FlowLogEntry final {
    double duration_seconds = 0.0;
    int departed = 0;
    int arrived = 0;
};

// Per-step vehicle view. A snapshot is assembled in a fresh registry and
// swapped in, so readers always see exactly one completed step.
class VehicleStateCache final {
public:
    static constexpr double kSecondsPerHour = 3600.0;

    void Clear();
    void ReplaceSnapshot(std::vector<VehicleSample> samples);
    void RecordStep(double duration_seconds, int departed, int arrived);

    std::size_t Count() const;
    // Ordering is stable within one step only.
    const std::vector<std::string>& Ids() const;
    bool Contains(const std::string& vehicle_id) const;

    bool Speeds(
        const std::vector<std::string>& vehicle_ids,
        std::vector<double>& out_speeds,
        core::Error& out_error) const;
    bool Speed(const std::string& vehicle_id, double& out_speed, core::Error& out_error) const;
    bool Position(
        const std::string& vehicle_id,
        RoadPosition& out_position,
        core::Error& out_error) const;
    std::vector<double> AllSpeeds() const;
    double MeanSpeed() const;

    // Vehicles per hour over the trailing window of simulated time. A window
    // longer than the recorded history uses the whole history.
    double OutflowRate(double window_seconds) const;
    double InflowRate(double window_seconds) const;
    double ElapsedSeconds() const;
    const std::vector<FlowLogEntry>& FlowLog() const;

private:
    double FlowRate(double window_seconds, bool count_arrivals) const;
    bool FindEntity(
        const std::string& vehicle_id,
        entt::entity& out_entity,
        core::Error& out_error) const;

    entt::registry registry_;
    std::unordered_map<std::string, entt::entity> index_;
    std::vector<std::string> ids_;
    std::vector<FlowLogEntry> flow_log_;
    double elapsed_seconds_ = 0.0;
};

}  // namespace flowsim::kernel
