#include "kernel/vehicle_state_cache.h"

#include <utility>

namespace flowsim::kernel {
namespace {

constexpr double kWindowEpsilon = 1e-9;

}  // namespace

void VehicleStateCache::Clear() {
    registry_.clear();
    index_.clear();
    ids_.clear();
    flow_log_.clear();
    elapsed_seconds_ = 0.0;
}

void VehicleStateCache::ReplaceSnapshot(std::vector<VehicleSample> samples) {
    entt::registry next_registry;
    std::unordered_map<std::string, entt::entity> next_index;
    std::vector<std::string> next_ids;
    next_index.reserve(samples.size());
    next_ids.reserve(samples.size());

    for (VehicleSample& sample : samples) {
        if (next_index.contains(sample.id)) {
            continue;
        }

        const entt::entity entity = next_registry.create();
        next_registry.emplace<VehicleIdentity>(entity, VehicleIdentity{.id = sample.id});
        next_registry.emplace<VehicleSpeed>(
            entity,
            VehicleSpeed{.meters_per_second = sample.speed});
        next_registry.emplace<RoadPosition>(entity, std::move(sample.position));
        next_index.emplace(sample.id, entity);
        next_ids.push_back(std::move(sample.id));
    }

    registry_ = std::move(next_registry);
    index_ = std::move(next_index);
    ids_ = std::move(next_ids);
}

void VehicleStateCache::RecordStep(double duration_seconds, int departed, int arrived) {
    flow_log_.push_back(FlowLogEntry{
        .duration_seconds = duration_seconds,
        .departed = departed,
        .arrived = arrived,
    });
    elapsed_seconds_ += duration_seconds;
}

std::size_t VehicleStateCache::Count() const {
    return ids_.size();
}

const std::vector<std::string>& VehicleStateCache::Ids() const {
    return ids_;
}

bool VehicleStateCache::Contains(const std::string& vehicle_id) const {
    return index_.contains(vehicle_id);
}

bool VehicleStateCache::Speeds(
    const std::vector<std::string>& vehicle_ids,
    std::vector<double>& out_speeds,
    core::Error& out_error) const {
    std::vector<double> speeds;
    speeds.reserve(vehicle_ids.size());
    for (const std::string& vehicle_id : vehicle_ids) {
        entt::entity entity = entt::null;
        if (!FindEntity(vehicle_id, entity, out_error)) {
            return false;
        }
        speeds.push_back(registry_.get<VehicleSpeed>(entity).meters_per_second);
    }

    out_speeds = std::move(speeds);
    out_error.Clear();
    return true;
}

bool VehicleStateCache::Speed(
    const std::string& vehicle_id,
    double& out_speed,
    core::Error& out_error) const {
    entt::entity entity = entt::null;
    if (!FindEntity(vehicle_id, entity, out_error)) {
        return false;
    }

    out_speed = registry_.get<VehicleSpeed>(entity).meters_per_second;
    out_error.Clear();
    return true;
}

bool VehicleStateCache::Position(
    const std::string& vehicle_id,
    RoadPosition& out_position,
    core::Error& out_error) const {
    entt::entity entity = entt::null;
    if (!FindEntity(vehicle_id, entity, out_error)) {
        return false;
    }

    out_position = registry_.get<RoadPosition>(entity);
    out_error.Clear();
    return true;
}

std::vector<double> VehicleStateCache::AllSpeeds() const {
    std::vector<double> speeds;
    speeds.reserve(ids_.size());
    for (const std::string& vehicle_id : ids_) {
        speeds.push_back(registry_.get<VehicleSpeed>(index_.at(vehicle_id)).meters_per_second);
    }
    return speeds;
}

double VehicleStateCache::MeanSpeed() const {
    if (ids_.empty()) {
        return 0.0;
    }

    double total = 0.0;
    registry_.view<const VehicleSpeed>().each([&total](const VehicleSpeed& speed) {
        total += speed.meters_per_second;
    });
    return total / static_cast<double>(ids_.size());
}

double VehicleStateCache::OutflowRate(double window_seconds) const {
    return FlowRate(window_seconds, true);
}

double VehicleStateCache::InflowRate(double window_seconds) const {
    return FlowRate(window_seconds, false);
}

double VehicleStateCache::ElapsedSeconds() const {
    return elapsed_seconds_;
}

const std::vector<FlowLogEntry>& VehicleStateCache::FlowLog() const {
    return flow_log_;
}

double VehicleStateCache::FlowRate(double window_seconds, bool count_arrivals) const {
    if (window_seconds <= 0.0) {
        return 0.0;
    }

    double covered_seconds = 0.0;
    int vehicle_count = 0;
    for (auto entry = flow_log_.rbegin(); entry != flow_log_.rend(); ++entry) {
        if (covered_seconds + entry->duration_seconds > window_seconds + kWindowEpsilon) {
            break;
        }
        covered_seconds += entry->duration_seconds;
        vehicle_count += count_arrivals ? entry->arrived : entry->departed;
    }

    if (covered_seconds <= 0.0) {
        return 0.0;
    }
    return kSecondsPerHour * static_cast<double>(vehicle_count) / covered_seconds;
}

bool VehicleStateCache::FindEntity(
    const std::string& vehicle_id,
    entt::entity& out_entity,
    core::Error& out_error) const {
    const auto found = index_.find(vehicle_id);
    if (found == index_.end()) {
        out_error.Set(core::ErrorKind::UnknownEntity, "unknown vehicle id '" + vehicle_id + "'");
        return false;
    }

    out_entity = found->second;
    return true;
}

}  // namespace flowsim::kernel
