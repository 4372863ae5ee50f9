#include "kernel/pending_speed_commands.h"

#include <algorithm>
#include <cmath>

namespace flowsim::kernel {

bool PendingSpeedCommands::Queue(
    const VehicleStateCache& vehicles,
    const std::vector<VehicleCommand>& commands,
    core::Error& out_error) {
    for (const VehicleCommand& command : commands) {
        if (!vehicles.Contains(command.vehicle_id)) {
            out_error.Set(
                core::ErrorKind::UnknownEntity,
                "speed command for unknown vehicle id '" + command.vehicle_id + "'");
            return false;
        }
        if (!std::isfinite(command.target_speed)) {
            out_error.Set(
                core::ErrorKind::Configuration,
                "speed command for '" + command.vehicle_id + "' is not a finite number");
            return false;
        }
    }

    for (const VehicleCommand& command : commands) {
        const auto existing = std::find_if(
            commands_.begin(),
            commands_.end(),
            [&command](const SpeedCommand& queued) { return queued.first == command.vehicle_id; });
        if (existing != commands_.end()) {
            existing->second = command.target_speed;
        } else {
            commands_.emplace_back(command.vehicle_id, command.target_speed);
        }
    }

    out_error.Clear();
    return true;
}

std::vector<PendingSpeedCommands::SpeedCommand> PendingSpeedCommands::Take() {
    std::vector<SpeedCommand> taken = std::move(commands_);
    commands_.clear();
    return taken;
}

void PendingSpeedCommands::Clear() {
    commands_.clear();
}

std::size_t PendingSpeedCommands::Size() const {
    return commands_.size();
}

}  // namespace flowsim::kernel
