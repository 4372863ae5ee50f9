#pragma once

#include "core/error.h"
#include "kernel/kernel_simulation.h"
#include "kernel/vehicle_state_cache.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace flowsim::kernel {

// Target speeds waiting for the next step. A later command for the same
// vehicle replaces the earlier one.
class PendingSpeedCommands final {
public:
    using SpeedCommand = std::pair<std::string, double>;

    // Accepts all commands or none; every id must be in the current snapshot.
    bool Queue(
        const VehicleStateCache& vehicles,
        const std::vector<VehicleCommand>& commands,
        core::Error& out_error);
    std::vector<SpeedCommand> Take();
    void Clear();
    std::size_t Size() const;

private:
    std::vector<SpeedCommand> commands_;
};

}  // namespace flowsim::kernel
