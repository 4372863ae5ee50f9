#pragma once

#include "core/config.h"
#include "core/error.h"
#include "network/network_description.h"

namespace flowsim::kernel {

// Exclusive owner of one external simulator connection. Close() may be called
// any number of times, including after a failed Connect().
class IBackendHandle {
public:
    virtual ~IBackendHandle() = default;

    virtual bool Connect(
        const network::NetworkDescription& network,
        const core::SimulationConfig& config,
        core::Error& out_error) = 0;
    virtual void Close() = 0;
    virtual bool IsConnected() const = 0;
};

}  // namespace flowsim::kernel
