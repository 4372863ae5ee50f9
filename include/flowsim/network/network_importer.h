#pragma once

#include "core/config.h"
#include "network/network_description.h"

#include <string>
#include <string_view>

namespace flowsim::network {

class NetworkImporter final {
public:
    // Resolves relative paths against config.project_root. The net file is
    // optional for native networks, which describe themselves through the
    // template instead.
    static bool Import(
        const core::NetworkConfig& config,
        NetworkDescription& out_network,
        std::string& out_error);

    static bool ParseNetText(
        std::string_view document,
        NetworkDescription& out_network,
        std::string& out_error);
    static bool ParseRouteText(
        std::string_view document,
        NetworkDescription& out_network,
        std::string& out_error);
};

}  // namespace flowsim::network
