#pragma once

#include <cstdint>
#include <string>

namespace flowsim::core {

enum class ErrorKind : std::uint8_t {
    None = 0,
    // Invalid or missing option, detected before any simulation work.
    Configuration = 1,
    // Backend process or module unreachable, or handshake failed.
    Connection = 2,
    // Backend reachable but the network could not be loaded.
    Initialization = 3,
    // I/O failure while stepping; vehicle state is no longer trustworthy.
    SimulationCommunication = 4,
    // Query for a vehicle id that is not in the current snapshot.
    UnknownEntity = 5,
    // Emission file missing or malformed after the run.
    EmissionConversion = 6,
    // Reward or action callback (for example a policy script) failed.
    Policy = 7,
};

const char* ErrorKindName(ErrorKind kind);

struct Error final {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool HasError() const;
    void Clear();
    void Set(ErrorKind error_kind, std::string error_message);
    std::string Describe() const;
};

}  // namespace flowsim::core
