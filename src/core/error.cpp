#include "core/error.h"

#include <utility>

namespace flowsim::core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Connection:
            return "connection";
        case ErrorKind::Initialization:
            return "initialization";
        case ErrorKind::SimulationCommunication:
            return "simulation_communication";
        case ErrorKind::UnknownEntity:
            return "unknown_entity";
        case ErrorKind::EmissionConversion:
            return "emission_conversion";
        case ErrorKind::Policy:
            return "policy";
    }

    return "unknown";
}

bool Error::HasError() const {
    return kind != ErrorKind::None;
}

void Error::Clear() {
    kind = ErrorKind::None;
    message.clear();
}

void Error::Set(ErrorKind error_kind, std::string error_message) {
    kind = error_kind;
    message = std::move(error_message);
}

std::string Error::Describe() const {
    std::string text = ErrorKindName(kind);
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    return text;
}

}  // namespace flowsim::core
