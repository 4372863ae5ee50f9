#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace flowsim::core {

enum class LogLevel : std::uint8_t {
    Info = 0,
    Warn = 1,
    Error = 2,
};

class Logger final {
public:
    static void SetMinimumLevel(LogLevel level);
    static LogLevel MinimumLevel();

    static void Info(std::string_view module, std::string_view message);
    static void Warn(std::string_view module, std::string_view message);
    static void Error(std::string_view module, std::string_view message);

private:
    static void Log(LogLevel level, std::string_view module, std::string_view message);
};

}  // namespace flowsim::core
