#include "core/logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace flowsim::core {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<std::uint8_t>& MinimumLevelStorage() {
    static std::atomic<std::uint8_t> level{static_cast<std::uint8_t>(LogLevel::Info)};
    return level;
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }

    return "UNKNOWN";
}

std::string BuildTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostringstream stream;
    stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

}  // namespace

void Logger::SetMinimumLevel(LogLevel level) {
    MinimumLevelStorage().store(static_cast<std::uint8_t>(level));
}

LogLevel Logger::MinimumLevel() {
    return static_cast<LogLevel>(MinimumLevelStorage().load());
}

void Logger::Info(std::string_view module, std::string_view message) {
    Log(LogLevel::Info, module, message);
}

void Logger::Warn(std::string_view module, std::string_view message) {
    Log(LogLevel::Warn, module, message);
}

void Logger::Error(std::string_view module, std::string_view message) {
    Log(LogLevel::Error, module, message);
}

void Logger::Log(LogLevel level, std::string_view module, std::string_view message) {
    if (static_cast<std::uint8_t>(level) < MinimumLevelStorage().load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(LogMutex());
    std::ostream& stream = level == LogLevel::Info ? std::cout : std::cerr;
    stream << '[' << BuildTimestamp() << "] [" << LevelName(level) << "] [" << module << "] "
           << message << '\n';
}

}  // namespace flowsim::core
