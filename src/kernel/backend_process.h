#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

namespace flowsim::kernel {

// Owns one child simulator process. Close() is idempotent and always reaps
// the child; the destructor calls it.
class BackendProcess final {
public:
    static constexpr int kTerminateGraceMillis = 3000;
    static constexpr int kReapPollMillis = 10;

    BackendProcess() = default;
    ~BackendProcess();

    BackendProcess(const BackendProcess&) = delete;
    BackendProcess& operator=(const BackendProcess&) = delete;

    bool Launch(const std::vector<std::string>& arguments, std::string& out_error);
    void Close();

    bool IsLaunched() const;
    bool IsRunning();
    pid_t Pid() const;
    const std::string& CommandLine() const;

private:
    bool TryReap(int& out_status);

    pid_t pid_ = -1;
    bool exited_ = false;
    std::string command_line_;
};

}  // namespace flowsim::kernel
