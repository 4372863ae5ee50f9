#include "kernel/backend_process.h"

#include "core/logger.h"

#include <chrono>
#include <cstring>
#include <thread>

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace flowsim::kernel {
namespace {

std::string JoinArguments(const std::vector<std::string>& arguments) {
    std::string text;
    for (const std::string& argument : arguments) {
        if (!text.empty()) {
            text += ' ';
        }
        text += argument;
    }
    return text;
}

// Reports the child's exec failure back through a close-on-exec pipe: a
// successful exec closes the pipe without writing anything.
bool ReadExecFailure(int read_fd, int& out_errno) {
    int child_errno = 0;
    std::size_t received = 0;
    while (received < sizeof(child_errno)) {
        const ssize_t result = read(
            read_fd,
            reinterpret_cast<char*>(&child_errno) + received,
            sizeof(child_errno) - received);
        if (result > 0) {
            received += static_cast<std::size_t>(result);
            continue;
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        break;
    }

    if (received == sizeof(child_errno)) {
        out_errno = child_errno;
        return true;
    }
    return false;
}

}  // namespace

BackendProcess::~BackendProcess() {
    Close();
}

bool BackendProcess::Launch(const std::vector<std::string>& arguments, std::string& out_error) {
    Close();

    if (arguments.empty() || arguments.front().empty()) {
        out_error = "backend command line is empty";
        return false;
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const std::string& argument : arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    int exec_pipe[2] = {-1, -1};
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        out_error = "pipe2 failed: " + std::string(std::strerror(errno));
        return false;
    }

    const pid_t child = fork();
    if (child < 0) {
        const int fork_errno = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        out_error = "fork failed: " + std::string(std::strerror(fork_errno));
        return false;
    }

    if (child == 0) {
        close(exec_pipe[0]);
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        const ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(exec_pipe[1]);
    int exec_errno = 0;
    const bool exec_failed = ReadExecFailure(exec_pipe[0], exec_errno);
    close(exec_pipe[0]);

    if (exec_failed) {
        int status = 0;
        while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
        }
        out_error = "cannot execute '" + arguments.front() + "': " + std::strerror(exec_errno);
        return false;
    }

    pid_ = child;
    exited_ = false;
    command_line_ = JoinArguments(arguments);
    core::Logger::Info(
        "kernel",
        "Launched backend pid=" + std::to_string(pid_) + ": " + command_line_);
    out_error.clear();
    return true;
}

void BackendProcess::Close() {
    if (pid_ <= 0) {
        return;
    }

    int status = 0;
    if (!exited_ && !TryReap(status)) {
        kill(pid_, SIGTERM);

        const auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(kTerminateGraceMillis);
        while (!TryReap(status) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMillis));
        }

        if (!exited_) {
            core::Logger::Warn(
                "kernel",
                "Backend pid=" + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL.");
            kill(pid_, SIGKILL);
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
            exited_ = true;
        }
    }

    core::Logger::Info("kernel", "Backend pid=" + std::to_string(pid_) + " closed.");
    pid_ = -1;
    exited_ = false;
    command_line_.clear();
}

bool BackendProcess::IsLaunched() const {
    return pid_ > 0;
}

bool BackendProcess::IsRunning() {
    if (pid_ <= 0 || exited_) {
        return false;
    }

    int status = 0;
    return !TryReap(status);
}

pid_t BackendProcess::Pid() const {
    return pid_;
}

const std::string& BackendProcess::CommandLine() const {
    return command_line_;
}

bool BackendProcess::TryReap(int& out_status) {
    if (exited_) {
        return true;
    }

    const pid_t result = waitpid(pid_, &out_status, WNOHANG);
    if (result == pid_ || (result < 0 && errno == ECHILD)) {
        exited_ = true;
        return true;
    }
    return false;
}

}  // namespace flowsim::kernel
