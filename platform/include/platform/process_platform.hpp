#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include <warden/core/result.hpp>

namespace platform {

struct ProcessHandle {
    pid_t pid{-1};
    bool valid() const { return pid > 0; }
};

struct ProcessStatus {
    enum class Kind { kRunning, kExited, kUnknown };
    Kind kind{Kind::kUnknown};
    int wait_status{0};   // raw waitpid status when kExited and known
};

// Process control scoped to login sessions. launch_in_session, request_stop,
// force_terminate and wait_for_exit may block; callers run them off the
// control thread.
class IProcessPlatform {
public:
    virtual ~IProcessPlatform() = default;

    // Runs the executable with the credentials of the session's logon.
    // kNoLogonContext when the session has no logon context (yet).
    virtual warden::core::Result<ProcessHandle>
    launch_in_session(int session_id, const std::string& executable,
                      const std::vector<std::string>& args) = 0;

    // Non-blocking; reaps the child when it has exited
    virtual ProcessStatus poll(const ProcessHandle& h) = 0;

    virtual warden::core::Result<void> request_stop(const ProcessHandle& h) = 0;
    virtual warden::core::Result<void> force_terminate(const ProcessHandle& h) = 0;

    // true once the process is gone (and reaped)
    virtual bool wait_for_exit(const ProcessHandle& h, std::chrono::milliseconds timeout) = 0;

    // Kills every process running `executable` except the caller; returns the count
    virtual int kill_stray_processes(const std::string& executable) = 0;
};

} // namespace platform
