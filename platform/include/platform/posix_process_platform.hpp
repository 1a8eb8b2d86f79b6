#pragma once
#include <functional>
#include <log.hpp>
#include <platform/logind_session_platform.hpp>
#include <platform/process_platform.hpp>

namespace platform {

// fork/exec based launcher. The child becomes its own process group leader so
// stop/terminate reach anything the worker spawned, drops to the session
// user, and is signalled SIGTERM if the supervisor dies first.
class PosixProcessPlatform : public IProcessPlatform {
public:
    using LogonResolver = std::function<warden::core::Result<LogonContext>(int session_id)>;

    explicit PosixProcessPlatform(LogonResolver resolver);

    warden::core::Result<ProcessHandle>
    launch_in_session(int session_id, const std::string& executable,
                      const std::vector<std::string>& args) override;

    ProcessStatus poll(const ProcessHandle& h) override;
    warden::core::Result<void> request_stop(const ProcessHandle& h) override;
    warden::core::Result<void> force_terminate(const ProcessHandle& h) override;
    bool wait_for_exit(const ProcessHandle& h, std::chrono::milliseconds timeout) override;
    int kill_stray_processes(const std::string& executable) override;

private:
    warden::core::Result<void> signal_group(const ProcessHandle& h, int sig);

    LogonResolver resolver_;
    warden::log::Logger log_;
};

} // namespace platform
