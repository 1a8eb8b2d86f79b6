#include <platform/posix_process_platform.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <pwd.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace {

// a child that neither execs nor reports within this window is killed
constexpr std::chrono::milliseconds kExecReportTimeout{10000};

std::string errno_text(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

// Everything the child needs, resolved before fork so the child only makes
// async-signal-safe calls
struct ChildPlan {
    std::string executable;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string home;
    uid_t uid{0};
    gid_t gid{0};
    std::string user_name;
    std::vector<gid_t> groups;
    bool switch_user{false};
};

Result<std::vector<gid_t>> supplementary_groups(const std::string& user, gid_t primary) {
    int count = 32;
    std::vector<gid_t> groups;
    for (int attempt = 0; attempt < 8; ++attempt) {
        groups.resize(static_cast<size_t>(count));
        int n = count;
        if (::getgrouplist(user.c_str(), primary, groups.data(), &n) >= 0) {
            groups.resize(static_cast<size_t>(n));
            return groups;
        }
        count = n > count ? n : count * 2;
    }
    return ErrorCode(SupervisorErrc::kLaunchFailed, "group list for " + user + " keeps growing");
}

Result<ChildPlan> build_plan(const platform::LogonContext& ctx, const std::string& executable,
                             const std::vector<std::string>& args) {
    ChildPlan plan;
    plan.executable = executable;

    long buf_len = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(buf_len > 0 ? static_cast<size_t>(buf_len) : 16384u);
    passwd pw{};
    passwd* found = nullptr;
    const int rc = ::getpwuid_r(static_cast<uid_t>(ctx.uid), &pw, buf.data(), buf.size(), &found);
    if (rc != 0 || found == nullptr) {
        return ErrorCode(SupervisorErrc::kNoLogonContext,
                         "no passwd entry for uid " + std::to_string(ctx.uid));
    }
    plan.uid = pw.pw_uid;
    plan.gid = pw.pw_gid;
    plan.user_name = pw.pw_name;
    plan.home = pw.pw_dir ? pw.pw_dir : "/";

    if (::geteuid() == plan.uid) {
        plan.switch_user = false;
    } else if (::geteuid() == 0) {
        plan.switch_user = true;
    } else {
        return ErrorCode(SupervisorErrc::kPermissionDenied,
                         "cannot launch as uid " + std::to_string(plan.uid) + " without root");
    }
    if (plan.switch_user) {
        auto groups = supplementary_groups(plan.user_name, plan.gid);
        if (!groups.HasValue()) return groups.Error();
        plan.groups = std::move(groups.Value());
    }

    plan.argv_storage.push_back(executable);
    plan.argv_storage.insert(plan.argv_storage.end(), args.begin(), args.end());

    plan.env_storage = {
        "HOME=" + plan.home,
        "USER=" + plan.user_name,
        "LOGNAME=" + plan.user_name,
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "XDG_RUNTIME_DIR=" + ctx.runtime_dir,
        "XDG_SESSION_ID=" + std::to_string(ctx.session_id),
    };
    if (!ctx.display.empty()) plan.env_storage.push_back("DISPLAY=" + ctx.display);
    return plan;
}

// Pointer tables into the storage; only valid while the plan stays put
void bind_pointers(ChildPlan& plan) {
    plan.argv.clear();
    plan.envp.clear();
    for (auto& a : plan.argv_storage) plan.argv.push_back(a.data());
    plan.argv.push_back(nullptr);
    for (auto& e : plan.env_storage) plan.envp.push_back(e.data());
    plan.envp.push_back(nullptr);
}

// Runs in the forked child; never returns
[[noreturn]] void exec_child(const ChildPlan& plan, int report_fd) {
    auto fail = [report_fd](int err) {
        ssize_t ignored = ::write(report_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    };

    if (::setsid() < 0) fail(errno);
    if (::prctl(PR_SET_PDEATHSIG, SIGTERM) < 0) fail(errno);

    if (plan.switch_user) {
        if (::setgroups(plan.groups.size(), plan.groups.data()) < 0) fail(errno);
        if (::setgid(plan.gid) < 0) fail(errno);
        if (::setuid(plan.uid) < 0) fail(errno);
    }
    if (::chdir(plan.home.c_str()) < 0 && ::chdir("/") < 0) fail(errno);

    ::execve(plan.executable.c_str(), plan.argv.data(), plan.envp.data());
    fail(errno);
    ::_exit(127);
}

// >0 once the pipe is readable (error report or EOF on exec), 0 on timeout,
// <0 on poll failure
int wait_for_exec_report(int fd) {
    const auto deadline = std::chrono::steady_clock::now() + kExecReportTimeout;
    pollfd pfd{fd, POLLIN, 0};
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return 0;
        const int r = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (r < 0 && errno == EINTR) continue;
        return r;
    }
}

} // namespace

namespace platform {

PosixProcessPlatform::PosixProcessPlatform(LogonResolver resolver)
    : resolver_(std::move(resolver)),
      log_(warden::log::Logger::CreateLogger("PLAT")) {}

Result<ProcessHandle>
PosixProcessPlatform::launch_in_session(int session_id, const std::string& executable,
                                        const std::vector<std::string>& args) {
    auto ctx = resolver_(session_id);
    if (!ctx.HasValue()) return ctx.Error();

    auto plan = build_plan(ctx.Value(), executable, args);
    if (!plan.HasValue()) return plan.Error();
    bind_pointers(plan.Value());

    // exec failures travel back over a close-on-exec pipe; EOF means exec succeeded
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return ErrorCode(SupervisorErrc::kLaunchFailed, "pipe2: " + errno_text(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]); ::close(fds[1]);
        return ErrorCode(SupervisorErrc::kLaunchFailed, "fork: " + errno_text(err));
    }
    if (pid == 0) {
        ::close(fds[0]);
        exec_child(plan.Value(), fds[1]);
    }

    ::close(fds[1]);
    const int exec_wait = wait_for_exec_report(fds[0]);
    int child_err = 0;
    ssize_t n = -1;
    if (exec_wait > 0) {
        do {
            n = ::read(fds[0], &child_err, sizeof(child_err));
        } while (n < 0 && errno == EINTR);
    }
    ::close(fds[0]);

    if (exec_wait <= 0) {
        const int err = errno;
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        if (exec_wait < 0) {
            return ErrorCode(SupervisorErrc::kLaunchFailed, "poll on exec report: " + errno_text(err));
        }
        return ErrorCode(SupervisorErrc::kLaunchFailed,
                         "child for session " + std::to_string(session_id) + " did not exec "
                         + executable + " within "
                         + std::to_string(kExecReportTimeout.count()) + " ms");
    }
    if (n == static_cast<ssize_t>(sizeof(child_err))) {
        ::waitpid(pid, nullptr, 0);
        return ErrorCode(SupervisorErrc::kLaunchFailed,
                         "exec " + executable + " in session " + std::to_string(session_id)
                         + ": " + errno_text(child_err));
    }

    WARDEN_LOGDEBUG(log_, "Launched {} as {} in session {} (PID {})",
                    executable, plan.Value().user_name, session_id, pid);
    return ProcessHandle{pid};
}

ProcessStatus PosixProcessPlatform::poll(const ProcessHandle& h) {
    if (!h.valid()) return {ProcessStatus::Kind::kExited, 0};
    int status = 0;
    const pid_t r = ::waitpid(h.pid, &status, WNOHANG);
    if (r == h.pid) return {ProcessStatus::Kind::kExited, status};
    if (r == 0) return {ProcessStatus::Kind::kRunning, 0};
    if (errno == ECHILD) {
        // not our child any more (already reaped elsewhere); fall back to existence
        if (::kill(h.pid, 0) == 0 || errno == EPERM) return {ProcessStatus::Kind::kRunning, 0};
        return {ProcessStatus::Kind::kExited, 0};
    }
    return {ProcessStatus::Kind::kUnknown, 0};
}

Result<void> PosixProcessPlatform::signal_group(const ProcessHandle& h, int sig) {
    if (!h.valid()) return ErrorCode(SupervisorErrc::kNotFound, "invalid pid");
    // the worker leads its own process group (setsid in the child)
    if (::kill(-h.pid, sig) == 0 || ::kill(h.pid, sig) == 0) return {};
    if (errno == ESRCH) return {};
    return ErrorCode(SupervisorErrc::kUnknown,
                     "kill(" + std::to_string(h.pid) + ", " + std::to_string(sig) + "): " + errno_text(errno));
}

Result<void> PosixProcessPlatform::request_stop(const ProcessHandle& h) {
    return signal_group(h, SIGTERM);
}

Result<void> PosixProcessPlatform::force_terminate(const ProcessHandle& h) {
    auto r = signal_group(h, SIGKILL);
    if (!r.HasValue()) return r;
    if (!wait_for_exit(h, std::chrono::seconds(2))) {
        return ErrorCode(SupervisorErrc::kUnknown,
                         "PID " + std::to_string(h.pid) + " survived SIGKILL");
    }
    return {};
}

bool PosixProcessPlatform::wait_for_exit(const ProcessHandle& h, std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto st = poll(h);
        if (st.kind == ProcessStatus::Kind::kExited) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(50ms);
    }
}

int PosixProcessPlatform::kill_stray_processes(const std::string& executable) {
    std::error_code ec;
    const fs::path target = fs::weakly_canonical(executable, ec);
    if (ec) return 0;

    int killed = 0;
    const pid_t self = ::getpid();
    fs::directory_iterator it("/proc", ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
        const pid_t pid = static_cast<pid_t>(std::stol(name));
        if (pid == self) continue;

        std::error_code link_ec;
        const fs::path exe = fs::read_symlink(it->path() / "exe", link_ec);
        if (link_ec || exe != target) continue;

        if (::kill(pid, SIGKILL) == 0) {
            ++killed;
            WARDEN_LOGWARN(log_, "Killed stray worker PID {} ({})", pid, exe.string());
        }
    }
    return killed;
}

} // namespace platform
