#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <platform/process_platform.hpp>

namespace fakes {

// In-memory processes. Nothing is forked; pids are counters.
class FakeProcessPlatform : public platform::IProcessPlatform {
public:
    struct Launch {
        int session_id;
        std::string executable;
        std::vector<std::string> args;
        pid_t pid;   // -1 when the launch failed
    };

    // Scripting
    void fail_launches(std::optional<warden::core::SupervisorErrc> e) { std::scoped_lock lk(mu_); launch_error_ = e; }
    void exit_on_launch(bool v) { std::scoped_lock lk(mu_); exit_on_launch_ = v; }
    void ignore_sigterm(bool v) { std::scoped_lock lk(mu_); ignore_sigterm_ = v; }
    void throw_on_poll(pid_t pid) { std::scoped_lock lk(mu_); throw_on_poll_.insert(pid); }
    void crash(pid_t pid, int wait_status = 139) { std::scoped_lock lk(mu_); exited_[pid] = wait_status; }

    // Observation
    std::vector<Launch> launches() { std::scoped_lock lk(mu_); return launches_; }
    int launch_count(int session_id) {
        std::scoped_lock lk(mu_);
        int n = 0;
        for (const auto& l : launches_) if (l.session_id == session_id) ++n;
        return n;
    }
    std::vector<pid_t> stop_requests() { std::scoped_lock lk(mu_); return stops_; }
    std::vector<pid_t> force_terminations() { std::scoped_lock lk(mu_); return kills_; }
    bool alive(pid_t pid) { std::scoped_lock lk(mu_); return started_.count(pid) && !exited_.count(pid); }

    warden::core::Result<platform::ProcessHandle>
    launch_in_session(int session_id, const std::string& executable,
                      const std::vector<std::string>& args) override {
        std::scoped_lock lk(mu_);
        if (launch_error_) {
            launches_.push_back({session_id, executable, args, -1});
            return warden::core::ErrorCode(*launch_error_, "scripted");
        }
        const pid_t pid = next_pid_++;
        started_.insert(pid);
        if (exit_on_launch_) exited_[pid] = 1 << 8;   // exit code 1
        launches_.push_back({session_id, executable, args, pid});
        return platform::ProcessHandle{pid};
    }

    platform::ProcessStatus poll(const platform::ProcessHandle& h) override {
        std::scoped_lock lk(mu_);
        if (throw_on_poll_.count(h.pid)) throw std::runtime_error("poll exploded");
        auto it = exited_.find(h.pid);
        if (it != exited_.end()) return {platform::ProcessStatus::Kind::kExited, it->second};
        if (started_.count(h.pid)) return {platform::ProcessStatus::Kind::kRunning, 0};
        return {platform::ProcessStatus::Kind::kUnknown, 0};
    }

    warden::core::Result<void> request_stop(const platform::ProcessHandle& h) override {
        std::scoped_lock lk(mu_);
        stops_.push_back(h.pid);
        if (!ignore_sigterm_) exited_.emplace(h.pid, 15);
        return {};
    }

    warden::core::Result<void> force_terminate(const platform::ProcessHandle& h) override {
        std::scoped_lock lk(mu_);
        kills_.push_back(h.pid);
        exited_[h.pid] = 9;
        return {};
    }

    bool wait_for_exit(const platform::ProcessHandle& h, std::chrono::milliseconds) override {
        std::scoped_lock lk(mu_);
        return exited_.count(h.pid) > 0;
    }

    int kill_stray_processes(const std::string&) override { return 0; }

private:
    std::mutex mu_;
    pid_t next_pid_{100};
    std::optional<warden::core::SupervisorErrc> launch_error_;
    bool exit_on_launch_{false};
    bool ignore_sigterm_{false};
    std::set<pid_t> throw_on_poll_;
    std::set<pid_t> started_;
    std::map<pid_t, int> exited_;
    std::vector<Launch> launches_;
    std::vector<pid_t> stops_;
    std::vector<pid_t> kills_;
};

} // namespace fakes
