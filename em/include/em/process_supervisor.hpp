#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <config/supervisor_config.hpp>
#include <em/task_executor.hpp>
#include <em/worker_record.hpp>
#include <log.hpp>
#include <phm/heartbeat_channel.hpp>
#include <phm/restart_policy.hpp>
#include <platform/process_platform.hpp>
#include <session/session_monitor.hpp>
#include <warden/core/bounded_queue.hpp>
#include <warden/core/result.hpp>

namespace em {

// Completions posted by executor tasks
struct LaunchCompleted {
    int session_id;
    std::uint64_t generation;
    warden::core::Result<platform::ProcessHandle> result;
};

struct StopCompleted {
    int session_id;
    std::uint64_t generation;
    bool graceful;           // exited within the grace period
};

struct TerminateCompleted {
    int session_id;
    std::uint64_t generation;
    bool killed;             // false when aborted because heartbeats resumed
    warden::core::ErrorCode reason;
};

using SupervisorMessage = std::variant<session::SessionUpdate, phm::HeartbeatObserved,
                                       LaunchCompleted, StopCompleted, TerminateCompleted>;

// Reconciles the worker table against the interactive sessions. Every
// mutation happens on the thread calling run_cycle()/run(); other threads
// only post messages.
class ProcessSupervisor {
public:
    struct Config {
        std::string worker_executable;
        std::vector<std::string> worker_args;
        std::string channel_dir{"/run/warden"};
        std::string channel_base_name{"warden_heartbeat"};
        std::chrono::seconds heartbeat_interval{10};
        int missed_beat_multiplier{2};
        std::chrono::seconds startup_timeout{30};
        phm::RestartPolicy::Config restart{};
        bool multi_session_enabled{true};
        std::chrono::milliseconds reconcile_tick{1000};
        std::chrono::milliseconds stop_grace{5000};
        std::size_t event_queue_capacity{256};
    };

    struct CycleStats {
        int launches{0};
        int stops{0};
        int terminations{0};
    };

    using Clock = std::function<TimePoint()>;
    using FailureCallback = std::function<void(int session_id, const warden::core::ErrorCode& reason)>;

    ProcessSupervisor(Config cfg, platform::IProcessPlatform& processes,
                      phm::IHeartbeatChannelFactory& channels, ITaskExecutor& executor,
                      Clock clock = &std::chrono::steady_clock::now);

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Thread-safe producers; periodic messages are dropped when the queue is full
    bool post(session::SessionUpdate update);
    bool post(phm::HeartbeatObserved hb);

    // One reconciliation pass: messages, liveness, restarts, launches
    void run_cycle();

    // Cycles until `running` turns false or request_stop() is called
    void run(const std::atomic<bool>& running);
    // Callable from any thread; run() returns after the current cycle
    void request_stop();

    // Stops every worker within the grace window and closes all channels
    void shutdown();

    void set_failure_callback(FailureCallback cb) { on_failure_ = std::move(cb); }

    std::optional<WorkerView> worker(int session_id) const;
    std::vector<WorkerView> workers() const;
    std::size_t worker_count() const { return workers_.size(); }
    const CycleStats& last_cycle() const { return last_cycle_; }
    std::size_t dropped_messages() const { return queue_.Dropped(); }

    static Config from(const config::SupervisorConfig& c, const std::string& worker_executable);

private:
    void apply_messages();
    void apply(session::SessionUpdate& m);
    void apply(phm::HeartbeatObserved& m);
    void apply(LaunchCompleted& m);
    void apply(StopCompleted& m);
    void apply(TerminateCompleted& m);

    std::set<int> desired_sessions() const;
    void stop_orphans(const std::set<int>& desired);
    void check_liveness(WorkerRecord& rec);
    void launch_missing(const std::set<int>& desired);

    void launch(WorkerRecord& rec);
    void mark_running(WorkerRecord& rec, TimePoint at, const std::string& status);
    void begin_stop(WorkerRecord& rec);
    void begin_terminate(WorkerRecord& rec, warden::core::ErrorCode reason, bool abortable);
    void handle_failure(WorkerRecord& rec, const warden::core::ErrorCode& reason);
    void close_channel(WorkerRecord& rec, bool send_stop);

    // Runs fn for one record; an exception only affects that session
    template <typename Fn>
    void isolated(int session_id, const char* what, Fn&& fn);

    WorkerRecord* find(int session_id, std::uint64_t generation);
    warden::log::Logger log_for(const WorkerRecord& rec) const;

    Config cfg_;
    platform::IProcessPlatform& processes_;
    phm::IHeartbeatChannelFactory& channels_;
    ITaskExecutor& executor_;
    Clock clock_;
    phm::RestartPolicy policy_;
    warden::log::Logger log_;

    warden::core::BoundedQueue<SupervisorMessage> queue_;
    session::SessionMap sessions_;
    bool have_sessions_{false};
    std::map<int, WorkerRecord> workers_;
    std::map<int, std::uint64_t> generations_;   // survives record removal

    TimePoint now_{};
    CycleStats cycle_{};
    CycleStats last_cycle_{};
    bool shutting_down_{false};
    std::atomic<bool> stop_requested_{false};
    FailureCallback on_failure_{};
};

} // namespace em
