#include <em/process_supervisor.hpp>
#include <algorithm>
#include <exception>
#include <sys/wait.h>

using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace em {

namespace {

std::string describe_exit(int wait_status) {
    if (WIFEXITED(wait_status))   return "exit code " + std::to_string(WEXITSTATUS(wait_status));
    if (WIFSIGNALED(wait_status)) return "signal " + std::to_string(WTERMSIG(wait_status));
    return "status " + std::to_string(wait_status);
}

} // namespace

ProcessSupervisor::Config ProcessSupervisor::from(const config::SupervisorConfig& c,
                                                  const std::string& worker_executable) {
    Config out;
    out.worker_executable = worker_executable;
    out.worker_args = c.worker_args;
    out.channel_dir = c.channel_dir;
    out.channel_base_name = c.channel_base_name;
    out.heartbeat_interval = c.heartbeat_interval();
    out.missed_beat_multiplier = c.missed_beat_multiplier;
    out.startup_timeout = c.startup_timeout();
    out.restart.max_restart_attempts = c.max_restart_attempts;
    out.restart.restart_delay = c.restart_delay();
    out.restart.stability_window = c.stability_window();
    out.multi_session_enabled = c.multi_session_enabled;
    out.reconcile_tick = std::chrono::milliseconds(c.reconcile_tick_ms);
    out.stop_grace = c.stop_grace();
    out.event_queue_capacity = c.event_queue_capacity;
    return out;
}

ProcessSupervisor::ProcessSupervisor(Config cfg, platform::IProcessPlatform& processes,
                                     phm::IHeartbeatChannelFactory& channels,
                                     ITaskExecutor& executor, Clock clock)
    : cfg_(std::move(cfg)),
      processes_(processes),
      channels_(channels),
      executor_(executor),
      clock_(std::move(clock)),
      policy_(cfg_.restart),
      log_(warden::log::Logger::CreateLogger("EM")),
      queue_(cfg_.event_queue_capacity) {}

bool ProcessSupervisor::post(session::SessionUpdate update) {
    if (queue_.TryPush(SupervisorMessage{std::move(update)})) return true;
    WARDEN_LOGWARN(log_, "Event queue full, session update dropped ({} dropped so far)", queue_.Dropped());
    return false;
}

bool ProcessSupervisor::post(phm::HeartbeatObserved hb) {
    return queue_.TryPush(SupervisorMessage{std::move(hb)});
}

warden::log::Logger ProcessSupervisor::log_for(const WorkerRecord& rec) const {
    std::string tag = "sid=" + std::to_string(rec.session_id) + " gen=" + std::to_string(rec.generation);
    if (rec.process.valid()) tag += " pid=" + std::to_string(rec.process.pid);
    return log_.WithCorrelation(std::move(tag));
}

WorkerRecord* ProcessSupervisor::find(int session_id, std::uint64_t generation) {
    auto it = workers_.find(session_id);
    if (it == workers_.end() || it->second.generation != generation) return nullptr;
    return &it->second;
}

template <typename Fn>
void ProcessSupervisor::isolated(int session_id, const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        WARDEN_LOGERROR(log_, "Session {}: {} failed: {}", session_id, what, e.what());
    }
}

// ---------- messages ----------

void ProcessSupervisor::apply_messages() {
    for (auto& msg : queue_.Drain()) {
        try {
            std::visit([this](auto& m) { apply(m); }, msg);
        } catch (const std::exception& e) {
            WARDEN_LOGERROR(log_, "Applying message failed: {}", e.what());
        }
    }
}

void ProcessSupervisor::apply(session::SessionUpdate& m) {
    for (const auto& ev : m.events) {
        WARDEN_LOGDEBUG(log_, "Session {} {}", ev.session_id, session::to_string(ev.type));
    }
    sessions_ = std::move(m.sessions);
    have_sessions_ = true;
}

void ProcessSupervisor::apply(phm::HeartbeatObserved& m) {
    WorkerRecord* rec = find(m.session_id, m.generation);
    if (!rec) return;   // stale generation or record already gone

    switch (rec->state) {
        case WorkerState::kStarting:
            // late beats after the startup deadline do not rescue the launch
            if (rec->terminate_pending) return;
            if (!rec->process.valid()) {
                if (rec->launch_pending && (!rec->early_heartbeat || m.at > *rec->early_heartbeat))
                    rec->early_heartbeat = m.at;
                return;
            }
            mark_running(*rec, m.at, m.status);
            break;
        case WorkerState::kRunning:
            if (!rec->last_heartbeat || m.at > *rec->last_heartbeat) rec->last_heartbeat = m.at;
            break;
        case WorkerState::kUnresponsive:
            if (rec->abort_terminate) rec->abort_terminate->store(true);
            rec->state = WorkerState::kRunning;
            rec->last_heartbeat = m.at;
            WARDEN_LOGWARN(log_for(*rec), "Worker for session {} resumed heartbeats", rec->session_id);
            break;
        default:
            break;
    }
}

void ProcessSupervisor::apply(LaunchCompleted& m) {
    WorkerRecord* rec = find(m.session_id, m.generation);
    if (!rec || !rec->launch_pending) {
        // nobody wants this process any more
        if (m.result.HasValue()) {
            const auto h = m.result.Value();
            WARDEN_LOGWARN(log_, "Orphaned worker pid {} for session {}, terminating", h.pid, m.session_id);
            executor_.submit([this, h] {
                if (!processes_.request_stop(h) || !processes_.wait_for_exit(h, cfg_.stop_grace)) {
                    auto r = processes_.force_terminate(h);
                    if (!r) WARDEN_LOGERROR(log_, "Could not terminate pid {}: {}", h.pid, r.Error().Message());
                }
            });
        }
        return;
    }
    rec->launch_pending = false;

    if (!m.result.HasValue()) {
        const auto& err = m.result.Error();
        if (rec->state == WorkerState::kStopping) {
            close_channel(*rec, false);
            workers_.erase(rec->session_id);
            return;
        }
        WARDEN_LOGERROR(log_for(*rec), "Launching worker for session {} failed: {}",
                        rec->session_id, err.Message());
        handle_failure(*rec, err);
        return;
    }

    rec->process = m.result.Value();
    rec->start_time = now_;
    rec->startup_deadline = now_ + cfg_.startup_timeout;
    WARDEN_LOGINFO(log_for(*rec), "Launched worker for session {} ({})", rec->session_id, rec->user_name);

    // the session left while we were launching
    if (rec->state == WorkerState::kStopping) {
        begin_stop(*rec);
        return;
    }
    if (rec->early_heartbeat) mark_running(*rec, *rec->early_heartbeat, "beat before launch completed");
}

void ProcessSupervisor::mark_running(WorkerRecord& rec, TimePoint at, const std::string& status) {
    rec.state = WorkerState::kRunning;
    rec.running_since = at;
    rec.last_heartbeat = at;
    rec.early_heartbeat.reset();
    WARDEN_LOGINFO(log_for(rec), "Worker for session {} is running ({})",
                   rec.session_id, status.empty() ? "no status" : status);
}

void ProcessSupervisor::apply(StopCompleted& m) {
    WorkerRecord* rec = find(m.session_id, m.generation);
    if (!rec) return;
    auto log = log_for(*rec);
    if (m.graceful) WARDEN_LOGINFO(log, "Worker for session {} stopped", m.session_id);
    else            WARDEN_LOGWARN(log, "Worker for session {} had to be killed", m.session_id);
    rec->state = WorkerState::kStopped;
    workers_.erase(m.session_id);
}

void ProcessSupervisor::apply(TerminateCompleted& m) {
    WorkerRecord* rec = find(m.session_id, m.generation);
    if (!rec) return;
    rec->terminate_pending = false;
    rec->abort_terminate.reset();

    if (!m.killed) {
        if (rec->state == WorkerState::kStopping) begin_stop(*rec);
        return;   // heartbeats resumed in time
    }

    rec->process = {};
    if (rec->state == WorkerState::kStopping) {
        close_channel(*rec, false);
        workers_.erase(m.session_id);
        return;
    }
    handle_failure(*rec, m.reason);
}

// ---------- cycle ----------

std::set<int> ProcessSupervisor::desired_sessions() const {
    std::set<int> out;
    for (const auto& [id, s] : sessions_) {
        if (!session::is_interactive_active(s)) continue;
        if (!cfg_.multi_session_enabled && !s.is_console) continue;
        out.insert(id);
    }
    return out;
}

void ProcessSupervisor::run_cycle() {
    now_ = clock_();
    cycle_ = {};

    apply_messages();

    const std::set<int> desired = desired_sessions();
    if (have_sessions_) stop_orphans(desired);

    for (auto& [id, rec] : workers_) {
        isolated(id, "liveness check", [&] { check_liveness(rec); });
    }

    launch_missing(desired);
    last_cycle_ = cycle_;
}

void ProcessSupervisor::stop_orphans(const std::set<int>& desired) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        WorkerRecord& rec = it->second;
        if (desired.count(it->first) || rec.state == WorkerState::kStopping) { ++it; continue; }

        bool erase = false;
        isolated(it->first, "stop", [&] {
            if (rec.launch_pending || rec.terminate_pending) {
                // finish once the in-flight task reports back
                rec.state = WorkerState::kStopping;
                WARDEN_LOGINFO(log_for(rec), "Session {} gone, stopping after pending operation", rec.session_id);
            } else if (!rec.process.valid() || rec.state == WorkerState::kFailed) {
                close_channel(rec, false);
                // budget and Failed marker live until the session logs off
                if (sessions_.count(rec.session_id)) return;
                WARDEN_LOGINFO(log_for(rec), "Session {} logged off, dropping {} record",
                               rec.session_id, to_string(rec.state));
                erase = true;
            } else {
                WARDEN_LOGINFO(log_for(rec), "Session {} left the desired set, stopping worker", rec.session_id);
                begin_stop(rec);
            }
        });
        it = erase ? workers_.erase(it) : std::next(it);
    }
}

void ProcessSupervisor::check_liveness(WorkerRecord& rec) {
    if (!rec.process.valid() || rec.terminate_pending) return;
    if (rec.state != WorkerState::kStarting && rec.state != WorkerState::kRunning) return;

    const auto status = processes_.poll(rec.process);
    if (status.kind == platform::ProcessStatus::Kind::kExited) {
        const std::string how = describe_exit(status.wait_status);
        WARDEN_LOGWARN(log_for(rec), "Worker for session {} exited unexpectedly ({}) while {}",
                       rec.session_id, how, to_string(rec.state));
        rec.process = {};
        handle_failure(rec, ErrorCode(SupervisorErrc::kUnexpectedExit, how));
        return;
    }

    if (rec.state == WorkerState::kStarting) {
        if (now_ >= rec.startup_deadline) {
            WARDEN_LOGWARN(log_for(rec), "No heartbeat from session {} within {}s of launch",
                           rec.session_id, cfg_.startup_timeout.count());
            begin_terminate(rec, ErrorCode(SupervisorErrc::kLaunchFailed, "no heartbeat within startup timeout"),
                            false);
        }
        return;
    }

    const auto timeout = cfg_.heartbeat_interval * cfg_.missed_beat_multiplier;
    const TimePoint last = rec.last_heartbeat.value_or(rec.start_time);
    if (now_ - last >= timeout) {
        const auto silent = std::chrono::duration_cast<std::chrono::seconds>(now_ - last).count();
        WARDEN_LOGWARN(log_for(rec), "Worker for session {} unresponsive, silent for {}s",
                       rec.session_id, silent);
        rec.state = WorkerState::kUnresponsive;
        begin_terminate(rec, ErrorCode(SupervisorErrc::kHeartbeatTimeout,
                                       "silent for " + std::to_string(silent) + "s"),
                        true);
    }
}

void ProcessSupervisor::launch_missing(const std::set<int>& desired) {
    for (int id : desired) {
        auto it = workers_.find(id);
        if (it == workers_.end()) {
            WorkerRecord rec;
            rec.session_id = id;
            rec.user_name = sessions_.at(id).user_name;
            it = workers_.emplace(id, std::move(rec)).first;
        } else if (!it->second.awaiting_launch() || now_ < it->second.budget.cooldown_until) {
            continue;
        }
        WorkerRecord& rec = it->second;
        isolated(id, "launch", [&] { launch(rec); });
    }
}

// ---------- actions ----------

void ProcessSupervisor::launch(WorkerRecord& rec) {
    close_channel(rec, false);

    rec.generation = ++generations_[rec.session_id];
    rec.state = WorkerState::kStarting;
    rec.process = {};
    rec.last_heartbeat.reset();
    rec.running_since.reset();
    rec.early_heartbeat.reset();
    rec.start_time = now_;
    rec.startup_deadline = now_ + cfg_.startup_timeout;

    std::optional<std::uint32_t> owner;
    if (auto s = sessions_.find(rec.session_id); s != sessions_.end()) owner = s->second.uid;

    auto ch = channels_.create(rec.session_id, rec.generation, owner,
                               [this](phm::HeartbeatObserved hb) { post(std::move(hb)); });
    if (!ch.HasValue()) {
        WARDEN_LOGERROR(log_for(rec), "Heartbeat channel for session {} unavailable: {}",
                        rec.session_id, ch.Error().Message());
        handle_failure(rec, ch.Error());
        return;
    }
    rec.channel = std::move(ch.Value());

    std::vector<std::string> args = {
        "user-session",
        "--session-id", std::to_string(rec.session_id),
        "--channel-dir", cfg_.channel_dir,
        "--channel-name", cfg_.channel_base_name,
        "--interval-s", std::to_string(cfg_.heartbeat_interval.count()),
    };
    args.insert(args.end(), cfg_.worker_args.begin(), cfg_.worker_args.end());

    rec.launch_pending = true;
    ++cycle_.launches;
    WARDEN_LOGDEBUG(log_for(rec), "Launching {} in session {}", cfg_.worker_executable, rec.session_id);

    const int sid = rec.session_id;
    const std::uint64_t gen = rec.generation;
    executor_.submit([this, sid, gen, args = std::move(args)] {
        Result<platform::ProcessHandle> r = ErrorCode(SupervisorErrc::kLaunchFailed);
        try {
            r = processes_.launch_in_session(sid, cfg_.worker_executable, args);
        } catch (const std::exception& e) {
            r = ErrorCode(SupervisorErrc::kLaunchFailed, e.what());
        }
        queue_.ForcePush(LaunchCompleted{sid, gen, std::move(r)});
    });
}

void ProcessSupervisor::begin_stop(WorkerRecord& rec) {
    rec.state = WorkerState::kStopping;
    close_channel(rec, true);
    ++cycle_.stops;

    const int sid = rec.session_id;
    const std::uint64_t gen = rec.generation;
    const platform::ProcessHandle h = rec.process;
    executor_.submit([this, sid, gen, h] {
        bool graceful = false;
        try {
            auto r = processes_.request_stop(h);
            graceful = r && processes_.wait_for_exit(h, cfg_.stop_grace);
            if (!graceful) {
                auto k = processes_.force_terminate(h);
                if (!k) WARDEN_LOGERROR(log_, "Session {}: force terminate failed: {}", sid, k.Error().Message());
            }
        } catch (const std::exception& e) {
            WARDEN_LOGERROR(log_, "Session {}: stop failed: {}", sid, e.what());
        }
        queue_.ForcePush(StopCompleted{sid, gen, graceful});
    });
}

void ProcessSupervisor::begin_terminate(WorkerRecord& rec, ErrorCode reason, bool abortable) {
    rec.terminate_pending = true;
    rec.abort_terminate = abortable ? std::make_shared<std::atomic<bool>>(false) : nullptr;
    ++cycle_.terminations;

    const int sid = rec.session_id;
    const std::uint64_t gen = rec.generation;
    const platform::ProcessHandle h = rec.process;
    auto abort = rec.abort_terminate;
    executor_.submit([this, sid, gen, h, abort, reason = std::move(reason)]() mutable {
        bool killed = false;
        if (!abort || !abort->load()) {
            try {
                auto r = processes_.force_terminate(h);
                if (!r) WARDEN_LOGERROR(log_, "Session {}: force terminate failed: {}", sid, r.Error().Message());
            } catch (const std::exception& e) {
                WARDEN_LOGERROR(log_, "Session {}: force terminate threw: {}", sid, e.what());
            }
            killed = true;
        }
        queue_.ForcePush(TerminateCompleted{sid, gen, killed, std::move(reason)});
    });
}

void ProcessSupervisor::handle_failure(WorkerRecord& rec, const ErrorCode& reason) {
    const auto running_for = rec.running_since
        ? now_ - *rec.running_since
        : std::chrono::steady_clock::duration::zero();

    close_channel(rec, false);
    rec.process = {};
    rec.last_heartbeat.reset();
    rec.running_since.reset();
    rec.early_heartbeat.reset();

    const auto d = policy_.decide(rec.budget, running_for);
    if (running_for > policy_.config().stability_window && rec.budget.restart_count > 0) {
        WARDEN_LOGINFO(log_for(rec), "Session {} was stable, restart history cleared", rec.session_id);
    }
    phm::RestartPolicy::record(rec.budget, d, now_);

    if (d.retry()) {
        rec.state = WorkerState::kStarting;
        WARDEN_LOGWARN(log_for(rec), "Worker for session {} failed ({}), restart {}/{} in {}s",
                       rec.session_id, reason.Message(), d.restart_count,
                       policy_.config().max_restart_attempts, d.delay.count());
        return;
    }

    rec.state = WorkerState::kFailed;
    const ErrorCode exhausted(SupervisorErrc::kRestartBudgetExhausted,
                              "session " + std::to_string(rec.session_id) + " after "
                              + std::to_string(d.restart_count) + " failures, last: " + reason.Message());
    WARDEN_LOGERROR(log_for(rec), "Giving up on worker for session {}: {}", rec.session_id, exhausted.Message());
    if (on_failure_) on_failure_(rec.session_id, exhausted);
}

void ProcessSupervisor::close_channel(WorkerRecord& rec, bool send_stop) {
    if (!rec.channel) return;
    if (send_stop) {
        auto r = rec.channel->send_stop();
        if (!r) WARDEN_LOGDEBUG(log_for(rec), "Stop command not delivered: {}", r.Error().Message());
    }
    rec.channel->close();
    rec.channel.reset();
}

// ---------- loop ----------

void ProcessSupervisor::run(const std::atomic<bool>& running) {
    WARDEN_LOGINFO(log_, "Supervision loop started (tick {} ms)", cfg_.reconcile_tick.count());
    while (running.load() && !stop_requested_.load() && !shutting_down_) {
        run_cycle();
        queue_.WaitFor(cfg_.reconcile_tick);
    }
    WARDEN_LOGINFO(log_, "Supervision loop stopped");
}

void ProcessSupervisor::request_stop() {
    stop_requested_.store(true);
    queue_.Wake();
}

std::optional<WorkerView> ProcessSupervisor::worker(int session_id) const {
    auto it = workers_.find(session_id);
    if (it == workers_.end()) return std::nullopt;
    const WorkerRecord& r = it->second;
    WorkerView v;
    v.session_id = r.session_id;
    v.generation = r.generation;
    v.pid = r.process.pid;
    v.state = r.state;
    v.restart_count = r.budget.restart_count;
    v.last_heartbeat = r.last_heartbeat;
    v.cooldown_until = r.budget.cooldown_until;
    return v;
}

std::vector<WorkerView> ProcessSupervisor::workers() const {
    std::vector<WorkerView> out;
    for (const auto& entry : workers_) {
        if (auto v = worker(entry.first)) out.push_back(*v);
    }
    return out;
}

void ProcessSupervisor::shutdown() {
    if (shutting_down_) return;
    shutting_down_ = true;
    queue_.Wake();
    WARDEN_LOGINFO(log_, "Shutting down, {} worker record(s)", workers_.size());

    for (auto& entry : workers_) close_channel(entry.second, true);
    executor_.drain();

    // completions learned during the drain may carry pids we have not seen yet
    now_ = clock_();
    apply_messages();

    std::vector<platform::ProcessHandle> live;
    for (auto& [id, rec] : workers_) {
        close_channel(rec, false);
        if (!rec.process.valid()) continue;
        auto r = processes_.request_stop(rec.process);
        if (!r) WARDEN_LOGWARN(log_for(rec), "SIGTERM to session {} failed: {}", id, r.Error().Message());
        live.push_back(rec.process);
    }

    const auto deadline = std::chrono::steady_clock::now() + cfg_.stop_grace;
    std::vector<platform::ProcessHandle> stragglers;
    for (const auto& h : live) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!processes_.wait_for_exit(h, std::max(left, std::chrono::milliseconds(0))))
            stragglers.push_back(h);
    }
    for (const auto& h : stragglers) {
        WARDEN_LOGWARN(log_, "Worker pid {} ignored SIGTERM, killing", h.pid);
        auto r = processes_.force_terminate(h);
        if (!r) WARDEN_LOGERROR(log_, "Could not kill pid {}: {}", h.pid, r.Error().Message());
    }

    workers_.clear();
    WARDEN_LOGINFO(log_, "All workers stopped ({} forced)", stragglers.size());
}

} // namespace em
