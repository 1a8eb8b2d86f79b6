#include <session/session_monitor.hpp>
#include <exception>

using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace session {

std::string_view to_string(SessionChangeType t) {
    switch (t) {
        case SessionChangeType::kLogon:        return "logon";
        case SessionChangeType::kLogoff:       return "logoff";
        case SessionChangeType::kStateChanged: return "state-changed";
    }
    return "unknown";
}

SessionMonitor::SessionMonitor(platform::ISessionPlatform& platform,
                               std::chrono::milliseconds poll_interval, Clock clock)
    : platform_(platform),
      interval_(poll_interval),
      clock_(std::move(clock)),
      log_(warden::log::Logger::CreateLogger("SESS")) {}

SessionMonitor::~SessionMonitor() {
    stop();
}

Result<SessionMap> SessionMonitor::snapshot() noexcept {
    try {
        auto listed = platform_.enumerate_sessions();
        if (!listed.HasValue()) {
            return ErrorCode(SupervisorErrc::kSessionQueryFailed, listed.Error().Message());
        }
        const auto now = clock_();
        SessionMap out;
        for (auto& s : listed.Value()) {
            if (s.user_name.empty()) continue;
            s.last_observed = now;
            const int id = s.session_id;
            if (!out.emplace(id, std::move(s)).second)
                WARDEN_LOGWARN(log_, "Session {} listed twice, keeping the first entry", id);
        }
        return out;
    } catch (const std::exception& e) {
        return ErrorCode(SupervisorErrc::kSessionQueryFailed, e.what());
    }
}

std::optional<int> SessionMonitor::console_session_id() noexcept {
    try {
        auto id = platform_.active_console_session_id();
        if (id.HasValue()) return id.Value();
        WARDEN_LOGDEBUG(log_, "No console session: {}", id.Error().Message());
    } catch (const std::exception& e) {
        WARDEN_LOGWARN(log_, "Console session query threw: {}", e.what());
    }
    return std::nullopt;
}

std::vector<SessionEvent> SessionMonitor::diff(const SessionMap& before, const SessionMap& after) {
    std::vector<SessionEvent> events;

    for (const auto& [id, now] : after) {
        auto it = before.find(id);
        if (it == before.end()) {
            if (now.state == SessionState::kActive)
                events.push_back({SessionChangeType::kLogon, id, now, std::nullopt});
            continue;
        }
        const SessionState old_state = it->second.state;
        if (old_state != now.state
            && (old_state == SessionState::kActive || now.state == SessionState::kActive)) {
            events.push_back({SessionChangeType::kStateChanged, id, now, old_state});
        }
    }
    for (const auto& [id, old] : before) {
        if (after.find(id) == after.end())
            events.push_back({SessionChangeType::kLogoff, id, old, std::nullopt});
    }
    return events;
}

std::optional<SessionUpdate> SessionMonitor::poll_once() {
    auto snap = snapshot();
    if (!snap.HasValue()) {
        ++consecutive_failures_;
        // first failure is worth a warning, repeats only at debug
        if (consecutive_failures_ == 1)
            WARDEN_LOGWARN(log_, "Session query failed, keeping previous view: {}", snap.Error().Message());
        else
            WARDEN_LOGDEBUG(log_, "Session query failed ({} in a row): {}",
                            consecutive_failures_, snap.Error().Message());
        return std::nullopt;
    }
    if (consecutive_failures_ > 0) {
        WARDEN_LOGINFO(log_, "Session query recovered after {} failures", consecutive_failures_);
        consecutive_failures_ = 0;
    }

    SessionUpdate update;
    update.events = diff(last_, snap.Value());
    update.sessions = std::move(snap.Value());

    for (const auto& ev : update.events) {
        if (ev.type == SessionChangeType::kStateChanged) {
            WARDEN_LOGINFO(log_, "Session {} ({}) {}: {} -> {}", ev.session_id, ev.info.user_name,
                           to_string(ev.type), to_string(*ev.previous_state), to_string(ev.info.state));
        } else {
            WARDEN_LOGINFO(log_, "Session {} ({}) {}", ev.session_id, ev.info.user_name, to_string(ev.type));
        }
    }
    if (!have_last_) {
        WARDEN_LOGINFO(log_, "Initial session view: {} interactive session(s)", update.sessions.size());
        have_last_ = true;
    }

    last_ = update.sessions;
    return update;
}

void SessionMonitor::start(Sink sink) {
    if (worker_.joinable()) return;
    sink_ = std::move(sink);
    {
        std::scoped_lock lk(mu_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this] { run(); });
}

void SessionMonitor::stop() {
    {
        std::scoped_lock lk(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void SessionMonitor::run() {
    WARDEN_LOGDEBUG(log_, "Session monitor started, polling every {} ms", interval_.count());
    for (;;) {
        try {
            if (auto update = poll_once()) sink_(std::move(*update));
        } catch (const std::exception& e) {
            WARDEN_LOGERROR(log_, "Session poll failed: {}", e.what());
        }

        std::unique_lock lk(mu_);
        if (cv_.wait_for(lk, interval_, [this] { return stop_requested_; })) break;
    }
    WARDEN_LOGDEBUG(log_, "Session monitor stopped");
}

} // namespace session
