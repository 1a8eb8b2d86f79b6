#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <log.hpp>
#include <platform/session_platform.hpp>
#include <session/session_info.hpp>
#include <warden/core/result.hpp>

namespace session {

enum class SessionChangeType { kLogon, kLogoff, kStateChanged };

std::string_view to_string(SessionChangeType t);

struct SessionEvent {
    SessionChangeType type{SessionChangeType::kStateChanged};
    int session_id{-1};
    SessionInfo info;                            // current view; last known view for logoff
    std::optional<SessionState> previous_state;  // set for kStateChanged
};

// What the monitor publishes: the events and the snapshot they came from.
// The snapshot alone is enough to rebuild the desired set, so a dropped
// update is repaired by the next one.
struct SessionUpdate {
    std::vector<SessionEvent> events;
    SessionMap sessions;
};

class SessionMonitor {
public:
    using Sink = std::function<void(SessionUpdate)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SessionMonitor(platform::ISessionPlatform& platform, std::chrono::milliseconds poll_interval,
                   Clock clock = &std::chrono::system_clock::now);
    ~SessionMonitor();

    SessionMonitor(const SessionMonitor&) = delete;
    SessionMonitor& operator=(const SessionMonitor&) = delete;

    // Interactive sessions right now. Never throws; a failed enumeration comes
    // back as kSessionQueryFailed.
    warden::core::Result<SessionMap> snapshot() noexcept;

    std::optional<int> console_session_id() noexcept;

    // One poll: snapshot, diff against the previous one, remember the new one.
    // nullopt when the platform query failed (treated as "no change").
    std::optional<SessionUpdate> poll_once();

    // Pure snapshot diff, ordered by session id
    static std::vector<SessionEvent> diff(const SessionMap& before, const SessionMap& after);

    // Polls on a background thread until stop(); the first poll runs immediately
    void start(Sink sink);
    void stop();

    bool running() const { return worker_.joinable(); }

private:
    void run();

    platform::ISessionPlatform& platform_;
    std::chrono::milliseconds interval_;
    Clock clock_;
    warden::log::Logger log_;

    SessionMap last_;
    bool have_last_{false};
    int consecutive_failures_{0};

    Sink sink_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::thread worker_;
};

} // namespace session
