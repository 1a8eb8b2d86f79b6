#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace session {

enum class SessionState {
    kActive = 0,
    kConnected,
    kConnectQuery,
    kShadow,
    kDisconnected,
    kIdle,
    kListen,
    kReset,
    kDown,
    kInit
};

std::string_view to_string(SessionState s);

struct SessionInfo {
    int session_id{-1};
    std::string user_name;
    std::string domain;
    SessionState state{SessionState::kDown};
    bool is_console{false};
    std::optional<std::uint32_t> uid;   // owner, when the platform knows it
    std::chrono::system_clock::time_point last_observed{};
};

// Snapshots are keyed by session id; ordered so logs and diffs are stable
using SessionMap = std::map<int, SessionInfo>;

// A session can host a worker: a human login in the foreground
inline bool is_interactive_active(const SessionInfo& s) {
    return !s.user_name.empty() && s.state == SessionState::kActive;
}

} // namespace session
