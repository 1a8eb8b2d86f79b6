#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <phm/heartbeat_channel.hpp>
#include <phm/restart_policy.hpp>
#include <platform/process_platform.hpp>

namespace em {

enum class WorkerState { kStarting, kRunning, kUnresponsive, kStopping, kStopped, kFailed };

inline constexpr std::string_view to_string(WorkerState s) {
    switch (s) {
        case WorkerState::kStarting:     return "Starting";
        case WorkerState::kRunning:      return "Running";
        case WorkerState::kUnresponsive: return "Unresponsive";
        case WorkerState::kStopping:     return "Stopping";
        case WorkerState::kStopped:      return "Stopped";
        case WorkerState::kFailed:       return "Failed";
    }
    return "Unknown";
}

using TimePoint = std::chrono::steady_clock::time_point;

// One per supervised session; only the control thread touches it
struct WorkerRecord {
    int session_id{-1};
    std::string user_name;
    std::uint64_t generation{0};
    platform::ProcessHandle process{};
    WorkerState state{WorkerState::kStarting};

    TimePoint start_time{};
    TimePoint startup_deadline{};
    std::optional<TimePoint> last_heartbeat{};
    std::optional<TimePoint> running_since{};
    std::optional<TimePoint> early_heartbeat{};   // beat seen before the launch reported back
    phm::RestartBudget budget{};

    bool launch_pending{false};      // launch task in flight
    bool terminate_pending{false};   // forced termination in flight
    std::shared_ptr<std::atomic<bool>> abort_terminate{};
    std::unique_ptr<phm::IHeartbeatChannel> channel{};

    // Waiting for its cooldown before the next launch
    bool awaiting_launch() const {
        return state == WorkerState::kStarting && !process.valid()
               && !launch_pending && !terminate_pending;
    }
};

// Copyable view of a record, for callers outside the control thread
struct WorkerView {
    int session_id{-1};
    std::uint64_t generation{0};
    pid_t pid{-1};
    WorkerState state{WorkerState::kStarting};
    int restart_count{0};
    std::optional<TimePoint> last_heartbeat{};
    TimePoint cooldown_until{};
};

} // namespace em
