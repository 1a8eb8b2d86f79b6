#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <warden/core/result.hpp>

namespace warden::phm {

// Worker side of the heartbeat channel. Not thread-safe; owned by the
// worker's main loop.
class HeartbeatClient {
public:
    HeartbeatClient(std::string channel_dir, std::string channel_name, int session_id);
    ~HeartbeatClient();

    HeartbeatClient(const HeartbeatClient&) = delete;
    HeartbeatClient& operator=(const HeartbeatClient&) = delete;

    core::Result<void> Connect();

    // Sends one frame; reconnects first when the previous connection broke
    core::Result<void> ReportAlive(std::string_view status = {}) noexcept;

    // Non-blocking; true once the supervisor has sent a stop command
    bool StopRequested() noexcept;

    bool Connected() const noexcept { return fd_ >= 0; }
    const std::string& Endpoint() const noexcept { return endpoint_; }
    std::uint64_t LastSequence() const noexcept { return seq_; }

private:
    void Disconnect() noexcept;

    std::string endpoint_;
    int fd_{-1};
    std::uint64_t seq_{0};
    bool stop_requested_{false};
    std::string inbound_;
};

} // namespace warden::phm
