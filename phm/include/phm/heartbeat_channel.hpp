#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <log.hpp>
#include <warden/core/result.hpp>

namespace phm {

// Posted by a channel listener; carries no decision, only the fact
struct HeartbeatObserved {
    int session_id{-1};
    std::uint64_t generation{0};
    std::chrono::steady_clock::time_point at{};
    std::uint64_t seq{0};
    std::string status;
};

using HeartbeatSink = std::function<void(HeartbeatObserved)>;
using Clock = std::function<std::chrono::steady_clock::time_point()>;

// Supervisor side of one worker generation's heartbeat stream
class IHeartbeatChannel {
public:
    virtual ~IHeartbeatChannel() = default;

    virtual const std::string& endpoint() const = 0;

    // Asks the connected worker to exit; kChannelFailed when nobody is connected
    virtual warden::core::Result<void> send_stop() = 0;

    // Stops the listener and removes the endpoint. Idempotent.
    virtual void close() = 0;
};

class IHeartbeatChannelFactory {
public:
    virtual ~IHeartbeatChannelFactory() = default;

    virtual warden::core::Result<std::unique_ptr<IHeartbeatChannel>>
    create(int session_id, std::uint64_t generation,
           std::optional<std::uint32_t> owner_uid, HeartbeatSink sink) = 0;

    // Path the worker of `session_id` connects to
    virtual std::string endpoint_for(int session_id) const = 0;
};

// Listening Unix stream socket at <dir>/<base>_<session>. One worker
// connection at a time; a new connection replaces the previous one.
class UnixHeartbeatChannel : public IHeartbeatChannel {
public:
    static warden::core::Result<std::unique_ptr<UnixHeartbeatChannel>>
    open(const std::string& path, int session_id, std::uint64_t generation,
         std::optional<std::uint32_t> owner_uid, HeartbeatSink sink, Clock clock);

    ~UnixHeartbeatChannel() override;

    UnixHeartbeatChannel(const UnixHeartbeatChannel&) = delete;
    UnixHeartbeatChannel& operator=(const UnixHeartbeatChannel&) = delete;

    const std::string& endpoint() const override { return path_; }
    warden::core::Result<void> send_stop() override;
    void close() override;

    // Frames accepted so far, for diagnostics
    std::uint64_t frames() const { return frames_.load(); }

private:
    UnixHeartbeatChannel(std::string path, int session_id, std::uint64_t generation,
                         HeartbeatSink sink, Clock clock);

    void listen_loop();
    void replace_client(int fd);
    void on_line(const std::string& line);

    std::string path_;
    int session_id_;
    std::uint64_t generation_;
    HeartbeatSink sink_;
    Clock clock_;
    warden::log::Logger log_;

    int listen_fd_{-1};
    int wake_pipe_[2]{-1, -1};

    std::mutex client_mu_;
    int client_fd_{-1};

    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> frames_{0};
    std::thread listener_;
};

class UnixHeartbeatChannelFactory : public IHeartbeatChannelFactory {
public:
    UnixHeartbeatChannelFactory(std::string channel_dir, std::string base_name,
                                Clock clock = &std::chrono::steady_clock::now);

    warden::core::Result<std::unique_ptr<IHeartbeatChannel>>
    create(int session_id, std::uint64_t generation,
           std::optional<std::uint32_t> owner_uid, HeartbeatSink sink) override;

    std::string endpoint_for(int session_id) const override;

private:
    std::string dir_;
    std::string base_;
    Clock clock_;
};

} // namespace phm
