#include <warden/phm/heartbeat_client.hpp>
#include <phm/heartbeat_frame.hpp>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace warden::phm {

HeartbeatClient::HeartbeatClient(std::string channel_dir, std::string channel_name, int session_id)
    : endpoint_(std::move(channel_dir) + "/" + std::move(channel_name) + "_" + std::to_string(session_id)) {}

HeartbeatClient::~HeartbeatClient() {
    Disconnect();
}

void HeartbeatClient::Disconnect() noexcept {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

Result<void> HeartbeatClient::Connect() {
    Disconnect();
    inbound_.clear();

    sockaddr_un addr{};
    if (endpoint_.size() >= sizeof(addr.sun_path))
        return ErrorCode(SupervisorErrc::kChannelFailed, "endpoint path too long: " + endpoint_);
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, endpoint_.c_str(), endpoint_.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return ErrorCode(SupervisorErrc::kChannelFailed, std::strerror(errno));
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        ::close(fd);
        return ErrorCode(SupervisorErrc::kChannelFailed, endpoint_ + ": " + std::strerror(err));
    }
    fd_ = fd;
    return {};
}

Result<void> HeartbeatClient::ReportAlive(std::string_view status) noexcept {
    if (fd_ < 0) {
        auto c = Connect();
        if (!c) return c;
    }
    try {
        ::phm::HeartbeatFrame f;
        f.seq = ++seq_;
        f.ts_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        f.status = std::string(status);
        const std::string frame = ::phm::encode(f);
        const ssize_t n = ::send(fd_, frame.data(), frame.size(), MSG_NOSIGNAL);
        if (n != static_cast<ssize_t>(frame.size())) {
            const int err = errno;
            Disconnect();
            return ErrorCode(SupervisorErrc::kChannelFailed, std::strerror(err));
        }
        return {};
    } catch (const std::exception& e) {
        return ErrorCode(SupervisorErrc::kUnknown, e.what());
    }
}

bool HeartbeatClient::StopRequested() noexcept {
    if (stop_requested_ || fd_ < 0) return stop_requested_;

    char buf[256];
    for (;;) {
        const ssize_t r = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (r > 0) {
            inbound_.append(buf, static_cast<std::size_t>(r));
            continue;
        }
        if (r == 0) Disconnect();   // supervisor closed the channel
        break;
    }

    std::size_t pos;
    while ((pos = inbound_.find('\n')) != std::string::npos) {
        const std::string line = inbound_.substr(0, pos);
        inbound_.erase(0, pos + 1);
        auto cmd = ::phm::decode_control(line);
        if (cmd.HasValue() && cmd->cmd == ::phm::kStopCommand) stop_requested_ = true;
    }
    return stop_requested_;
}

} // namespace warden::phm
