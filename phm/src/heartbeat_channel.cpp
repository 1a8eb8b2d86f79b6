#include <phm/heartbeat_channel.hpp>
#include <phm/heartbeat_frame.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace phm {

namespace {

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) { ::close(fd); fd = -1; }
}

} // namespace

UnixHeartbeatChannel::UnixHeartbeatChannel(std::string path, int session_id,
                                           std::uint64_t generation,
                                           HeartbeatSink sink, Clock clock)
    : path_(std::move(path)),
      session_id_(session_id),
      generation_(generation),
      sink_(std::move(sink)),
      clock_(std::move(clock)),
      log_(warden::log::Logger::CreateLogger("PHM").WithCorrelation(
          "sid=" + std::to_string(session_id) + " gen=" + std::to_string(generation))) {}

Result<std::unique_ptr<UnixHeartbeatChannel>>
UnixHeartbeatChannel::open(const std::string& path, int session_id, std::uint64_t generation,
                           std::optional<std::uint32_t> owner_uid, HeartbeatSink sink, Clock clock) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path))
        return ErrorCode(SupervisorErrc::kChannelFailed, "endpoint path too long: " + path);

    std::unique_ptr<UnixHeartbeatChannel> ch(
        new UnixHeartbeatChannel(path, session_id, generation, std::move(sink), std::move(clock)));

    ch->listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (ch->listen_fd_ < 0)
        return ErrorCode(SupervisorErrc::kChannelFailed, errno_text("socket"));

    // a previous generation may have left its endpoint behind
    ::unlink(path.c_str());

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    if (::bind(ch->listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        return ErrorCode(SupervisorErrc::kChannelFailed, errno_text("bind") + " " + path);
    if (::listen(ch->listen_fd_, 2) != 0)
        return ErrorCode(SupervisorErrc::kChannelFailed, errno_text("listen"));

    // only the session user (and root) may talk to this endpoint
    if (::chmod(path.c_str(), 0600) != 0)
        WARDEN_LOGWARN(ch->log_, "chmod {} failed: {}", path, std::strerror(errno));
    if (owner_uid && ::geteuid() == 0) {
        if (::chown(path.c_str(), static_cast<uid_t>(*owner_uid), static_cast<gid_t>(-1)) != 0)
            WARDEN_LOGWARN(ch->log_, "chown {} to uid {} failed: {}", path, *owner_uid, std::strerror(errno));
    }

    if (::pipe2(ch->wake_pipe_, O_CLOEXEC) != 0)
        return ErrorCode(SupervisorErrc::kChannelFailed, errno_text("pipe2"));

    ch->listener_ = std::thread([raw = ch.get()] { raw->listen_loop(); });
    WARDEN_LOGDEBUG(ch->log_, "listening on {}", path);
    return ch;
}

UnixHeartbeatChannel::~UnixHeartbeatChannel() {
    close();
}

void UnixHeartbeatChannel::close() {
    if (closed_.exchange(true)) return;

    if (listener_.joinable()) {
        const char b = 'x';
        if (::write(wake_pipe_[1], &b, 1) < 0)
            WARDEN_LOGWARN(log_, "wake write failed: {}", std::strerror(errno));
        listener_.join();
    }
    {
        std::scoped_lock lk(client_mu_);
        close_fd(client_fd_);
    }
    close_fd(listen_fd_);
    close_fd(wake_pipe_[0]);
    close_fd(wake_pipe_[1]);
    ::unlink(path_.c_str());
    WARDEN_LOGDEBUG(log_, "closed {} after {} frames", path_, frames_.load());
}

Result<void> UnixHeartbeatChannel::send_stop() {
    const std::string frame = encode(ControlFrame{kStopCommand});
    std::scoped_lock lk(client_mu_);
    if (client_fd_ < 0)
        return ErrorCode(SupervisorErrc::kChannelFailed, "no worker connected to " + path_);
    const ssize_t n = ::send(client_fd_, frame.data(), frame.size(), MSG_NOSIGNAL);
    if (n != static_cast<ssize_t>(frame.size()))
        return ErrorCode(SupervisorErrc::kChannelFailed, errno_text("send"));
    return {};
}

void UnixHeartbeatChannel::replace_client(int fd) {
    std::scoped_lock lk(client_mu_);
    close_fd(client_fd_);
    client_fd_ = fd;
}

void UnixHeartbeatChannel::on_line(const std::string& line) {
    auto frame = decode_heartbeat(line);
    if (!frame.HasValue()) {
        WARDEN_LOGDEBUG(log_, "dropping malformed frame: {}", frame.Error().Message());
        return;
    }
    ++frames_;
    HeartbeatObserved hb;
    hb.session_id = session_id_;
    hb.generation = generation_;
    hb.at = clock_();
    hb.seq = frame->seq;
    hb.status = std::move(frame->status);
    sink_(std::move(hb));
}

void UnixHeartbeatChannel::listen_loop() {
    LineAssembler lines;
    char buf[1024];

    while (!closed_.load()) {
        int cfd;
        {
            std::scoped_lock lk(client_mu_);
            cfd = client_fd_;
        }
        pollfd fds[3] = {
            {listen_fd_, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
            {cfd, POLLIN, 0},
        };
        const nfds_t n = cfd >= 0 ? 3 : 2;

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            WARDEN_LOGERROR(log_, "poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents) break;

        if (fds[0].revents & POLLIN) {
            const int c = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (c >= 0) {
                ucred cred{};
                socklen_t len = sizeof(cred);
                if (::getsockopt(c, SOL_SOCKET, SO_PEERCRED, &cred, &len) == 0)
                    WARDEN_LOGDEBUG(log_, "worker connected (pid {} uid {})", cred.pid, cred.uid);
                replace_client(c);
                lines = LineAssembler{};
                continue;   // old fd is gone; re-poll with the new one
            }
            WARDEN_LOGWARN(log_, "accept failed: {}", std::strerror(errno));
        }

        if (n == 3 && fds[2].revents) {
            const ssize_t r = ::read(cfd, buf, sizeof(buf));
            if (r > 0) {
                for (const auto& line : lines.feed(buf, static_cast<std::size_t>(r)))
                    on_line(line);
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                WARDEN_LOGDEBUG(log_, "worker disconnected");
                replace_client(-1);
                lines = LineAssembler{};
            }
        }
    }
}

UnixHeartbeatChannelFactory::UnixHeartbeatChannelFactory(std::string channel_dir,
                                                         std::string base_name, Clock clock)
    : dir_(std::move(channel_dir)), base_(std::move(base_name)), clock_(std::move(clock)) {}

std::string UnixHeartbeatChannelFactory::endpoint_for(int session_id) const {
    return (std::filesystem::path(dir_) / (base_ + "_" + std::to_string(session_id))).string();
}

Result<std::unique_ptr<IHeartbeatChannel>>
UnixHeartbeatChannelFactory::create(int session_id, std::uint64_t generation,
                                    std::optional<std::uint32_t> owner_uid, HeartbeatSink sink) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return ErrorCode(SupervisorErrc::kChannelFailed, dir_ + ": " + ec.message());

    auto ch = UnixHeartbeatChannel::open(endpoint_for(session_id), session_id, generation,
                                         owner_uid, std::move(sink), clock_);
    if (!ch.HasValue()) return ch.Error();
    return std::unique_ptr<IHeartbeatChannel>(std::move(ch.Value()));
}

} // namespace phm
