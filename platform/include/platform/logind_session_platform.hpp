#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <log.hpp>
#include <platform/session_platform.hpp>

namespace platform {

// What a process needs to run inside a session's logon
struct LogonContext {
    int session_id{-1};
    std::uint32_t uid{0};
    std::string user_name;
    std::string display;        // X11 DISPLAY, empty for tty/wayland sessions
    std::string runtime_dir;    // XDG_RUNTIME_DIR of the user
};

// Session enumeration backed by systemd-logind's runtime state files:
//   <root>/sessions/<id>   KEY=VALUE per session
//   <root>/seats/seat0     ACTIVE=<id> for the foreground session
class LogindSessionPlatform : public ISessionPlatform {
public:
    explicit LogindSessionPlatform(std::filesystem::path runtime_root = "/run/systemd");

    warden::core::Result<std::vector<session::SessionInfo>> enumerate_sessions() override;
    warden::core::Result<int> active_console_session_id() override;

    warden::core::Result<LogonContext> logon_context(int session_id);

    using KeyValues = std::map<std::string, std::string>;
    static warden::core::Result<KeyValues> read_state_file(const std::filesystem::path& file);

    // Maps one state file to a SessionInfo. A non-user session comes back with
    // an empty user name so the caller discards it.
    static session::SessionInfo to_session_info(int session_id, const KeyValues& kv,
                                                std::optional<int> console_id,
                                                const std::string& local_host);

    static session::SessionState map_state(const KeyValues& kv);

private:
    std::filesystem::path root_;
    std::string host_name_;
    warden::log::Logger log_;
};

} // namespace platform
