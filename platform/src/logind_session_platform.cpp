#include <platform/logind_session_platform.hpp>
#include <charconv>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;
using session::SessionInfo;
using session::SessionState;

namespace {

std::optional<int> parse_session_id(const std::string& s) {
    int id = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, id);
    if (ec != std::errc{} || ptr != last || id < 0) return std::nullopt;
    return id;
}

std::string value_or(const platform::LogindSessionPlatform::KeyValues& kv,
                     const std::string& key, const std::string& def = {}) {
    auto it = kv.find(key);
    return it == kv.end() ? def : it->second;
}

std::string local_host_name() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return {};
    return buf;
}

} // namespace

namespace platform {

LogindSessionPlatform::LogindSessionPlatform(fs::path runtime_root)
    : root_(std::move(runtime_root)),
      host_name_(local_host_name()),
      log_(warden::log::Logger::CreateLogger("PLAT")) {}

Result<LogindSessionPlatform::KeyValues>
LogindSessionPlatform::read_state_file(const fs::path& file) {
    std::ifstream in(file);
    if (!in) return ErrorCode(SupervisorErrc::kNotFound, file.string());

    KeyValues kv;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string value = line.substr(eq + 1);
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);
        kv[line.substr(0, eq)] = std::move(value);
    }
    if (in.bad()) return ErrorCode(SupervisorErrc::kCorruption, file.string());
    return kv;
}

SessionState LogindSessionPlatform::map_state(const KeyValues& kv) {
    const std::string state = value_or(kv, "STATE");
    if (state == "active")  return value_or(kv, "ACTIVE", "1") == "1" ? SessionState::kActive
                                                                     : SessionState::kDisconnected;
    if (state == "online")  return SessionState::kDisconnected;
    if (state == "opening") return SessionState::kInit;
    if (state == "closing") return SessionState::kDown;
    return SessionState::kDown;
}

SessionInfo LogindSessionPlatform::to_session_info(int session_id, const KeyValues& kv,
                                                   std::optional<int> console_id,
                                                   const std::string& local_host) {
    SessionInfo s;
    s.session_id = session_id;
    s.state = map_state(kv);
    s.is_console = console_id && *console_id == session_id;

    // greeter, lock-screen and background sessions are not human logins
    const std::string cls = value_or(kv, "CLASS", "user");
    const std::string type = value_or(kv, "TYPE", "unspecified");
    if (cls == "user" && type != "unspecified")
        s.user_name = value_or(kv, "USER");

    s.domain = value_or(kv, "REMOTE") == "1" ? value_or(kv, "REMOTE_HOST") : local_host;

    const std::string uid = value_or(kv, "UID");
    std::uint32_t parsed = 0;
    auto [ptr, ec] = std::from_chars(uid.data(), uid.data() + uid.size(), parsed);
    if (!uid.empty() && ec == std::errc{} && ptr == uid.data() + uid.size()) s.uid = parsed;
    return s;
}

Result<std::vector<SessionInfo>> LogindSessionPlatform::enumerate_sessions() {
    const fs::path dir = root_ / "sessions";
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return ErrorCode(SupervisorErrc::kSessionQueryFailed,
                         dir.string() + ": " + ec.message());
    }

    std::optional<int> console;
    if (auto c = active_console_session_id(); c.HasValue()) console = c.Value();

    std::vector<SessionInfo> out;
    int unreadable = 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            WARDEN_LOGWARN(log_, "Session enumeration stopped early: {}", ec.message());
            ++unreadable;
            break;
        }
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file(ec)) { ec.clear(); continue; }    // <id>.ref fifos, dirs
        const auto id = parse_session_id(name);
        if (!id) {
            WARDEN_LOGVERBOSE(log_, "Skipping non-numeric logind session '{}'", name);
            continue;
        }
        auto kv = read_state_file(entry.path());
        if (!kv.HasValue()) {
            // raced with logind removing the file, or transient I/O trouble
            ++unreadable;
            WARDEN_LOGDEBUG(log_, "Session {} unreadable: {}", *id, kv.Error().Message());
            continue;
        }
        out.push_back(to_session_info(*id, kv.Value(), console, host_name_));
    }

    if (unreadable > 0) {
        WARDEN_LOGWARN(log_, "Session enumeration incomplete: {} of {} entries unreadable",
                       unreadable, unreadable + static_cast<int>(out.size()));
    }
    return out;
}

Result<int> LogindSessionPlatform::active_console_session_id() {
    auto kv = read_state_file(root_ / "seats" / "seat0");
    if (!kv.HasValue()) return kv.Error();
    const std::string active = value_or(kv.Value(), "ACTIVE");
    if (auto id = parse_session_id(active)) return *id;
    return ErrorCode(SupervisorErrc::kNotFound, "seat0 has no active session");
}

Result<LogonContext> LogindSessionPlatform::logon_context(int session_id) {
    auto kv = read_state_file(root_ / "sessions" / std::to_string(session_id));
    if (!kv.HasValue()) {
        return ErrorCode(SupervisorErrc::kNoLogonContext,
                         "session " + std::to_string(session_id) + " not registered with logind");
    }
    const auto info = to_session_info(session_id, kv.Value(), std::nullopt, host_name_);
    if (info.user_name.empty() || !info.uid || info.state == SessionState::kDown
        || info.state == SessionState::kInit) {
        return ErrorCode(SupervisorErrc::kNoLogonContext,
                         "session " + std::to_string(session_id) + " has no completed user logon");
    }

    LogonContext ctx;
    ctx.session_id = session_id;
    ctx.uid = *info.uid;
    ctx.user_name = info.user_name;
    ctx.display = value_or(kv.Value(), "DISPLAY");
    ctx.runtime_dir = "/run/user/" + std::to_string(ctx.uid);
    return ctx;
}

} // namespace platform
