#include <config/supervisor_config.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include <log.hpp>
#include <unistd.h>

namespace fs = std::filesystem;
using nlohmann::json;
using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace config {

namespace {

constexpr const char* kWorkerName = "warden_worker";
constexpr int kMaxHeartbeatIntervalS = 3600;
constexpr int kMaxMissedBeatMultiplier = 100;

SupervisorConfig from_json(const json& j) {
    SupervisorConfig c;
    c.worker_executable      = j.value("worker_executable", c.worker_executable);
    c.channel_base_name      = j.value("channel_base_name", c.channel_base_name);
    c.channel_dir            = j.value("channel_dir", c.channel_dir);
    c.heartbeat_interval_s   = j.value("heartbeat_interval_s", c.heartbeat_interval_s);
    c.missed_beat_multiplier = j.value("missed_beat_multiplier", c.missed_beat_multiplier);
    c.restart_delay_s        = j.value("restart_delay_s", c.restart_delay_s);
    c.max_restart_attempts   = j.value("max_restart_attempts", c.max_restart_attempts);
    c.startup_timeout_s      = j.value("startup_timeout_s", c.startup_timeout_s);
    c.stability_window_s     = j.value("stability_window_s", c.stability_window_s);
    c.multi_session_enabled  = j.value("multi_session_enabled", c.multi_session_enabled);
    c.session_poll_interval_ms = j.value("session_poll_interval_ms", c.session_poll_interval_ms);
    c.reconcile_tick_ms      = j.value("reconcile_tick_ms", c.reconcile_tick_ms);
    c.stop_grace_ms          = j.value("stop_grace_ms", c.stop_grace_ms);
    c.event_queue_capacity   = j.value("event_queue_capacity", c.event_queue_capacity);
    c.aux_threads            = j.value("aux_threads", c.aux_threads);
    c.kill_stray_workers     = j.value("kill_stray_workers", c.kill_stray_workers);
    c.log_level              = j.value("log_level", c.log_level);
    c.log_file               = j.value("log_file", c.log_file);
    c.log_to_dlt             = j.value("log_to_dlt", c.log_to_dlt);

    if (j.contains("worker_args") && j["worker_args"].is_array()) {
        for (const auto& a : j["worker_args"])
            if (a.is_string()) c.worker_args.push_back(a.get<std::string>());
    }
    return c;
}

bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

fs::path self_directory() {
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::current_path(ec) : self.parent_path();
}

} // namespace

Result<SupervisorConfig> parse_config(const std::string& json_text) noexcept {
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return ErrorCode(SupervisorErrc::kInvalidConfig, "top level must be an object");
        }
        return from_json(j);
    } catch (const json::type_error& e) {
        // well-formed JSON, wrong value type ("heartbeat_interval_s": "ten")
        return ErrorCode(SupervisorErrc::kInvalidConfig, e.what());
    } catch (const json::exception& e) {
        return ErrorCode(SupervisorErrc::kCorruption, e.what());
    }
}

Result<SupervisorConfig> load_config(const std::string& path) noexcept {
    std::ifstream in(path);
    if (!in) return ErrorCode(SupervisorErrc::kNotFound, path);
    std::stringstream ss;
    ss << in.rdbuf();
    auto r = parse_config(ss.str());
    if (!r.HasValue()) return ErrorCode(r.Error().value, path + ": " + r.Error().detail);
    return r;
}

std::vector<std::string> validate(const SupervisorConfig& c) {
    std::vector<std::string> errors;

    const std::string exe = resolve_worker_executable(c);
    if (!is_executable(exe))
        errors.push_back("worker executable not found or not executable at: " + exe);
    if (c.channel_base_name.find_first_not_of(" \t") == std::string::npos)
        errors.push_back("channel_base_name cannot be empty");
    if (c.channel_base_name.find('/') != std::string::npos)
        errors.push_back("channel_base_name must not contain '/'");
    if (c.channel_dir.empty())
        errors.push_back("channel_dir cannot be empty");
    if (c.heartbeat_interval_s <= 0 || c.heartbeat_interval_s > kMaxHeartbeatIntervalS)
        errors.push_back("heartbeat_interval_s must be between 1 and " + std::to_string(kMaxHeartbeatIntervalS));
    if (c.missed_beat_multiplier < 1 || c.missed_beat_multiplier > kMaxMissedBeatMultiplier)
        errors.push_back("missed_beat_multiplier must be between 1 and " + std::to_string(kMaxMissedBeatMultiplier));
    if (c.restart_delay_s < 0)
        errors.push_back("restart_delay_s must be greater than or equal to 0");
    if (c.max_restart_attempts <= 0)
        errors.push_back("max_restart_attempts must be greater than 0");
    if (c.startup_timeout_s <= 0)
        errors.push_back("startup_timeout_s must be greater than 0");
    if (c.stability_window_s <= c.startup_timeout_s)
        errors.push_back("stability_window_s must be greater than startup_timeout_s");
    if (c.session_poll_interval_ms <= 0)
        errors.push_back("session_poll_interval_ms must be greater than 0");
    if (c.reconcile_tick_ms <= 0)
        errors.push_back("reconcile_tick_ms must be greater than 0");
    if (c.stop_grace_ms < 0)
        errors.push_back("stop_grace_ms must be greater than or equal to 0");
    if (c.event_queue_capacity == 0)
        errors.push_back("event_queue_capacity must be greater than 0");
    if (c.aux_threads <= 0)
        errors.push_back("aux_threads must be greater than 0");
    if (!warden::log::ParseLogLevel(c.log_level))
        errors.push_back("log_level '" + c.log_level + "' is not a known level");
    return errors;
}

std::string resolve_worker_executable(const SupervisorConfig& c) {
    if (!c.worker_executable.empty() && is_executable(c.worker_executable)) {
        std::error_code ec;
        const auto abs = fs::absolute(c.worker_executable, ec);
        return ec ? c.worker_executable : abs.lexically_normal().string();
    }

    const fs::path base = self_directory();
    const fs::path candidates[] = {
        base / kWorkerName,
        base / ".." / "libexec" / "warden" / kWorkerName,
    };
    for (const auto& p : candidates) {
        if (is_executable(p)) return p.lexically_normal().string();
    }
    // report the configured path when set, else the most likely install location
    return c.worker_executable.empty() ? (base / kWorkerName).string() : c.worker_executable;
}

std::string summary(const SupervisorConfig& c) {
    const std::string exe = resolve_worker_executable(c);
    std::ostringstream oss;
    oss << "Supervisor configuration:\n"
        << "- Worker: " << exe << " [" << (is_executable(exe) ? "EXISTS" : "NOT FOUND") << "]\n"
        << "- Heartbeat channel: " << c.channel_dir << "/" << c.channel_base_name << "_<session>\n"
        << "- Heartbeat interval: " << c.heartbeat_interval_s << "s (timeout after "
        << c.missed_beat_multiplier << " missed)\n"
        << "- Restart delay: " << c.restart_delay_s << "s\n"
        << "- Max restart attempts: " << c.max_restart_attempts << "\n"
        << "- Startup timeout: " << c.startup_timeout_s << "s\n"
        << "- Stability window: " << c.stability_window_s << "s\n"
        << "- Multi-session support: " << (c.multi_session_enabled ? "enabled" : "console only") << "\n"
        << "- Session poll / reconcile tick: " << c.session_poll_interval_ms << "ms / "
        << c.reconcile_tick_ms << "ms";
    return oss.str();
}

} // namespace config
