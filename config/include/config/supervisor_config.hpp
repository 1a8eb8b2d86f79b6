#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <warden/core/result.hpp>

namespace config {

struct SupervisorConfig {
    std::string worker_executable;                  // empty: resolve next to the supervisor
    std::vector<std::string> worker_args;           // appended after the session arguments
    std::string channel_base_name{"warden_heartbeat"};
    std::string channel_dir{"/run/warden"};

    int heartbeat_interval_s{10};
    int missed_beat_multiplier{2};
    int restart_delay_s{5};
    int max_restart_attempts{3};
    int startup_timeout_s{30};
    int stability_window_s{120};
    bool multi_session_enabled{true};

    int session_poll_interval_ms{5000};
    int reconcile_tick_ms{1000};
    int stop_grace_ms{5000};
    std::size_t event_queue_capacity{256};
    int aux_threads{2};
    bool kill_stray_workers{true};

    std::string log_level{"info"};
    std::string log_file;                           // empty: console only
    bool log_to_dlt{false};

    std::chrono::seconds heartbeat_interval() const { return std::chrono::seconds(heartbeat_interval_s); }
    std::chrono::seconds heartbeat_timeout() const {
        return std::chrono::seconds(heartbeat_interval_s) * missed_beat_multiplier;
    }
    std::chrono::seconds restart_delay() const { return std::chrono::seconds(restart_delay_s); }
    std::chrono::seconds startup_timeout() const { return std::chrono::seconds(startup_timeout_s); }
    std::chrono::seconds stability_window() const { return std::chrono::seconds(stability_window_s); }
    std::chrono::milliseconds stop_grace() const { return std::chrono::milliseconds(stop_grace_ms); }
};

// Reads a JSON config file; absent keys keep their defaults
warden::core::Result<SupervisorConfig> load_config(const std::string& path) noexcept;
warden::core::Result<SupervisorConfig> parse_config(const std::string& json_text) noexcept;

// Every violation found, empty when the config is usable
std::vector<std::string> validate(const SupervisorConfig& cfg);

// Fills worker_executable when empty or missing; search order: configured path,
// the supervisor's own directory, ../libexec/warden
std::string resolve_worker_executable(const SupervisorConfig& cfg);

std::string summary(const SupervisorConfig& cfg);

} // namespace config
