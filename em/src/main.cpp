#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <config/supervisor_config.hpp>
#include <em/process_supervisor.hpp>
#include <em/task_executor.hpp>
#include <log.hpp>
#include <phm/heartbeat_channel.hpp>
#include <platform/logind_session_platform.hpp>
#include <platform/posix_process_platform.hpp>
#include <session/session_monitor.hpp>
#include <sinks_console.hpp>
#include <sinks_dlt.hpp>
#include <sinks_file.hpp>

using namespace warden::log;

namespace {

constexpr const char* kDefaultConfigPath = "/etc/warden/warden.json";

std::atomic_bool running{true};
void on_sig(int) { running = false; }

std::string host_name() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) return "HOST";
    return buf;
}

void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [--check-config] [config.json]\n"
              << "  config path defaults to $WARDEN_CONFIG, then " << kDefaultConfigPath << "\n";
}

void setup_logging(const config::SupervisorConfig& cfg) {
    auto& lm = LogManager::Instance();
    lm.SetGlobalIds(host_name(), "WRDN");
    lm.SetDefaultLevel(ParseLogLevel(cfg.log_level).value_or(LogLevel::kInfo));
    lm.ClearSinks();
    lm.AddSink(std::make_shared<ConsoleSink>());
    if (!cfg.log_file.empty()) {
        auto file = std::make_shared<FileSink>(cfg.log_file);
        if (file->IsOpen()) lm.AddSink(file);
        else std::cerr << "[EM] Could not open log file " << cfg.log_file << ", console only\n";
    }
    if (cfg.log_to_dlt) lm.AddSink(std::make_shared<DltSink>());
}

} // namespace

int main(int argc, char** argv) {
    bool check_only = false;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--check-config") == 0) check_only = true;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) { usage(argv[0]); return 0; }
        else if (config_path.empty()) config_path = argv[i];
        else { usage(argv[0]); return 2; }
    }
    const bool explicit_path = !config_path.empty() || std::getenv("WARDEN_CONFIG");
    if (config_path.empty()) {
        const char* env = std::getenv("WARDEN_CONFIG");
        config_path = env ? env : kDefaultConfigPath;
    }

    config::SupervisorConfig cfg;
    auto loaded = config::load_config(config_path);
    if (loaded.HasValue()) {
        cfg = loaded.Value();
    } else if (explicit_path || loaded.Error().value != warden::core::SupervisorErrc::kNotFound) {
        std::cerr << "[EM] Failed to load configuration: " << loaded.Error().Message() << "\n";
        return 1;
    }

    setup_logging(cfg);
    auto log = Logger::CreateLogger("EM");
    auto cfg_log = Logger::CreateLogger("CFG");
    if (!loaded.HasValue())
        WARDEN_LOGWARN(cfg_log, "No configuration at {}, using built-in defaults", config_path);

    const auto errors = config::validate(cfg);
    for (const auto& e : errors) WARDEN_LOGERROR(cfg_log, "Invalid configuration: {}", e);
    WARDEN_LOGINFO(cfg_log, "{}", config::summary(cfg));
    if (!errors.empty()) return 2;
    if (check_only) return 0;

    std::signal(SIGINT, on_sig);
    std::signal(SIGTERM, on_sig);
    std::signal(SIGPIPE, SIG_IGN);

    WARDEN_LOGINFO(log, "warden starting (pid {})", ::getpid());
    const std::string worker_exe = config::resolve_worker_executable(cfg);

    platform::LogindSessionPlatform sessions;
    platform::PosixProcessPlatform processes(
        [&sessions](int session_id) { return sessions.logon_context(session_id); });

    // nothing survives a restart, so workers from the last run are strays
    if (cfg.kill_stray_workers) {
        const int killed = processes.kill_stray_processes(worker_exe);
        if (killed > 0) WARDEN_LOGWARN(log, "Killed {} stray worker process(es) from a previous run", killed);
    }

    em::ThreadPoolExecutor pool(static_cast<std::size_t>(cfg.aux_threads));
    phm::UnixHeartbeatChannelFactory channels(cfg.channel_dir, cfg.channel_base_name);
    em::ProcessSupervisor supervisor(em::ProcessSupervisor::from(cfg, worker_exe),
                                     processes, channels, pool);
    supervisor.set_failure_callback([&log](int sid, const warden::core::ErrorCode& reason) {
        WARDEN_LOGERROR(log, "Session {} left unsupervised until next logon: {}", sid, reason.Message());
    });

    session::SessionMonitor monitor(sessions, std::chrono::milliseconds(cfg.session_poll_interval_ms));
    monitor.start([&supervisor](session::SessionUpdate u) { supervisor.post(std::move(u)); });

    supervisor.run(running);

    WARDEN_LOGINFO(log, "Caught signal: shutting down workers");
    monitor.stop();
    supervisor.shutdown();
    if (supervisor.dropped_messages() > 0)
        WARDEN_LOGWARN(log, "{} queued message(s) were dropped under load", supervisor.dropped_messages());

    WARDEN_LOGINFO(log, "warden stopped");
    return 0;
}
