#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "log.hpp"
#include "sinks_console.hpp"
#include <warden/phm/heartbeat_client.hpp>

static std::atomic<bool> running{true};
static void on_sig(int){ running = false; }

namespace {

struct WorkerArgs {
  int session_id{-1};
  std::string channel_dir;
  std::string channel_name;
  int interval_s{5};
  bool verbose{false};
};

bool parse_args(int argc, char** argv, WorkerArgs& out) {
  if (argc < 2 || std::strcmp(argv[1], "user-session") != 0) return false;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
    if (a == "--verbose") { out.verbose = true; continue; }
    const char* v = next();
    if (!v) return false;
    if      (a == "--session-id")   out.session_id = std::atoi(v);
    else if (a == "--channel-dir")  out.channel_dir = v;
    else if (a == "--channel-name") out.channel_name = v;
    else if (a == "--interval-s")   out.interval_s = std::atoi(v);
    else return false;
  }
  return out.session_id >= 0 && !out.channel_dir.empty() && !out.channel_name.empty()
         && out.interval_s > 0;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGTERM, on_sig);
  std::signal(SIGINT, on_sig);
  std::signal(SIGPIPE, SIG_IGN);

  WorkerArgs args;
  if (!parse_args(argc, argv, args)) {
    std::cerr << "usage: " << argv[0] << " user-session --session-id <id> --channel-dir <dir>"
              << " --channel-name <base> [--interval-s <s>] [--verbose]\n";
    return 2;
  }

  auto &LM = warden::log::LogManager::Instance();
  LM.SetGlobalIds("HOST", "WRKR");
  LM.SetDefaultLevel(args.verbose ? warden::log::LogLevel::kDebug : warden::log::LogLevel::kInfo);
  LM.AddSink(std::make_shared<warden::log::ConsoleSink>());
  auto lg = warden::log::Logger::CreateLogger("WRK").WithCorrelation("sid=" + std::to_string(args.session_id));

  warden::phm::HeartbeatClient phm(args.channel_dir, args.channel_name, args.session_id);
  if (auto r = phm.Connect(); !r) {
    WARDEN_LOGWARN(lg, "Heartbeat channel not reachable yet: {}", r.Error().Message());
  }
  WARDEN_LOGINFO(lg, "Worker up in session {}, beating every {}s on {}",
                 args.session_id, args.interval_s, phm.Endpoint());

  using namespace std::chrono_literals;
  using clock = std::chrono::steady_clock;
  const auto period = std::chrono::seconds(args.interval_s);
  auto next_beat = clock::now();
  bool channel_ok = true;

  while (running.load(std::memory_order_relaxed)) {
    if (clock::now() >= next_beat) {
      auto r = phm.ReportAlive("idle");
      if (!r && channel_ok) WARDEN_LOGWARN(lg, "Heartbeat not delivered: {}", r.Error().Message());
      else if (r && !channel_ok) WARDEN_LOGINFO(lg, "Heartbeat channel restored");
      else if (r) WARDEN_LOGDEBUG(lg, "Heartbeat {}", phm.LastSequence());
      channel_ok = static_cast<bool>(r);
      next_beat += period;
    }
    if (phm.StopRequested()) {
      WARDEN_LOGINFO(lg, "Stop requested by supervisor");
      break;
    }
    std::this_thread::sleep_for(100ms);
  }

  WARDEN_LOGINFO(lg, "Worker exiting");
  return 0;
}
