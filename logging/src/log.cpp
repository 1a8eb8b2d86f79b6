#include "log.hpp"
#include "sinks_file.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace warden::log {

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "off")                       return LogLevel::kOff;
  if (s == "fatal")                     return LogLevel::kFatal;
  if (s == "error")                     return LogLevel::kError;
  if (s == "warn" || s == "warning")    return LogLevel::kWarn;
  if (s == "info")                      return LogLevel::kInfo;
  if (s == "debug")                     return LogLevel::kDebug;
  if (s == "verbose" || s == "trace")   return LogLevel::kVerbose;
  return std::nullopt;
}

FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

void FileSink::write(const LogRecord& r) noexcept {
  std::scoped_lock lk(mu_);
  if (!out_) return;
  const std::time_t secs = static_cast<std::time_t>(r.ts_ns / 1000000000ull);
  const unsigned millis = static_cast<unsigned>((r.ts_ns / 1000000ull) % 1000ull);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  out_ << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << "Z "
       << r.app_id << ' ' << r.ctx_id << ' ' << ToString(r.level) << ' ';
  if (!r.correlation.empty()) out_ << '[' << r.correlation << "] ";
  out_ << r.message << '\n';
  if (r.level != LogLevel::kOff && r.level <= LogLevel::kWarn) out_.flush();
}

} // namespace warden::log
