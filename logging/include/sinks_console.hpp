#pragma once
#include "log.hpp"
#include <iostream>
#include <mutex>

namespace warden::log {

// WARN and worse go to stderr, the rest to stdout. One line per record.
struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    std::scoped_lock lk(mu_);
    auto& os = (r.level != LogLevel::kOff && r.level <= LogLevel::kWarn) ? std::cerr : std::cout;
    os << "[" << ToString(r.level) << "] " << r.ctx_id << ": ";
    if (!r.correlation.empty()) os << "[" << r.correlation << "] ";
    os << r.message << std::endl;
  }

private:
  std::mutex mu_;
};

} // namespace warden::log
