#pragma once
#include "log.hpp"
#include <mutex>
#include <unordered_map>
#include <string>

namespace warden::log {

// Forwards records to the COVESA DLT daemon. Needs HAVE_DLT at build time;
// otherwise every write is a no-op after a single warning on stderr.
class DltSink : public ISink {
public:
  explicit DltSink(std::string app_description = "Session worker supervisor");
  ~DltSink();

  DltSink(const DltSink&) = delete;
  DltSink& operator=(const DltSink&) = delete;

  void write(const LogRecord& r) noexcept override;

private:
  void ensureAppRegistered(const std::string& app_id);
  void ensureCtxRegistered(const std::string& ctx_id);

  struct CtxHandle { void* h = nullptr; }; // DltContext*, opaque here
  std::mutex mu_;
  std::string app_desc_;
  std::string registered_app_id_;
  std::unordered_map<std::string, CtxHandle> ctx_by_id_;
};

} // namespace warden::log
