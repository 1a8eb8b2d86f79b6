#include "sinks_dlt.hpp"
#include <cstring>
#include <iostream>

#ifdef HAVE_DLT
  #include <dlt/dlt_user.h>
#endif

namespace warden::log {

namespace {

const char* describe_context(const std::string& ctx_id) {
  if (ctx_id == "EM")   return "Process supervisor";
  if (ctx_id == "SESS") return "Session monitor";
  if (ctx_id == "PHM")  return "Heartbeat channel";
  if (ctx_id == "PLAT") return "Platform layer";
  if (ctx_id == "CFG")  return "Configuration";
  if (ctx_id == "WRK")  return "Session worker";
  return "warden";
}

#ifdef HAVE_DLT
DltLogLevelType to_dlt_level(LogLevel l) {
  switch (l) {
    case LogLevel::kFatal:   return DLT_LOG_FATAL;
    case LogLevel::kError:   return DLT_LOG_ERROR;
    case LogLevel::kWarn:    return DLT_LOG_WARN;
    case LogLevel::kInfo:    return DLT_LOG_INFO;
    case LogLevel::kDebug:   return DLT_LOG_DEBUG;
    case LogLevel::kVerbose: return DLT_LOG_VERBOSE;
    default:                 return DLT_LOG_INFO;
  }
}
#endif

} // namespace

DltSink::DltSink(std::string app_description)
  : app_desc_(std::move(app_description)) {}

DltSink::~DltSink() {
#ifdef HAVE_DLT
  std::scoped_lock lk(mu_);
  for (auto& [id, handle] : ctx_by_id_) {
    auto* ctx = static_cast<DltContext*>(handle.h);
    if (!ctx) continue;
    dlt_unregister_context(ctx);
    delete ctx;
  }
  ctx_by_id_.clear();
  if (!registered_app_id_.empty()) dlt_unregister_app();
#endif
}

void DltSink::ensureAppRegistered(const std::string& app_id) {
#ifdef HAVE_DLT
  if (!registered_app_id_.empty()) return;   // one DLT app per process
  dlt_register_app(app_id.c_str(), app_desc_.c_str());
  registered_app_id_ = app_id;
#else
  (void)app_id;
#endif
}

void DltSink::ensureCtxRegistered(const std::string& ctx_id) {
#ifdef HAVE_DLT
  if (ctx_by_id_.find(ctx_id) != ctx_by_id_.end()) return;
  auto* ctx = new DltContext();
  std::memset(ctx, 0, sizeof(DltContext));
  dlt_register_context(ctx, ctx_id.c_str(), describe_context(ctx_id));
  ctx_by_id_[ctx_id] = CtxHandle{ctx};
#else
  (void)ctx_id;
#endif
}

void DltSink::write(const LogRecord& r) noexcept {
#ifdef HAVE_DLT
  std::scoped_lock lk(mu_);
  ensureAppRegistered(r.app_id);
  ensureCtxRegistered(r.ctx_id);

  auto it = ctx_by_id_.find(r.ctx_id);
  if (it == ctx_by_id_.end() || it->second.h == nullptr) return;
  auto* ctx = static_cast<DltContext*>(it->second.h);

  if (r.correlation.empty()) {
    DLT_LOG(*ctx, to_dlt_level(r.level), DLT_STRING(r.message.c_str()));
  } else {
    DLT_LOG(*ctx, to_dlt_level(r.level),
            DLT_STRING(r.correlation.c_str()), DLT_STRING(r.message.c_str()));
  }
#else
  std::scoped_lock lk(mu_);
  static bool warned = false;
  if (!warned) {
    std::cerr << "[DLT] Built without DLT support (HAVE_DLT not defined); context "
              << describe_context(r.ctx_id) << " stays on the other sinks\n";
    warned = true;
  }
#endif
}

} // namespace warden::log
