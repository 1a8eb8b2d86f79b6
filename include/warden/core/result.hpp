#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::core {

// Error domain shared by the supervisor, its platform layer and config loading
enum class SupervisorErrc {
    kSuccess = 0,
    kSessionQueryFailed,      // transient; cycle treated as "no change"
    kNoLogonContext,          // session has no usable logon yet
    kLaunchFailed,
    kUnexpectedExit,
    kHeartbeatTimeout,
    kRestartBudgetExhausted,
    kChannelFailed,
    kInvalidConfig,
    kNotFound,
    kPermissionDenied,
    kCorruption,
    kUnknown
};

inline constexpr std::string_view ToString(SupervisorErrc e) {
    switch (e) {
        case SupervisorErrc::kSuccess:                return "Success";
        case SupervisorErrc::kSessionQueryFailed:     return "SessionQueryError";
        case SupervisorErrc::kNoLogonContext:         return "NoLogonContext";
        case SupervisorErrc::kLaunchFailed:           return "LaunchError";
        case SupervisorErrc::kUnexpectedExit:         return "UnexpectedExit";
        case SupervisorErrc::kHeartbeatTimeout:       return "HeartbeatTimeout";
        case SupervisorErrc::kRestartBudgetExhausted: return "RestartBudgetExhausted";
        case SupervisorErrc::kChannelFailed:          return "ChannelError";
        case SupervisorErrc::kInvalidConfig:          return "InvalidConfig";
        case SupervisorErrc::kNotFound:               return "NotFound";
        case SupervisorErrc::kPermissionDenied:       return "PermissionDenied";
        case SupervisorErrc::kCorruption:             return "Corruption";
        default:                                      return "Unknown";
    }
}

class ErrorCode {
public:
    SupervisorErrc value;
    std::string detail;   // correlation text (session, pid, errno...)
    ErrorCode(SupervisorErrc v, std::string d = {}) : value(v), detail(std::move(d)) {}
    operator bool() const { return value != SupervisorErrc::kSuccess; }

    std::string Message() const {
        std::string out(ToString(value));
        if (!detail.empty()) { out += ": "; out += detail; }
        return out;
    }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(SupervisorErrc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace warden::core
