#pragma once
#include <vector>
#include <warden/core/result.hpp>
#include <session/session_info.hpp>

namespace platform {

// OS session enumeration. Implementations skip entries they cannot read and
// only fail the whole call when enumeration itself is impossible.
class ISessionPlatform {
public:
    virtual ~ISessionPlatform() = default;

    virtual warden::core::Result<std::vector<session::SessionInfo>> enumerate_sessions() = 0;

    // kNotFound when no session currently owns the console
    virtual warden::core::Result<int> active_console_session_id() = 0;
};

} // namespace platform
