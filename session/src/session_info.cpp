#include <session/session_info.hpp>

namespace session {

std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::kActive:       return "Active";
        case SessionState::kConnected:    return "Connected";
        case SessionState::kConnectQuery: return "ConnectQuery";
        case SessionState::kShadow:       return "Shadow";
        case SessionState::kDisconnected: return "Disconnected";
        case SessionState::kIdle:         return "Idle";
        case SessionState::kListen:       return "Listen";
        case SessionState::kReset:        return "Reset";
        case SessionState::kDown:         return "Down";
        case SessionState::kInit:         return "Init";
    }
    return "Unknown";
}

} // namespace session
