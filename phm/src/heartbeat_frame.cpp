#include <phm/heartbeat_frame.hpp>
#include <nlohmann/json.hpp>

using nlohmann::json;
using warden::core::ErrorCode;
using warden::core::Result;
using warden::core::SupervisorErrc;

namespace phm {

std::string encode(const HeartbeatFrame& f) {
    json j{{"seq", f.seq}, {"ts_ms", f.ts_ms}};
    if (!f.status.empty()) j["status"] = f.status;
    return j.dump() + "\n";
}

std::string encode(const ControlFrame& f) {
    return json{{"cmd", f.cmd}}.dump() + "\n";
}

Result<HeartbeatFrame> decode_heartbeat(std::string_view line) {
    try {
        const json j = json::parse(line);
        if (!j.is_object() || !j.contains("seq"))
            return ErrorCode(SupervisorErrc::kCorruption, "heartbeat frame without seq");
        HeartbeatFrame f;
        f.seq = j.at("seq").get<std::uint64_t>();
        f.ts_ms = j.value("ts_ms", std::int64_t{0});
        f.status = j.value("status", std::string{});
        return f;
    } catch (const json::exception& e) {
        return ErrorCode(SupervisorErrc::kCorruption, e.what());
    }
}

Result<ControlFrame> decode_control(std::string_view line) {
    try {
        const json j = json::parse(line);
        if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string())
            return ErrorCode(SupervisorErrc::kCorruption, "control frame without cmd");
        return ControlFrame{j["cmd"].get<std::string>()};
    } catch (const json::exception& e) {
        return ErrorCode(SupervisorErrc::kCorruption, e.what());
    }
}

std::vector<std::string> LineAssembler::feed(const char* data, std::size_t n) {
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < n; ++i) {
        const char c = data[i];
        if (c == '\n') {
            if (!skipping_ && !partial_.empty()) lines.push_back(std::move(partial_));
            partial_.clear();
            skipping_ = false;
            continue;
        }
        if (skipping_) continue;
        if (partial_.size() >= max_line_) {
            partial_.clear();
            skipping_ = true;
            ++discarded_;
            continue;
        }
        partial_.push_back(c);
    }
    return lines;
}

} // namespace phm
