#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <warden/core/result.hpp>

namespace phm {

// Worker -> supervisor. One JSON object per line:
//   {"seq":12,"ts_ms":1700000000123,"status":"capturing"}
struct HeartbeatFrame {
    std::uint64_t seq{0};
    std::int64_t ts_ms{0};     // sender wall clock, informational only
    std::string status;        // optional, may be empty
};

// Supervisor -> worker, e.g. {"cmd":"stop"}
struct ControlFrame {
    std::string cmd;
};

inline constexpr const char* kStopCommand = "stop";

std::string encode(const HeartbeatFrame& f);
std::string encode(const ControlFrame& f);

warden::core::Result<HeartbeatFrame> decode_heartbeat(std::string_view line);
warden::core::Result<ControlFrame> decode_control(std::string_view line);

// Splits a byte stream into lines. A line longer than the limit is discarded
// up to its terminating newline.
class LineAssembler {
public:
    explicit LineAssembler(std::size_t max_line = 4096) : max_line_(max_line) {}

    // Appends bytes and returns every completed line (without '\n')
    std::vector<std::string> feed(const char* data, std::size_t n);

    std::size_t discarded() const { return discarded_; }

private:
    std::size_t max_line_;
    std::string partial_;
    bool skipping_{false};
    std::size_t discarded_{0};
};

} // namespace phm
