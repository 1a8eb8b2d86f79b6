#pragma once
#include <chrono>
#include <optional>

namespace phm {

struct RestartBudget {
    int restart_count{0};
    std::optional<std::chrono::steady_clock::time_point> last_failure_time{};
    std::chrono::steady_clock::time_point cooldown_until{};
};

struct RestartDecision {
    enum class Kind { kRetry, kGiveUp };
    Kind kind{Kind::kGiveUp};
    std::chrono::seconds delay{0};
    int restart_count{0};      // count after recording this failure

    bool retry() const { return kind == Kind::kRetry; }
};

class RestartPolicy {
public:
    struct Config {
        int max_restart_attempts{3};
        std::chrono::seconds restart_delay{5};
        std::chrono::seconds stability_window{120};
    };

    RestartPolicy() = default;
    explicit RestartPolicy(const Config& cfg) : cfg_(cfg) {}

    // Pure: records one failure against `budget` and decides. `running_for` is
    // how long the failed instance had been Running continuously (zero when it
    // never reached Running).
    RestartDecision decide(const RestartBudget& budget,
                           std::chrono::steady_clock::duration running_for) const;

    // Applies a decision taken at `now` to the budget
    static void record(RestartBudget& budget, const RestartDecision& d,
                       std::chrono::steady_clock::time_point now);

    const Config& config() const { return cfg_; }

private:
    Config cfg_{};
};

} // namespace phm
