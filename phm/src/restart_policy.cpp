#include <phm/restart_policy.hpp>

namespace phm {

RestartDecision RestartPolicy::decide(const RestartBudget& budget,
                                      std::chrono::steady_clock::duration running_for) const {
    // a long healthy run forgives earlier failures
    const int prior = running_for > cfg_.stability_window ? 0 : budget.restart_count;

    RestartDecision d;
    d.restart_count = prior + 1;
    if (d.restart_count >= cfg_.max_restart_attempts) {
        d.kind = RestartDecision::Kind::kGiveUp;
        return d;
    }
    d.kind = RestartDecision::Kind::kRetry;
    d.delay = cfg_.restart_delay;
    return d;
}

void RestartPolicy::record(RestartBudget& budget, const RestartDecision& d,
                           std::chrono::steady_clock::time_point now) {
    budget.restart_count = d.restart_count;
    budget.last_failure_time = now;
    budget.cooldown_until = d.retry() ? now + d.delay : now;
}

} // namespace phm
