#pragma once
#include "event_loop.hpp"
#include <functional>

namespace chansync {

// Periodic liveness check for one topic. Every check_interval_ms, if the
// channel is responding and no protocol activity was seen for more than
// timeout_ms, on_stale fires and the activity clock restarts.
class StaleWatchdog {
public:
    StaleWatchdog(EventLoop& loop, int64_t timeout_ms, int64_t check_interval_ms,
                  std::function<bool()> is_responding, std::function<void()> on_stale);
    ~StaleWatchdog();

    StaleWatchdog(const StaleWatchdog&) = delete;
    StaleWatchdog& operator=(const StaleWatchdog&) = delete;

    // Record protocol activity.
    void touch();

    int64_t idle_ms() const;

private:
    void check();

    EventLoop& loop_;
    int64_t timeout_ms_;
    std::function<bool()> is_responding_;
    std::function<void()> on_stale_;
    int64_t last_activity_ms_;
    EventLoop::TimerId timer_ = 0;
};

} // namespace chansync
