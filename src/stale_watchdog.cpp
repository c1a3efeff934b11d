#include "stale_watchdog.hpp"
#include <iostream>

namespace chansync {

StaleWatchdog::StaleWatchdog(EventLoop& loop, int64_t timeout_ms, int64_t check_interval_ms,
                             std::function<bool()> is_responding, std::function<void()> on_stale)
    : loop_(loop),
      timeout_ms_(timeout_ms),
      is_responding_(std::move(is_responding)),
      on_stale_(std::move(on_stale)),
      last_activity_ms_(loop.now()) {
    timer_ = loop_.call_every(check_interval_ms, [this] { check(); });
}

StaleWatchdog::~StaleWatchdog() {
    loop_.cancel(timer_);
}

void StaleWatchdog::touch() {
    last_activity_ms_ = loop_.now();
}

int64_t StaleWatchdog::idle_ms() const {
    return loop_.now() - last_activity_ms_;
}

void StaleWatchdog::check() {
    if (!is_responding_()) return;
    int64_t idle = idle_ms();
    if (idle <= timeout_ms_) return;
    std::cerr << "[watchdog] stale state: " << idle << " ms since last activity\n";
    last_activity_ms_ = loop_.now();
    on_stale_();
}

} // namespace chansync
