#include "event_loop.hpp"

#include <algorithm>
#include <chrono>

namespace chansync {

static int64_t steady_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// Idle wait in run() when nothing is scheduled; post() and stop() wake it early.
static constexpr int64_t kIdleWaitMs = 1000;

EventLoop::EventLoop() : now_fn_(steady_ms) {}

EventLoop::EventLoop(NowFn now, AdvanceFn advance)
    : now_fn_(std::move(now)), advance_fn_(std::move(advance)) {}

int64_t EventLoop::now() const {
    return now_fn_();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::add_timer(int64_t delay_ms, int64_t interval_ms, Task task) {
    TimerId id = next_timer_id_++;
    timers_[id] = Timer{now() + std::max<int64_t>(delay_ms, 0), interval_ms, std::move(task)};
    return id;
}

EventLoop::TimerId EventLoop::call_after(int64_t delay_ms, Task task) {
    return add_timer(delay_ms, 0, std::move(task));
}

EventLoop::TimerId EventLoop::call_every(int64_t interval_ms, Task task) {
    if (interval_ms <= 0) interval_ms = 1;
    return add_timer(interval_ms, interval_ms, std::move(task));
}

bool EventLoop::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

size_t EventLoop::run_due_timers() {
    size_t ran = 0;
    // Bounded so a zero-delay timer that re-arms itself cannot starve the tick.
    size_t budget = timers_.size();
    while (budget-- > 0) {
        int64_t t = now();
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.deadline > t) continue;
            if (due == timers_.end() || it->second.deadline < due->second.deadline) due = it;
        }
        if (due == timers_.end()) break;

        Task task;
        if (due->second.interval > 0) {
            due->second.deadline = t + due->second.interval;
            task = due->second.task;
        } else {
            task = std::move(due->second.task);
            timers_.erase(due);
        }
        task();
        ++ran;
    }
    return ran;
}

size_t EventLoop::run_pending() {
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch) task();
    return batch.size() + run_due_timers();
}

int64_t EventLoop::next_deadline() const {
    int64_t next = -1;
    for (const auto& [id, timer] : timers_) {
        if (next < 0 || timer.deadline < next) next = timer.deadline;
    }
    return next;
}

void EventLoop::wait(int64_t ms) {
    if (ms <= 0) return;
    if (advance_fn_) {
        advance_fn_(ms);
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(ms),
                 [this] { return !posted_.empty() || stopped_.load(); });
}

bool EventLoop::run_until(const std::function<bool()>& pred, int64_t timeout_ms) {
    const int64_t deadline = now() + timeout_ms;
    for (;;) {
        run_pending();
        if (pred()) return true;
        if (stopped_.load()) return false;
        int64_t t = now();
        if (t >= deadline) return false;

        int64_t until = deadline;
        int64_t next = next_deadline();
        if (next >= 0 && next < until) until = next;
        bool has_posted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            has_posted = !posted_.empty();
        }
        if (!has_posted) wait(std::max<int64_t>(until - t, 1));
    }
}

void EventLoop::run_for(int64_t ms) {
    run_until([] { return false; }, ms);
}

void EventLoop::run() {
    while (!stopped_.load()) {
        run_pending();
        int64_t wait_ms = kIdleWaitMs;
        int64_t next = next_deadline();
        if (next >= 0) wait_ms = std::min(wait_ms, std::max<int64_t>(next - now(), 1));
        bool has_posted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            has_posted = !posted_.empty();
        }
        if (!has_posted) wait(wait_ms);
    }
}

void EventLoop::stop() {
    stopped_.store(true);
    cv_.notify_all();
}

} // namespace chansync
