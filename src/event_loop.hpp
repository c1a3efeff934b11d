#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace chansync {

// Single-threaded cooperative scheduler. Every channel mutation runs on the
// thread that pumps the loop; other threads hand work over with post().
//
// Time comes from injectable hooks so tests can drive timers with a manual
// clock: `now` returns milliseconds, `advance` blocks (or jumps simulated
// time) for at most the given number of milliseconds.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;   // 0 is never a valid id
    using NowFn = std::function<int64_t()>;
    using AdvanceFn = std::function<void(int64_t)>;

    EventLoop();
    EventLoop(NowFn now, AdvanceFn advance);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Thread-safe. Runs on the next tick.
    void post(Task task);

    TimerId call_after(int64_t delay_ms, Task task);
    TimerId call_every(int64_t interval_ms, Task task);
    bool cancel(TimerId id);
    bool has_timer(TimerId id) const { return timers_.count(id) > 0; }
    size_t timer_count() const { return timers_.size(); }

    // One tick: posted tasks queued so far, then due timers. Returns the
    // number of callbacks run.
    size_t run_pending();

    // Pumps until pred() holds, the timeout elapses or stop() is called.
    bool run_until(const std::function<bool()>& pred, int64_t timeout_ms);
    void run_for(int64_t ms);

    // Pumps until stop().
    void run();
    void stop();   // thread-safe
    bool stopped() const { return stopped_.load(); }

    int64_t now() const;

private:
    struct Timer {
        int64_t deadline = 0;
        int64_t interval = 0;  // 0 for one-shot
        Task task;
    };

    TimerId add_timer(int64_t delay_ms, int64_t interval_ms, Task task);
    size_t run_due_timers();
    int64_t next_deadline() const;  // -1 when no timers
    void wait(int64_t ms);

    NowFn now_fn_;
    AdvanceFn advance_fn_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Task> posted_;
    std::atomic<bool> stopped_{false};

    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
};

} // namespace chansync
