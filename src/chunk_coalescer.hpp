#pragma once
#include "event_loop.hpp"
#include "protocol.hpp"
#include <functional>
#include <vector>

namespace chansync {

// Per-topic buffer for streaming_chunk / thinking_chunk deltas. Consecutive
// deltas of the same kind and stream are concatenated; the batch is handed to
// the flush callback at the next frame boundary, or earlier via flush_sync().
class ChunkCoalescer {
public:
    using FlushFn = std::function<void(std::vector<ProtocolEvent>)>;

    ChunkCoalescer(EventLoop& loop, int64_t frame_interval_ms, FlushFn on_flush);
    ~ChunkCoalescer();

    ChunkCoalescer(const ChunkCoalescer&) = delete;
    ChunkCoalescer& operator=(const ChunkCoalescer&) = delete;

    // Throws std::invalid_argument for non-delta events.
    void push(ProtocolEvent delta);

    void flush_sync();
    void destroy();

    bool has_pending() const { return !pending_.empty(); }
    size_t pending_size() const { return pending_.size(); }

private:
    void schedule();
    void flush();

    EventLoop& loop_;
    int64_t frame_interval_ms_;
    FlushFn on_flush_;
    std::vector<ProtocolEvent> pending_;
    EventLoop::TimerId timer_ = 0;
};

} // namespace chansync
