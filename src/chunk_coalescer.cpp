#include "chunk_coalescer.hpp"
#include <stdexcept>

namespace chansync {

ChunkCoalescer::ChunkCoalescer(EventLoop& loop, int64_t frame_interval_ms, FlushFn on_flush)
    : loop_(loop),
      frame_interval_ms_(frame_interval_ms > 0 ? frame_interval_ms : 16),
      on_flush_(std::move(on_flush)) {}

ChunkCoalescer::~ChunkCoalescer() {
    destroy();
}

// Appends `next` onto `last` when both are the same delta kind for the same stream.
static bool merge_into(ProtocolEvent& last, const ProtocolEvent& next) {
    if (auto* a = std::get_if<StreamingChunk>(&last)) {
        auto* b = std::get_if<StreamingChunk>(&next);
        if (!b || a->stream_id != b->stream_id || a->execution_id != b->execution_id)
            return false;
        a->content += b->content;
        return true;
    }
    if (auto* a = std::get_if<ThinkingChunk>(&last)) {
        auto* b = std::get_if<ThinkingChunk>(&next);
        if (!b || a->stream_id != b->stream_id) return false;
        a->content += b->content;
        return true;
    }
    return false;
}

void ChunkCoalescer::push(ProtocolEvent delta) {
    if (!is_delta(delta))
        throw std::invalid_argument(std::string("coalescer: not a delta event: ") +
                                    event_type_name(delta));
    if (pending_.empty() || !merge_into(pending_.back(), delta))
        pending_.push_back(std::move(delta));
    schedule();
}

void ChunkCoalescer::schedule() {
    if (timer_ != 0) return;
    int64_t into_frame = loop_.now() % frame_interval_ms_;
    if (into_frame < 0) into_frame += frame_interval_ms_;
    timer_ = loop_.call_after(frame_interval_ms_ - into_frame, [this] {
        timer_ = 0;
        flush();
    });
}

void ChunkCoalescer::flush() {
    if (pending_.empty()) return;
    std::vector<ProtocolEvent> batch;
    batch.swap(pending_);
    on_flush_(std::move(batch));
}

void ChunkCoalescer::flush_sync() {
    if (timer_ != 0) {
        loop_.cancel(timer_);
        timer_ = 0;
    }
    flush();
}

void ChunkCoalescer::destroy() {
    if (timer_ != 0) {
        loop_.cancel(timer_);
        timer_ = 0;
    }
    pending_.clear();
}

} // namespace chansync
