#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace chansync {

// Reads newline-terminated lines from a file descriptor on a background
// thread. stop() wakes the thread through a pipe and joins it, so callbacks
// never run after stop() returns.
class LineReader {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using EofHandler = std::function<void()>;

    // The descriptor is borrowed, not closed.
    LineReader(int fd, LineHandler on_line, EofHandler on_eof);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Returns false when the wake-up pipe cannot be created.
    bool start();

    // Signal the reader thread to stop and join it.
    void stop();

private:
    void read_loop();

    int fd_;
    LineHandler on_line_;
    EofHandler on_eof_;

    int shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace chansync
