#include "line_reader.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace chansync {

LineReader::LineReader(int fd, LineHandler on_line, EofHandler on_eof)
    : fd_(fd), on_line_(std::move(on_line)), on_eof_(std::move(on_eof)) {}

LineReader::~LineReader() {
    stop();
}

bool LineReader::start() {
    if (running_.load()) return true;
    if (::pipe(shutdown_pipe_) != 0) return false;
    running_.store(true);
    thread_ = std::thread([this]() { read_loop(); });
    return true;
}

void LineReader::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) ::write(shutdown_pipe_[1], &b, 1);
    if (thread_.joinable()) thread_.join();
    if (shutdown_pipe_[0] >= 0) { ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0) { ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1; }
}

void LineReader::read_loop() {
    std::string pending;
    char buf[1024];
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = fd_;               fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = shutdown_pipe_[0]; fds[1].events = POLLIN; fds[1].revents = 0;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or EINTR
        if (fds[1].revents & POLLIN) return; // shutdown signal
        if (!(fds[0].revents & (POLLIN | POLLHUP))) continue;

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            on_line_(line);
        }
    }
    if (!running_.load()) return;
    // Input ended: deliver an unterminated last line, then report EOF.
    if (!pending.empty()) on_line_(pending);
    if (on_eof_) on_eof_();
}

} // namespace chansync
