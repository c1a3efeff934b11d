#include <catch2/catch.hpp>
#include "line_reader.hpp"

#include <unistd.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace chansync;

// Pipe whose write end the test controls.
struct PipeInput {
    int fds[2] = {-1, -1};

    PipeInput() { REQUIRE(::pipe(fds) == 0); }
    ~PipeInput() {
        close_write();
        if (fds[0] >= 0) ::close(fds[0]);
    }

    void write(const std::string& data) {
        REQUIRE(::write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    }
    void close_write() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
};

struct Collected {
    std::mutex mutex;
    std::vector<std::string> lines;
    bool eof = false;

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return lines.size();
    }
    bool ended() {
        std::lock_guard<std::mutex> lock(mutex);
        return eof;
    }
};

template <typename Pred>
static bool wait_for(Pred pred) {
    for (int i = 0; i < 200; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

TEST_CASE("LineReader: splits input into lines and reports EOF", "[line_reader]") {
    PipeInput in;
    Collected got;
    LineReader reader(in.fds[0],
        [&got](const std::string& line) {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.lines.push_back(line);
        },
        [&got] {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.eof = true;
        });
    REQUIRE(reader.start());

    in.write("first\nsec");
    in.write("ond\r\nlast");
    REQUIRE(wait_for([&] { return got.count() == 2; }));
    in.close_write();
    REQUIRE(wait_for([&] { return got.ended(); }));

    reader.stop();
    REQUIRE(got.lines == std::vector<std::string>{"first", "second", "last"});
}

TEST_CASE("LineReader: stop joins while input is still open", "[line_reader]") {
    PipeInput in;
    Collected got;
    LineReader reader(in.fds[0],
        [&got](const std::string& line) {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.lines.push_back(line);
        },
        [&got] {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.eof = true;
        });
    REQUIRE(reader.start());

    auto started = std::chrono::steady_clock::now();
    reader.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;
    REQUIRE(elapsed < std::chrono::milliseconds(500));
    REQUIRE_FALSE(got.ended());

    // Nothing is delivered once stop() has returned.
    in.write("late\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(got.count() == 0);
}
