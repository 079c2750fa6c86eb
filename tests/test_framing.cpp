#include <catch2/catch.hpp>
#include "framing.hpp"
#include "util.hpp"
#include <csignal>
#include <fcntl.h>
#include <string>
#include <unistd.h>

using namespace toolrelay;

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() {
        REQUIRE(pipe2(fds, O_CLOEXEC) == 0);
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
    void put(const std::string& s) {
        REQUIRE(write(fds[1], s.data(), s.size()) == static_cast<ssize_t>(s.size()));
    }
};

int64_t soon(int ms = 500) { return monotonic_millis() + ms; }

} // namespace

// ── LineReader ───────────────────────────────────────────────────

TEST_CASE("LineReader: reads newline-terminated frames", "[framing]") {
    Pipe p;
    p.put("first\nsecond\n");
    LineReader reader(p.read_end());
    std::string line;
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "first");
    REQUIRE(reader.has_buffered_line());
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "second");
    REQUIRE_FALSE(reader.has_buffered_line());
}

TEST_CASE("LineReader: strips carriage return", "[framing]") {
    Pipe p;
    p.put("{\"a\":1}\r\n");
    LineReader reader(p.read_end());
    std::string line;
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "{\"a\":1}");
}

TEST_CASE("LineReader: partial frame waits for the rest", "[framing]") {
    Pipe p;
    p.put("hal");
    LineReader reader(p.read_end());
    std::string line;
    REQUIRE(reader.read_line(line, soon(50)) == ReadStatus::Timeout);
    p.put("f\n");
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "half");
}

TEST_CASE("LineReader: times out on a silent pipe", "[framing]") {
    Pipe p;
    LineReader reader(p.read_end());
    std::string line;
    int64_t start = monotonic_millis();
    REQUIRE(reader.read_line(line, start + 100) == ReadStatus::Timeout);
    REQUIRE(monotonic_millis() - start >= 100);
}

TEST_CASE("LineReader: EOF yields trailing data then Closed", "[framing]") {
    Pipe p;
    p.put("done\ntail");
    p.close_write();
    LineReader reader(p.read_end());
    std::string line;
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "done");
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "tail");
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Closed);
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Closed);
}

TEST_CASE("LineReader: empty lines are frames too", "[framing]") {
    Pipe p;
    p.put("\nx\n");
    LineReader reader(p.read_end());
    std::string line = "stale";
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line.empty());
}

// ── write_all ────────────────────────────────────────────────────

TEST_CASE("write_all: writes every byte", "[framing]") {
    Pipe p;
    REQUIRE(write_all(p.write_end(), "abc\n", soon()));
    LineReader reader(p.read_end());
    std::string line;
    REQUIRE(reader.read_line(line, soon()) == ReadStatus::Line);
    REQUIRE(line == "abc");
}

TEST_CASE("write_all: fails when the reader is gone", "[framing]") {
    std::signal(SIGPIPE, SIG_IGN);
    Pipe p;
    p.close_read();
    REQUIRE_FALSE(write_all(p.write_end(), "lost\n", soon()));
}

TEST_CASE("write_all: invalid fd fails", "[framing]") {
    REQUIRE_FALSE(write_all(-1, "x", soon()));
}

TEST_CASE("write_all: times out on a full pipe", "[framing]") {
    Pipe p;
    REQUIRE(set_nonblocking(p.write_end()));
    REQUIRE((fcntl(p.write_end(), F_GETFL) & O_NONBLOCK) != 0);
    std::string big(1024 * 1024, 'x');
    size_t written = 0;
    auto start = monotonic_millis();
    REQUIRE_FALSE(write_all(p.write_end(), big, soon(100), &written));
    REQUIRE(monotonic_millis() - start < 1000);
    // The pipe took what fit before the deadline
    REQUIRE(written > 0);
    REQUIRE(written < big.size());
}

TEST_CASE("set_nonblocking: rejects an invalid fd", "[framing]") {
    REQUIRE_FALSE(set_nonblocking(-1));
}
