#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace toolrelay {

// A single frame may not exceed this many bytes
constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

enum class ReadStatus { Line, Timeout, Closed, Overflow };

// Newline-delimited reader over a pipe. Bytes after the last newline stay
// buffered for the next call. Not thread-safe; callers serialize access.
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    // Waits until deadline (monotonic_millis() clock). A trailing '\r' is
    // stripped. On EOF a final unterminated line is returned before Closed.
    ReadStatus read_line(std::string& line, int64_t deadline_ms);

    int fd() const { return fd_; }
    bool has_buffered_line() const;

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;
};

// Put fd in non-blocking mode so writes can honour a deadline
bool set_nonblocking(int fd);

// Write all bytes, waiting for the pipe to drain until deadline.
// Returns false on timeout or when the reader has gone away.
// fd must be non-blocking or a write larger than the free space can stall.
// When written is given it receives the byte count sent before returning.
bool write_all(int fd, const std::string& data, int64_t deadline_ms,
               size_t* written = nullptr);

} // namespace toolrelay
