#include "framing.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace toolrelay {

static bool take_line(std::string& buffer, std::string& line) {
    auto nl = buffer.find('\n');
    if (nl == std::string::npos) return false;
    line = buffer.substr(0, nl);
    buffer.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool LineReader::has_buffered_line() const {
    return buffer_.find('\n') != std::string::npos;
}

ReadStatus LineReader::read_line(std::string& line, int64_t deadline_ms) {
    for (;;) {
        if (take_line(buffer_, line)) return ReadStatus::Line;

        if (eof_) {
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::Closed;
        }

        if (buffer_.size() > kMaxFrameSize) {
            buffer_.clear();
            return ReadStatus::Overflow;
        }

        int64_t remaining = deadline_ms - monotonic_millis();
        if (remaining <= 0) return ReadStatus::Timeout;

        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining, 1000)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }
        if (ret == 0) continue;

        char buf[8192];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n > 0) {
            buffer_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

bool set_nonblocking(int fd) {
    if (fd < 0) return false;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (flags & O_NONBLOCK) return true;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool write_all(int fd, const std::string& data, int64_t deadline_ms, size_t* written) {
    size_t sent = 0;
    auto finish = [&](bool ok) {
        if (written) *written = sent;
        return ok;
    };
    if (fd < 0) return finish(false);
    while (sent < data.size()) {
        int64_t remaining = deadline_ms - monotonic_millis();
        if (remaining <= 0) return finish(false);

        struct pollfd pfd = {fd, POLLOUT, 0};
        int ret = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining, 1000)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return finish(false);
        }
        if (ret == 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return finish(false);

        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return finish(false);
        }
        sent += static_cast<size_t>(n);
    }
    return finish(true);
}

} // namespace toolrelay
