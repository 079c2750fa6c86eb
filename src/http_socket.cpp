// HTTP/HTTPS client using POSIX sockets + OpenSSL. Plain http:// is the
// common case (a local Ollama); https:// goes through TLS with peer
// verification.

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace toolrelay {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return false;
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty()) return false;

    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        out.host = host_port.substr(0, colon);
        out.port = host_port.substr(colon + 1);
    } else {
        out.host = host_port;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    int64_t  deadline_ms = 0; // whole exchange, monotonic clock
    std::string error;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        deadline_ms = monotonic_millis() + timeout_secs * 1000;

        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so the deadline is honoured
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                struct pollfd pfd = {fd, POLLOUT, 0};
                int64_t remaining = std::max<int64_t>(deadline_ms - monotonic_millis(), 0);
                rc = poll(&pfd, 1, static_cast<int>(remaining));
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) connected = true;
                    else error = std::string("connect: ") + std::strerror(err);
                } else {
                    error = "connect timed out";
                }
            } else {
                error = std::string("connect: ") + std::strerror(errno);
            }
            if (connected) {
                fcntl(fd, F_SETFL, flags);
            } else {
                ::close(fd);
                fd = -1;
            }
        }
        freeaddrinfo(res);
        if (!connected) {
            if (error.empty()) error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // 1-second slices so the abort flag and deadline are polled
        set_socket_timeout(1);

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            int rc;
            while ((rc = SSL_connect(ssl)) != 1) {
                int err = SSL_get_error(ssl, rc);
                bool retry = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                    (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK));
                if (!retry || expired()) {
                    char buf[256];
                    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                    error = std::string("TLS handshake failed: ") + buf;
                    return false;
                }
            }
        }
        return true;
    }

    bool expired() const {
        if (g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed))
            return true;
        return monotonic_millis() >= deadline_ms;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error/deadline.
    // EAGAIN (1-second slice expiry) loops back so the caller can check abort.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (expired()) {
                error = "request timed out";
                return -1;
            }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) {
                error = "request timed out";
                return false;
            }
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed";
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    error = std::string("send: ") + std::strerror(errno);
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                 const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    req += "User-Agent: toolrelay\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (to_lower(h.first) == "content-length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF/error before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

static bool parse_response_head(Connection& conn, std::string& leftover, ResponseHead& head) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK" — extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || sp1 == std::string::npos) {
        conn.error = "invalid status line: " + truncate(status_line, 80);
        return false;
    }
    head.status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (head.status < 100 || head.status > 999) {
        conn.error = "invalid status code in: " + truncate(status_line, 80);
        return false;
    }

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) return true; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = to_lower(trim(line.substr(0, colon)));
        std::string value = to_lower(trim(line.substr(colon + 1)));

        if (name == "transfer-encoding") {
            head.chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            char* end = nullptr;
            unsigned long n = std::strtoul(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                head.content_length = n;
                head.has_length = true;
            }
        }
    }
    conn.error = "connection closed inside response headers";
    return false;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                         size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Accumulate full body (handles chunked + content-length + read-to-close).
static bool read_body(Connection& conn, std::string& leftover,
                      const ResponseHead& head, std::string& body) {
    if (head.chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false; // trailing \r\n
        }
        return false;
    }
    if (head.has_length) {
        return read_exactly(conn, leftover, head.content_length, body);
    }
    body += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        body.append(buf, static_cast<size_t>(n));
    }
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                               const std::string& url_str,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_secs) {
    HttpResponse resp;
    ParsedUrl url;
    if (!parse_url(url_str, url)) {
        resp.error = "invalid URL: " + url_str;
        return resp;
    }

    Connection conn;
    if (!conn.connect(url, timeout_secs)) {
        resp.error = conn.error;
        return resp;
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.error;
        return resp;
    }

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) {
        resp.error = conn.error.empty() ? "no response" : conn.error;
        return resp;
    }

    resp.status_code = head.status;
    if (!read_body(conn, leftover, head, resp.body)) {
        resp.error = conn.error.empty() ? "truncated response body" : conn.error;
    }
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace toolrelay
