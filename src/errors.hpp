#pragma once
#include <stdexcept>
#include <string>

namespace toolrelay {

enum class ErrorKind {
    Spawn,
    HandshakeTimeout,
    Malformed,
    ConnectionClosed,
    Timeout,
    Remote,
    NotConnected,
    ToolNotFound,
    ArgumentParse,
    ModelUnavailable,
    Internal
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Spawn: return "spawn";
        case ErrorKind::HandshakeTimeout: return "handshake_timeout";
        case ErrorKind::Malformed: return "malformed";
        case ErrorKind::ConnectionClosed: return "connection_closed";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Remote: return "remote";
        case ErrorKind::NotConnected: return "not_connected";
        case ErrorKind::ToolNotFound: return "tool_not_found";
        case ErrorKind::ArgumentParse: return "argument_parse";
        case ErrorKind::ModelUnavailable: return "model_unavailable";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

// Every fault raised inside the core. Expected absence (unknown tool, no
// model reply) is reported with std::optional instead.
class ToolRelayError : public std::runtime_error {
public:
    ToolRelayError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    // JSON-RPC error object returned by the provider
    ToolRelayError(int remote_code, const std::string& message)
        : std::runtime_error(message), kind_(ErrorKind::Remote), remote_code_(remote_code) {}

    ErrorKind kind() const { return kind_; }
    int remote_code() const { return remote_code_; }

    bool is_timeout() const {
        return kind_ == ErrorKind::Timeout || kind_ == ErrorKind::HandshakeTimeout;
    }

private:
    ErrorKind kind_;
    int remote_code_ = 0;
};

} // namespace toolrelay
