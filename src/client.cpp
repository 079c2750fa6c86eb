#include "client.hpp"
#include "errors.hpp"
#include "framing.hpp"
#include "util.hpp"

#include <iostream>

namespace toolrelay {

const char* connection_state_to_string(ProviderConnectionState state) {
    switch (state) {
        case ProviderConnectionState::Unconnected: return "unconnected";
        case ProviderConnectionState::Connecting: return "connecting";
        case ProviderConnectionState::Ready: return "ready";
        case ProviderConnectionState::Failed: return "failed";
        case ProviderConnectionState::Disposed: return "disposed";
    }
    return "unknown";
}

ToolProviderClient::ToolProviderClient(ProviderConfig config, ClientOptions options)
    : config_(std::move(config)), options_(options) {}

ToolProviderClient::~ToolProviderClient() {
    dispose();
}

void ToolProviderClient::connect() {
    auto expected = ProviderConnectionState::Unconnected;
    if (!state_.compare_exchange_strong(expected, ProviderConnectionState::Connecting)) {
        throw ToolRelayError(ErrorKind::Internal,
            "connect() on " + config_.name + " in state " +
            connection_state_to_string(expected));
    }

    try {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            process_ = ProcessHandle::spawn(config_);
        }
        start_stderr_pump();

        SessionOptions opts;
        opts.label = config_.name;
        opts.handshake_timeout = options_.handshake_timeout;
        opts.request_timeout = options_.request_timeout;
        opts.pipelined = options_.pipelined;
        session_ = std::make_unique<ProtocolSession>(
            process_->take_stdout(), process_->take_stdin(), opts);

        const ServerInfo& info = session_->initialize();
        std::cerr << "[client] Connected to " << config_.name;
        if (!info.name.empty()) std::cerr << " (" << info.name << " " << info.version << ")";
        std::cerr << "\n";
    } catch (const ToolRelayError& e) {
        mark_failed(e);
        dispose();
        throw;
    } catch (const std::exception& e) {
        ToolRelayError err(ErrorKind::Internal,
            "Failed to connect " + config_.name + ": " + e.what());
        mark_failed(err);
        dispose();
        throw err;
    }

    expected = ProviderConnectionState::Connecting;
    if (!state_.compare_exchange_strong(expected, ProviderConnectionState::Ready)) {
        // dispose() raced us from another thread
        throw ToolRelayError(ErrorKind::NotConnected,
            config_.name + " was disposed during connect");
    }
}

void ToolProviderClient::require_ready(const char* op) const {
    auto s = state();
    if (s != ProviderConnectionState::Ready) {
        throw ToolRelayError(ErrorKind::NotConnected,
            std::string(op) + " on " + config_.name + " which is " +
            connection_state_to_string(s));
    }
}

void ToolProviderClient::mark_failed(const ToolRelayError& error) {
    auto s = state_.load();
    while (s != ProviderConnectionState::Disposed && s != ProviderConnectionState::Failed) {
        if (state_.compare_exchange_weak(s, ProviderConnectionState::Failed)) {
            std::cerr << "[client] " << config_.name << " failed ("
                      << error_kind_to_string(error.kind()) << "): " << error.what() << "\n";
            break;
        }
    }
}

std::vector<ToolDescriptor> ToolProviderClient::list_tools() {
    require_ready("tools/list");
    try {
        return session_->list_tools(config_.name);
    } catch (const ToolRelayError& e) {
        if (e.kind() == ErrorKind::ConnectionClosed || e.kind() == ErrorKind::Malformed)
            mark_failed(e);
        throw;
    }
}

std::vector<ResourceDescriptor> ToolProviderClient::list_resources() {
    require_ready("resources/list");
    try {
        return session_->list_resources(config_.name);
    } catch (const ToolRelayError& e) {
        if (e.kind() == ErrorKind::ConnectionClosed || e.kind() == ErrorKind::Malformed)
            mark_failed(e);
        throw;
    }
}

ToolResult ToolProviderClient::call_tool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         std::chrono::milliseconds timeout) {
    require_ready("tools/call");
    try {
        return session_->call_tool(name, arguments, timeout);
    } catch (const ToolRelayError& e) {
        // A timed-out call leaves the session usable: its id is abandoned.
        // A send cut off mid-frame closes it, though.
        if (e.kind() == ErrorKind::ConnectionClosed || e.kind() == ErrorKind::Malformed ||
            session_->is_closed())
            mark_failed(e);
        throw;
    }
}

bool ToolProviderClient::is_alive() {
    bool alive;
    std::optional<int> code;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (!process_) return false;
        alive = process_->is_alive();
        if (!alive) code = process_->exit_code();
    }
    if (!alive) {
        auto expected = ProviderConnectionState::Ready;
        if (state_.compare_exchange_strong(expected, ProviderConnectionState::Failed)) {
            std::cerr << "[client] " << config_.name << " exited unexpectedly";
            if (code) std::cerr << " (exit code " << *code << ")";
            std::cerr << "\n";
        }
    }
    return alive && state() == ProviderConnectionState::Ready;
}

std::optional<pid_t> ToolProviderClient::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_) return std::nullopt;
    return process_->pid();
}

std::optional<int> ToolProviderClient::exit_code() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_) return std::nullopt;
    return process_->exit_code();
}

const ServerInfo* ToolProviderClient::server_info() const {
    if (!session_ || !session_->is_initialized()) return nullptr;
    return &session_->server_info();
}

void ToolProviderClient::start_stderr_pump() {
    int fd = process_->stderr_fd();
    if (fd < 0) return;
    stop_stderr_.store(false);
    stderr_thread_ = std::thread([this, fd]() {
        LineReader reader(fd);
        std::string line;
        while (!stop_stderr_.load()) {
            ReadStatus status = reader.read_line(line, monotonic_millis() + 100);
            if (status == ReadStatus::Closed) break;
            if (status == ReadStatus::Line && !trim(line).empty()) {
                std::cerr << "[" << config_.name << "] " << line << "\n";
            }
        }
    });
}

void ToolProviderClient::stop_stderr_pump() noexcept {
    stop_stderr_.store(true);
    if (stderr_thread_.joinable()) stderr_thread_.join();
}

void ToolProviderClient::abandon(const ToolRelayError& error) {
    mark_failed(error);
    dispose();
}

void ToolProviderClient::dispose() noexcept {
    if (released_) return;
    released_ = true;

    if (session_) session_->close();
    stop_stderr_pump();
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_) process_->terminate(options_.terminate_grace);
    }

    auto s = state_.load();
    while (s != ProviderConnectionState::Failed && s != ProviderConnectionState::Disposed) {
        if (state_.compare_exchange_weak(s, ProviderConnectionState::Disposed)) break;
    }
}

} // namespace toolrelay
