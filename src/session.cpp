#include "session.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <unistd.h>

#ifndef TOOLRELAY_VERSION
#define TOOLRELAY_VERSION "0.0.0"
#endif

namespace toolrelay {

using json = nlohmann::json;

// Upper bound on how long one waiter holds the reader role before
// re-checking its own deadline and letting others in
static constexpr int64_t kReadSliceMs = 100;

// Guards against providers that hand out cursors forever
static constexpr int kMaxPages = 100;

ProtocolSession::ProtocolSession(int read_fd, int write_fd, SessionOptions options)
    : options_(std::move(options)), reader_(read_fd), write_fd_(write_fd) {
    if (write_fd_ >= 0 && !set_nonblocking(write_fd_)) {
        std::cerr << "[" << options_.label << "] Could not make the request pipe non-blocking\n";
    }
}

ProtocolSession::~ProtocolSession() {
    close();
    if (reader_.fd() >= 0) ::close(reader_.fd());
}

bool ProtocolSession::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ProtocolSession::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t ProtocolSession::abandoned_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return abandoned_.size();
}

void ProtocolSession::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = true;
            fail_all_locked(ToolRelayError(ErrorKind::ConnectionClosed, "Session closed"));
        }
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> wlock(write_mutex_);
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

bool ProtocolSession::send_frame(const json& frame, int64_t deadline_ms, bool* partial) {
    // Invalid UTF-8 from tool arguments must not abort the dump
    std::string line = frame.dump(-1, ' ', false, json::error_handler_t::replace);
    line += "\n";
    std::lock_guard<std::mutex> lock(write_mutex_);
    size_t written = 0;
    bool ok = write_all(write_fd_, line, deadline_ms, &written);
    if (partial) *partial = !ok && written > 0;
    return ok;
}

void ProtocolSession::fail_all_locked(const ToolRelayError& error) {
    for (auto& [id, call] : pending_) {
        call->error = error;
        call->done = true;
    }
    pending_.clear();
}

void ProtocolSession::release_ticket_locked() {
    ++serving_ticket_;
    while (cancelled_tickets_.erase(serving_ticket_) > 0) {
        ++serving_ticket_;
    }
    cv_.notify_all();
}

void ProtocolSession::handle_server_request_locked(const json& msg) {
    std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
    json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
    if (method == "ping") {
        reply["result"] = json::object();
    } else {
        std::cerr << "[" << options_.label << "] Unsupported server request: "
                  << method << "\n";
        reply["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};
    }
    if (!send_frame(reply, monotonic_millis() + 1000)) {
        std::cerr << "[" << options_.label << "] Failed to answer server request "
                  << method << "\n";
    }
}

static ToolRelayError remote_error(const json& err) {
    int code = err.contains("code") && err["code"].is_number_integer()
        ? err["code"].get<int>() : -32603;
    std::string message = err.contains("message") && err["message"].is_string()
        ? err["message"].get<std::string>() : "Unknown error";
    return ToolRelayError(code, message);
}

void ProtocolSession::dispatch_locked(const std::string& line) {
    if (trim(line).empty()) return;

    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::parse_error&) {
        fail_all_locked(ToolRelayError(ErrorKind::Malformed,
            "Malformed frame from " + options_.label + ": " + truncate(line, 200)));
        return;
    }
    if (!msg.is_object()) {
        fail_all_locked(ToolRelayError(ErrorKind::Malformed,
            "Frame from " + options_.label + " is not an object: " + truncate(line, 200)));
        return;
    }

    bool has_id = msg.contains("id") && !msg["id"].is_null();

    if (msg.contains("method")) {
        if (has_id) {
            handle_server_request_locked(msg);
        } else {
            std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
            std::cerr << "[" << options_.label << "] notification: " << method << "\n";
        }
        return;
    }

    if (!has_id) {
        // Error without an id: the provider could not parse something we sent
        if (msg.contains("error") && msg["error"].is_object()) {
            fail_all_locked(remote_error(msg["error"]));
        }
        return;
    }

    if (!msg["id"].is_number_integer()) {
        std::cerr << "[" << options_.label << "] Discarding response with foreign id "
                  << msg["id"].dump() << "\n";
        return;
    }

    int64_t id = msg["id"].get<int64_t>();
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        if (abandoned_.erase(id) > 0) {
            std::cerr << "[" << options_.label << "] Discarding late response for request "
                      << id << "\n";
        } else {
            std::cerr << "[" << options_.label << "] Discarding response with unknown id "
                      << id << "\n";
        }
        return;
    }

    auto call = it->second;
    pending_.erase(it);

    if (msg.contains("error") && msg["error"].is_object()) {
        call->error = remote_error(msg["error"]);
    } else if (msg.contains("result")) {
        call->result = msg["result"];
    } else {
        call->error = ToolRelayError(ErrorKind::Malformed,
            "Response to " + call->method + " has neither result nor error");
    }
    call->done = true;
}

json ProtocolSession::request(const std::string& method, const json& params,
                              std::chrono::milliseconds timeout) {
    const int64_t deadline = monotonic_millis() + timeout.count();
    std::unique_lock<std::mutex> lock(mutex_);

    bool holds_ticket = false;
    if (!options_.pipelined) {
        uint64_t ticket = next_ticket_++;
        while (serving_ticket_ != ticket && !closed_) {
            int64_t remaining = deadline - monotonic_millis();
            if (remaining <= 0) {
                cancelled_tickets_.insert(ticket);
                throw ToolRelayError(ErrorKind::Timeout,
                    method + " to " + options_.label + " timed out waiting for the session");
            }
            cv_.wait_for(lock, std::chrono::milliseconds(remaining));
        }
        holds_ticket = serving_ticket_ == ticket;
        if (!holds_ticket) cancelled_tickets_.insert(ticket);
    }

    // Hand the FIFO slot to the next caller however this request ends
    struct TicketRelease {
        ProtocolSession* self;
        std::unique_lock<std::mutex>& lock;
        bool active;
        ~TicketRelease() {
            if (!active) return;
            if (!lock.owns_lock()) lock.lock();
            self->release_ticket_locked();
        }
    } release{this, lock, holds_ticket};

    if (closed_) {
        throw ToolRelayError(ErrorKind::ConnectionClosed,
            "Session to " + options_.label + " is closed");
    }

    int64_t id = next_id_++;
    auto call = std::make_shared<PendingCall>();
    call->method = method;
    pending_[id] = call;

    json frame = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) frame["params"] = params;

    lock.unlock();
    bool partial = false;
    bool sent = send_frame(frame, deadline, &partial);
    lock.lock();

    if (!sent && !call->done) {
        pending_.erase(id);
        if (monotonic_millis() >= deadline) {
            if (partial) {
                // Half a frame is in the pipe; nothing after it can be parsed
                std::cerr << "[" << options_.label << "] Closing session after a partial write\n";
                closed_ = true;
                fail_all_locked(ToolRelayError(ErrorKind::ConnectionClosed,
                    "Connection to " + options_.label + " lost after a partial write"));
                cv_.notify_all();
            }
            throw ToolRelayError(ErrorKind::Timeout,
                method + " to " + options_.label + " timed out while sending");
        }
        closed_ = true;
        fail_all_locked(ToolRelayError(ErrorKind::ConnectionClosed,
            "Connection to " + options_.label + " lost"));
        cv_.notify_all();
        throw ToolRelayError(ErrorKind::ConnectionClosed,
            "Failed to send " + method + " to " + options_.label);
    }

    while (!call->done) {
        int64_t now = monotonic_millis();
        if (now >= deadline) {
            pending_.erase(id);
            abandoned_.insert(id);
            throw ToolRelayError(ErrorKind::Timeout,
                method + " to " + options_.label + " timed out after " +
                std::to_string(timeout.count()) + "ms");
        }

        if (reader_active_) {
            cv_.wait_for(lock, std::chrono::milliseconds(std::min(deadline - now, kReadSliceMs)));
            continue;
        }

        // Become the reader until one frame arrives or the slice ends
        reader_active_ = true;
        lock.unlock();
        std::string line;
        ReadStatus status = reader_.read_line(line, std::min(deadline, now + kReadSliceMs));
        lock.lock();
        reader_active_ = false;

        switch (status) {
            case ReadStatus::Line:
                dispatch_locked(line);
                break;
            case ReadStatus::Timeout:
                break;
            case ReadStatus::Closed:
                closed_ = true;
                fail_all_locked(ToolRelayError(ErrorKind::ConnectionClosed,
                    "Connection to " + options_.label + " closed"));
                break;
            case ReadStatus::Overflow:
                closed_ = true;
                fail_all_locked(ToolRelayError(ErrorKind::Malformed,
                    "Frame from " + options_.label + " exceeds size limit"));
                break;
        }
        cv_.notify_all();
    }

    if (call->error) throw *call->error;
    return call->result;
}

void ProtocolSession::notify(const std::string& method, const json& params) {
    json frame = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    if (!send_frame(frame, monotonic_millis() + options_.request_timeout.count())) {
        throw ToolRelayError(ErrorKind::ConnectionClosed,
            "Failed to send " + method + " to " + options_.label);
    }
}

const ServerInfo& ProtocolSession::initialize() {
    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "toolrelay"}, {"version", TOOLRELAY_VERSION}}}
    };

    json result;
    try {
        result = request("initialize", params, options_.handshake_timeout);
    } catch (const ToolRelayError& e) {
        if (e.kind() == ErrorKind::Timeout) {
            throw ToolRelayError(ErrorKind::HandshakeTimeout,
                options_.label + " did not complete the handshake within " +
                std::to_string(options_.handshake_timeout.count()) + "ms");
        }
        throw;
    }

    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result["protocolVersion"].is_string()) {
        throw ToolRelayError(ErrorKind::Malformed,
            "Invalid initialize result from " + options_.label + ": " +
            truncate(result.dump(), 200));
    }
    if (result.contains("capabilities") && !result["capabilities"].is_object()) {
        throw ToolRelayError(ErrorKind::Malformed,
            "Invalid capabilities from " + options_.label);
    }

    ServerInfo info;
    info.protocol_version = result["protocolVersion"].get<std::string>();
    if (result.contains("capabilities"))
        info.capabilities = result["capabilities"];
    info.has_tools = info.capabilities.contains("tools");
    info.has_resources = info.capabilities.contains("resources");
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        const auto& si = result["serverInfo"];
        if (si.contains("name") && si["name"].is_string())
            info.name = si["name"].get<std::string>();
        if (si.contains("version") && si["version"].is_string())
            info.version = si["version"].get<std::string>();
    }
    if (result.contains("instructions") && result["instructions"].is_string())
        info.instructions = result["instructions"].get<std::string>();

    notify("notifications/initialized");

    server_info_ = std::move(info);
    initialized_ = true;
    return server_info_;
}

void ProtocolSession::require_initialized(const char* op) const {
    if (!initialized_) {
        throw ToolRelayError(ErrorKind::NotConnected,
            std::string(op) + " before initialize on " + options_.label);
    }
}

std::vector<ToolDescriptor> ProtocolSession::list_tools(const std::string& provider) {
    require_initialized("tools/list");
    std::vector<ToolDescriptor> tools;
    std::string cursor;
    for (int page = 0; page < kMaxPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;
        json result = request("tools/list", params, options_.request_timeout);
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            throw ToolRelayError(ErrorKind::Malformed,
                "Invalid tools/list result from " + options_.label);
        }
        for (const auto& item : result["tools"]) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
                std::cerr << "[" << options_.label << "] Skipping tool without a name\n";
                continue;
            }
            tools.push_back(tool_descriptor_from_json(item, provider));
        }
        if (result.contains("nextCursor") && result["nextCursor"].is_string() &&
            !result["nextCursor"].get<std::string>().empty()) {
            cursor = result["nextCursor"].get<std::string>();
        } else {
            return tools;
        }
    }
    std::cerr << "[" << options_.label << "] tools/list exceeded " << kMaxPages
              << " pages, truncating\n";
    return tools;
}

std::vector<ResourceDescriptor> ProtocolSession::list_resources(const std::string& provider) {
    require_initialized("resources/list");
    std::vector<ResourceDescriptor> resources;
    if (!server_info_.has_resources) return resources;

    std::string cursor;
    for (int page = 0; page < kMaxPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;
        json result = request("resources/list", params, options_.request_timeout);
        if (!result.is_object() || !result.contains("resources") ||
            !result["resources"].is_array()) {
            throw ToolRelayError(ErrorKind::Malformed,
                "Invalid resources/list result from " + options_.label);
        }
        for (const auto& item : result["resources"]) {
            if (!item.is_object() || !item.contains("uri") || !item["uri"].is_string()) continue;
            resources.push_back(resource_descriptor_from_json(item, provider));
        }
        if (result.contains("nextCursor") && result["nextCursor"].is_string() &&
            !result["nextCursor"].get<std::string>().empty()) {
            cursor = result["nextCursor"].get<std::string>();
        } else {
            break;
        }
    }
    return resources;
}

ToolResult ProtocolSession::call_tool(const std::string& name, const json& arguments,
                                      std::chrono::milliseconds timeout) {
    require_initialized("tools/call");
    json params = {
        {"name", name},
        {"arguments", arguments.is_object() ? arguments : json::object()}
    };
    json result = request("tools/call", params, timeout);
    return tool_result_from_json(result);
}

} // namespace toolrelay
