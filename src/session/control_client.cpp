#include "control_client.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

using json = nlohmann::json;

// ── UnixControlTransport ──────────────────────────────────

namespace {

constexpr size_t MAX_RESPONSE_BYTES = 1 << 20;

// Closes the fd on every exit path.
struct SocketGuard {
    int fd;
    ~SocketGuard() { platform::close_socket(fd); }
};

} // namespace

std::string UnixControlTransport::request(const std::string& socket_path,
                                          const std::string& command) {
    int fd = platform::connect_unix(socket_path);
    if (fd < 0) {
        int err = errno;
        bool not_listening_yet = (err == ENOENT || err == ECONNREFUSED);
        throw ConnectionError(fmt::format("Cannot connect to {}: {}",
                                          socket_path, std::strerror(err)),
                              not_listening_yet);
    }
    SocketGuard guard{fd};

    if (!platform::write_all(fd, command + "\n")) {
        throw ProtocolError(fmt::format("Failed to send '{}' to {}: {}",
                                        command, socket_path, std::strerror(errno)));
    }

    auto line = platform::read_line(fd, MAX_RESPONSE_BYTES);
    if (line.is_err()) {
        throw ProtocolError(fmt::format("No response to '{}' from {}: {}",
                                        command, socket_path, line.error));
    }
    return line.value;
}

// ── ControlResponse ───────────────────────────────────────

ControlResponse ControlResponse::parse(const std::string& line) {
    json doc;
    try {
        doc = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ProtocolError(fmt::format("Malformed control response: {}", e.what()));
    }

    if (!doc.is_object() || !doc.contains("status") || !doc["status"].is_string()) {
        throw ProtocolError("Control response has no status: " + line);
    }
    if (!doc.contains("payload") || !doc["payload"].is_string()) {
        throw ProtocolError("Control response has no payload: " + line);
    }

    ControlResponse resp;
    resp.status = doc["status"].get<std::string>();
    resp.payload = doc["payload"].get<std::string>();
    return resp;
}

const std::string& ControlResponse::unwrap() const {
    if (!ok()) {
        throw ProtocolError(fmt::format("Control error ({}): {}", status, payload));
    }
    return payload;
}

std::optional<CapabilityDescriptor> parse_capabilities(const std::string& payload) {
    json doc;
    try {
        doc = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw ProtocolError(fmt::format("Malformed capabilities: {}", e.what()));
    }

    if (doc.is_null()) return std::nullopt;
    if (!doc.is_object()) {
        throw ProtocolError("Capabilities are not an object: " + payload);
    }

    CapabilityDescriptor caps;
    auto it = doc.find("xwayland");
    if (it != doc.end()) {
        if (!it->is_boolean()) {
            throw ProtocolError("Capability 'xwayland' is not a boolean: " + payload);
        }
        caps.xwayland = it->get<bool>();
    }
    return caps;
}

// ── ControlClient ─────────────────────────────────────────

ControlClient::ControlClient(ControlTransport& transport, int max_retries,
                             int retry_delay_ms, SleepFn sleep)
    : transport_(transport),
      max_retries_(max_retries),
      retry_delay_ms_(retry_delay_ms),
      sleep_(sleep ? std::move(sleep) : SleepFn(platform::sleep_ms)) {}

std::string ControlClient::send_command(const std::string& socket_path,
                                        const std::string& command) {
    for (int attempt = 0;; ++attempt) {
        try {
            std::string line = transport_.request(socket_path, command);
            wprs_log(fmt::format("control: '{}' -> {}", command, line.substr(0, CMD_LOG_TRUNCATE)));
            return ControlResponse::parse(line).unwrap();
        } catch (const ConnectionError& e) {
            if (!e.retryable() || attempt >= max_retries_) throw;
            wprs_log(fmt::format("control: attempt {} failed ({}), retrying in {}ms",
                                 attempt + 1, e.what(), retry_delay_ms_));
        }
        sleep_(retry_delay_ms_);
    }
}

std::optional<CapabilityDescriptor> ControlClient::query_capabilities(const std::string& socket_path) {
    return parse_capabilities(send_command(socket_path, CONTROL_CMD_CAPS));
}
