#pragma once

#include <functional>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>

// One request/response exchange over a control socket.
class ControlTransport {
public:
    virtual ~ControlTransport() = default;

    // Send `command` + '\n', return the response line without its newline.
    // Throws ConnectionError when the socket cannot be reached and
    // ProtocolError when the exchange breaks off.
    virtual std::string request(const std::string& socket_path, const std::string& command) = 0;
};

// AF_UNIX stream socket, one connection per request.
class UnixControlTransport : public ControlTransport {
public:
    std::string request(const std::string& socket_path, const std::string& command) override;
};

// Decoded response line: {"status": "Ok" | <error tag>, "payload": "<string>"}
struct ControlResponse {
    std::string status;
    std::string payload;

    bool ok() const { return status == CONTROL_STATUS_OK; }

    // Throws ProtocolError if the line is not a well-formed response.
    static ControlResponse parse(const std::string& line);

    // Payload of an ok response; ProtocolError carrying the payload otherwise.
    const std::string& unwrap() const;
};

// Payload of an ok "caps" response. JSON null means nothing is known and
// yields nullopt. Throws ProtocolError on anything that is not an object or null.
std::optional<CapabilityDescriptor> parse_capabilities(const std::string& payload);

using SleepFn = std::function<void(int ms)>;

class ControlClient {
public:
    // max_retries counts attempts after the first one.
    ControlClient(ControlTransport& transport,
                  int max_retries = CONTROL_MAX_RETRIES,
                  int retry_delay_ms = CONTROL_RETRY_DELAY_MS,
                  SleepFn sleep = nullptr);

    // Send a command, retrying while the socket is not listening yet, and
    // return the unwrapped payload.
    std::string send_command(const std::string& socket_path, const std::string& command);

    std::optional<CapabilityDescriptor> query_capabilities(const std::string& socket_path);

private:
    ControlTransport& transport_;
    int max_retries_;
    int retry_delay_ms_;
    SleepFn sleep_;
};
