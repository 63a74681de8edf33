#pragma once

#include <stdexcept>
#include <string>

// Base for every failure that aborts an attach/detach/run. what() is the
// one-line description shown to the user.
class WprsError : public std::runtime_error {
public:
    WprsError(const std::string& kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// Destination parameter resolution failed, or the config file is unusable.
class ConfigurationError : public WprsError {
public:
    explicit ConfigurationError(const std::string& msg)
        : WprsError("configuration", msg) {}
};

// Companion or remote process failed to start.
class LaunchError : public WprsError {
public:
    explicit LaunchError(const std::string& msg)
        : WprsError("launch", msg) {}
};

// Control channel answered with an error status or malformed data.
class ProtocolError : public WprsError {
public:
    explicit ProtocolError(const std::string& msg)
        : WprsError("protocol", msg) {}
};

// Control channel never became reachable. retryable() is true for the
// not-yet-listening cases (missing socket file, connection refused).
class ConnectionError : public WprsError {
public:
    explicit ConnectionError(const std::string& msg, bool retryable = true)
        : WprsError("connection", msg), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// Remote-side preparation failed.
class RemoteSetupError : public WprsError {
public:
    explicit RemoteSetupError(const std::string& msg)
        : WprsError("remote setup", msg) {}
};

// Master connection could not be started, checked or forwarded.
class TransportError : public WprsError {
public:
    explicit TransportError(const std::string& msg)
        : WprsError("transport", msg) {}
};
