#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Subprocess execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

using Argv = std::vector<std::string>;
using EnvMap = std::map<std::string, std::string>;

// Launcher configuration. Built once in main and passed by const reference
// to every component; nothing below main reads process-wide settings.
struct LauncherConfig {
    std::string wprsc_path = "wprsc";
    std::vector<std::string> wprsc_args;
    bool title_prefix = true;
    bool wayland_debug = false;
    std::string backtrace = "1";

    std::vector<std::string> ssh_args;          // extra args for the master connection
    bool pulseaudio_forwarding = true;
    std::string pulse_socket;                   // "" = $XDG_RUNTIME_DIR/pulse/native
    bool forward_agent = true;

    std::string remote_runtime_dir;             // "" = ask the remote host
    std::string remote_socket_name = "wprs.sock";
    std::string remote_control_socket_name = "wprs-control.sock";

    std::string wayland_display = "wprs-0";
    std::string x_display = ":100";
    int cursor_size = 0;                        // 0 = probe
    EnvMap env;                                 // extra remote variables

    // Host-derived; filled by resolve_local_settings() when left empty
    std::string runtime_dir;
    std::string local_hostname;
    std::string local_agent_socket;             // "" = no local agent
};

// What the companion session supports. Absent entirely when the control
// channel answered with a null payload.
struct CapabilityDescriptor {
    bool xwayland = false;

    bool operator==(const CapabilityDescriptor& o) const { return xwayland == o.xwayland; }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
