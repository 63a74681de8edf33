#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

// Ordered KEY=VALUE assignments for the remote command. Later entries win
// when `env` applies them, so user extras go last.
using EnvList = std::vector<std::pair<std::string, std::string>>;

// Remote-side facts gathered during attach.
struct RemoteSession {
    std::string runtime_dir;
    std::optional<std::string> pulse_socket;   // remote path ssh -R listens on
    std::optional<std::string> agent_socket;   // remote symlink to the forwarded agent
};

// config.pulse_socket, else <local runtime dir>/pulse/native.
std::string local_pulse_socket(const LauncherConfig& config, const std::string& runtime_dir);

// Environment for commands run in the remote session. DISPLAY is included
// only when caps report xwayland; otherwise `warn` is told why it is missing.
EnvList build_remote_environment(const LauncherConfig& config,
                                 const std::optional<CapabilityDescriptor>& caps,
                                 const RemoteSession& remote,
                                 const EnvMap& extra_env,
                                 const StatusCallback& warn);

// `env K=V ... cmd args...` as one shell-quoted string.
std::string remote_command_line(const EnvList& env, const Argv& command);
