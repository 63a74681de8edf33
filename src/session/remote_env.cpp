#include "remote_env.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fmt/format.h>

std::string local_pulse_socket(const LauncherConfig& config, const std::string& runtime_dir) {
    if (!config.pulse_socket.empty()) return config.pulse_socket;
    return (std::filesystem::path(runtime_dir) / "pulse" / "native").string();
}

EnvList build_remote_environment(const LauncherConfig& config,
                                 const std::optional<CapabilityDescriptor>& caps,
                                 const RemoteSession& remote,
                                 const EnvMap& extra_env,
                                 const StatusCallback& warn) {
    EnvList env;
    env.emplace_back("WAYLAND_DISPLAY", config.wayland_display);

    if (caps && caps->xwayland) {
        env.emplace_back("DISPLAY", config.x_display);
    } else if (warn) {
        warn(caps ? "Remote session has no xwayland support; DISPLAY not set"
                  : "Remote session reported no capabilities; DISPLAY not set");
    }

    if (remote.pulse_socket) {
        env.emplace_back("PULSE_SERVER", "unix:" + *remote.pulse_socket);
    }
    if (remote.agent_socket) {
        env.emplace_back("SSH_AUTH_SOCK", *remote.agent_socket);
    }
    env.emplace_back("XDG_SESSION_TYPE", "wayland");
    int cursor = config.cursor_size > 0 ? config.cursor_size : DEFAULT_CURSOR_SIZE;
    env.emplace_back("XCURSOR_SIZE", std::to_string(cursor));

    for (const auto& [k, v] : extra_env) {
        env.emplace_back(k, v);
    }
    return env;
}

std::string remote_command_line(const EnvList& env, const Argv& command) {
    Argv words = {"env"};
    for (const auto& [k, v] : env) words.push_back(k + "=" + v);
    words.insert(words.end(), command.begin(), command.end());
    return shell_join(words);
}
