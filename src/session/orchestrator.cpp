#include "orchestrator.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace {

const std::string& require_runtime_dir(const LauncherConfig& config) {
    if (config.runtime_dir.empty()) {
        throw ConfigurationError("No local runtime directory configured");
    }
    return config.runtime_dir;
}

} // namespace

SessionOrchestrator::SessionOrchestrator(const LauncherConfig& config,
                                         std::string destination,
                                         const std::string& identity,
                                         CommandRunner& runner,
                                         ProcessTable& processes,
                                         ControlTransport& control,
                                         StatusCallback status,
                                         StatusCallback warn,
                                         SleepFn sleep)
    : config_(config),
      destination_(std::move(destination)),
      identity_(identity),
      runtime_dir_(require_runtime_dir(config)),
      paths_(SessionPaths::for_identity(runtime_dir_, identity)),
      status_(std::move(status)),
      warn_(std::move(warn)),
      transport_(config, runner, paths_),
      supervisor_(processes, paths_.pid_file),
      reconciler_(supervisor_),
      control_(control, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, std::move(sleep)) {}

void SessionOrchestrator::report(const std::string& msg) const {
    wprs_log(msg);
    if (status_) status_(msg);
}

void SessionOrchestrator::warn(const std::string& msg) const {
    wprs_log("warning: " + msg);
    if (warn_) warn_(msg);
}

// ── attach ────────────────────────────────────────────────

std::optional<CapabilityDescriptor> SessionOrchestrator::attach() {
    ensure_transport();
    resolve_remote_runtime_dir();
    forward_with_recovery(plan_forwards());
    link_agent_socket();

    bool restarted = reconciler_.reconcile(companion_command(), companion_environment());
    report(restarted ? "Started wprsc" : "wprsc already running");

    // wprsc's own control socket, not the forwarded server one
    auto caps = control_.query_capabilities(paths_.control_socket.string());
    wprs_log(caps ? fmt::format("capabilities: xwayland={}", caps->xwayland)
                  : std::string("capabilities: none"));
    return caps;
}

void SessionOrchestrator::ensure_transport() {
    if (transport_.is_alive(destination_)) return;
    report(fmt::format("Connecting to {}", destination_));
    transport_.start(destination_);
}

void SessionOrchestrator::resolve_remote_runtime_dir() {
    if (!config_.remote_runtime_dir.empty()) {
        remote_.runtime_dir = config_.remote_runtime_dir;
        return;
    }

    auto r = transport_.run_remote(destination_, "printf '%s' \"$XDG_RUNTIME_DIR\"");
    std::string dir = r.stdout_data;
    trim(dir);
    if (r.failed() || dir.empty()) {
        throw RemoteSetupError(fmt::format(
            "Cannot determine XDG_RUNTIME_DIR on {}; set remote_runtime_dir in the config",
            destination_));
    }
    remote_.runtime_dir = dir;
}

std::vector<SocketForward> SessionOrchestrator::plan_forwards() {
    namespace fs = std::filesystem;
    const fs::path remote_dir(remote_.runtime_dir);

    std::vector<SocketForward> forwards = {
        {SocketForward::Direction::LocalToRemote, paths_.data_socket.string(),
         (remote_dir / config_.remote_socket_name).string()},
        {SocketForward::Direction::LocalToRemote, paths_.server_control_socket.string(),
         (remote_dir / config_.remote_control_socket_name).string()},
    };

    remote_.pulse_socket.reset();
    if (config_.pulseaudio_forwarding) {
        std::string local = local_pulse_socket(config_, runtime_dir_);
        if (fs::exists(local)) {
            std::string remote = (remote_dir / (REMOTE_PULSE_PREFIX + identity_)).string();
            forwards.push_back({SocketForward::Direction::RemoteToLocal, remote, local});
            remote_.pulse_socket = remote;
        } else {
            warn(fmt::format("No PulseAudio socket at {}; audio will not be forwarded", local));
        }
    }
    return forwards;
}

void SessionOrchestrator::forward_with_recovery(const std::vector<SocketForward>& forwards) {
    if (transport_.forward(destination_, forwards)) return;

    // A reused master sometimes refuses new forwards; one fresh connection
    // is the only recovery attempted.
    report("Forwarding failed, restarting ssh connection");
    transport_.stop(destination_);
    transport_.start(destination_);
    if (!transport_.forward(destination_, forwards)) {
        throw TransportError(fmt::format("Failed to forward session sockets to {}", destination_));
    }
}

void SessionOrchestrator::link_agent_socket() {
    remote_.agent_socket.reset();
    if (!config_.forward_agent) return;
    if (config_.local_agent_socket.empty()) {
        wprs_log("agent: no local agent socket, skipping remote link");
        return;
    }

    std::string link = (std::filesystem::path(remote_.runtime_dir) /
                        (REMOTE_AGENT_PREFIX + identity_)).string();
    auto r = transport_.run_remote(destination_, fmt::format(
        "test -n \"$SSH_AUTH_SOCK\" && ln -sfn \"$SSH_AUTH_SOCK\" {}", shell_quote(link)));
    if (r.failed()) {
        std::string detail = r.stderr_data;
        trim(detail);
        throw RemoteSetupError(fmt::format("Failed to link agent socket at {} on {}{}",
                                           link, destination_,
                                           detail.empty() ? "" : ": " + detail));
    }
    remote_.agent_socket = link;
}

// ── detach ────────────────────────────────────────────────

void SessionOrchestrator::detach() {
    supervisor_.stop();
    transport_.stop(destination_);
    report(fmt::format("Detached from {}", destination_));
}

// ── run ───────────────────────────────────────────────────

int SessionOrchestrator::run_remote_command(const Argv& command, const EnvMap& extra_env) {
    auto caps = attach();
    auto env = build_remote_environment(config_, caps, remote_, extra_env,
                                        [this](const std::string& msg) { warn(msg); });
    return transport_.exec_remote(destination_, remote_command_line(env, command));
}

// ── desired invocation ────────────────────────────────────

Argv SessionOrchestrator::companion_command() const {
    Argv cmd = {config_.wprsc_path};
    cmd.insert(cmd.end(), config_.wprsc_args.begin(), config_.wprsc_args.end());
    if (config_.title_prefix) {
        cmd.push_back(fmt::format("--title-prefix=[{}] ", destination_));
    }
    cmd.push_back("--socket=" + paths_.data_socket.string());
    cmd.push_back("--control-socket=" + paths_.control_socket.string());
    return cmd;
}

EnvMap SessionOrchestrator::companion_environment() const {
    return {
        {ENV_WAYLAND_DEBUG, config_.wayland_debug ? "1" : "0"},
        {ENV_RUST_BACKTRACE, config_.backtrace},
    };
}
