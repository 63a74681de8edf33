#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "command_runner.hpp"
#include "control_client.hpp"
#include "identity.hpp"
#include "process_table.hpp"
#include "reconciler.hpp"
#include "remote_env.hpp"
#include "supervisor.hpp"
#include "transport.hpp"

// Composes transport, supervisor, reconciler and control client into the
// user-facing attach / detach / run operations for one destination.
class SessionOrchestrator {
public:
    SessionOrchestrator(const LauncherConfig& config,
                        std::string destination,
                        const std::string& identity,
                        CommandRunner& runner,
                        ProcessTable& processes,
                        ControlTransport& control,
                        StatusCallback status = nullptr,
                        StatusCallback warn = nullptr,
                        SleepFn sleep = nullptr);

    // Bring the session up (or confirm it is up) and return the companion's
    // capabilities; nullopt when it reports none.
    std::optional<CapabilityDescriptor> attach();

    // Stop the companion, then the master connection.
    void detach();

    // attach(), then run `command` remotely with the session environment
    // plus extra_env. Returns the remote exit status.
    int run_remote_command(const Argv& command, const EnvMap& extra_env);

    // Desired companion invocation for this destination.
    Argv companion_command() const;
    EnvMap companion_environment() const;

    const SessionPaths& paths() const { return paths_; }
    const RemoteSession& remote() const { return remote_; }

private:
    const LauncherConfig& config_;
    std::string destination_;
    std::string identity_;
    std::string runtime_dir_;
    SessionPaths paths_;
    StatusCallback status_;
    StatusCallback warn_;

    TransportController transport_;
    ProcessSupervisor supervisor_;
    SessionReconciler reconciler_;
    ControlClient control_;

    RemoteSession remote_;

    void report(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void ensure_transport();
    void resolve_remote_runtime_dir();
    std::vector<SocketForward> plan_forwards();
    void forward_with_recovery(const std::vector<SocketForward>& forwards);
    void link_agent_socket();
};
