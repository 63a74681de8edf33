#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "command_runner.hpp"
#include "identity.hpp"

// One socket forwarding carried by `ssh -O forward`.
struct SocketForward {
    enum class Direction { LocalToRemote, RemoteToLocal };

    Direction direction;
    std::string listen;   // path bound by ssh (local for -L, remote for -R)
    std::string target;   // path connected to on the other side

    // "-L" / "-R" followed by "listen:target"
    Argv to_args() const;
};

// Drives an OpenSSH master connection (ControlMaster) through its control
// socket. The master is the multiplexed transport every session socket and
// remote command rides on.
class TransportController {
public:
    TransportController(const LauncherConfig& config, CommandRunner& runner,
                        const SessionPaths& paths);

    // ssh -O check
    bool is_alive(const std::string& destination);

    // Start a persistent master with no remote command. Creates the control
    // directory owner-only first. Does not check whether one already runs.
    // Throws TransportError.
    void start(const std::string& destination);

    // ssh -O exit (best-effort), then remove the forwarded local sockets.
    void stop(const std::string& destination);

    // One ssh -O forward carrying every pair. False if ssh reported failure.
    bool forward(const std::string& destination, const std::vector<SocketForward>& forwards);

    // Run a shell command on the remote host over the master, output captured.
    CommandResult run_remote(const std::string& destination, const std::string& command);

    // Run a shell command on the remote host with our stdio attached.
    // Returns its exit status. Throws LaunchError if ssh cannot be started.
    int exec_remote(const std::string& destination, const std::string& command);

private:
    const LauncherConfig& config_;
    CommandRunner& runner_;
    SessionPaths paths_;

    Argv base_args() const;
};
