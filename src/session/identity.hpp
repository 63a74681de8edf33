#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "command_runner.hpp"

namespace fs = std::filesystem;

// Connection parameters after ssh applied its config (aliases, Match
// blocks, defaults). Empty string for any field ssh did not report.
struct ResolvedDestination {
    std::string host;
    std::string port;
    std::string user;
    std::string proxy_jump;
};

// Parse `ssh -G` output ("key value" per line, lowercase keys).
ResolvedDestination parse_ssh_config(const std::string& ssh_g_output);

// Every session-scoped file, namespaced by the destination identity.
struct SessionPaths {
    fs::path data_socket;       // <runtime>/wprs-<id>.sock
    fs::path control_socket;    // <runtime>/wprs-<id>-control.sock, bound by wprsc
    fs::path server_control_socket;  // <runtime>/wprs-<id>-server-control.sock, ssh -L listener
    fs::path pid_file;          // <runtime>/wprsc-<id>.pid
    fs::path companion_log;     // <runtime>/wprsc-<id>.log
    fs::path ssh_control_dir;   // <runtime>/wprs-ssh (0700)
    fs::path ssh_control_path;  // <runtime>/wprs-ssh/<id>

    static SessionPaths for_identity(const fs::path& runtime_dir, const std::string& identity);
};

class IdentityDeriver {
public:
    IdentityDeriver(const LauncherConfig& config, CommandRunner& runner);

    // Ask ssh for the effective parameters. Read-only; nothing is sent to
    // the remote host. Throws ConfigurationError if ssh -G fails.
    ResolvedDestination resolve(const std::string& destination);

    // Hex SHA-256 over local hostname + resolved host, port, user, proxy jump.
    std::string derive(const std::string& destination);

    static std::string digest(const std::string& local_hostname,
                              const ResolvedDestination& resolved);

private:
    const LauncherConfig& config_;
    CommandRunner& runner_;
};
