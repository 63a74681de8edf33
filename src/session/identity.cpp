#include "identity.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <sstream>
#include <fmt/format.h>

ResolvedDestination parse_ssh_config(const std::string& ssh_g_output) {
    ResolvedDestination out;
    bool seen_host = false, seen_port = false, seen_user = false, seen_jump = false;

    std::istringstream in(ssh_g_output);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        auto space = line.find(' ');
        if (space == std::string::npos) continue;

        std::string key = line.substr(0, space);
        std::string value = line.substr(space + 1);
        trim(value);

        // ssh -G prints each option once; keep the first if it ever repeats
        if (key == "hostname" && !seen_host) {
            out.host = value;
            seen_host = true;
        } else if (key == "port" && !seen_port) {
            out.port = value;
            seen_port = true;
        } else if (key == "user" && !seen_user) {
            out.user = value;
            seen_user = true;
        } else if (key == "proxyjump" && !seen_jump) {
            out.proxy_jump = value;
            seen_jump = true;
        }
    }
    return out;
}

SessionPaths SessionPaths::for_identity(const fs::path& runtime_dir, const std::string& identity) {
    SessionPaths p;
    p.data_socket = runtime_dir / fmt::format("{}{}.sock", SOCKET_PREFIX, identity);
    p.control_socket = runtime_dir / fmt::format("{}{}-control.sock", SOCKET_PREFIX, identity);
    p.server_control_socket =
        runtime_dir / fmt::format("{}{}-server-control.sock", SOCKET_PREFIX, identity);
    p.pid_file = runtime_dir / fmt::format("{}{}.pid", PID_FILE_PREFIX, identity);
    p.companion_log = runtime_dir / fmt::format("{}{}.log", PID_FILE_PREFIX, identity);
    p.ssh_control_dir = runtime_dir / SSH_CONTROL_DIR;
    p.ssh_control_path = p.ssh_control_dir / identity;
    return p;
}

IdentityDeriver::IdentityDeriver(const LauncherConfig& config, CommandRunner& runner)
    : config_(config), runner_(runner) {}

ResolvedDestination IdentityDeriver::resolve(const std::string& destination) {
    Argv argv = {SSH_BINARY, "-G"};
    argv.insert(argv.end(), config_.ssh_args.begin(), config_.ssh_args.end());
    argv.push_back(destination);

    auto r = runner_.run(argv);
    wprs_log_cmd("resolve", argv, r);
    if (r.failed()) {
        std::string detail = r.stderr_data;
        trim(detail);
        throw ConfigurationError(fmt::format(
            "Cannot resolve ssh parameters for '{}' (exit {}){}", destination, r.exit_code,
            detail.empty() ? "" : ": " + detail));
    }
    return parse_ssh_config(r.stdout_data);
}

std::string IdentityDeriver::derive(const std::string& destination) {
    if (config_.local_hostname.empty()) {
        throw ConfigurationError("Local hostname is unknown; cannot derive a session identity");
    }
    std::string id = digest(config_.local_hostname, resolve(destination));
    wprs_log(fmt::format("identity {} -> {}", destination, id));
    return id;
}

std::string IdentityDeriver::digest(const std::string& local_hostname,
                                    const ResolvedDestination& resolved) {
    return sha256_hex(local_hostname + resolved.host + resolved.port +
                      resolved.user + resolved.proxy_jump);
}
