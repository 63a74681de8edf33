#include "transport.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <system_error>
#include <unistd.h>
#include <fmt/format.h>

Argv SocketForward::to_args() const {
    return {direction == Direction::LocalToRemote ? "-L" : "-R", listen + ":" + target};
}

TransportController::TransportController(const LauncherConfig& config, CommandRunner& runner,
                                         const SessionPaths& paths)
    : config_(config), runner_(runner), paths_(paths) {}

Argv TransportController::base_args() const {
    return {SSH_BINARY, "-S", paths_.ssh_control_path.string()};
}

bool TransportController::is_alive(const std::string& destination) {
    Argv argv = base_args();
    argv.insert(argv.end(), {"-O", "check", destination});
    auto r = runner_.run(argv);
    wprs_log_cmd("check", argv, r);
    return r.success();
}

void TransportController::start(const std::string& destination) {
    if (!platform::ensure_private_dir(paths_.ssh_control_dir)) {
        throw TransportError(fmt::format("Cannot create control directory {}",
                                         paths_.ssh_control_dir.string()));
    }

    Argv argv = base_args();
    argv.insert(argv.end(), {"-M", "-N", "-f",
                             "-o", "ControlPersist=yes",
                             "-o", SSH_OPT_STREAM_UNLINK});
    if (config_.forward_agent) argv.push_back("-A");
    argv.insert(argv.end(), config_.ssh_args.begin(), config_.ssh_args.end());
    argv.push_back(destination);

    // Attached: ssh may prompt for passwords or host keys, and -f detaches
    // the master while it still holds whatever stdio we give it.
    wprs_log(fmt::format("start CMD: {}", join_words(argv)));
    int rc = runner_.run_attached(argv);
    wprs_log(fmt::format("start exit={}", rc));
    if (rc != 0) {
        throw TransportError(fmt::format("Failed to start ssh connection to {} (exit {})",
                                         destination, rc));
    }
}

void TransportController::stop(const std::string& destination) {
    Argv argv = base_args();
    argv.insert(argv.end(), {"-O", "exit", destination});
    auto r = runner_.run(argv);
    wprs_log_cmd("exit", argv, r);

    // Listeners ssh created for -L forwards; wprsc owns control_socket
    for (const auto& sock : {paths_.data_socket, paths_.server_control_socket}) {
        std::error_code ec;
        fs::remove(sock, ec);
        if (ec) wprs_log(fmt::format("remove {}: {}", sock.string(), ec.message()));
    }
}

bool TransportController::forward(const std::string& destination,
                                  const std::vector<SocketForward>& forwards) {
    Argv argv = base_args();
    argv.insert(argv.end(), {"-O", "forward"});
    for (const auto& f : forwards) {
        auto args = f.to_args();
        argv.insert(argv.end(), args.begin(), args.end());
    }
    argv.push_back(destination);

    auto r = runner_.run(argv);
    wprs_log_cmd("forward", argv, r);
    return r.success();
}

CommandResult TransportController::run_remote(const std::string& destination,
                                              const std::string& command) {
    Argv argv = base_args();
    if (config_.forward_agent) argv.push_back("-A");
    argv.insert(argv.end(), {"-T", destination, command});
    auto r = runner_.run(argv);
    wprs_log_cmd("remote", argv, r);
    return r;
}

int TransportController::exec_remote(const std::string& destination,
                                     const std::string& command) {
    Argv argv = base_args();
    if (config_.forward_agent) argv.push_back("-A");
    argv.push_back(isatty(STDIN_FILENO) ? "-t" : "-T");
    argv.insert(argv.end(), {destination, command});

    wprs_log(fmt::format("exec CMD: {}", join_words(argv)));
    int rc = runner_.run_attached(argv);
    wprs_log(fmt::format("exec exit={}", rc));
    return rc;
}
