#include "launcher_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <memory>
#include <core/log.hpp>
#include <session/command_runner.hpp>
#include <session/control_client.hpp>
#include <session/identity.hpp>
#include <session/orchestrator.hpp>
#include <session/process_table.hpp>
#include <fmt/format.h>

// ── Argument parsing ──────────────────────────────────────

namespace {

// Accepts "--name VALUE" and "--name=VALUE". Returns false if `arg` is not
// this option; sets `error` if it is but the value is missing.
bool take_value(const std::string& name, const std::vector<std::string>& args,
                size_t& i, std::string& value, std::string& error) {
    const std::string& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size()) {
            error = fmt::format("option {} requires a value", name);
            return true;
        }
        value = args[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

} // namespace

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    size_t i = 0;

    for (; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--") { i++; break; }
        if (arg.empty() || arg[0] != '-') break;

        std::string value, error;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "--wayland-debug") {
            opts.wayland_debug = true;
        } else if (arg == "--no-pulseaudio") {
            opts.no_pulseaudio = true;
        } else if (arg == "--no-title-prefix") {
            opts.no_title_prefix = true;
        } else if (take_value("--config", args, i, value, error)) {
            if (!error.empty()) return Result<CliOptions>::Err(error);
            opts.config_path = value;
        } else if (take_value("--wprsc", args, i, value, error)) {
            if (!error.empty()) return Result<CliOptions>::Err(error);
            opts.wprsc_path = value;
        } else if (take_value("--wprsc-arg", args, i, value, error)) {
            if (!error.empty()) return Result<CliOptions>::Err(error);
            opts.wprsc_args.push_back(value);
        } else if (take_value("--ssh-arg", args, i, value, error)) {
            if (!error.empty()) return Result<CliOptions>::Err(error);
            opts.ssh_args.push_back(value);
        } else if (take_value("--env", args, i, value, error)) {
            if (!error.empty()) return Result<CliOptions>::Err(error);
            auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                return Result<CliOptions>::Err("--env expects KEY=VALUE, got '" + value + "'");
            }
            opts.env[value.substr(0, eq)] = value.substr(eq + 1);
        } else {
            return Result<CliOptions>::Err("unknown option " + arg);
        }
    }

    // --help / --version need nothing else
    if (opts.help || opts.version) return Result<CliOptions>::Ok(opts);

    if (i >= args.size()) return Result<CliOptions>::Err("missing destination");
    opts.destination = args[i++];

    if (i >= args.size()) return Result<CliOptions>::Err("missing subcommand");
    const std::string& sub = args[i++];
    if (sub == "attach") {
        opts.subcommand = Subcommand::Attach;
    } else if (sub == "detach") {
        opts.subcommand = Subcommand::Detach;
    } else if (sub == "run") {
        opts.subcommand = Subcommand::Run;
        opts.command.assign(args.begin() + i, args.end());
        if (opts.command.empty()) return Result<CliOptions>::Err("run: missing command");
        return Result<CliOptions>::Ok(opts);
    } else {
        return Result<CliOptions>::Err("unknown subcommand " + sub);
    }

    if (i < args.size()) {
        return Result<CliOptions>::Err("unexpected argument " + args[i]);
    }
    return Result<CliOptions>::Ok(opts);
}

void apply_options(const CliOptions& opts, LauncherConfig& config) {
    if (opts.wprsc_path) config.wprsc_path = *opts.wprsc_path;
    config.wprsc_args.insert(config.wprsc_args.end(),
                             opts.wprsc_args.begin(), opts.wprsc_args.end());
    config.ssh_args.insert(config.ssh_args.end(), opts.ssh_args.begin(), opts.ssh_args.end());
    for (const auto& [k, v] : opts.env) config.env[k] = v;
    if (opts.wayland_debug) config.wayland_debug = true;
    if (opts.no_pulseaudio) config.pulseaudio_forwarding = false;
    if (opts.no_title_prefix) config.title_prefix = false;
}

// ── Session commands ──────────────────────────────────────

namespace {

void print_status(const std::string& msg) { std::cout << theme::step(msg) << std::flush; }
void print_warning(const std::string& msg) { std::cerr << theme::warn(msg) << std::flush; }

// Everything one session command needs, wired to the real system.
struct SessionContext {
    SystemCommandRunner runner;
    UnixControlTransport control;
    std::string identity;
    std::unique_ptr<LocalProcessTable> processes;
    std::unique_ptr<SessionOrchestrator> orchestrator;

    SessionContext(const LauncherConfig& config, const std::string& destination) {
        IdentityDeriver deriver(config, runner);
        identity = deriver.derive(destination);

        auto paths = SessionPaths::for_identity(config.runtime_dir, identity);

        processes = std::make_unique<LocalProcessTable>(paths.companion_log.string());
        orchestrator = std::make_unique<SessionOrchestrator>(
            config, destination, identity, runner, *processes, control,
            print_status, print_warning);
    }
};

} // namespace

LauncherCLI::LauncherCLI(const LauncherConfig& config) : config_(config) {}

int LauncherCLI::run_attach(const std::string& destination) {
    SessionContext ctx(config_, destination);
    auto caps = ctx.orchestrator->attach();

    std::cout << theme::ok(fmt::format("Attached to {}", destination));
    std::cout << theme::kv("identity", ctx.identity);
    std::cout << theme::kv("socket", ctx.orchestrator->paths().data_socket.string());
    std::cout << theme::kv("xwayland", caps ? (caps->xwayland ? "yes" : "no") : "unknown");
    return 0;
}

int LauncherCLI::run_detach(const std::string& destination) {
    SessionContext ctx(config_, destination);
    ctx.orchestrator->detach();
    return 0;
}

int LauncherCLI::run_command(const std::string& destination, const Argv& command) {
    SessionContext ctx(config_, destination);
    int status = ctx.orchestrator->run_remote_command(command, config_.env);
    wprs_log(fmt::format("run: remote command exited {}", status));
    return status;
}
