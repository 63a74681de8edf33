#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class Subcommand { None, Attach, Detach, Run };

// Parsed command line. Flags that were not given leave the config alone.
struct CliOptions {
    bool help = false;
    bool version = false;

    std::string config_path;                    // "" = default location
    std::optional<std::string> wprsc_path;
    std::vector<std::string> wprsc_args;
    std::vector<std::string> ssh_args;
    EnvMap env;
    bool wayland_debug = false;
    bool no_pulseaudio = false;
    bool no_title_prefix = false;

    std::string destination;
    Subcommand subcommand = Subcommand::None;
    Argv command;                               // run only
};

// Options come before the destination; everything after `run` belongs to
// the remote command. Err carries a one-line reason for the usage error.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Apply command-line flags over the loaded config (flags win).
void apply_options(const CliOptions& opts, LauncherConfig& config);

class LauncherCLI {
public:
    explicit LauncherCLI(const LauncherConfig& config);

    int run_attach(const std::string& destination);
    int run_detach(const std::string& destination);
    int run_command(const std::string& destination, const Argv& command);

private:
    const LauncherConfig& config_;
};
