#include <iostream>
#include <vector>
#include <string>
#include "cli/launcher_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>

static const char* WPRS_VERSION = "0.4.0";

void print_usage(std::ostream& out) {
    out << theme::section("Usage");
    out << theme::color::BLUE << "    wprs [options] <destination> attach"
        << theme::color::RESET << theme::color::DIM
        << "          Start or reuse the session" << theme::color::RESET << "\n";
    out << theme::color::BLUE << "    wprs [options] <destination> detach"
        << theme::color::RESET << theme::color::DIM
        << "          Stop wprsc and the ssh connection" << theme::color::RESET << "\n";
    out << theme::color::BLUE << "    wprs [options] <destination> run "
        << theme::color::RESET << theme::color::YELLOW << "<cmd...>"
        << theme::color::RESET << theme::color::DIM
        << "  Run a remote program in the session" << theme::color::RESET << "\n";
    out << theme::section("Options");
    out << theme::color::DIM
        << "    --config PATH          Config file (default ~/.config/wprs/launcher.yaml)\n"
        << "    --wprsc PATH           wprsc executable\n"
        << "    --wprsc-arg ARG        Extra wprsc argument (repeatable)\n"
        << "    --ssh-arg ARG          Extra ssh argument (repeatable)\n"
        << "    --env KEY=VALUE        Extra remote environment variable (repeatable)\n"
        << "    --wayland-debug        Run wprsc with WAYLAND_DEBUG=1\n"
        << "    --no-pulseaudio        Do not forward audio\n"
        << "    --no-title-prefix      Do not prefix window titles with the destination\n"
        << "    --version              Show version\n"
        << "    --help                 Show this help"
        << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        print_usage(std::cerr);
        return 2;
    }
    CliOptions opts = parsed.value;

    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }
    if (opts.version) {
        std::cout << theme::color::BOLD << "wprs" << theme::color::RESET
                  << theme::color::DIM << " version " << WPRS_VERSION
                  << theme::color::RESET << "\n";
        return 0;
    }

    try {
        bool explicit_config = !opts.config_path.empty();
        auto loaded = load_config(explicit_config ? fs::path(opts.config_path) : get_config_path(),
                                  explicit_config);
        if (loaded.is_err()) {
            throw ConfigurationError(loaded.error);
        }
        LauncherConfig config = loaded.value;
        apply_options(opts, config);
        resolve_local_settings(config);

        LauncherCLI cli(config);
        switch (opts.subcommand) {
            case Subcommand::Attach: return cli.run_attach(opts.destination);
            case Subcommand::Detach: return cli.run_detach(opts.destination);
            case Subcommand::Run:    return cli.run_command(opts.destination, opts.command);
            case Subcommand::None:   break;
        }
        print_usage(std::cerr);
        return 2;
    } catch (const WprsError& e) {
        wprs_log(std::string(e.kind()) + ": " + e.what());
        std::cerr << theme::fail(e.what());
        return 1;
    } catch (const std::exception& e) {
        wprs_log(std::string("error: ") + e.what());
        std::cerr << theme::fail(e.what());
        return 1;
    }
}
