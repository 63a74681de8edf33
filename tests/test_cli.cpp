#include <gtest/gtest.h>
#include <cli/launcher_cli.hpp>

TEST(CliArgs, Attach) {
    auto r = parse_args({"devbox", "attach"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.destination, "devbox");
    EXPECT_EQ(r.value.subcommand, Subcommand::Attach);
}

TEST(CliArgs, DetachWithOptions) {
    auto r = parse_args({"--config", "/tmp/l.yaml", "--no-pulseaudio", "alice@host", "detach"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.config_path, "/tmp/l.yaml");
    EXPECT_TRUE(r.value.no_pulseaudio);
    EXPECT_EQ(r.value.subcommand, Subcommand::Detach);
}

TEST(CliArgs, RunKeepsCommandFlags) {
    // Flags after `run` belong to the remote program
    auto r = parse_args({"devbox", "run", "foot", "--title", "x"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.subcommand, Subcommand::Run);
    EXPECT_EQ(r.value.command, (Argv{"foot", "--title", "x"}));
}

TEST(CliArgs, RunWithoutCommand) {
    EXPECT_TRUE(parse_args({"devbox", "run"}).is_err());
}

TEST(CliArgs, RepeatableOptions) {
    auto r = parse_args({"--wprsc-arg", "-v", "--wprsc-arg=--x", "--ssh-arg", "-4",
                         "--env", "GDK_SCALE=2", "--env=EMPTY=", "h", "attach"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wprsc_args, (std::vector<std::string>{"-v", "--x"}));
    EXPECT_EQ(r.value.ssh_args, (std::vector<std::string>{"-4"}));
    EXPECT_EQ(r.value.env.at("GDK_SCALE"), "2");
    EXPECT_EQ(r.value.env.at("EMPTY"), "");
}

TEST(CliArgs, UsageErrors) {
    EXPECT_TRUE(parse_args({}).is_err());
    EXPECT_TRUE(parse_args({"devbox"}).is_err());
    EXPECT_TRUE(parse_args({"devbox", "bogus"}).is_err());
    EXPECT_TRUE(parse_args({"--frobnicate", "devbox", "attach"}).is_err());
    EXPECT_TRUE(parse_args({"--config"}).is_err());
    EXPECT_TRUE(parse_args({"--env", "NOEQUALS", "devbox", "attach"}).is_err());
    EXPECT_TRUE(parse_args({"devbox", "attach", "extra"}).is_err());
}

TEST(CliArgs, HelpAndVersionStandAlone) {
    auto help = parse_args({"--help"});
    ASSERT_TRUE(help.is_ok());
    EXPECT_TRUE(help.value.help);

    auto version = parse_args({"--version"});
    ASSERT_TRUE(version.is_ok());
    EXPECT_TRUE(version.value.version);
}

TEST(CliArgs, ApplyOptionsOverridesConfig) {
    LauncherConfig config;
    config.wprsc_args = {"--from-config"};
    config.env = {{"A", "config"}, {"B", "config"}};

    auto r = parse_args({"--wprsc", "/opt/wprsc", "--wprsc-arg", "--cli", "--env", "A=cli",
                         "--wayland-debug", "--no-title-prefix", "--no-pulseaudio",
                         "h", "attach"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    apply_options(r.value, config);

    EXPECT_EQ(config.wprsc_path, "/opt/wprsc");
    EXPECT_EQ(config.wprsc_args, (std::vector<std::string>{"--from-config", "--cli"}));
    EXPECT_EQ(config.env.at("A"), "cli");
    EXPECT_EQ(config.env.at("B"), "config");
    EXPECT_TRUE(config.wayland_debug);
    EXPECT_FALSE(config.title_prefix);
    EXPECT_FALSE(config.pulseaudio_forwarding);
}

TEST(CliArgs, UnsetFlagsLeaveConfigAlone) {
    LauncherConfig config;
    config.wayland_debug = true;
    config.wprsc_path = "/custom/wprsc";

    auto r = parse_args({"h", "attach"});
    ASSERT_TRUE(r.is_ok());
    apply_options(r.value, config);

    EXPECT_TRUE(config.wayland_debug);
    EXPECT_EQ(config.wprsc_path, "/custom/wprsc");
    EXPECT_TRUE(config.pulseaudio_forwarding);
}
