#include <gtest/gtest.h>
#include <session/remote_env.hpp>

static std::vector<std::string> keys(const EnvList& env) {
    std::vector<std::string> out;
    for (const auto& kv : env) out.push_back(kv.first);
    return out;
}

static std::string value_of(const EnvList& env, const std::string& key) {
    for (const auto& kv : env) {
        if (kv.first == key) return kv.second;
    }
    return "<unset>";
}

class RemoteEnvTest : public ::testing::Test {
protected:
    LauncherConfig config;
    RemoteSession remote;
    std::vector<std::string> warnings;
    StatusCallback warn = [this](const std::string& m) { warnings.push_back(m); };

    void SetUp() override {
        config.cursor_size = 32;
        remote.runtime_dir = "/run/user/1000";
    }
};

TEST_F(RemoteEnvTest, XwaylandSetsDisplay) {
    auto env = build_remote_environment(config, CapabilityDescriptor{true}, remote, {}, warn);
    EXPECT_EQ(value_of(env, "DISPLAY"), ":100");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(RemoteEnvTest, NoXwaylandOmitsDisplayWithWarning) {
    auto env = build_remote_environment(config, CapabilityDescriptor{false}, remote, {}, warn);
    EXPECT_EQ(value_of(env, "DISPLAY"), "<unset>");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("xwayland"), std::string::npos);
}

TEST_F(RemoteEnvTest, NullCapabilitiesOmitDisplayWithWarning) {
    auto env = build_remote_environment(config, std::nullopt, remote, {}, warn);
    EXPECT_EQ(value_of(env, "DISPLAY"), "<unset>");
    EXPECT_EQ(value_of(env, "WAYLAND_DISPLAY"), "wprs-0");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("no capabilities"), std::string::npos);
}

TEST_F(RemoteEnvTest, FullOrdering) {
    remote.pulse_socket = "/run/user/1000/wprs-pulse-abc";
    remote.agent_socket = "/run/user/1000/wprs-ssh-auth-sock-abc";
    EnvMap extra = {{"GDK_SCALE", "2"}, {"A_FIRST", "x"}};

    auto env = build_remote_environment(config, CapabilityDescriptor{true}, remote, extra, warn);
    EXPECT_EQ(keys(env), (std::vector<std::string>{
        "WAYLAND_DISPLAY", "DISPLAY", "PULSE_SERVER", "SSH_AUTH_SOCK",
        "XDG_SESSION_TYPE", "XCURSOR_SIZE", "A_FIRST", "GDK_SCALE"}));
    EXPECT_EQ(value_of(env, "PULSE_SERVER"), "unix:/run/user/1000/wprs-pulse-abc");
    EXPECT_EQ(value_of(env, "SSH_AUTH_SOCK"), "/run/user/1000/wprs-ssh-auth-sock-abc");
    EXPECT_EQ(value_of(env, "XDG_SESSION_TYPE"), "wayland");
    EXPECT_EQ(value_of(env, "XCURSOR_SIZE"), "32");
}

TEST_F(RemoteEnvTest, CommandLineQuotesValues) {
    EnvList env = {{"WAYLAND_DISPLAY", "wprs-0"}, {"TITLE", "a b"}};
    EXPECT_EQ(remote_command_line(env, {"foot", "-e", "echo $HOME"}),
              "env WAYLAND_DISPLAY=wprs-0 'TITLE=a b' foot -e 'echo $HOME'");
}

// ── Probes ──────────────────────────────────────────────

TEST_F(RemoteEnvTest, UnsetCursorSizeFallsBackToDefault) {
    config.cursor_size = 0;
    auto env = build_remote_environment(config, CapabilityDescriptor{true}, remote, {}, warn);
    EXPECT_EQ(value_of(env, "XCURSOR_SIZE"), "24");
}

TEST(PulseSocket, ConfiguredOrRuntimeDefault) {
    LauncherConfig config;
    EXPECT_EQ(local_pulse_socket(config, "/run/user/1000"), "/run/user/1000/pulse/native");
    config.pulse_socket = "/tmp/custom";
    EXPECT_EQ(local_pulse_socket(config, "/run/user/1000"), "/tmp/custom");
}
