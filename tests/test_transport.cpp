#include <gtest/gtest.h>
#include <session/transport.hpp>
#include <fstream>
#include <sys/stat.h>
#include "fakes.hpp"

class TransportTest : public ::testing::Test {
protected:
    TempDir dir;
    LauncherConfig config;
    FakeCommandRunner runner;
    SessionPaths paths;

    void SetUp() override {
        config.forward_agent = false;
        paths = SessionPaths::for_identity(dir.path(), "abc123");
    }
};

TEST_F(TransportTest, IsAliveUsesControlCheck) {
    TransportController t(config, runner, paths);
    EXPECT_TRUE(t.is_alive("devbox"));

    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0],
              (Argv{"ssh", "-S", paths.ssh_control_path.string(), "-O", "check", "devbox"}));
}

TEST_F(TransportTest, IsAliveFalseWhenNoMaster) {
    runner.on_run = [](const Argv&) {
        return CommandResult{255, "", "Control socket connect: No such file or directory"};
    };
    TransportController t(config, runner, paths);
    EXPECT_FALSE(t.is_alive("devbox"));
}

TEST_F(TransportTest, StartCreatesPrivateControlDir) {
    TransportController t(config, runner, paths);
    t.start("devbox");

    struct stat st;
    ASSERT_EQ(stat(paths.ssh_control_dir.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);
}

TEST_F(TransportTest, StartArguments) {
    config.forward_agent = true;
    config.ssh_args = {"-p", "2222"};
    TransportController t(config, runner, paths);
    t.start("devbox");

    ASSERT_EQ(runner.attached_calls.size(), 1u);
    const auto& argv = runner.attached_calls[0];
    EXPECT_EQ(argv.front(), "ssh");
    EXPECT_EQ(argv.back(), "devbox");
    EXPECT_TRUE(has_arg(argv, "-M"));
    EXPECT_TRUE(has_arg(argv, "-N"));
    EXPECT_TRUE(has_arg(argv, "-f"));
    EXPECT_TRUE(has_arg(argv, "-A"));
    EXPECT_TRUE(has_arg(argv, "ControlPersist=yes"));
    EXPECT_TRUE(has_arg(argv, "StreamLocalBindUnlink=yes"));
    EXPECT_TRUE(has_arg(argv, "2222"));
    EXPECT_TRUE(has_arg(argv, paths.ssh_control_path.string()));
}

TEST_F(TransportTest, StartFailureIsTransportError) {
    runner.on_attached = [](const Argv&) { return 255; };
    TransportController t(config, runner, paths);
    EXPECT_THROW(t.start("devbox"), TransportError);
}

TEST_F(TransportTest, ForwardCarriesAllPairsInOneCommand) {
    TransportController t(config, runner, paths);
    std::vector<SocketForward> forwards = {
        {SocketForward::Direction::LocalToRemote, "/l/data.sock", "/r/wprs.sock"},
        {SocketForward::Direction::LocalToRemote, "/l/ctl.sock", "/r/wprs-control.sock"},
        {SocketForward::Direction::RemoteToLocal, "/r/pulse", "/l/pulse/native"},
    };
    EXPECT_TRUE(t.forward("devbox", forwards));

    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0], (Argv{"ssh", "-S", paths.ssh_control_path.string(),
                                     "-O", "forward",
                                     "-L", "/l/data.sock:/r/wprs.sock",
                                     "-L", "/l/ctl.sock:/r/wprs-control.sock",
                                     "-R", "/r/pulse:/l/pulse/native",
                                     "devbox"}));
}

TEST_F(TransportTest, ForwardFailureReportedAsFalse) {
    runner.on_run = [](const Argv&) {
        return CommandResult{255, "", "mux_client_forward: forwarding request failed"};
    };
    TransportController t(config, runner, paths);
    EXPECT_FALSE(t.forward("devbox", {}));
}

TEST_F(TransportTest, StopRemovesForwardListeners) {
    std::ofstream(paths.data_socket) << "";
    std::ofstream(paths.server_control_socket) << "";
    std::ofstream(paths.control_socket) << "";

    TransportController t(config, runner, paths);
    t.stop("devbox");

    EXPECT_EQ(runner.count_ops("exit"), 1);
    EXPECT_FALSE(fs::exists(paths.data_socket));
    EXPECT_FALSE(fs::exists(paths.server_control_socket));
    // wprsc's socket is not ssh's to clean up
    EXPECT_TRUE(fs::exists(paths.control_socket));
}

TEST_F(TransportTest, StopToleratesNothingToStop) {
    runner.on_run = [](const Argv&) {
        return CommandResult{255, "", "Control socket connect: No such file or directory"};
    };
    TransportController t(config, runner, paths);
    EXPECT_NO_THROW(t.stop("devbox"));
    EXPECT_NO_THROW(t.stop("devbox"));
}

TEST_F(TransportTest, RunRemoteCapturesOutput) {
    runner.on_run = [](const Argv&) { return CommandResult{0, "/run/user/1000", ""}; };
    TransportController t(config, runner, paths);
    auto r = t.run_remote("devbox", "printf '%s' \"$XDG_RUNTIME_DIR\"");

    EXPECT_EQ(r.stdout_data, "/run/user/1000");
    const auto& argv = runner.calls.back();
    EXPECT_EQ(argv.back(), "printf '%s' \"$XDG_RUNTIME_DIR\"");
    EXPECT_TRUE(has_arg(argv, "-T"));
}

TEST_F(TransportTest, ExecRemoteReturnsExitStatus) {
    runner.on_attached = [](const Argv&) { return 3; };
    TransportController t(config, runner, paths);
    EXPECT_EQ(t.exec_remote("devbox", "false"), 3);
    EXPECT_EQ(runner.attached_calls.back().back(), "false");
}

TEST(SocketForward, Args) {
    SocketForward l{SocketForward::Direction::LocalToRemote, "/a", "/b"};
    SocketForward r{SocketForward::Direction::RemoteToLocal, "/c", "/d"};
    EXPECT_EQ(l.to_args(), (Argv{"-L", "/a:/b"}));
    EXPECT_EQ(r.to_args(), (Argv{"-R", "/c:/d"}));
}
