#include <gtest/gtest.h>
#include <session/control_client.hpp>
#include <platform/socket_util.hpp>
#include <cstring>
#include <thread>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include "fakes.hpp"

// ── Response decoding ───────────────────────────────────

TEST(ControlResponse, ParsesOk) {
    auto r = ControlResponse::parse(R"({"status":"Ok","payload":"{\"xwayland\":true}"})");
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.unwrap(), R"({"xwayland":true})");
}

TEST(ControlResponse, ErrorStatusCarriesPayload) {
    auto r = ControlResponse::parse(R"({"status":"Err","payload":"unknown command"})");
    EXPECT_FALSE(r.ok());
    try {
        r.unwrap();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("unknown command"), std::string::npos);
    }
}

TEST(ControlResponse, MalformedIsProtocolError) {
    EXPECT_THROW(ControlResponse::parse("not json"), ProtocolError);
    EXPECT_THROW(ControlResponse::parse("[1,2]"), ProtocolError);
    EXPECT_THROW(ControlResponse::parse(R"({"payload":"x"})"), ProtocolError);
    EXPECT_THROW(ControlResponse::parse(R"({"status":"Ok"})"), ProtocolError);
    EXPECT_THROW(ControlResponse::parse(R"({"status":"Ok","payload":5})"), ProtocolError);
}

TEST(Capabilities, NullPayloadMeansNone) {
    EXPECT_FALSE(parse_capabilities("null").has_value());
}

TEST(Capabilities, Xwayland) {
    auto on = parse_capabilities(R"({"xwayland":true})");
    ASSERT_TRUE(on.has_value());
    EXPECT_TRUE(on->xwayland);

    auto off = parse_capabilities(R"({"xwayland":false})");
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(off->xwayland);

    // Unknown fields are tolerated; missing xwayland defaults to false
    auto other = parse_capabilities(R"({"fractional_scale":true})");
    ASSERT_TRUE(other.has_value());
    EXPECT_FALSE(other->xwayland);
}

TEST(Capabilities, MalformedIsProtocolError) {
    EXPECT_THROW(parse_capabilities("{"), ProtocolError);
    EXPECT_THROW(parse_capabilities("42"), ProtocolError);
    EXPECT_THROW(parse_capabilities(R"({"xwayland":"yes"})"), ProtocolError);
}

// ── Retry policy ────────────────────────────────────────

class ControlClientTest : public ::testing::Test {
protected:
    FakeControlTransport transport;
    std::vector<int> sleeps;
    SleepFn sleep = [this](int ms) { sleeps.push_back(ms); };
};

TEST_F(ControlClientTest, FirstAttemptSucceeds) {
    transport.respond(ok_response("null"));
    ControlClient client(transport, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, sleep);

    EXPECT_FALSE(client.query_capabilities("/run/ctl.sock").has_value());
    EXPECT_EQ(transport.requests, (std::vector<std::string>{"caps"}));
    EXPECT_EQ(transport.last_socket, "/run/ctl.sock");
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(ControlClientTest, SucceedsOnLastAllowedAttempt) {
    transport.refuse(10);
    transport.respond(ok_response(R"({"xwayland":true})"));
    ControlClient client(transport, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, sleep);

    auto caps = client.query_capabilities("/run/ctl.sock");
    ASSERT_TRUE(caps.has_value());
    EXPECT_TRUE(caps->xwayland);
    EXPECT_EQ(transport.requests.size(), 11u);
    EXPECT_EQ(sleeps.size(), 10u);
    for (int ms : sleeps) EXPECT_EQ(ms, 1000);
}

TEST_F(ControlClientTest, GivesUpAfterElevenAttempts) {
    transport.refuse(20);
    ControlClient client(transport, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, sleep);

    EXPECT_THROW(client.query_capabilities("/run/ctl.sock"), ConnectionError);
    EXPECT_EQ(transport.requests.size(), 11u);
    EXPECT_EQ(sleeps.size(), 10u);
}

TEST_F(ControlClientTest, NonRetryableConnectionErrorFailsFast) {
    transport.refuse(1, false);
    ControlClient client(transport, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, sleep);

    EXPECT_THROW(client.send_command("/run/ctl.sock", "caps"), ConnectionError);
    EXPECT_EQ(transport.requests.size(), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(ControlClientTest, ErrorStatusNotRetried) {
    transport.respond(R"({"status":"Err","payload":"busy"})");
    ControlClient client(transport, CONTROL_MAX_RETRIES, CONTROL_RETRY_DELAY_MS, sleep);

    EXPECT_THROW(client.query_capabilities("/run/ctl.sock"), ProtocolError);
    EXPECT_EQ(transport.requests.size(), 1u);
}

// ── Real AF_UNIX socket ─────────────────────────────────

// Accepts one connection, reads one line, answers with `response`.
class OneShotServer {
public:
    OneShotServer(const fs::path& path, std::string response)
        : response_(std::move(response)) {
        fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        bound_ = fd_ >= 0 &&
                 bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
                 listen(fd_, 1) == 0;
        if (bound_) thread_ = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        join();
        if (fd_ >= 0) close(fd_);
    }

    bool bound() const { return bound_; }

    // Wait for the exchange to finish; returns the line the client sent.
    const std::string& join() {
        if (thread_.joinable()) thread_.join();
        return received_;
    }

private:
    int fd_ = -1;
    bool bound_ = false;
    std::string response_;
    std::string received_;
    std::thread thread_;

    void serve() {
        int conn = accept(fd_, nullptr, nullptr);
        if (conn < 0) return;
        auto line = platform::read_line(conn, 4096);
        if (line.is_ok()) received_ = line.value;
        platform::write_all(conn, response_ + "\n");
        close(conn);
    }
};

TEST(UnixControlTransportTest, RoundTripOverSocket) {
    TempDir dir;
    auto path = dir.path() / "ctl.sock";
    OneShotServer server(path, ok_response(R"({"xwayland":false})"));
    ASSERT_TRUE(server.bound());

    UnixControlTransport transport;
    std::string line = transport.request(path.string(), "caps");
    EXPECT_EQ(server.join(), "caps");

    auto resp = ControlResponse::parse(line);
    EXPECT_TRUE(resp.ok());
    EXPECT_EQ(resp.payload, R"({"xwayland":false})");
}

TEST(UnixControlTransportTest, MissingSocketIsRetryable) {
    TempDir dir;
    UnixControlTransport transport;
    try {
        transport.request((dir.path() / "absent.sock").string(), "caps");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_TRUE(e.retryable());
    }
}

TEST(UnixControlTransportTest, EmptyAnswerIsProtocolError) {
    TempDir dir;
    auto path = dir.path() / "ctl.sock";
    OneShotServer server(path, "");
    ASSERT_TRUE(server.bound());

    // The server answers with a bare newline; that is not a response
    UnixControlTransport transport;
    std::string line = transport.request(path.string(), "caps");
    server.join();
    EXPECT_THROW(ControlResponse::parse(line), ProtocolError);
}

TEST(UnixControlTransportTest, ClientQueriesCapabilities) {
    TempDir dir;
    auto path = dir.path() / "ctl.sock";
    OneShotServer server(path, ok_response("null"));
    ASSERT_TRUE(server.bound());

    UnixControlTransport transport;
    ControlClient client(transport, 0, 0, [](int) {});
    EXPECT_FALSE(client.query_capabilities(path.string()).has_value());
    EXPECT_EQ(server.join(), "caps");
}
