#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>

#include "RuntimeClient.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Framing.hpp"
#include "include/RpcTcpServer.hpp"
#include "include/Runtime.hpp"
#include "rpc/RpcHandlers.hpp"

using nlohmann::json;
using namespace lsim;

namespace {

constexpr const char* kLoopback = "127.0.0.1";

/* Server on an ephemeral loopback port, driven through RuntimeClient. */
class ServerFixture : public ::testing::Test {
protected:
    void SetUp() override {
        BindRuntimeRpcCommands(rt, reg);
        srv = std::make_unique<RpcTcpServer>(rt, kLoopback, 0);
        ASSERT_TRUE(srv->start(&reg)) << "errno " << srv->lastErrno();
        ASSERT_NE(srv->port(), 0);
    }

    void TearDown() override {
        srv->stop();
    }

    void connect(RuntimeClient& c) { c.connect(kLoopback, srv->port()); }

    /* Poll until pred() holds or ~2s pass. */
    template <typename Pred>
    static bool eventually(Pred pred) {
        for (int i = 0; i < 200; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    Runtime                       rt;
    CommandRegistry               reg;
    std::unique_ptr<RpcTcpServer> srv;
};

std::string header(std::uint32_t len) {
    std::string h(kFrameHeaderSize, '\0');
    writeLengthLE(len, &h[0]);
    return h;
}

} // namespace

TEST_F(ServerFixture, PingEchoesReqId) {
    RuntimeClient c;
    connect(c);
    const std::int64_t id = c.send("PING");
    const json r = c.receive();
    EXPECT_EQ(r.at("ok"), true);
    EXPECT_EQ(r.at("req_id"), id);
    EXPECT_EQ(r.at("error"), "");
    EXPECT_EQ(r.at("payload").at("resp"), "PONG");
}

TEST_F(ServerFixture, StateSurvivesReconnect) {
    {
        RuntimeClient c;
        connect(c);
        const json load = c.call("LOAD_PROJECT", json{
            {"project", json::object()},
            {"pages", json::object()},
            {"vars", json::object()},
            {"sources", {{"a.st", "x"}}}
        });
        ASSERT_EQ(load.at("ok"), true) << load.dump();
        EXPECT_EQ(load.at("payload").at("loaded"), true);
        EXPECT_EQ(load.at("payload").at("project_info").at("files"), 1);
        EXPECT_EQ(load.at("payload").at("project_info").at("st_files"), 1);

        const json start = c.call("START");
        EXPECT_EQ(start.at("payload").at("runtime_state"), "RUN");
    }

    RuntimeClient c2;
    connect(c2);
    const json st = c2.call("GET_STATUS");
    EXPECT_EQ(st.at("payload").at("runtime_state"), "RUN");
    EXPECT_EQ(st.at("payload").at("project_loaded"), true);
}

TEST_F(ServerFixture, DisconnectPurgesOnlyThatConnectionsForces) {
    RuntimeClient a, b;
    connect(a);
    connect(b);

    ASSERT_EQ(a.call("FORCE_SET", {{"owner_id", "A"}, {"values", {{"X", 1}}}}).at("ok"), true);
    ASSERT_EQ(b.call("FORCE_SET", {{"owner_id", "B"}, {"values", {{"Y", 2}}}}).at("ok"), true);
    EXPECT_EQ(b.call("GET_FORCES").at("payload").at("forces").size(), 2u);

    a.close();
    EXPECT_TRUE(eventually([&] {
        return b.call("GET_FORCES").at("payload").at("forces").size() == 1u;
    }));
    const json forces = b.call("GET_FORCES").at("payload").at("forces");
    EXPECT_EQ(forces[0].at("owner_id"), "B");
    EXPECT_TRUE(b.call("READ_VARS", {{"names", {"X"}}}).at("payload").at("values").at("X").is_null());
}

TEST_F(ServerFixture, OversizedLengthClosesWithoutReply) {
    RuntimeClient c;
    connect(c);
    c.sendRaw(header(50000000u));
    EXPECT_TRUE(c.waitForClose(2000));

    RuntimeClient other;
    connect(other);
    EXPECT_EQ(other.call("PING").at("ok"), true);
}

TEST_F(ServerFixture, RepliesBeforeBadLengthAreDelivered) {
    RuntimeClient c;
    connect(c);
    c.sendRaw(encodeFrame(json{{"cmd", "SET_VARS"}, {"req_id", 1}, {"payload", {{"values", {{"X", 5}}}}}}) +
              encodeFrame(json{{"cmd", "PING"}, {"req_id", 2}, {"payload", json::object()}}) +
              header(50000000u));

    const json first = c.receive();
    EXPECT_EQ(first.at("req_id"), 1);
    EXPECT_EQ(first.at("payload").at("count"), 1);
    EXPECT_EQ(c.receive().at("req_id"), 2);
    EXPECT_TRUE(c.waitForClose(2000));

    RuntimeClient other;
    connect(other);
    EXPECT_EQ(other.call("READ_VARS", {{"names", {"X"}}}).at("payload").at("values").at("X"), 5);
}

TEST_F(ServerFixture, LargeBacklogIsDeliveredIntact) {
    RuntimeClient c;
    connect(c);
    const std::string big(1024 * 1024, 'x');
    ASSERT_EQ(c.call("SET_VARS", {{"values", {{"BIG", big}}}}).at("ok"), true);

    // Several MiB of replies queue up before the client reads any of them.
    std::vector<std::int64_t> ids;
    for (int i = 0; i < 6; ++i) ids.push_back(c.send("READ_VARS", {{"names", {"BIG"}}}));
    for (const std::int64_t id : ids) {
        const json r = c.receive();
        EXPECT_EQ(r.at("req_id"), id);
        EXPECT_EQ(r.at("payload").at("values").at("BIG").get<std::string>().size(), big.size());
    }
}

TEST_F(ServerFixture, DescriptorsAboveSelectLimitAreRejected) {
    rlimit lim{};
    ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &lim), 0);
    if (lim.rlim_max != RLIM_INFINITY && lim.rlim_max < static_cast<rlim_t>(FD_SETSIZE) + 16) {
        GTEST_SKIP() << "RLIMIT_NOFILE too low";
    }
    const rlimit saved = lim;
    lim.rlim_cur = static_cast<rlim_t>(FD_SETSIZE) + 16;
    ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &lim), 0);

    // Occupy every descriptor below FD_SETSIZE so the next accept() lands above it.
    std::vector<int> filler;
    for (;;) {
        const int fd = ::open("/dev/null", O_RDONLY);
        ASSERT_GE(fd, 0);
        if (fd >= FD_SETSIZE - 1) { ::close(fd); break; }
        filler.push_back(fd);
    }

    {
        RuntimeClient c;
        connect(c);
        EXPECT_TRUE(c.waitForClose(2000));
    }

    for (const int fd : filler) ::close(fd);
    ::setrlimit(RLIMIT_NOFILE, &saved);

    RuntimeClient ok;
    connect(ok);
    EXPECT_EQ(ok.call("PING").at("ok"), true);
}

TEST_F(ServerFixture, ZeroLengthClosesWithoutReply) {
    RuntimeClient c;
    connect(c);
    c.sendRaw(header(0));
    EXPECT_TRUE(c.waitForClose(2000));
}

TEST_F(ServerFixture, MalformedJsonKeepsConnectionOpen) {
    RuntimeClient c;
    connect(c);
    c.sendRaw(header(5) + "{oops");
    const json err = c.receive();
    EXPECT_EQ(err.at("ok"), false);
    EXPECT_EQ(err.at("req_id"), -1);
    EXPECT_EQ(err.at("error").get<std::string>().rfind("JSON parse error", 0), 0u);

    EXPECT_EQ(c.call("PING").at("ok"), true);
}

TEST_F(ServerFixture, SchemaErrorEchoesIntegerReqId) {
    RuntimeClient c;
    connect(c);
    c.sendJson(json{{"req_id", 77}, {"payload", json::object()}});
    const json r = c.receive();
    EXPECT_EQ(r.at("ok"), false);
    EXPECT_EQ(r.at("req_id"), 77);
    EXPECT_EQ(r.at("error"), "Invalid message schema");
}

TEST_F(ServerFixture, PipelinedRequestsAnswerInOrder) {
    RuntimeClient c;
    connect(c);

    std::string burst;
    for (int i = 1; i <= 20; ++i) {
        burst += encodeFrame(json{{"cmd", i % 2 ? "PING" : "NOPE"}, {"req_id", i}, {"payload", json::object()}});
    }
    c.sendRaw(burst);

    for (int i = 1; i <= 20; ++i) {
        const json r = c.receive();
        EXPECT_EQ(r.at("req_id"), i);
        EXPECT_EQ(r.at("ok"), i % 2 == 1);
    }
}

TEST_F(ServerFixture, ShutdownStopsAcceptingButKeepsOpenSessions) {
    RuntimeClient keeper, closer;
    connect(keeper);
    connect(closer);

    const json r = closer.call("SHUTDOWN");
    EXPECT_EQ(r.at("payload").at("shutting_down"), true);
    EXPECT_TRUE(closer.waitForClose(2000));
    EXPECT_TRUE(srv->shutdownRequested());

    EXPECT_TRUE(eventually([&] {
        RuntimeClient probe;
        try {
            probe.connect(kLoopback, srv->port(), 200);
        } catch (const ClientError&) {
            return true;
        }
        return false;
    }));

    EXPECT_EQ(keeper.call("PING").at("ok"), true);
    EXPECT_FALSE(srv->finished());

    keeper.close();
    EXPECT_TRUE(eventually([&] { return srv->finished(); }));
}
