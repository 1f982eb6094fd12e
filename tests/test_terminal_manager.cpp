#include <gtest/gtest.h>
#include <managers/terminal_manager.hpp>
#include "mock_transport.hpp"
#include "recording_sink.hpp"
#include <atomic>
#include <thread>

namespace {

class TerminalManagerTest : public ::testing::Test {
protected:
    MemoryConnectionStore store;
    MockTransportFactory factory;
    RecordingSink sink;
    std::unique_ptr<TerminalManager> terminals;

    void SetUp() override {
        store.put(make_descriptor("c1"));
        terminals = std::make_unique<TerminalManager>(store, factory, sink,
                                                      TerminalConfig{"xterm-256color", 100, 40});
    }

    void TearDown() override { terminals.reset(); }

    std::string connect_ok(const std::string& connection_id = "c1") {
        auto r = terminals->connect(connection_id);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }

    bool saw_status(const std::string& session_id, TerminalStatus status) {
        for (const auto& e : sink.statuses()) {
            if (e.session_id == session_id && e.status == status) return true;
        }
        return false;
    }
};

} // namespace

TEST_F(TerminalManagerTest, ConnectOpensPtyAndReportsStatus) {
    auto id = connect_ok();
    EXPECT_EQ(id, "ssh-1");

    auto statuses = sink.statuses();
    ASSERT_GE(statuses.size(), 2u);
    EXPECT_EQ(statuses[0].status, TerminalStatus::Connecting);
    EXPECT_EQ(statuses[1].status, TerminalStatus::Connected);
    EXPECT_EQ(statuses[1].connection_id, "c1");

    auto pty = factory.last()->pty();
    EXPECT_EQ(pty.term, "xterm-256color");
    EXPECT_EQ(pty.cols, 100);
    EXPECT_EQ(pty.rows, 40);

    EXPECT_TRUE(store.get_connection("c1")->last_connected_at.has_value());

    auto sessions = terminals->list_sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].status, TerminalStatus::Connected);
}

TEST_F(TerminalManagerTest, TerminalsNeverShareConnections) {
    connect_ok();
    connect_ok();
    EXPECT_EQ(factory.connects.load(), 2);
}

TEST_F(TerminalManagerTest, OutputIsSequencedAndBuffered) {
    auto id = connect_ok();
    auto shell = factory.last()->shell();
    shell->push_output("hello ");
    shell->push_output("world");

    ASSERT_TRUE(sink.wait_for([&] { return sink.outputs().size() >= 2; }));
    auto outputs = sink.outputs();
    EXPECT_EQ(outputs[0].seq, 1u);
    EXPECT_EQ(outputs[0].data, "hello ");
    EXPECT_EQ(outputs[1].seq, 2u);

    auto snap = terminals->read_output_buffer(id, 1);
    ASSERT_TRUE(snap.is_ok());
    EXPECT_EQ(snap.value.last_seq, 2u);
    ASSERT_EQ(snap.value.chunks.size(), 1u);
    EXPECT_EQ(snap.value.chunks[0].data, "world");
}

TEST_F(TerminalManagerTest, OutputFollowsConnectedStatus) {
    auto id = connect_ok();
    factory.last()->shell()->push_output("$ ");
    ASSERT_TRUE(sink.wait_for([&] { return !sink.outputs().empty(); }));
    EXPECT_TRUE(saw_status(id, TerminalStatus::Connected));
}

TEST_F(TerminalManagerTest, StartupCommandThenDefaultDirectory) {
    auto desc = make_descriptor("c2");
    desc.startup_command = "source env.sh";
    desc.default_directory = "~/work dir";
    store.put(desc);

    connect_ok("c2");
    EXPECT_EQ(factory.last()->shell()->written(), "source env.sh\ncd ~/'work dir'\n");
}

TEST_F(TerminalManagerTest, SendAndResize) {
    auto id = connect_ok();
    auto shell = factory.last()->shell();

    terminals->send(id, "ls\n");
    terminals->send("ssh-404", "ignored");
    EXPECT_EQ(shell->written(), "ls\n");

    terminals->resize(id, 0, 10);
    EXPECT_EQ(shell->size(), std::make_pair(100, 40));
    terminals->resize(id, 132, 50);
    EXPECT_EQ(shell->size(), std::make_pair(132, 50));
}

TEST_F(TerminalManagerTest, DisconnectClosesAndReports) {
    auto id = connect_ok();
    auto transport = factory.last();

    ASSERT_TRUE(terminals->disconnect(id).is_ok());
    EXPECT_TRUE(transport->closed());
    EXPECT_TRUE(transport->shell()->closed());
    EXPECT_TRUE(saw_status(id, TerminalStatus::Disconnected));
    EXPECT_TRUE(terminals->list_sessions().empty());

    // Input after disconnect is dropped.
    terminals->send(id, "late");
    EXPECT_EQ(transport->shell()->written(), "");

    auto again = terminals->disconnect(id);
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(again.error, "Session not found");
    EXPECT_TRUE(terminals->read_output_buffer(id).is_err());
}

TEST_F(TerminalManagerTest, RemoteHangUpEndsSession) {
    auto id = connect_ok();
    auto transport = factory.last();
    transport->shell()->push_output("logout\n");
    transport->shell()->hang_up();

    ASSERT_TRUE(sink.wait_for([&] { return saw_status(id, TerminalStatus::Disconnected); }));
    EXPECT_TRUE(terminals->list_sessions().empty());
    EXPECT_TRUE(transport->closed());
    ASSERT_FALSE(sink.outputs().empty());
    EXPECT_EQ(sink.outputs().back().data, "logout\n");
}

TEST_F(TerminalManagerTest, ConnectTimeoutIsReported) {
    factory.before_connect = [](const ConnectionDescriptor&) {
        throw TimeoutError("handshake timed out");
    };
    auto r = terminals->connect("c1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Connection timeout (30s)");

    auto statuses = sink.statuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[1].status, TerminalStatus::Error);
    EXPECT_EQ(statuses[1].error.value_or(""), "Connection timeout (30s)");
    EXPECT_TRUE(terminals->list_sessions().empty());
}

TEST_F(TerminalManagerTest, UnknownConnection) {
    auto r = terminals->connect("nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Connection not found");
    EXPECT_EQ(factory.connects.load(), 0);
}

TEST_F(TerminalManagerTest, DisconnectConnectionEndsOnlyItsSessions) {
    store.put(make_descriptor("c2"));
    connect_ok("c1");
    connect_ok("c1");
    auto other = connect_ok("c2");

    terminals->disconnect_connection("c1");
    auto left = terminals->list_sessions();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, other);
}

TEST_F(TerminalManagerTest, DisconnectWhileOthersQuerySessions) {
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) ids.push_back(connect_ok());

    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            for (const auto& info : terminals->list_sessions()) {
                EXPECT_NE(info.status, TerminalStatus::Error);
            }
            for (const auto& id : ids) terminals->send(id, "x");
        }
    });
    for (const auto& id : ids) EXPECT_TRUE(terminals->disconnect(id).is_ok());
    done = true;
    watcher.join();

    EXPECT_TRUE(terminals->list_sessions().empty());
    for (const auto& id : ids) EXPECT_TRUE(saw_status(id, TerminalStatus::Disconnected));
}

TEST_F(TerminalManagerTest, TestConnection) {
    EXPECT_TRUE(terminals->test_connection("c1").is_ok());
    EXPECT_TRUE(factory.last()->closed());

    factory.before_connect = [](const ConnectionDescriptor&) {
        throw SshError("Authentication failed");
    };
    auto r = terminals->test_connection("c1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Authentication failed");
}

TEST(DefaultDirectory, TildeStaysUnquoted) {
    EXPECT_EQ(default_directory_command("~"), "cd ~\n");
    EXPECT_EQ(default_directory_command("~/"), "cd ~/\n");
    EXPECT_EQ(default_directory_command("~/src"), "cd ~/'src'\n");
    EXPECT_EQ(default_directory_command("/var/log"), "cd '/var/log'\n");
    EXPECT_EQ(default_directory_command("/it's"), "cd '/it'\\''s'\n");
}
