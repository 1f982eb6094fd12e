#include <gtest/gtest.h>
#include <managers/engine.hpp>
#include "mock_transport.hpp"
#include "recording_sink.hpp"

namespace {

class EngineTest : public ::testing::Test {
protected:
    MemoryConnectionStore store;
    MockTransportFactory factory;
    std::shared_ptr<MockRemote> remote = factory.remote;
    RecordingSink sink;
    Config config;
    std::unique_ptr<HostlinkEngine> engine;

    void SetUp() override {
        store.put(make_descriptor("c1"));
        store.put(make_descriptor("c2"));
        engine = std::make_unique<HostlinkEngine>(config, store, factory, sink);
    }

    void TearDown() override { engine.reset(); }
};

} // namespace

TEST_F(EngineTest, ListDirThroughFacade) {
    remote->add_files("/srv", 3);
    auto r = engine->list_dir("c1", "/srv");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.entries.size(), 3u);
    EXPECT_FALSE(r.value.page.has_value());
}

TEST_F(EngineTest, FailuresComeBackAsErrors) {
    auto missing = engine->list_dir("c1", "/nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_NE(missing.error.find("/nope"), std::string::npos);

    auto unknown = engine->read_file("ghost", "/x");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error, "Connection not found");

    auto cursor = engine->list_dir("c1", "/", ListDirOptions{std::string("dir-1-ff"), 10, false});
    ASSERT_TRUE(cursor.is_err());
    EXPECT_NE(cursor.error.find("cursor"), std::string::npos);

    auto cancel = engine->upload_cancel("upload-9");
    ASSERT_TRUE(cancel.is_err());
    EXPECT_EQ(cancel.error, "Upload task not found: upload-9");
}

TEST_F(EngineTest, ToolMissingSurfacesHint) {
    {
        std::lock_guard<std::mutex> lock(remote->mutex);
        remote->exec_handler = [](const std::string& cmd) {
            return cmd == "command -v zip" ? SSHResult{1, "", ""} : SSHResult{0, "", ""};
        };
    }
    auto r = engine->zip_dir("c1", "/srv");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("'zip'"), std::string::npos);
}

TEST_F(EngineTest, TransportFailurePurgesListingState) {
    remote->add_files("/a", 5);
    remote->add_files("/b", 30);
    ASSERT_TRUE(engine->list_dir("c1", "/a").is_ok());
    EXPECT_EQ(engine->dir_lister().cache_size(), 1u);

    remote->round_size = 10;
    remote->fail_round = 1;
    remote->fail_round_transport = true;
    ListDirOptions page;
    page.limit = 25;
    EXPECT_TRUE(engine->list_dir("c1", "/b", page).is_err());

    EXPECT_FALSE(engine->file_sessions().has_session("c1"));
    EXPECT_EQ(engine->dir_lister().cache_size(), 0u);
}

TEST_F(EngineTest, DeleteConnectionTearsEverythingDown) {
    remote->add_files("/a", 5);
    ASSERT_TRUE(engine->list_dir("c1", "/a").is_ok());
    ASSERT_TRUE(engine->list_dir("c2", "/a").is_ok());
    auto term = engine->terminal_connect("c1");
    ASSERT_TRUE(term.is_ok());

    ASSERT_TRUE(engine->delete_connection("c1").is_ok());

    EXPECT_FALSE(store.get_connection("c1").has_value());
    EXPECT_FALSE(engine->file_sessions().has_session("c1"));
    EXPECT_FALSE(engine->dir_lister().cache_entry("c1", "/a"));
    EXPECT_TRUE(engine->dir_lister().cache_entry("c2", "/a"));
    EXPECT_TRUE(engine->list_sessions().empty());
    EXPECT_TRUE(engine->delete_connection("c1").is_err());
}

TEST_F(EngineTest, EndpointChangeResetsFileSession) {
    ASSERT_TRUE(engine->home_dir("c1").is_ok());
    ASSERT_TRUE(engine->file_sessions().has_session("c1"));

    auto renamed = *store.get_connection("c1");
    renamed.name = "Renamed";
    store.put(renamed);
    EXPECT_TRUE(engine->file_sessions().has_session("c1"));

    auto moved = renamed;
    moved.host = "elsewhere.test";
    store.put(moved);
    EXPECT_FALSE(engine->file_sessions().has_session("c1"));

    ASSERT_TRUE(engine->home_dir("c1").is_ok());
    EXPECT_EQ(engine->file_sessions().descriptor_of("c1")->host, "elsewhere.test");
}

TEST_F(EngineTest, RemovedConnectionResetsFileSession) {
    ASSERT_TRUE(engine->home_dir("c2").is_ok());
    ASSERT_TRUE(store.delete_connection("c2").is_ok());
    EXPECT_FALSE(engine->file_sessions().has_session("c2"));
}

TEST_F(EngineTest, TerminalAndFileSessionsAreSeparate) {
    ASSERT_TRUE(engine->home_dir("c1").is_ok());
    auto term = engine->terminal_connect("c1");
    ASSERT_TRUE(term.is_ok());
    EXPECT_EQ(factory.connects.load(), 2);

    ASSERT_TRUE(engine->terminal_disconnect(term.value).is_ok());
    EXPECT_TRUE(engine->file_sessions().has_session("c1"));
}

TEST_F(EngineTest, WriteThenReadAndExec) {
    ASSERT_TRUE(engine->write_file("c1", "~/notes/todo.txt", "a\nb\n").is_ok());
    auto r = engine->read_file("c1", "~/notes/todo.txt", 2, 1);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "2\tb");

    auto ex = engine->exec("c1", "true");
    ASSERT_TRUE(ex.is_ok());
    EXPECT_EQ(ex.value.exit_code, 0);
}

TEST_F(EngineTest, ShutdownIsIdempotentAndRefusesWork) {
    ASSERT_TRUE(engine->home_dir("c1").is_ok());
    engine->shutdown();
    engine->shutdown();
    EXPECT_TRUE(engine->list_dir("c1", "/").is_err());
    EXPECT_TRUE(factory.last()->closed());
}

TEST_F(EngineTest, ListConnections) {
    EXPECT_EQ(engine->list_connections().size(), 2u);
}
