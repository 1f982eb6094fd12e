#include <gtest/gtest.h>
#include <core/connection_store.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <thread>

namespace {

class ConnectionStoreTest : public ::testing::Test {
protected:
    fs::path path = platform::temp_file("hostlink_store", ".json");

    void TearDown() override { platform::remove_quietly(path); }

    void write(const std::string& body) { std::ofstream(path, std::ios::trunc) << body; }
};

ConnectionDescriptor sample(const std::string& id) {
    ConnectionDescriptor c;
    c.id = id;
    c.name = "Box " + id;
    c.host = id + ".example.test";
    c.username = "me";
    c.auth_type = AuthType::PrivateKey;
    c.private_key_path = "~/.ssh/id_ed25519";
    c.created_at = 1000;
    c.updated_at = 1000;
    return c;
}

} // namespace

TEST_F(ConnectionStoreTest, MissingFileIsEmpty) {
    FileConnectionStore store(path);
    EXPECT_TRUE(store.list_connections().empty());
    EXPECT_TRUE(store.list_groups().empty());
}

TEST_F(ConnectionStoreTest, ParsesAndNormalizesDocument) {
    write(R"({"ssh": {
        "groups": [{"id": "g1", "name": "Lab"}, {"id": "g1", "name": "Dup"}, {"name": "no id"}],
        "connections": [
            {"id": "a", "name": "A", "host": "a.test", "username": "u", "groupId": "g1",
             "authType": "agent", "proxyJump": "jump@bastion:2222", "lastConnectedAt": 55},
            {"id": "b", "name": "B", "host": "b.test"},
            {"id": "a", "name": "A again", "host": "x", "username": "u"}
        ]}})");
    FileConnectionStore store(path);

    auto groups = store.list_groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].name, "Lab");

    auto conns = store.list_connections();
    ASSERT_EQ(conns.size(), 1u);
    const auto& a = conns[0];
    EXPECT_EQ(a.port, 22);
    EXPECT_EQ(a.auth_type, AuthType::Agent);
    EXPECT_EQ(a.keep_alive_interval, 60);
    EXPECT_EQ(a.group_id.value_or(""), "g1");
    EXPECT_EQ(a.proxy_jump.value_or(""), "jump@bastion:2222");
    EXPECT_EQ(a.last_connected_at.value_or(0), 55);
}

TEST_F(ConnectionStoreTest, MalformedFileYieldsEmptyView) {
    write("{not json");
    FileConnectionStore store(path);
    EXPECT_TRUE(store.list_connections().empty());
}

TEST_F(ConnectionStoreTest, CreateUpdateDeletePersist) {
    {
        FileConnectionStore store(path);
        ASSERT_TRUE(store.create_connection(sample("a")).is_ok());
        ASSERT_TRUE(store.create_connection(sample("b")).is_ok());
        EXPECT_TRUE(store.create_connection(sample("a")).is_err());

        auto b = *store.get_connection("b");
        b.port = 2200;
        ASSERT_TRUE(store.update_connection(b).is_ok());
        ASSERT_TRUE(store.delete_connection("a").is_ok());
        EXPECT_TRUE(store.delete_connection("a").is_err());
    }

    FileConnectionStore reopened(path);
    auto conns = reopened.list_connections();
    ASSERT_EQ(conns.size(), 1u);
    EXPECT_EQ(conns[0].id, "b");
    EXPECT_EQ(conns[0].port, 2200);
    EXPECT_EQ(conns[0].auth_type, AuthType::PrivateKey);
    EXPECT_EQ(conns[0].private_key_path.value_or(""), "~/.ssh/id_ed25519");
}

TEST_F(ConnectionStoreTest, ControlCharactersAreWrittenAsJsonEscapes) {
    auto c = sample("a");
    c.name = std::string("tab\there \x01 bell\x07");
    c.startup_command = std::string("echo \"hi\"\x1b[0m");
    {
        FileConnectionStore store(path);
        ASSERT_TRUE(store.create_connection(c).is_ok());
    }

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("\\u0001"), std::string::npos);
    EXPECT_NE(text.find("\\u0007"), std::string::npos);
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) { return std::tolower(ch); });
    EXPECT_NE(lower.find("\\u001b"), std::string::npos);
    EXPECT_EQ(text.find("\\x"), std::string::npos);

    FileConnectionStore reopened(path);
    auto got = reopened.get_connection("a");
    ASSERT_TRUE(got);
    EXPECT_EQ(got->name, c.name);
    EXPECT_EQ(got->startup_command.value_or(""), *c.startup_command);
}

TEST_F(ConnectionStoreTest, DeletingGroupUngroupsConnections) {
    FileConnectionStore store(path);
    ConnectionGroup g;
    g.id = "g";
    g.name = "Group";
    ASSERT_TRUE(store.create_group(g).is_ok());
    auto c = sample("a");
    c.group_id = "g";
    ASSERT_TRUE(store.create_connection(c).is_ok());

    ASSERT_TRUE(store.delete_group("g").is_ok());
    EXPECT_FALSE(store.get_connection("a")->group_id.has_value());
}

TEST_F(ConnectionStoreTest, RecordConnectedStampsTime) {
    FileConnectionStore store(path);
    ASSERT_TRUE(store.create_connection(sample("a")).is_ok());
    ASSERT_TRUE(store.record_connected("a", 123456).is_ok());
    EXPECT_EQ(store.get_connection("a")->last_connected_at.value_or(0), 123456);
    EXPECT_TRUE(store.record_connected("zzz", 1).is_err());
}

TEST_F(ConnectionStoreTest, MutationsNotifyListeners) {
    FileConnectionStore store(path);
    int calls = 0;
    store.on_change([&] { ++calls; });
    ASSERT_TRUE(store.create_connection(sample("a")).is_ok());
    ASSERT_TRUE(store.delete_connection("a").is_ok());
    EXPECT_EQ(calls, 2);
}

TEST_F(ConnectionStoreTest, ReloadPicksUpExternalEdits) {
    FileConnectionStore store(path);
    ASSERT_TRUE(store.create_connection(sample("a")).is_ok());
    EXPECT_FALSE(store.reload_if_changed());

    int calls = 0;
    store.on_change([&] { ++calls; });

    // Ensure the modification time moves on coarse-grained filesystems.
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    write(R"({"ssh": {"connections": [{"id": "z", "name": "Z", "host": "z", "username": "u"}]}})");

    EXPECT_TRUE(store.reload_if_changed());
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(store.list_connections().size(), 1u);
    EXPECT_EQ(store.list_connections()[0].id, "z");
}

TEST(ConnectionDescriptor, SameEndpointIgnoresCosmeticFields) {
    auto a = sample("a");
    auto b = a;
    b.name = "Renamed";
    b.sort_order = 9;
    b.startup_command = "htop";
    EXPECT_TRUE(a.same_endpoint(b));

    b.port = 2222;
    EXPECT_FALSE(a.same_endpoint(b));
}

TEST(ConnectionDescriptor, AuthTypeNames) {
    EXPECT_EQ(parse_auth_type(auth_type_name(AuthType::PrivateKey)), AuthType::PrivateKey);
    EXPECT_EQ(parse_auth_type("unknown"), AuthType::Password);
}
