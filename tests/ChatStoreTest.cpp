#include "FakeConnection.h"

#include "storage/ChatStore.h"
#include "storage/Digest.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace json = boost::json;

using relaychat::storage::ChatEntry;
using relaychat::storage::ChatStore;
using relaychat::storage::ConversationKey;
using relaychat::storage::GroupInfo;
using relaychat::storage::MessageType;
using relaychat::storage::StoreError;
using relaychat::testing::TempDir;

namespace {

std::string read_file(const fs::path& file) {
    std::ifstream in(file);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_file(const fs::path& file, const std::string& contents) {
    std::ofstream out(file, std::ios::trunc);
    out << contents;
}

} // namespace

TEST(DigestTest, KnownSha256Vectors) {
    EXPECT_EQ(relaychat::storage::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(relaychat::storage::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChatStoreTest, CreatesLogDirectories) {
    TempDir dir;
    ChatStore store(dir.path() / "logs");
    EXPECT_TRUE(fs::is_directory(dir.path() / "logs" / "groups"));
}

TEST(ChatStoreTest, DirectKeyIsOrderIndependent) {
    TempDir dir;
    ChatStore store(dir.path());

    const auto ab = ConversationKey::direct("alice", "bob");
    const auto ba = ConversationKey::direct("bob", "alice");
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.file_name(), "alice_bob_conversation.json");
    EXPECT_EQ(store.path_of(ab).string(), (dir.path() / "alice_bob_conversation.json").string());

    store.append(ab, ChatEntry::make("alice", "bob", "hi bob", MessageType::Direct));
    store.append(ba, ChatEntry::make("bob", "alice", "hi alice", MessageType::Direct));

    const auto history = store.load(ab);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].message, "hi bob");
    EXPECT_EQ(history[1].message, "hi alice");
}

TEST(ChatStoreTest, GroupLogsLiveUnderGroupsDirectory) {
    TempDir dir;
    ChatStore store(dir.path());

    store.record(ChatEntry::make("alice", "g1", "hello group", MessageType::Group));

    const fs::path file = dir.path() / "groups" / "g1_group.json";
    ASSERT_TRUE(fs::exists(file));

    const auto history = store.load(ConversationKey::group("g1"));
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].type, MessageType::Group);
    EXPECT_EQ(history[0].receiver, "g1");
}

TEST(ChatStoreTest, WritesViewerCompatibleFields) {
    TempDir dir;
    ChatStore store(dir.path());
    store.record(ChatEntry::make("bob", "alice", "hello", MessageType::Direct));

    const json::value doc = json::parse(read_file(dir.path() / "alice_bob_conversation.json"));
    ASSERT_TRUE(doc.is_array());
    const json::object& entry = doc.as_array().at(0).as_object();

    EXPECT_EQ(json::value_to<std::string>(entry.at("sender")), "bob");
    EXPECT_EQ(json::value_to<std::string>(entry.at("receiver")), "alice");
    EXPECT_EQ(json::value_to<std::string>(entry.at("message")), "hello");
    EXPECT_EQ(json::value_to<std::string>(entry.at("type")), "direct");
    EXPECT_EQ(json::value_to<std::string>(entry.at("message_hash")), relaychat::storage::sha256_hex("hello"));
    EXPECT_EQ(json::value_to<std::string>(entry.at("timestamp")).size(), std::string("2024-01-01 00:00:00").size());
}

TEST(ChatStoreTest, HashDetectsAlteredText) {
    TempDir dir;
    ChatStore store(dir.path());
    store.record(ChatEntry::make("alice", "bob", "pay 10", MessageType::Direct));

    auto history = store.load(ConversationKey::direct("alice", "bob"));
    ASSERT_EQ(history.size(), 1u);
    EXPECT_TRUE(history[0].verify());

    // Edit the text on disk, leave the stored hash alone.
    const fs::path file = dir.path() / "alice_bob_conversation.json";
    json::value doc = json::parse(read_file(file));
    doc.as_array().at(0).as_object()["message"] = "pay 1000";
    write_file(file, json::serialize(doc));

    history = store.load(ConversationKey::direct("alice", "bob"));
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].verify());
}

TEST(ChatStoreTest, MissingLogLoadsEmpty) {
    TempDir dir;
    ChatStore store(dir.path());
    EXPECT_TRUE(store.load(ConversationKey::direct("x", "y")).empty());
}

TEST(ChatStoreTest, CorruptedLogIsReportedByLoad) {
    TempDir dir;
    ChatStore store(dir.path());
    write_file(dir.path() / "alice_bob_conversation.json", "[{\"sender\": ");

    try {
        store.load(ConversationKey::direct("alice", "bob"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), StoreError::Kind::CorruptedLog);
    }
}

TEST(ChatStoreTest, AppendStartsFreshAfterCorruption) {
    TempDir dir;
    ChatStore store(dir.path());
    const fs::path file = dir.path() / "alice_bob_conversation.json";
    write_file(file, "not json at all");

    store.record(ChatEntry::make("alice", "bob", "after", MessageType::Direct));

    const auto history = store.load(ConversationKey::direct("alice", "bob"));
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].message, "after");

    fs::path aside = file;
    aside += ".corrupt";
    EXPECT_EQ(read_file(aside), "not json at all");
}

TEST(ChatStoreTest, GroupMetadataLifecycle) {
    TempDir dir;
    ChatStore store(dir.path());

    GroupInfo info;
    info.group_name = "g1";
    info.admin = "alice";
    info.members = {"alice", "bob"};
    info.created_date = "2024-05-01 10:00:00";
    store.write_group_metadata(info);

    EXPECT_TRUE(fs::exists(dir.path() / "groups" / "g1_info.json"));
    auto loaded = store.load_group_metadata("g1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->admin, "alice");
    EXPECT_EQ(loaded->members, (std::vector<std::string>{"alice", "bob"}));
    EXPECT_EQ(loaded->created_date, "2024-05-01 10:00:00");

    store.delete_group_metadata("g1");
    EXPECT_FALSE(fs::exists(dir.path() / "groups" / "g1_info.json"));
    EXPECT_FALSE(store.load_group_metadata("g1").has_value());
}

TEST(ChatStoreTest, DeletedGroupsReleaseTheirFileLocks) {
    TempDir dir;
    ChatStore store(dir.path());

    for (int i = 0; i < 50; ++i) {
        GroupInfo info;
        info.group_name = "g" + std::to_string(i);
        info.admin = "alice";
        info.members = {"alice"};
        info.created_date = "2024-05-01 10:00:00";
        store.write_group_metadata(info);
        store.delete_group_metadata(info.group_name);
    }
    EXPECT_EQ(store.tracked_files(), 0u);

    store.append(ConversationKey::direct("alice", "bob"),
                 ChatEntry::make("alice", "bob", "hi", MessageType::Direct));
    EXPECT_EQ(store.tracked_files(), 1u);
}

TEST(ChatStoreTest, ConcurrentAppendsToOneConversationKeepEveryEntry) {
    TempDir dir;
    ChatStore store(dir.path());

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string sender = (t % 2 == 0) ? "alice" : "bob";
                const std::string receiver = (t % 2 == 0) ? "bob" : "alice";
                store.record(ChatEntry::make(sender, receiver,
                                             std::to_string(t) + ":" + std::to_string(i),
                                             MessageType::Direct));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(store.load(ConversationKey::direct("alice", "bob")).size(),
              static_cast<std::size_t>(kThreads * kPerThread));
}
