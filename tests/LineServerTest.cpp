#include "FakeConnection.h"

#include "chat/ChatService.h"
#include "networking/LineServer.h"
#include "storage/ChatStore.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <istream>
#include <thread>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using relaychat::chat::ChatService;
using relaychat::networking::ClientId;
using relaychat::networking::Connection;
using relaychat::networking::LineServer;
using relaychat::storage::ChatStore;
using relaychat::storage::ConversationKey;
using relaychat::testing::TempDir;

namespace {

// Blocking client speaking the line protocol.
class Client {
public:
    explicit Client(unsigned short port) : socket_(ioc_) {
        socket_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void write_raw(const std::string& data) { asio::write(socket_, asio::buffer(data)); }
    void write_line(const std::string& line) { write_raw(line + "\n"); }

    std::string read_line() {
        asio::read_until(socket_, buffer_, '\n');
        std::istream in(&buffer_);
        std::string line;
        std::getline(in, line);
        return line;
    }

    // Reads until `last` arrives; returns every line read, `last` included.
    std::vector<std::string> read_through(const std::string& last) {
        std::vector<std::string> lines;
        do {
            lines.push_back(read_line());
        } while (lines.back() != last);
        return lines;
    }

    // Unlike write_raw, tolerates the server hanging up mid-write.
    void try_write_raw(const std::string& data) {
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(data), ec);
    }

    bool closed_by_server() {
        boost::system::error_code ec;
        asio::read_until(socket_, buffer_, '\n', ec);
        return ec == asio::error::eof || ec == asio::error::connection_reset;
    }

    bool at_eof() {
        boost::system::error_code ec;
        asio::read_until(socket_, buffer_, '\n', ec);
        return ec == asio::error::eof;
    }

private:
    asio::io_context ioc_;
    tcp::socket socket_;
    asio::streambuf buffer_;
};

const std::string kLastHelpLine = "- /quit - Leave chat";

class LineServerTest : public ::testing::Test {
protected:
    LineServerTest()
        : store(dir.path()),
          service(store),
          server(ioc, "127.0.0.1", 0) {
        server.set_on_connect([this](std::shared_ptr<Connection> c) { service.on_connect(std::move(c)); });
        server.set_on_message([this](ClientId id, const std::string& line) { service.on_message(id, line); });
        server.set_on_disconnect([this](ClientId id) { service.on_disconnect(id); });
        server.start();
        runner = std::thread([this] { ioc.run(); });
    }

    ~LineServerTest() override {
        server.stop();
        runner.join();
    }

    std::unique_ptr<Client> login(const std::string& name) {
        auto client = std::make_unique<Client>(server.local_port());
        EXPECT_EQ(client->read_line(), "Enter your username: ");
        client->write_line(name);
        const auto welcome = client->read_through(kLastHelpLine);
        EXPECT_EQ(welcome.front(), "Welcome to the chat, " + name + "!");
        return client;
    }

    TempDir dir;
    ChatStore store;
    ChatService service;
    asio::io_context ioc;
    LineServer server;
    std::thread runner;
};

} // namespace

TEST_F(LineServerTest, PrivateMessageOverSockets) {
    auto alice = login("alice");
    auto bob = login("bob");
    EXPECT_EQ(alice->read_line(), "bob has joined the chat");

    alice->write_line("@bob hello");
    EXPECT_EQ(bob->read_line(), "[Private] alice: hello");
    EXPECT_EQ(alice->read_line(), "[Private to bob]: hello");
    EXPECT_EQ(store.load(ConversationKey::direct("alice", "bob")).size(), 1u);

    bob->write_line("/quit");
    EXPECT_TRUE(bob->at_eof());
    EXPECT_EQ(alice->read_line(), "bob has left the chat");
}

TEST_F(LineServerTest, LinesAreReassembledAcrossReads) {
    auto alice = login("alice");
    auto bob = login("bob");
    EXPECT_EQ(alice->read_line(), "bob has joined the chat");

    alice->write_raw("@bob hel");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    alice->write_raw("lo\r\n");
    EXPECT_EQ(bob->read_line(), "[Private] alice: hello");
    EXPECT_EQ(alice->read_line(), "[Private to bob]: hello");
}

TEST_F(LineServerTest, CoalescedLinesAreSplit) {
    auto alice = login("alice");

    alice->write_raw("/users\n/listgroups\n");
    EXPECT_EQ(alice->read_line(), "Online users: alice");
    EXPECT_EQ(alice->read_line(), "You are not a member of any groups");
}

TEST_F(LineServerTest, DuplicateNameIsRejectedAndClosed) {
    auto alice = login("alice");

    Client impostor(server.local_port());
    EXPECT_EQ(impostor.read_line(), "Enter your username: ");
    impostor.write_line("alice");
    EXPECT_EQ(impostor.read_line(), "Username already taken. Please try again.");
    EXPECT_TRUE(impostor.at_eof());

    EXPECT_TRUE(service.sessions().is_online("alice"));
}

TEST_F(LineServerTest, OversizeLineDropsTheConnection) {
    auto alice = login("alice");
    auto bob = login("bob");
    EXPECT_EQ(alice->read_line(), "bob has joined the chat");

    alice->try_write_raw(std::string(LineServer::kMaxLineLength + 1024, 'x') + "\n");

    EXPECT_EQ(bob->read_line(), "alice has left the chat");
    EXPECT_TRUE(alice->closed_by_server());
    EXPECT_FALSE(service.sessions().is_online("alice"));
    EXPECT_TRUE(store.load(ConversationKey::direct("alice", "bob")).empty());
}
