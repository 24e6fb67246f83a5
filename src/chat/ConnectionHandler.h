#pragma once

#include "networking/Connection.h"

#include <memory>
#include <string>

namespace relaychat::chat {

class CommandDispatcher;
class MessageRouter;
class SessionRegistry;

// Per-connection control loop:
//
//   Connecting --open()--> AwaitingName --name accepted--> Active --/quit, EOF--> Closed
//                               |
//                               +--name taken or invalid--> Closed
//
// Calls for one connection arrive serialized (one strand per connection).
class ConnectionHandler {
public:
    enum class State { Connecting, AwaitingName, Active, Closed };

    static constexpr const char* kPrompt = "Enter your username: ";
    static constexpr const char* kNameTaken = "Username already taken. Please try again.";
    static constexpr const char* kBadEncoding = "Error: Message is not valid UTF-8 and was not sent";

    ConnectionHandler(std::shared_ptr<networking::Connection> connection,
                      SessionRegistry& sessions,
                      MessageRouter& router,
                      CommandDispatcher& dispatcher);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    void open();
    void handle_line(const std::string& line);

    // Peer gone or I/O failure. Safe to call in any state, any number of times.
    void close();

    State state() const noexcept { return state_; }
    const std::string& name() const noexcept { return name_; }

private:
    void handshake(const std::string& line);
    void reject(const std::string& reason);

    std::shared_ptr<networking::Connection> connection_;
    SessionRegistry& sessions_;
    MessageRouter& router_;
    CommandDispatcher& dispatcher_;

    State state_ = State::Connecting;
    std::string name_;
};

} // namespace relaychat::chat
