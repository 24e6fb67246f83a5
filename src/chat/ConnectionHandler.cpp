#include "chat/ConnectionHandler.h"

#include "Log.h"
#include "chat/CommandDispatcher.h"
#include "chat/MessageRouter.h"
#include "chat/Session.h"
#include "chat/SessionRegistry.h"
#include "chat/Utf8.h"

#include <utility>

namespace relaychat::chat {

ConnectionHandler::ConnectionHandler(std::shared_ptr<networking::Connection> connection,
                                     SessionRegistry& sessions,
                                     MessageRouter& router,
                                     CommandDispatcher& dispatcher)
    : connection_(std::move(connection)),
      sessions_(sessions),
      router_(router),
      dispatcher_(dispatcher) {}

void ConnectionHandler::open() {
    if (state_ != State::Connecting) return;
    connection_->send(kPrompt);
    state_ = State::AwaitingName;
}

void ConnectionHandler::handle_line(const std::string& line) {
    switch (state_) {
        case State::AwaitingName:
            handshake(line);
            break;

        case State::Active:
            if (!is_valid_utf8(line)) {
                connection_->send(kBadEncoding);
                break;
            }
            if (dispatcher_.dispatch(name_, *connection_, line) == DispatchResult::Quit) {
                close();
                connection_->close();
            }
            break;

        case State::Connecting:
        case State::Closed:
            break;
    }
}

void ConnectionHandler::handshake(const std::string& line) {
    std::string candidate = Names::trim_copy(line);

    if (!is_valid_utf8(candidate) || !Names::is_valid_user(candidate)) {
        reject("Invalid username. Use 1-" + std::to_string(Names::kMaxNameLen) +
               " characters without spaces or any of / \\ @ # _.");
        return;
    }
    if (!sessions_.try_register(candidate, connection_)) {
        log::info("session", "rejected duplicate name " + candidate);
        reject(kNameTaken);
        return;
    }

    name_ = std::move(candidate);
    state_ = State::Active;
    log::info("session", name_ + " connected as client " + std::to_string(connection_->id()));

    router_.announce(name_ + " has joined the chat", name_);
    connection_->send(CommandDispatcher::welcome_text(name_));
}

void ConnectionHandler::reject(const std::string& reason) {
    connection_->send(reason);
    state_ = State::Closed;
    connection_->close();
}

void ConnectionHandler::close() {
    const bool was_active = (state_ == State::Active);
    state_ = State::Closed;
    if (!was_active) return;

    if (sessions_.deregister(name_, connection_->id())) {
        log::info("session", name_ + " disconnected");
        router_.announce(name_ + " has left the chat", name_);
    }
}

} // namespace relaychat::chat
