#pragma once

#include "chat/CommandDispatcher.h"
#include "chat/ConnectionHandler.h"
#include "chat/GroupRegistry.h"
#include "chat/MessageRouter.h"
#include "chat/SessionRegistry.h"
#include "networking/Connection.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace relaychat::storage { class ChatStore; }

namespace relaychat::chat {

// Owns the shared registries and one ConnectionHandler per live connection.
// The three entry points match LineServer's callbacks.
class ChatService {
public:
    explicit ChatService(storage::ChatStore& store);

    ChatService(const ChatService&) = delete;
    ChatService& operator=(const ChatService&) = delete;

    void on_connect(std::shared_ptr<networking::Connection> connection);
    void on_message(networking::ClientId id, const std::string& line);
    void on_disconnect(networking::ClientId id);

    SessionRegistry& sessions() noexcept { return sessions_; }
    GroupRegistry& groups() noexcept { return groups_; }

private:
    std::shared_ptr<ConnectionHandler> handler_for(networking::ClientId id) const;

    SessionRegistry sessions_;
    GroupRegistry groups_;
    MessageRouter router_;
    CommandDispatcher dispatcher_;

    mutable std::mutex mu_;
    std::unordered_map<networking::ClientId, std::shared_ptr<ConnectionHandler>> handlers_;
};

} // namespace relaychat::chat
