#include "chat/ChatService.h"

#include "storage/ChatStore.h"

#include <utility>

namespace relaychat::chat {

ChatService::ChatService(storage::ChatStore& store)
    : groups_(store, sessions_),
      router_(sessions_, groups_, store),
      dispatcher_(sessions_, groups_, router_) {}

void ChatService::on_connect(std::shared_ptr<networking::Connection> connection) {
    const networking::ClientId id = connection->id();
    auto handler = std::make_shared<ConnectionHandler>(std::move(connection), sessions_, router_, dispatcher_);

    {
        std::lock_guard<std::mutex> lk(mu_);
        handlers_[id] = handler;
    }
    handler->open();
}

void ChatService::on_message(networking::ClientId id, const std::string& line) {
    if (auto handler = handler_for(id)) handler->handle_line(line);
}

void ChatService::on_disconnect(networking::ClientId id) {
    std::shared_ptr<ConnectionHandler> handler;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = handlers_.find(id);
        if (it == handlers_.end()) return;
        handler = std::move(it->second);
        handlers_.erase(it);
    }
    handler->close();
}

std::shared_ptr<ConnectionHandler> ChatService::handler_for(networking::ClientId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = handlers_.find(id);
    if (it == handlers_.end()) return nullptr;
    return it->second;
}

} // namespace relaychat::chat
