#pragma once

#include "chat/Session.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaychat::chat {

// Name <-> connection maps for every Active session.
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Atomic check-and-insert; false if the name is already live.
    bool try_register(const std::string& name, std::shared_ptr<networking::Connection> connection);

    // Removes the session only if it still belongs to this connection.
    bool deregister(const std::string& name, networking::ClientId id);

    std::shared_ptr<networking::Connection> find(const std::string& name) const;
    std::optional<std::string> name_of(networking::ClientId id) const;
    bool is_online(const std::string& name) const;

    // Sorted by name.
    std::vector<std::string> names() const;
    std::vector<Session> snapshot() const;

    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, Session> by_name_;
    std::unordered_map<networking::ClientId, std::string> by_id_;
};

} // namespace relaychat::chat
