#include "chat/SessionRegistry.h"

#include <utility>

namespace relaychat::chat {

bool SessionRegistry::try_register(const std::string& name,
                                   std::shared_ptr<networking::Connection> connection) {
    std::lock_guard<std::mutex> lk(mu_);
    if (by_name_.count(name)) return false;

    const networking::ClientId id = connection->id();

    Session session;
    session.name = name;
    session.connection = std::move(connection);
    session.connected_at = Session::Clock::now();

    by_name_.emplace(name, std::move(session));
    by_id_[id] = name;
    return true;
}

bool SessionRegistry::deregister(const std::string& name, networking::ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_name_.find(name);
    if (it == by_name_.end() || it->second.connection->id() != id) return false;

    by_name_.erase(it);
    by_id_.erase(id);
    return true;
}

std::shared_ptr<networking::Connection> SessionRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return nullptr;
    return it->second.connection;
}

std::optional<std::string> SessionRegistry::name_of(networking::ClientId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

bool SessionRegistry::is_online(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_name_.count(name) != 0;
}

std::vector<std::string> SessionRegistry::names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(by_name_.size());
    for (const auto& [name, session] : by_name_) out.push_back(name);
    return out;
}

std::vector<Session> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Session> out;
    out.reserve(by_name_.size());
    for (const auto& [name, session] : by_name_) out.push_back(session);
    return out;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_name_.size();
}

} // namespace relaychat::chat
