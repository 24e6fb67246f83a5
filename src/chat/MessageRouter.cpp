#include "chat/MessageRouter.h"

#include "Log.h"
#include "chat/SessionRegistry.h"
#include "storage/ChatStore.h"

namespace relaychat::chat {

MessageRouter::MessageRouter(const SessionRegistry& sessions, const GroupRegistry& groups,
                             storage::ChatStore& store)
    : sessions_(sessions),
      groups_(groups),
      store_(store) {}

std::size_t MessageRouter::broadcast_public(const std::string& sender, const std::string& text) {
    const std::string line = sender + ": " + text;

    std::size_t delivered = 0;
    for (const auto& session : sessions_.snapshot()) {
        if (session.name == sender) continue;
        if (!session.connection->send(line)) continue;

        ++delivered;
        persist(storage::ChatEntry::make(sender, session.name, text, storage::MessageType::Direct));
    }
    return delivered;
}

RouteOutcome MessageRouter::send_private(const std::string& sender, const std::string& target,
                                         const std::string& text) {
    auto connection = sessions_.find(target);
    if (!connection) {
        return {RouteStatus::UserNotFound, 0, "Error: User " + target + " not found"};
    }

    if (!connection->send("[Private] " + sender + ": " + text)) {
        return {RouteStatus::SendFailed, 0, "Error: Could not send message to " + target};
    }

    persist(storage::ChatEntry::make(sender, target, text, storage::MessageType::Direct));
    return {RouteStatus::Delivered, 1, "[Private to " + target + "]: " + text};
}

RouteOutcome MessageRouter::send_group(const std::string& sender, const std::string& group_name,
                                       const std::string& text) {
    const auto group = groups_.find(group_name);
    if (!group) {
        return {RouteStatus::GroupNotFound, 0, "Group '" + group_name + "' does not exist"};
    }
    if (!group->has_member(sender)) {
        return {RouteStatus::NotMember, 0, "You are not a member of group '" + group_name + "'"};
    }

    const std::string line = "[" + group_name + "] " + sender + ": " + text;

    std::size_t delivered = 0;
    for (const auto& member : group->members) {
        if (member == sender) continue;
        auto connection = sessions_.find(member);
        if (connection && connection->send(line)) ++delivered;
    }

    persist(storage::ChatEntry::make(sender, group_name, text, storage::MessageType::Group));
    return {RouteStatus::Delivered, delivered, line};
}

std::size_t MessageRouter::announce(const std::string& text, const std::string& except) {
    std::size_t delivered = 0;
    for (const auto& session : sessions_.snapshot()) {
        if (session.name == except) continue;
        if (session.connection->send(text)) ++delivered;
    }
    return delivered;
}

std::size_t MessageRouter::deliver(const std::vector<Notice>& notices) {
    std::size_t delivered = 0;
    for (const auto& notice : notices) {
        auto connection = sessions_.find(notice.recipient);
        if (connection && connection->send(notice.text)) ++delivered;
    }
    return delivered;
}

void MessageRouter::persist(const storage::ChatEntry& entry) {
    try {
        store_.record(entry);
    } catch (const storage::StoreError& e) {
        log::error("router", e.what());
    }
}

} // namespace relaychat::chat
