#pragma once

#include "chat/GroupRegistry.h"

#include <cstddef>
#include <string>
#include <vector>

namespace relaychat::storage {
class ChatStore;
struct ChatEntry;
} // namespace relaychat::storage

namespace relaychat::chat {

class SessionRegistry;

enum class RouteStatus {
    Delivered,
    UserNotFound,
    GroupNotFound,
    NotMember,
    SendFailed,
};

struct RouteOutcome {
    RouteStatus status = RouteStatus::Delivered;
    std::size_t delivered = 0;
    std::string reply;  // confirmation or error line for the sender

    bool ok() const noexcept { return status == RouteStatus::Delivered; }
};

// Fan-out of chat lines to live sessions, writing each message through to the store.
//
// Delivery is best effort: a recipient whose connection refuses the line is skipped
// and the rest still get it. The sender is never a recipient of its own message.
class MessageRouter {
public:
    MessageRouter(const SessionRegistry& sessions, const GroupRegistry& groups,
                  storage::ChatStore& store);

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    // "<sender>: <text>" to everyone else; one direct log entry per live recipient.
    std::size_t broadcast_public(const std::string& sender, const std::string& text);

    // "[Private] <sender>: <text>" to target; reply is "[Private to <target>]: <text>".
    RouteOutcome send_private(const std::string& sender, const std::string& target,
                              const std::string& text);

    // "[<group>] <sender>: <text>" to the other live members; one group log entry.
    // reply is the same line, for the sender's own echo.
    RouteOutcome send_group(const std::string& sender, const std::string& group,
                            const std::string& text);

    // Server notices ("X has joined the chat") to every session except one.
    std::size_t announce(const std::string& text, const std::string& except);

    std::size_t deliver(const std::vector<Notice>& notices);

private:
    void persist(const storage::ChatEntry& entry);

    const SessionRegistry& sessions_;
    const GroupRegistry& groups_;
    storage::ChatStore& store_;
};

} // namespace relaychat::chat
