#pragma once

#include <boost/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace relaychat::storage {

enum class MessageType { Direct, Group };

std::string_view to_string(MessageType type) noexcept;

// "%Y-%m-%d %H:%M:%S" in local time.
std::string current_timestamp();

// One persisted message. Field names are shared with the history viewer.
struct ChatEntry {
    std::string timestamp;
    std::string sender;
    std::string receiver;  // peer name for direct messages, group name for group ones
    std::string message;
    std::string message_hash;
    MessageType type = MessageType::Direct;

    static ChatEntry make(std::string sender, std::string receiver,
                          std::string message, MessageType type);

    // True when message_hash still matches message.
    bool verify() const;
};

// Persisted form of a group's membership.
struct GroupInfo {
    std::string group_name;
    std::string admin;
    std::vector<std::string> members;
    std::string created_date;
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const ChatEntry& entry);
ChatEntry tag_invoke(boost::json::value_to_tag<ChatEntry>, const boost::json::value& jv);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const GroupInfo& info);
GroupInfo tag_invoke(boost::json::value_to_tag<GroupInfo>, const boost::json::value& jv);

} // namespace relaychat::storage
