#include "storage/ChatEntry.h"

#include "storage/Digest.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace relaychat::storage {

namespace json = boost::json;

std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::Direct: return "direct";
        case MessageType::Group:  return "group";
    }
    return "direct";
}

std::string current_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

ChatEntry ChatEntry::make(std::string sender, std::string receiver,
                          std::string message, MessageType type) {
    ChatEntry entry;
    entry.timestamp = current_timestamp();
    entry.sender = std::move(sender);
    entry.receiver = std::move(receiver);
    entry.message_hash = sha256_hex(message);
    entry.message = std::move(message);
    entry.type = type;
    return entry;
}

bool ChatEntry::verify() const {
    return sha256_hex(message) == message_hash;
}

void tag_invoke(json::value_from_tag, json::value& jv, const ChatEntry& entry) {
    jv = {
        {"timestamp", entry.timestamp},
        {"sender", entry.sender},
        {"receiver", entry.receiver},
        {"message", entry.message},
        {"message_hash", entry.message_hash},
        {"type", to_string(entry.type)}
    };
}

ChatEntry tag_invoke(json::value_to_tag<ChatEntry>, const json::value& jv) {
    const json::object& obj = jv.as_object();

    ChatEntry entry;
    entry.timestamp = json::value_to<std::string>(obj.at("timestamp"));
    entry.sender = json::value_to<std::string>(obj.at("sender"));
    entry.receiver = json::value_to<std::string>(obj.at("receiver"));
    entry.message = json::value_to<std::string>(obj.at("message"));
    entry.message_hash = json::value_to<std::string>(obj.at("message_hash"));

    // "type" is optional; absent means direct.
    entry.type = MessageType::Direct;
    if (const json::value* type = obj.if_contains("type")) {
        const json::string& s = type->as_string();
        if (s == "group") {
            entry.type = MessageType::Group;
        } else if (s != "direct") {
            throw std::invalid_argument("unknown message type '" + std::string(s) + "'");
        }
    }
    return entry;
}

void tag_invoke(json::value_from_tag, json::value& jv, const GroupInfo& info) {
    jv = {
        {"group_name", info.group_name},
        {"admin", info.admin},
        {"members", json::value_from(info.members)},
        {"created_date", info.created_date}
    };
}

GroupInfo tag_invoke(json::value_to_tag<GroupInfo>, const json::value& jv) {
    const json::object& obj = jv.as_object();

    GroupInfo info;
    info.group_name = json::value_to<std::string>(obj.at("group_name"));
    info.admin = json::value_to<std::string>(obj.at("admin"));
    info.members = json::value_to<std::vector<std::string>>(obj.at("members"));
    info.created_date = json::value_to<std::string>(obj.at("created_date"));
    return info;
}

} // namespace relaychat::storage
