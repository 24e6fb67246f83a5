#include "storage/ChatStore.h"

#include "Log.h"
#include "storage/JsonFormat.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace relaychat::storage {

namespace fs = std::filesystem;
namespace json = boost::json;

ConversationKey ConversationKey::direct(const std::string& a, const std::string& b) {
    ConversationKey key;
    key.type = MessageType::Direct;
    if (b < a) {
        key.first = b;
        key.second = a;
    } else {
        key.first = a;
        key.second = b;
    }
    return key;
}

ConversationKey ConversationKey::group(std::string name) {
    ConversationKey key;
    key.type = MessageType::Group;
    key.first = std::move(name);
    return key;
}

std::string ConversationKey::file_name() const {
    if (type == MessageType::Group) return first + "_group.json";
    return first + "_" + second + "_conversation.json";
}

ChatStore::ChatStore(fs::path root)
    : root_(std::move(root)),
      groups_dir_(root_ / "groups") {
    std::error_code ec;
    fs::create_directories(groups_dir_, ec);
    if (ec) {
        throw StoreError(StoreError::Kind::WriteFailure,
                         "cannot create " + groups_dir_.string() + ": " + ec.message());
    }
}

fs::path ChatStore::path_of(const ConversationKey& key) const {
    if (key.type == MessageType::Group) return groups_dir_ / key.file_name();
    return root_ / key.file_name();
}

fs::path ChatStore::group_info_path(const std::string& group_name) const {
    return groups_dir_ / (group_name + "_info.json");
}

std::shared_ptr<std::mutex> ChatStore::lock_for(const fs::path& file) const {
    std::lock_guard<std::mutex> lk(locks_mu_);
    auto& slot = file_locks_[file.string()];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::size_t ChatStore::tracked_files() const {
    std::lock_guard<std::mutex> lk(locks_mu_);
    return file_locks_.size();
}

// Holders of the old mutex keep it alive; the next lock_for() starts a new one.
void ChatStore::drop_lock(const fs::path& file) {
    std::lock_guard<std::mutex> lk(locks_mu_);
    file_locks_.erase(file.string());
}

std::vector<ChatEntry> ChatStore::read_log(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return {};

    std::ostringstream contents;
    contents << in.rdbuf();

    json::error_code ec;
    json::value doc = json::parse(contents.str(), ec);
    if (ec) {
        throw StoreError(StoreError::Kind::CorruptedLog,
                         file.string() + ": " + ec.message());
    }

    try {
        return json::value_to<std::vector<ChatEntry>>(doc);
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::CorruptedLog,
                         file.string() + ": " + e.what());
    }
}

void ChatStore::write_file(const fs::path& file, const std::string& contents) {
    fs::path tmp = file;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << contents;
        out.flush();
        if (!out) {
            throw StoreError(StoreError::Kind::WriteFailure, "cannot write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StoreError(StoreError::Kind::WriteFailure,
                         "cannot replace " + file.string() + ": " + ec.message());
    }
}

void ChatStore::append(const ConversationKey& key, const ChatEntry& entry) {
    const fs::path file = path_of(key);
    const auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> lk(*file_lock);

    std::vector<ChatEntry> history;
    try {
        history = read_log(file);
    } catch (const StoreError& e) {
        log::warn("store", std::string("starting a fresh log: ") + e.what());

        fs::path aside = file;
        aside += ".corrupt";
        std::error_code ec;
        fs::rename(file, aside, ec);
        if (ec) log::warn("store", "cannot move aside " + file.string() + ": " + ec.message());
    }

    history.push_back(entry);
    write_file(file, to_pretty_string(json::value_from(history)));
}

void ChatStore::record(const ChatEntry& entry) {
    if (entry.type == MessageType::Group) {
        append(ConversationKey::group(entry.receiver), entry);
    } else {
        append(ConversationKey::direct(entry.sender, entry.receiver), entry);
    }
}

std::vector<ChatEntry> ChatStore::load(const ConversationKey& key) const {
    const fs::path file = path_of(key);
    const auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> lk(*file_lock);
    return read_log(file);
}

void ChatStore::write_group_metadata(const GroupInfo& info) {
    const fs::path file = group_info_path(info.group_name);
    const auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> lk(*file_lock);
    write_file(file, to_pretty_string(json::value_from(info)));
}

void ChatStore::delete_group_metadata(const std::string& group_name) {
    const fs::path file = group_info_path(group_name);
    const auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> lk(*file_lock);

    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw StoreError(StoreError::Kind::WriteFailure,
                         "cannot remove " + file.string() + ": " + ec.message());
    }
    drop_lock(file);
}

std::optional<GroupInfo> ChatStore::load_group_metadata(const std::string& group_name) const {
    const fs::path file = group_info_path(group_name);
    const auto file_lock = lock_for(file);
    std::lock_guard<std::mutex> lk(*file_lock);

    std::ifstream in(file, std::ios::binary);
    if (!in) return std::nullopt;

    std::ostringstream contents;
    contents << in.rdbuf();

    json::error_code ec;
    json::value doc = json::parse(contents.str(), ec);
    if (ec) {
        throw StoreError(StoreError::Kind::CorruptedLog, file.string() + ": " + ec.message());
    }
    try {
        return json::value_to<GroupInfo>(doc);
    } catch (const std::exception& e) {
        throw StoreError(StoreError::Kind::CorruptedLog, file.string() + ": " + e.what());
    }
}

} // namespace relaychat::storage
