#pragma once

#include "storage/ChatEntry.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaychat::storage {

class StoreError : public std::runtime_error {
public:
    enum class Kind { CorruptedLog, WriteFailure };

    StoreError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Selects one conversation log. Direct keys are order-independent.
struct ConversationKey {
    MessageType type = MessageType::Direct;
    std::string first;
    std::string second;  // empty for group keys

    static ConversationKey direct(const std::string& a, const std::string& b);
    static ConversationKey group(std::string name);

    // "<a>_<b>_conversation.json" or "<group>_group.json"
    std::string file_name() const;

    bool operator==(const ConversationKey& other) const noexcept {
        return type == other.type && first == other.first && second == other.second;
    }
};

// Append-only conversation logs plus group metadata, one JSON document per file.
//
// Appends to the same conversation are serialized by a per-file mutex, and every
// rewrite goes through a temporary file that is renamed over the target.
class ChatStore {
public:
    explicit ChatStore(std::filesystem::path root);

    ChatStore(const ChatStore&) = delete;
    ChatStore& operator=(const ChatStore&) = delete;

    const std::filesystem::path& root() const noexcept { return root_; }
    std::filesystem::path path_of(const ConversationKey& key) const;
    std::filesystem::path group_info_path(const std::string& group_name) const;

    // Read-modify-write of the conversation's array. A log that no longer parses is
    // moved aside to "<file>.corrupt" and a fresh array is started.
    // Throws StoreError(WriteFailure).
    void append(const ConversationKey& key, const ChatEntry& entry);

    // Derives the key from the entry (sender/receiver pair, or group name).
    void record(const ChatEntry& entry);

    // Entries in insertion order; empty when the log does not exist.
    // Throws StoreError(CorruptedLog).
    std::vector<ChatEntry> load(const ConversationKey& key) const;

    void write_group_metadata(const GroupInfo& info);
    void delete_group_metadata(const std::string& group_name);
    std::optional<GroupInfo> load_group_metadata(const std::string& group_name) const;

    // Files that currently have a lock entry.
    std::size_t tracked_files() const;

private:
    std::shared_ptr<std::mutex> lock_for(const std::filesystem::path& file) const;
    void drop_lock(const std::filesystem::path& file);
    static std::vector<ChatEntry> read_log(const std::filesystem::path& file);
    static void write_file(const std::filesystem::path& file, const std::string& contents);

    std::filesystem::path root_;
    std::filesystem::path groups_dir_;

    mutable std::mutex locks_mu_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> file_locks_;
};

} // namespace relaychat::storage
