#pragma once

#include "chat/Group.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relaychat::storage { class ChatStore; }

namespace relaychat::chat {

class SessionRegistry;

enum class GroupStatus {
    Ok,
    AlreadyExists,
    NotFound,
    NotAdmin,
    UserOffline,
    AlreadyMember,
    NotMember,
};

// A line owed to one user as a side effect of a group operation.
struct Notice {
    std::string recipient;
    std::string text;
};

struct GroupOutcome {
    GroupStatus status = GroupStatus::Ok;
    std::string reply;             // for the requesting user
    std::vector<Notice> notices;   // for everyone else; delivered by the router

    bool ok() const noexcept { return status == GroupStatus::Ok; }
};

// Membership and admin table for named groups, mirrored to the group info files.
// Every operation holds the registry lock for its whole check-and-mutate step.
class GroupRegistry {
public:
    GroupRegistry(storage::ChatStore& store, const SessionRegistry& sessions);

    GroupRegistry(const GroupRegistry&) = delete;
    GroupRegistry& operator=(const GroupRegistry&) = delete;

    GroupOutcome create(const std::string& admin, const std::string& name);
    GroupOutcome add_member(const std::string& requester, const std::string& name,
                            const std::string& user);

    // A departing admin hands over to the earliest-joined remaining member.
    // The last member out deletes the group and its info file.
    GroupOutcome leave(const std::string& user, const std::string& name);

    GroupOutcome list_for_user(const std::string& user) const;
    GroupOutcome list_members(const std::string& requester, const std::string& name) const;

    std::optional<Group> find(const std::string& name) const;
    bool exists(const std::string& name) const;

private:
    // Called with mu_ held, so info-file rewrites land in the order the
    // changes were made. Group commands wait on that disk write.
    // Failures are logged; in-memory state stays authoritative.
    void persist(const Group& group);
    void forget(const std::string& name);

    static std::vector<Notice> notify_members(const Group& group, const std::string& text);

    storage::ChatStore& store_;
    const SessionRegistry& sessions_;

    mutable std::mutex mu_;
    std::map<std::string, Group> groups_;
};

} // namespace relaychat::chat
