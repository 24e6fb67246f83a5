#include "chat/GroupRegistry.h"

#include "Log.h"
#include "chat/SessionRegistry.h"
#include "storage/ChatStore.h"

namespace relaychat::chat {

namespace {
std::string quoted(const std::string& s) {
    return "'" + s + "'";
}
} // namespace

GroupRegistry::GroupRegistry(storage::ChatStore& store, const SessionRegistry& sessions)
    : store_(store),
      sessions_(sessions) {}

GroupOutcome GroupRegistry::create(const std::string& admin, const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);

    if (groups_.count(name)) {
        return {GroupStatus::AlreadyExists, "Group " + quoted(name) + " already exists", {}};
    }

    Group group;
    group.name = name;
    group.admin = admin;
    group.members.push_back(admin);
    group.created_date = storage::current_timestamp();

    auto [it, inserted] = groups_.emplace(name, std::move(group));
    persist(it->second);

    log::info("groups", admin + " created " + name);
    return {GroupStatus::Ok, "Group " + quoted(name) + " created successfully. You are the admin.", {}};
}

GroupOutcome GroupRegistry::add_member(const std::string& requester, const std::string& name,
                                       const std::string& user) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return {GroupStatus::NotFound, "Group " + quoted(name) + " does not exist", {}};
    }
    Group& group = it->second;

    if (group.admin != requester) {
        return {GroupStatus::NotAdmin, "Only the admin can add members to " + quoted(name), {}};
    }
    if (!sessions_.is_online(user)) {
        return {GroupStatus::UserOffline, "User " + quoted(user) + " is not online", {}};
    }
    if (group.has_member(user)) {
        return {GroupStatus::AlreadyMember, "User " + quoted(user) + " is already in the group", {}};
    }

    group.add_member(user);
    persist(group);

    GroupOutcome outcome{GroupStatus::Ok, "User " + quoted(user) + " added to group " + quoted(name), {}};
    outcome.notices.push_back({user, "You have been added to group " + quoted(name) + " by " + requester});
    for (auto& notice : notify_members(group, user + " has been added to the group by " + requester)) {
        outcome.notices.push_back(std::move(notice));
    }
    return outcome;
}

GroupOutcome GroupRegistry::leave(const std::string& user, const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return {GroupStatus::NotFound, "Group " + quoted(name) + " does not exist", {}};
    }
    Group& group = it->second;

    if (!group.has_member(user)) {
        return {GroupStatus::NotMember, "You are not a member of group " + quoted(name), {}};
    }

    group.remove_member(user);

    if (group.members.empty()) {
        groups_.erase(it);
        forget(name);
        log::info("groups", name + " deleted");
        return {GroupStatus::Ok,
                "Left group " + quoted(name) + ". Group was deleted as it became empty.", {}};
    }

    GroupOutcome outcome{GroupStatus::Ok, "Left group " + quoted(name), {}};

    if (group.admin == user) {
        group.admin = group.members.front();
        outcome.notices.push_back({group.admin, "You are now the admin of group " + quoted(name)});
        log::info("groups", name + " admin is now " + group.admin);
    }

    persist(group);

    for (auto& notice : notify_members(group, user + " has left the group")) {
        outcome.notices.push_back(std::move(notice));
    }
    return outcome;
}

GroupOutcome GroupRegistry::list_for_user(const std::string& user) const {
    std::lock_guard<std::mutex> lk(mu_);

    std::string lines;
    for (const auto& [name, group] : groups_) {
        if (!group.has_member(user)) continue;
        lines += "\n" + name + " (Admin: " + group.admin +
                 ", Members: " + std::to_string(group.members.size()) + ")";
    }

    if (lines.empty()) return {GroupStatus::Ok, "You are not a member of any groups", {}};
    return {GroupStatus::Ok, "Your groups:" + lines, {}};
}

GroupOutcome GroupRegistry::list_members(const std::string& requester, const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return {GroupStatus::NotFound, "Group " + quoted(name) + " does not exist", {}};
    }
    const Group& group = it->second;

    if (!group.has_member(requester)) {
        return {GroupStatus::NotMember, "You are not a member of group " + quoted(name), {}};
    }

    std::string reply = "Members of " + quoted(name) + ":";
    for (const auto& member : group.members) {
        reply += "\n" + member;
        if (member == group.admin) reply += " (Admin)";
    }
    return {GroupStatus::Ok, reply, {}};
}

std::optional<Group> GroupRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = groups_.find(name);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

bool GroupRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return groups_.count(name) != 0;
}

void GroupRegistry::persist(const Group& group) {
    storage::GroupInfo info;
    info.group_name = group.name;
    info.admin = group.admin;
    info.members = group.members;
    info.created_date = group.created_date;

    try {
        store_.write_group_metadata(info);
    } catch (const storage::StoreError& e) {
        log::error("groups", e.what());
    }
}

void GroupRegistry::forget(const std::string& name) {
    try {
        store_.delete_group_metadata(name);
    } catch (const storage::StoreError& e) {
        log::error("groups", e.what());
    }
}

std::vector<Notice> GroupRegistry::notify_members(const Group& group, const std::string& text) {
    std::vector<Notice> notices;
    notices.reserve(group.members.size());
    for (const auto& member : group.members) {
        notices.push_back({member, "[" + group.name + "] " + text});
    }
    return notices;
}

} // namespace relaychat::chat
