#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace relaychat::chat {

// Invariants kept by GroupRegistry: admin is a member, members is never empty.
struct Group {
    std::string name;
    std::vector<std::string> members;  // join order
    std::string admin;
    std::string created_date;

    bool has_member(const std::string& user) const {
        return std::find(members.begin(), members.end(), user) != members.end();
    }

    void add_member(const std::string& user) { members.push_back(user); }

    void remove_member(const std::string& user) {
        members.erase(std::remove(members.begin(), members.end(), user), members.end());
    }
};

} // namespace relaychat::chat
