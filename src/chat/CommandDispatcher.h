#pragma once

#include "networking/Connection.h"

#include <string>

namespace relaychat::chat {

class GroupRegistry;
class MessageRouter;
class SessionRegistry;

// One client line, classified.
struct Command {
    enum class Kind {
        Empty,
        Quit,
        Help,
        Users,
        CreateGroup,
        AddToGroup,
        LeaveGroup,
        ListGroups,
        GroupMembers,
        Private,
        GroupMessage,
        Public,
        Malformed,
        Unknown,
    };

    Kind kind = Kind::Empty;
    std::string target;    // group name, or user for Private
    std::string argument;  // user to add for AddToGroup
    std::string text;      // message body; usage line for Malformed; command word for Unknown
};

Command parse_command(const std::string& line);

enum class DispatchResult { Continue, Quit };

// Executes one line from an Active session. Every command that is refused or
// malformed produces exactly one reply line to the sender and nothing else.
class CommandDispatcher {
public:
    CommandDispatcher(const SessionRegistry& sessions, GroupRegistry& groups, MessageRouter& router);

    DispatchResult dispatch(const std::string& sender, networking::Connection& connection,
                            const std::string& line);

    static std::string welcome_text(const std::string& name);
    static std::string help_text();

private:
    const SessionRegistry& sessions_;
    GroupRegistry& groups_;
    MessageRouter& router_;
};

} // namespace relaychat::chat
