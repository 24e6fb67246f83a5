#include "chat/CommandDispatcher.h"

#include "chat/GroupRegistry.h"
#include "chat/MessageRouter.h"
#include "chat/Session.h"
#include "chat/SessionRegistry.h"

#include <sstream>
#include <utility>
#include <vector>

namespace relaychat::chat {

namespace {

std::vector<std::string> split_words(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}

Command malformed(std::string usage) {
    Command cmd;
    cmd.kind = Command::Kind::Malformed;
    cmd.text = std::move(usage);
    return cmd;
}

// "@user text" / "#group text": the target runs up to the first space.
bool split_addressed(const std::string& line, std::string& target, std::string& text) {
    const auto space = line.find(' ', 1);
    if (space == std::string::npos) return false;

    target = line.substr(1, space - 1);
    text = line.substr(space + 1);
    return !target.empty() && !Names::trim_copy(text).empty();
}

Command parse_slash_command(const std::string& line) {
    std::string word = line;
    std::string rest;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == ' ' || line[i] == '\t') {
            word = line.substr(0, i);
            rest = line.substr(i + 1);
            break;
        }
    }
    const auto args = split_words(rest);

    Command cmd;
    if (word == "/quit") {
        cmd.kind = Command::Kind::Quit;
    } else if (word == "/help") {
        cmd.kind = Command::Kind::Help;
    } else if (word == "/users") {
        cmd.kind = Command::Kind::Users;
    } else if (word == "/listgroups") {
        cmd.kind = Command::Kind::ListGroups;
    } else if (word == "/creategroup") {
        if (args.size() != 1) return malformed("Usage: /creategroup groupname");
        cmd.kind = Command::Kind::CreateGroup;
        cmd.target = args[0];
    } else if (word == "/addtogroup") {
        if (args.size() != 2) return malformed("Usage: /addtogroup groupname username");
        cmd.kind = Command::Kind::AddToGroup;
        cmd.target = args[0];
        cmd.argument = args[1];
    } else if (word == "/leavegroup") {
        if (args.size() != 1) return malformed("Usage: /leavegroup groupname");
        cmd.kind = Command::Kind::LeaveGroup;
        cmd.target = args[0];
    } else if (word == "/groupmembers") {
        if (args.size() != 1) return malformed("Usage: /groupmembers groupname");
        cmd.kind = Command::Kind::GroupMembers;
        cmd.target = args[0];
    } else {
        cmd.kind = Command::Kind::Unknown;
        cmd.text = word;
    }
    return cmd;
}

} // namespace

Command parse_command(const std::string& line) {
    Command cmd;
    if (Names::trim_copy(line).empty()) return cmd;

    switch (line.front()) {
        case '/':
            return parse_slash_command(line);

        case '@':
            if (!split_addressed(line, cmd.target, cmd.text)) {
                return malformed("Invalid private message format. Use: @username message");
            }
            cmd.kind = Command::Kind::Private;
            return cmd;

        case '#':
            if (!split_addressed(line, cmd.target, cmd.text)) {
                return malformed("Invalid group message format. Use: #groupname message");
            }
            cmd.kind = Command::Kind::GroupMessage;
            return cmd;

        default:
            cmd.kind = Command::Kind::Public;
            cmd.text = line;
            return cmd;
    }
}

CommandDispatcher::CommandDispatcher(const SessionRegistry& sessions, GroupRegistry& groups,
                                     MessageRouter& router)
    : sessions_(sessions),
      groups_(groups),
      router_(router) {}

std::string CommandDispatcher::help_text() {
    return "Commands:\n"
           "- Type normally for public messages\n"
           "- Use @username message for private messages\n"
           "- Use #groupname message for group messages\n"
           "- /creategroup groupname - Create a new group\n"
           "- /addtogroup groupname username - Add user to group (admin only)\n"
           "- /leavegroup groupname - Leave a group\n"
           "- /listgroups - List your groups\n"
           "- /groupmembers groupname - List group members\n"
           "- /users - See online users\n"
           "- /help - Show this list\n"
           "- /quit - Leave chat";
}

std::string CommandDispatcher::welcome_text(const std::string& name) {
    return "Welcome to the chat, " + name + "!\n" + help_text();
}

DispatchResult CommandDispatcher::dispatch(const std::string& sender,
                                           networking::Connection& connection,
                                           const std::string& line) {
    const Command cmd = parse_command(line);

    switch (cmd.kind) {
        case Command::Kind::Empty:
            break;

        case Command::Kind::Quit:
            return DispatchResult::Quit;

        case Command::Kind::Help:
            connection.send(help_text());
            break;

        case Command::Kind::Users: {
            std::string list;
            for (const auto& name : sessions_.names()) {
                if (!list.empty()) list += ", ";
                list += name;
            }
            connection.send("Online users: " + list);
            break;
        }

        case Command::Kind::CreateGroup:
            if (!Names::is_valid(cmd.target)) {
                connection.send("Invalid group name '" + cmd.target + "'");
                break;
            }
            connection.send(groups_.create(sender, cmd.target).reply);
            break;

        case Command::Kind::AddToGroup: {
            auto outcome = groups_.add_member(sender, cmd.target, cmd.argument);
            connection.send(outcome.reply);
            router_.deliver(outcome.notices);
            break;
        }

        case Command::Kind::LeaveGroup: {
            auto outcome = groups_.leave(sender, cmd.target);
            connection.send(outcome.reply);
            router_.deliver(outcome.notices);
            break;
        }

        case Command::Kind::ListGroups:
            connection.send(groups_.list_for_user(sender).reply);
            break;

        case Command::Kind::GroupMembers:
            connection.send(groups_.list_members(sender, cmd.target).reply);
            break;

        case Command::Kind::Private:
            connection.send(router_.send_private(sender, cmd.target, cmd.text).reply);
            break;

        case Command::Kind::GroupMessage:
            connection.send(router_.send_group(sender, cmd.target, cmd.text).reply);
            break;

        case Command::Kind::Public:
            router_.broadcast_public(sender, cmd.text);
            break;

        case Command::Kind::Malformed:
            connection.send(cmd.text);
            break;

        case Command::Kind::Unknown:
            connection.send("Unknown command '" + cmd.text + "'. Type /help for the command list.");
            break;
    }
    return DispatchResult::Continue;
}

} // namespace relaychat::chat
