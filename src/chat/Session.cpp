#include "chat/Session.h"

namespace relaychat::chat {

bool Names::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string Names::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

bool Names::is_valid(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxNameLen) return false;

    for (char c : name) {
        if (is_space(c)) return false;
        if (c == '/' || c == '\\' || c == '@' || c == '#') return false;
        if (static_cast<unsigned char>(c) < 0x20) return false;
    }
    return name != "." && name != "..";
}

bool Names::is_valid_user(std::string_view name) noexcept {
    return is_valid(name) &&
           name.find('_') == std::string_view::npos &&
           name != "SYSTEM" && name != "Public";
}

} // namespace relaychat::chat
