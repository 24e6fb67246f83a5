#pragma once

#include "networking/Connection.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace relaychat::chat {

// The binding between one live connection and its display name.
struct Session {
    using Clock = std::chrono::steady_clock;

    std::string name;
    std::shared_ptr<networking::Connection> connection;
    Clock::time_point connected_at{};
};

// Display names and group names share one rule set because both end up in file names.
struct Names {
    static constexpr std::size_t kMaxNameLen = 32;

    static std::string trim_copy(std::string s);

    // 1..kMaxNameLen characters, no whitespace, none of "/\@#".
    static bool is_valid(std::string_view name) noexcept;

    // is_valid(), no '_' (it separates the pair in conversation file names),
    // and not one of the names the server uses itself.
    static bool is_valid_user(std::string_view name) noexcept;

private:
    static bool is_space(char c) noexcept;
};

} // namespace relaychat::chat
