#pragma once

#include <string_view>

namespace relaychat::chat {

// Well-formed UTF-8 as RFC 3629 defines it: no overlong forms, no surrogates,
// nothing above U+10FFFF. The JSON logs only hold text that passes this check.
bool is_valid_utf8(std::string_view text) noexcept;

} // namespace relaychat::chat
