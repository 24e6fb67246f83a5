#include "chat/Utf8.h"

#include <cstddef>

namespace relaychat::chat {

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;        // overlong
            else if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;        // overlong
            else if (c == 0xF4) hi = 0x8F;   // > U+10FFFF
        } else {
            return false;
        }

        if (n - i < len) return false;

        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < lo || second > hi) return false;
        for (std::size_t k = 2; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if (cont < 0x80 || cont > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

} // namespace relaychat::chat
