#pragma once

#include <string_view>

namespace relaychat::log {

enum class Level { Info, Warn, Error };

// Writes one "[tag] message" line. Safe to call from any worker thread.
void write(Level level, std::string_view tag, std::string_view message);

inline void info(std::string_view tag, std::string_view message) {
    write(Level::Info, tag, message);
}

inline void warn(std::string_view tag, std::string_view message) {
    write(Level::Warn, tag, message);
}

inline void error(std::string_view tag, std::string_view message) {
    write(Level::Error, tag, message);
}

} // namespace relaychat::log
