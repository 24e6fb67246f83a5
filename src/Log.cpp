#include "Log.h"

#include <iostream>
#include <mutex>

namespace relaychat::log {

namespace {
std::mutex& output_mutex() {
    static std::mutex mu;
    return mu;
}
} // namespace

void write(Level level, std::string_view tag, std::string_view message) {
    std::lock_guard<std::mutex> lk(output_mutex());

    std::ostream& out = (level == Level::Info) ? std::cout : std::cerr;
    out << "[" << tag << "] ";
    if (level == Level::Warn) out << "warning: ";
    if (level == Level::Error) out << "error: ";
    out << message << "\n";
    out.flush();
}

} // namespace relaychat::log
