#include "ServerConfig.h"

#include <stdexcept>
#include <string>
#include <thread>

namespace relaychat {

namespace {
unsigned short parse_port(const std::string& text) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port '" + text + "'");
    }
    if (used != text.size() || value == 0 || value > 65535) {
        throw std::invalid_argument("invalid port '" + text + "'");
    }
    return static_cast<unsigned short>(value);
}
} // namespace

ServerConfig ServerConfig::from_args(int argc, const char* const* argv) {
    if (argc > 4) {
        throw std::invalid_argument("usage: relaychat_server [host] [port] [log_dir]");
    }

    ServerConfig config;
    if (argc > 1) config.host = argv[1];
    if (argc > 2) config.port = parse_port(argv[2]);
    if (argc > 3) config.log_dir = argv[3];
    return config;
}

unsigned ServerConfig::worker_threads() const noexcept {
    if (threads != 0) return threads;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 2 : hw;
}

} // namespace relaychat
