#pragma once

#include <filesystem>
#include <string>

namespace relaychat {

struct ServerConfig {
    std::string host = "localhost";
    unsigned short port = 12345;
    std::filesystem::path log_dir = "server_logs";
    unsigned threads = 0;  // 0 = one per hardware thread

    // relaychat_server [host] [port] [log_dir]
    // Throws std::invalid_argument on a bad port or extra arguments.
    static ServerConfig from_args(int argc, const char* const* argv);

    unsigned worker_threads() const noexcept;
};

} // namespace relaychat
