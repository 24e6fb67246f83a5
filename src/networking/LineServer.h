#pragma once

#include "networking/Connection.h"

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace relaychat::networking {

// Newline-framed TCP server. Each accepted socket gets its own strand, so the
// callbacks for one client never run concurrently with each other.
class LineServer {
public:
    using OnConnect    = std::function<void(std::shared_ptr<Connection>)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    // Resolves and binds host:port. Throws boost::system::system_error on failure.
    LineServer(boost::asio::io_context& ioc, const std::string& host, unsigned short port);
    ~LineServer();

    LineServer(const LineServer&) = delete;
    LineServer& operator=(const LineServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections

    unsigned short local_port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace relaychat::networking
