#include "Log.h"
#include "ServerConfig.h"
#include "chat/ChatService.h"
#include "networking/LineServer.h"
#include "storage/ChatStore.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using relaychat::networking::ClientId;
using relaychat::networking::Connection;
using relaychat::networking::LineServer;

int main(int argc, char** argv) {
    namespace log = relaychat::log;

    relaychat::ServerConfig config;
    try {
        config = relaychat::ServerConfig::from_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        log::error("RelayChat", e.what());
        return 2;
    }

    try {
        boost::asio::io_context ioc;

        relaychat::storage::ChatStore store(config.log_dir);
        relaychat::chat::ChatService service(store);

        LineServer server(ioc, config.host, config.port);

        server.set_on_connect([&](std::shared_ptr<Connection> connection) {
            service.on_connect(std::move(connection));
        });
        server.set_on_message([&](ClientId id, const std::string& line) {
            service.on_message(id, line);
        });
        server.set_on_disconnect([&](ClientId id) {
            service.on_disconnect(id);
        });

        server.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            log::info("RelayChat", "shutting down...");
            server.stop();
        });

        log::info("RelayChat", "server started on " + config.host + ":" +
                                   std::to_string(server.local_port()) + ", logs in " +
                                   config.log_dir.string());

        // run() returns once the acceptor and every connection are closed.
        std::vector<std::thread> workers;
        const unsigned extra = config.worker_threads() - 1;
        workers.reserve(extra);
        for (unsigned i = 0; i < extra; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();

        log::info("RelayChat", "exit.");
    } catch (const boost::system::system_error& e) {
        log::error("RelayChat", std::string("startup failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        log::error("RelayChat", e.what());
        return 1;
    }
    return 0;
}
