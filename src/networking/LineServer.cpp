#include "networking/LineServer.h"

#include "Log.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace relaychat::networking {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using error_code = boost::system::error_code;

class LineServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& host, unsigned short port)
        : ioc_(ioc),
          acceptor_(asio::make_strand(ioc)) {
        tcp::resolver resolver(ioc);
        const tcp::endpoint endpoint =
            resolver.resolve(host, std::to_string(port), tcp::resolver::passive).begin()->endpoint();

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
    }

    void start() { do_accept(); }

    // The acceptor lives on its own strand; stop() may be called from any thread.
    void stop() {
        asio::post(
            acceptor_.get_executor(),
            [this] {
                error_code ec;
                acceptor_.close(ec);

                // Sessions deregister themselves as their reads abort.
                std::vector<std::shared_ptr<Session>> live;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    for (auto& [id, s] : sessions_) live.push_back(s);
                }
                for (auto& s : live) s->abort();
            });
    }

    unsigned short local_port() const {
        return acceptor_.local_endpoint().port();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Session : public Connection, public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              socket_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)),
              buffer_(kMaxLineLength) {}

        ClientId id() const noexcept override { return id_; }

        void start() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (self->server_.on_connect_) self->server_.on_connect_(self);
                    self->do_read();
                });
        }

        bool send(const std::string& line) override {
            if (closing_.load()) return false;

            asio::post(
                strand_,
                [self = shared_from_this(), msg = line + "\n"]() mutable {
                    if (self->finished_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(msg));
                    if (!writing) self->do_write();
                });
            return true;
        }

        void close() override {
            closing_ = true;
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    // With writes in flight, do_write shuts down once the queue drains.
                    if (!self->finished_ && self->write_queue_.empty()) self->shutdown();
                });
        }

        // Drops queued output and closes right away.
        void abort() {
            closing_ = true;
            asio::post(
                strand_,
                [self = shared_from_this()] { self->shutdown(); });
        }

    private:
        void do_read() {
            asio::async_read_until(
                socket_,
                buffer_,
                '\n',
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](error_code ec, std::size_t n) {
                        if (ec) return self->finish(ec);

                        auto begin = asio::buffers_begin(self->buffer_.data());
                        std::string line(begin, begin + static_cast<std::ptrdiff_t>(n - 1));
                        self->buffer_.consume(n);
                        if (!line.empty() && line.back() == '\r') line.pop_back();

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, line);

                        if (!self->finished_) self->do_read();
                    }));
        }

        void do_write() {
            asio::async_write(
                socket_,
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](error_code ec, std::size_t) {
                        if (ec) return self->finish(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) {
                            self->do_write();
                        } else if (self->closing_) {
                            self->shutdown();
                        }
                    }));
        }

        void shutdown() {
            error_code ignored;
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }

        // Runs once per session, whichever of read/write fails first.
        void finish(error_code ec) {
            if (finished_) return;
            finished_ = true;
            closing_ = true;

            if (ec != asio::error::eof &&
                ec != asio::error::operation_aborted &&
                ec != asio::error::connection_reset &&
                ec != asio::error::bad_descriptor) {
                log::warn("client " + std::to_string(id_), "io: " + ec.message());
            }

            error_code ignored;
            socket_.close(ignored);

            server_.remove_session(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        Impl& server_;
        ClientId id_;

        tcp::socket socket_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        asio::streambuf buffer_;
        std::deque<std::string> write_queue_;

        std::atomic<bool> closing_{false};
        bool finished_ = false;  // strand-only
    };

    void do_accept() {
        acceptor_.async_accept(
            ioc_,
            [this](error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    log::error("accept", ec.message());
                    return do_accept();
                }

                auto id = next_client_id_++;

                error_code peer_ec;
                auto peer = socket.remote_endpoint(peer_ec);
                if (!peer_ec) {
                    log::info("accept", "client " + std::to_string(id) + " from " +
                                            peer.address().to_string() + ":" +
                                            std::to_string(peer.port()));
                }

                auto session = std::make_shared<Session>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    sessions_[id] = session;
                }

                session->start();
                do_accept();
            });
    }

    void remove_session(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Session>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- LineServer wrapper ----

LineServer::LineServer(asio::io_context& ioc, const std::string& host, unsigned short port)
    : impl_(new Impl(ioc, host, port)) {}

void LineServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void LineServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void LineServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void LineServer::start() { impl_->start(); }
void LineServer::stop() { impl_->stop(); }

unsigned short LineServer::local_port() const { return impl_->local_port(); }

LineServer::~LineServer() = default;

} // namespace relaychat::networking
