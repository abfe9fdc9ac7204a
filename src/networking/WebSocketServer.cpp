#include "networking/WebSocketServer.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace duochat::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static constexpr const char* kServerName = "duochat";

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const ListenOptions& opts)
        : ioc_(ioc),
          opts_(opts),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(opts.bind_address), opts.port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::unordered_map<ClientId, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions.swap(sessions_);
        }
        for (auto& [id, s] : sessions) {
            s->close();
        }
    }

    void send(ClientId client, const std::string& msg) {
        std::shared_ptr<Session> s;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(client);
            if (it == sessions_.end()) return;
            s = it->second;
        }
        s->send(msg);
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        if (ec) return 0;
        return ep.port();
    }

    std::size_t session_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    // All members are touched only from the socket's strand.
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)) {}

        ClientId id() const { return id_; }

        void start() {
            asio::dispatch(
                ws_.get_executor(),
                [self = shared_from_this()] { self->do_handshake(); });
        }

        void send(const std::string& msg) {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), msg] {
                    // Broadcasts race closes; a dead socket just drops the frame.
                    if (self->closed_ || !self->ws_.is_open()) return;

                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this()] {
                    if (self->closed_ || !self->ws_.is_open()) return;
                    self->ws_.async_close(
                        websocket::close_code::going_away,
                        [self](beast::error_code ec) {
                            if (ec) self->on_close_or_fail(ec);
                        });
                });
        }

    private:
        void do_handshake() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) {
                    res.set(beast::http::field::server, kServerName);
                }));
            ws_.read_message_max(server_.opts_.max_message_bytes);

            ws_.async_accept(
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) {
                        self->fail("accept", ec);
                        self->server_.remove_session(self->id_);
                        return;
                    }

                    self->connected_ = true;
                    if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                    self->do_read();
                });
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);
                    // Disconnect already reported; late frames are dropped.
                    if (self->closed_) return;

                    // Binary frames are decoded the same way as text.
                    std::string msg = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                    self->do_read();
                });
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    // The queue front stays alive until this write completes.
                    if (ec || self->closed_) {
                        self->write_queue_.clear();
                        return self->on_close_or_fail(ec);
                    }

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        // Reached from the read and the write path; reports the disconnect once.
        // A pending write keeps its queue; its handler clears it.
        void on_close_or_fail(beast::error_code ec) {
            if (closed_) return;
            closed_ = true;

            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            // Cancels the other pending operation so nothing outlives the disconnect.
            beast::get_lowest_layer(ws_).close();

            server_.remove_session(id_);
            if (connected_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[Session " << id_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool connected_ = false;
        bool closed_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    return do_accept();
                }

                std::shared_ptr<Session> session;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    if (sessions_.size() >= opts_.max_connections) {
                        std::cerr << "[accept] connection limit (" << opts_.max_connections
                                  << ") reached, refusing client\n";
                        beast::error_code ignored;
                        socket.close(ignored);
                    } else {
                        auto id = next_client_id_++;
                        session = std::make_shared<Session>(*this, std::move(socket), id);
                        sessions_[id] = session;
                    }
                }

                if (session) session->start();
                do_accept();
            });
    }

    void remove_session(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

private:
    asio::io_context& ioc_;
    ListenOptions opts_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Session>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const ListenOptions& opts)
    : impl_(new Impl(ioc, opts)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

void WebSocketServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::session_count() const { return impl_->session_count(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace duochat::networking
