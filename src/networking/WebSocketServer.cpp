#include "WebSocketServer.h"

#include "util/Log.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace marketchat::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string query_param(const std::string& target, const std::string& key) {
    const auto q = target.find('?');
    if (q == std::string::npos) return {};

    std::size_t pos = q + 1;
    while (pos < target.size()) {
        std::size_t amp = target.find('&', pos);
        if (amp == std::string::npos) amp = target.size();
        const std::size_t eq = target.find('=', pos);
        if (eq != std::string::npos && eq < amp && target.compare(pos, eq - pos, key) == 0) {
            return url_decode(target.substr(eq + 1, amp - eq - 1));
        }
        pos = amp + 1;
    }
    return {};
}

std::string trim(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(address), port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all sessions
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, s] : sessions_) {
            s->close();
        }
        sessions_.clear();
    }

    bool send(ClientId client, const std::string& msg) {
        auto s = find(client);
        if (!s) return false;
        return s->send(msg);
    }

    void close(ClientId client) {
        if (auto s = find(client)) s->close();
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        ClientId id() const { return id_; }

        // Reads the HTTP upgrade request first so the user id can be checked
        // before the WebSocket handshake completes.
        void start() {
            beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
            http::async_read(
                ws_.next_layer(), buffer_, req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->fail("handshake read", ec);
                            return self->server_.remove_session(self->id_);
                        }
                        self->on_upgrade_request();
                    }));
        }

        bool send(const std::string& msg) {
            if (closed_.load()) return false;
            asio::post(
                strand_,
                [self = shared_from_this(), msg] {
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing && self->open_) self->do_write();
                });
            return true;
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (!self->open_) return;
                    beast::error_code ec;
                    self->ws_.close(websocket::close_code::normal, ec);
                });
        }

    private:
        void on_upgrade_request() {
            if (!websocket::is_upgrade(req_)) {
                return reject(http::status::bad_request, "websocket upgrade required");
            }

            const std::string user_id = WebSocketServer::handshake_user_id(
                std::string(req_.target()), std::string(req_["userid"]));
            if (user_id.empty()) {
                return reject(http::status::bad_request, "userId required");
            }

            if (!server_.on_connect_ || server_.on_connect_(id_, user_id) != Admission::Accept) {
                return reject(http::status::forbidden, "unknown user");
            }
            bound_ = true;

            beast::get_lowest_layer(ws_).expires_never();
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.async_accept(
                req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->open_ = true;
                        if (!self->write_queue_.empty()) self->do_write();
                        self->do_read();
                    }));
        }

        void reject(http::status status, const char* reason) {
            util::log_warn("ws") << "session " << id_ << " rejected: " << reason;
            closed_ = true;

            auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
            res->set(http::field::content_type, "text/plain");
            res->keep_alive(false);
            res->body() = reason;
            res->prepare_payload();

            http::async_write(
                ws_.next_layer(), *res,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                        if (ec) self->fail("reject write", ec);
                        beast::error_code ignored;
                        beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
                        self->server_.remove_session(self->id_);
                    }));
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            // Read and write failures can both land here; report once.
            if (closed_.exchange(true)) return;

            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed) fail("io", ec);

            open_ = false;
            write_queue_.clear();
            server_.remove_session(id_);
            if (bound_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            util::log_warn("ws") << "session " << id_ << " " << what << ": " << ec.message();
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        std::deque<std::string> write_queue_;

        bool open_ = false;    // handshake done; strand only
        bool bound_ = false;   // on_connect accepted the user; strand only
        std::atomic<bool> closed_{false};
    };

    std::shared_ptr<Session> find(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    util::log_warn("ws") << "accept: " << ec.message();
                    return do_accept();
                }

                auto id = next_client_id_++;
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

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(new Impl(ioc, address, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

bool WebSocketServer::send(ClientId client, const std::string& msg) { return impl_->send(client, msg); }
void WebSocketServer::close(ClientId client) { impl_->close(client); }

std::string WebSocketServer::handshake_user_id(const std::string& target, const std::string& header) {
    std::string from_header = trim(header);
    if (!from_header.empty()) return from_header;
    return trim(query_param(target, "userId"));
}

WebSocketServer::~WebSocketServer() = default;

} // namespace marketchat::networking
