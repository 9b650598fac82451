#pragma once

#include "networking/Transport.hpp"

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace marketchat::networking {

class WebSocketServer : public Transport {
public:
    // `user_id` comes from the upgrade request ("?userId=" or a "userid"
    // header). Requests without one are refused before this is called.
    using OnConnect    = std::function<Admission(ClientId, const std::string& user_id)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    WebSocketServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    unsigned short port() const;

    bool send(ClientId client, const std::string& msg) override;
    void close(ClientId client) override;

    // Extracts the user id from a request target and userid header value.
    static std::string handshake_user_id(const std::string& target, const std::string& header);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace marketchat::networking
