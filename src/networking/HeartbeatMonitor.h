#pragma once

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace marketchat::networking {

// Periodically asks for users whose heartbeats stopped to be set offline.
// Runs on a strand of the io_context it was built with.
class HeartbeatMonitor {
public:
    // Receives the silence threshold; returns how many users it expired.
    using Sweep = std::function<std::size_t(std::chrono::milliseconds timeout)>;

    HeartbeatMonitor(boost::asio::io_context& ioc,
                     std::chrono::milliseconds interval,
                     std::chrono::milliseconds timeout,
                     Sweep sweep);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start();
    void stop();

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace marketchat::networking
