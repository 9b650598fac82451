#include "HeartbeatMonitor.h"

#include "chat/Error.h"
#include "util/Log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>

namespace marketchat::networking {

namespace asio = boost::asio;

class HeartbeatMonitor::Impl : public std::enable_shared_from_this<HeartbeatMonitor::Impl> {
public:
    Impl(asio::io_context& ioc, std::chrono::milliseconds interval,
         std::chrono::milliseconds timeout, Sweep sweep)
        : strand_(asio::make_strand(ioc)),
          timer_(strand_),
          interval_(interval),
          timeout_(timeout),
          sweep_(std::move(sweep)) {}

    void start() {
        running_ = true;
        asio::post(strand_, [self = shared_from_this()] { self->arm(); });
    }

    void stop() {
        running_ = false;
        asio::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
    }

private:
    void arm() {
        if (!running_) return;
        timer_.expires_after(interval_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec == asio::error::operation_aborted || !self->running_) return;
            self->tick();
            self->arm();
        });
    }

    void tick() {
        try {
            const std::size_t n = sweep_(timeout_);
            if (n > 0) util::log_info("heartbeat") << n << " user(s) expired";
        } catch (const chat::ChatError& e) {
            // Retried on the next tick.
            util::log_error("heartbeat") << "sweep failed: " << e.what();
        }
    }

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds timeout_;
    Sweep sweep_;
    std::atomic<bool> running_{false};
};

HeartbeatMonitor::HeartbeatMonitor(asio::io_context& ioc,
                                   std::chrono::milliseconds interval,
                                   std::chrono::milliseconds timeout,
                                   Sweep sweep)
    : impl_(std::make_shared<Impl>(ioc, interval, timeout, std::move(sweep))) {}

HeartbeatMonitor::~HeartbeatMonitor() = default;

void HeartbeatMonitor::start() { impl_->start(); }
void HeartbeatMonitor::stop() { impl_->stop(); }

} // namespace marketchat::networking
