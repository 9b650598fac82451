#include "chat/ActiveViewTracker.h"
#include "chat/ConversationDirectory.h"
#include "chat/DeliveryEngine.h"
#include "chat/Error.h"
#include "chat/IDGenerator.hpp"
#include "chat/PresenceStore.h"
#include "chat/PushSender.h"
#include "config/Config.h"
#include "networking/EventRouter.h"
#include "networking/HeartbeatMonitor.h"
#include "networking/WebSocketServer.h"
#include "store/SqliteStore.h"
#include "util/Log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace marketchat;
    using namespace marketchat::networking;

    config::ServerConfig cfg;
    if (argc > 1) {
        std::string error;
        if (!config::load_config(argv[1], cfg, error)) {
            std::cerr << "[MarketChat] " << error << "\n";
            return 1;
        }
    }
    util::Logger::instance().set_level(cfg.log.level);

    try {
        boost::asio::io_context ioc;

        store::SqliteStore db(cfg.server.database);
        chat::IDGenerator idgen;
        chat::ActiveViewTracker tracker;
        chat::ConversationDirectory directory(db, idgen);
        chat::PresenceStore presence(db);
        chat::DeliveryEngine engine(db, directory, tracker, idgen);
        chat::LogPushSender push;

        WebSocketServer server(ioc, cfg.server.address, cfg.server.port);

        EventRouter::Options options;
        options.auto_register_users = cfg.server.auto_register_users;
        EventRouter router(server, db, presence, directory, tracker, engine, push, idgen, options);

        server.set_on_connect([&](ClientId client, const std::string& user_id) {
            return router.on_connect(client, user_id);
        });
        server.set_on_disconnect([&](ClientId client) { router.on_disconnect(client); });
        server.set_on_message([&](ClientId client, const std::string& msg) {
            router.on_message(client, msg);
        });

        HeartbeatMonitor heartbeat(ioc, cfg.presence.sweep_interval, cfg.presence.effective_timeout(),
                                   [&](std::chrono::milliseconds timeout) {
                                       return router.expire_stale(timeout).size();
                                   });

        server.start();
        heartbeat.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log_info("main") << "shutting down";
            heartbeat.stop();
            server.stop();
            ioc.stop();
        });

        util::log_info("main") << "WS server on " << cfg.server.address << ":" << server.port()
                               << ", " << cfg.server.threads << " thread(s), db " << cfg.server.database;

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < cfg.server.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();
    } catch (const chat::ChatError& e) {
        std::cerr << "[MarketChat] " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[MarketChat] " << e.what() << "\n";
        return 1;
    }

    util::log_info("main") << "exit";
    return 0;
}
