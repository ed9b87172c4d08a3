#include "client_config.hpp"
#include "errors.hpp"
#include "event_engine.hpp"
#include "logger.hpp"
#include "logging_listener.hpp"
#include "protocol_client.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace json = boost::json;

volatile sig_atomic_t g_running = 1;

void signal_handler(int) {
    g_running = 0;
}

int main(int argc, char** argv) {
    try {
        // Set up signal handling for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const std::string config_path = argc > 1 ? argv[1] : "config/gateway.json";
        GatewayConfig config = load_config_file(config_path);

        auto logger = std::make_shared<Logger>(config.log);
        auto event_engine = std::make_shared<EventEngine>(logger);
        event_engine->register_listener(std::make_shared<LoggingListener>(logger));
        event_engine->start();

        ProtocolClient client(event_engine, config.client, logger);
        client.connect();

        for (const auto& entry : config.markets) {
            if (!entry.is_object()) {
                logger->log_warning("Skipping malformed market entry: " + json::serialize(entry));
                continue;
            }
            const auto& market = entry.as_object();
            const std::string exchange = get_string(market, "exchange");
            const std::string symbol = get_string(market, "market");
            try {
                client.subscribe_to_order_book(exchange, symbol);
                client.subscribe_to_trades(exchange, symbol);
            } catch (const ClientError& e) {
                logger->log_error("Subscription for " + symbol + " on " + exchange + " failed: " + e.what());
            }
        }

        // Run until interrupted or the connection drops
        while (g_running && client.state() == ConnectionState::Connected) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "Shutting down..." << std::endl;
        client.disconnect();
        event_engine->stop();
        logger->flush();
        Logger::shutdown();

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Main exception: " << e.what() << std::endl;
        return 1;
    }
}
