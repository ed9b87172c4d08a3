#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/json.hpp>

#include "client_config.hpp"
#include "event_engine.hpp"
#include "itransport.hpp"
#include "logger.hpp"
#include "protocol_messages.hpp"
#include "types.hpp"

namespace json = boost::json;

/**
 * @class ProtocolClient
 * @brief Correlated request/response client for the remote trading engine.
 *
 * One persistent transport carries both the answers to our requests and unsolicited push
 * messages. Every request gets an id and a pending entry; the transport's receive context
 * resolves entries by id, and anything unmatched is classified as a push event and put on
 * the EventEngine.
 *
 * Request methods block the calling thread until the response or the timeout. They must not
 * be called from the transport's receive context.
 */
class ProtocolClient {
public:
    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

    /**
     * @throws ValidationError if the config is invalid or the engine/logger is missing.
     * @param transport_factory Builds a fresh transport per connect(); defaults to WebSocketTransport.
     */
    ProtocolClient(std::shared_ptr<EventEngine> event_engine, ClientConfig config,
                   std::shared_ptr<Logger> logger, TransportFactory transport_factory = {});
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /**
     * @brief Opens the transport, authenticates and moves to Connected.
     * @throws ConnectionError on transport or authentication failure; the client is left Disconnected.
     */
    void connect();

    // Closes the transport, fails any pending request and moves to Disconnected.
    void disconnect();

    ConnectionState state() const { return state_.load(); }
    std::size_t pending_requests() const;
    const ClientConfig& config() const { return config_; }

    /**
     * @brief Sends one request and waits for the response carrying the same id.
     *
     * An "id" already present in the request is kept; otherwise the next id is assigned.
     * A non-success status is returned, not thrown.
     * @throws RequestTimeout, ConnectionError
     */
    Response send_request(json::object request);

    //////////////////////////////////////////////////////////////////////////
    // Trading operations
    //////////////////////////////////////////////////////////////////////////

    json::object create_order(const std::string& exchange, const std::string& market, OrderSide side,
                              OrderType order_type, double amount, std::optional<double> price = std::nullopt);

    json::object cancel_order(const std::string& exchange, const std::string& market, const std::string& order_id);

    json::object get_order_status(const std::string& exchange, const std::string& market,
                                  const std::string& order_id);

    json::object get_order_book(const std::string& exchange, const std::string& market, int depth = 10);

    json::object get_ticker(const std::string& exchange, const std::string& market);

    // Returns the whole acknowledgment frame.
    json::object subscribe_to_order_book(const std::string& exchange, const std::string& market);
    json::object subscribe_to_trades(const std::string& exchange, const std::string& market);

    json::object get_balances(const std::string& exchange);

    json::array get_open_orders(const std::string& exchange, const std::string& market);

    json::array get_order_history(const std::string& exchange, const std::string& market, int limit = 50);

private:
    void open_transport();
    bool transport_is_open() const;
    void cleanup(const std::string& reason);
    void fail_pending(const std::string& reason);

    // Receive context
    void on_message(std::string text);
    void on_transport_closed(const std::string& reason);
    void handle_push(const std::string& type, const json::object& frame);

    Response request_checked(json::object request, const std::string& action);
    void publish(EventKind kind, json::object payload, const char* origin);

    std::shared_ptr<EventEngine> event_engine_;
    ClientConfig config_;
    std::shared_ptr<Logger> logger_;
    TransportFactory transport_factory_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<uint64_t> next_id_{0};

    std::shared_ptr<ITransport> transport_;
    mutable std::mutex transport_mutex_;
    std::mutex connection_mutex_;

    std::unordered_map<std::string, std::promise<json::object>> pending_;
    std::string auth_request_id_;
    mutable std::mutex pending_mutex_;
};
