#include "protocol_client.hpp"
#include "errors.hpp"
#include "websocket_transport.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

namespace {

constexpr const char* REMOTE_ORIGIN = "remote";
constexpr const char* CLIENT_ORIGIN = "protocol_client";

json::object data_as_object(const Response& response) {
    if (response.data.is_object()) {
        return response.data.as_object();
    }
    return json::object{};
}

json::array data_as_array(const Response& response) {
    if (response.data.is_array()) {
        return response.data.as_array();
    }
    return json::array{};
}

} // namespace

//////////////////////////////////////////////////////////////////////////
// Constructor / Destructor
//////////////////////////////////////////////////////////////////////////

ProtocolClient::ProtocolClient(std::shared_ptr<EventEngine> event_engine, ClientConfig config,
                               std::shared_ptr<Logger> logger, TransportFactory transport_factory)
    : event_engine_(std::move(event_engine))
    , config_(std::move(config))
    , logger_(std::move(logger))
    , transport_factory_(std::move(transport_factory))
{
    if (!event_engine_) {
        throw ValidationError("ProtocolClient requires an event engine");
    }
    if (!logger_) {
        throw ValidationError("ProtocolClient requires a logger");
    }
    config_.validate();

    if (!transport_factory_) {
        transport_factory_ = [logger = logger_]() { return std::make_unique<WebSocketTransport>(logger); };
    }
}

ProtocolClient::~ProtocolClient() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] Error during shutdown: {}", e.what());
    }
}

//////////////////////////////////////////////////////////////////////////
// Connection lifecycle
//////////////////////////////////////////////////////////////////////////

void ProtocolClient::connect() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (state_ == ConnectionState::Connected) {
        LOG_INFO(logger_->quill_logger(), "[ProtocolClient] Already connected");
        return;
    }

    LOG_INFO(logger_->quill_logger(), "[ProtocolClient] Connecting to ws://{}:{}{}",
             config_.host, config_.port, config_.target);
    // A transport lost while connected is still held; release it first.
    cleanup("Reconnecting");
    state_ = ConnectionState::Connecting;

    try {
        open_transport();

        json::object auth = make_authenticate_request(config_.api_key);
        std::string auth_id = std::to_string(++next_id_);
        auth["id"] = auth_id;
        {
            std::lock_guard<std::mutex> pending_lock(pending_mutex_);
            auth_request_id_ = auth_id;
        }

        Response response = send_request(std::move(auth));
        if (!response.ok()) {
            throw ConnectionError("Authentication failed: " +
                                  (response.message.empty() ? std::string("Authentication failed") : response.message));
        }

        // The transport may have dropped between the acknowledgment and here; on_transport_closed
        // then moved the state to Error and this exchange fails.
        ConnectionState expected = ConnectionState::Connecting;
        if (!transport_is_open() || !state_.compare_exchange_strong(expected, ConnectionState::Connected)) {
            throw ConnectionError("Connection lost during authentication");
        }
    } catch (const std::exception& e) {
        state_ = ConnectionState::Error;
        cleanup("Connection attempt failed");
        state_ = ConnectionState::Disconnected;
        LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] Failed to connect: {}", e.what());
        publish(EventKind::Error,
                json::object{{"message", "Failed to connect to " + config_.host + ":" + std::to_string(config_.port)},
                             {"error", e.what()}},
                CLIENT_ORIGIN);
        throw ConnectionError(std::string("Failed to connect: ") + e.what());
    }

    LOG_INFO(logger_->quill_logger(), "[ProtocolClient] Connected and authenticated");
    publish(EventKind::System, json::object{{"event", "connected"}}, CLIENT_ORIGIN);
}

void ProtocolClient::disconnect() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    bool was_active = state_ != ConnectionState::Disconnected;
    {
        std::lock_guard<std::mutex> transport_lock(transport_mutex_);
        was_active = was_active || transport_ != nullptr;
    }
    if (!was_active) {
        return;
    }

    LOG_INFO(logger_->quill_logger(), "[ProtocolClient] Disconnecting");
    cleanup("Disconnected");
    state_ = ConnectionState::Disconnected;
    LOG_INFO(logger_->quill_logger(), "[ProtocolClient] Disconnected");
    publish(EventKind::System, json::object{{"event", "disconnected"}}, CLIENT_ORIGIN);
}

bool ProtocolClient::transport_is_open() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return transport_ && transport_->is_open();
}

std::size_t ProtocolClient::pending_requests() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void ProtocolClient::open_transport() {
    const std::string port = std::to_string(config_.port);
    std::string last_error;

    for (int attempt = 0; attempt <= config_.retry_attempts; ++attempt) {
        if (attempt > 0) {
            LOG_WARNING(logger_->quill_logger(), "[ProtocolClient] Retrying transport open ({}/{})",
                        attempt, config_.retry_attempts);
            std::this_thread::sleep_for(config_.retry_delay);
        }

        std::shared_ptr<ITransport> transport = transport_factory_();
        transport->set_message_handler([this](std::string text) { on_message(std::move(text)); });
        transport->set_close_handler([this](const std::string& reason) { on_transport_closed(reason); });

        try {
            transport->open(config_.host, port, config_.target);
        } catch (const ConnectionError& e) {
            last_error = e.what();
            LOG_WARNING(logger_->quill_logger(), "[ProtocolClient] Transport open failed: {}", last_error);
            continue;
        }

        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport_ = std::move(transport);
        return;
    }

    throw ConnectionError(last_error.empty() ? std::string("Transport open failed") : last_error);
}

void ProtocolClient::cleanup(const std::string& reason) {
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport = std::move(transport_);
    }
    if (transport) {
        try {
            transport->close();
        } catch (const std::exception& e) {
            LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] Error closing transport: {}", e.what());
        }
    }
    fail_pending(reason);
}

void ProtocolClient::fail_pending(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [id, promise] : pending_) {
        promise.set_exception(std::make_exception_ptr(ConnectionError(reason)));
    }
    pending_.clear();
    auth_request_id_.clear();
}

//////////////////////////////////////////////////////////////////////////
// Request/response correlation
//////////////////////////////////////////////////////////////////////////

Response ProtocolClient::send_request(json::object request) {
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport = transport_;
    }
    if (!transport || !transport->is_open()) {
        throw ConnectionError("Not connected");
    }

    std::string id;
    if (auto existing = frame_id(request)) {
        id = *existing;
    } else {
        id = std::to_string(++next_id_);
        request["id"] = id;
    }
    const std::string type = get_string(request, "type", "request");

    std::future<json::object> response_future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto [it, inserted] = pending_.try_emplace(id);
        if (!inserted) {
            throw ValidationError("Request id " + id + " is already pending");
        }
        response_future = it->second.get_future();
    }

    try {
        transport->send(json::serialize(request));
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        throw;
    }

    if (response_future.wait_for(config_.request_timeout) != std::future_status::ready) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            expired = pending_.erase(id) > 0;
        }
        // Not in the table any more means the receive context resolved it meanwhile.
        if (expired) {
            LOG_WARNING(logger_->quill_logger(), "[ProtocolClient] Request {} ({}) timed out", id, type);
            throw RequestTimeout("Request " + type + " (id " + id + ") timed out after " +
                                 std::to_string(config_.request_timeout.count()) + " ms");
        }
    }

    return parse_response(response_future.get());
}

Response ProtocolClient::request_checked(json::object request, const std::string& action) {
    Response response = send_request(std::move(request));
    if (!response.ok()) {
        std::string remote = response.message.empty() ? std::string("Unknown error") : response.message;
        throw RemoteError("Failed to " + action + ": " + remote, remote);
    }
    return response;
}

//////////////////////////////////////////////////////////////////////////
// Receive context
//////////////////////////////////////////////////////////////////////////

void ProtocolClient::on_message(std::string text) {
    json::object frame;
    try {
        frame = parse_frame(text);
    } catch (const ProtocolError& e) {
        LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] {} | msg={}", e.what(), text);
        return;
    }

    std::optional<std::string> id = frame_id(frame);
    std::optional<std::string> type = frame_type(frame);
    const bool connecting = state_ == ConnectionState::Connecting;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        // Peers acknowledge authentication with a bare {status, message?}.
        if (!id && !type && connecting && !auth_request_id_.empty()) {
            id = auth_request_id_;
        }
        if (id) {
            auto it = pending_.find(*id);
            if (it != pending_.end()) {
                it->second.set_value(std::move(frame));
                pending_.erase(it);
                if (*id == auth_request_id_) {
                    auth_request_id_.clear();
                }
                return;
            }
        }
    }

    if (connecting) {
        LOG_DEBUG(logger_->quill_logger(), "[ProtocolClient] Dropping frame received before authentication");
        return;
    }

    if (type) {
        handle_push(*type, frame);
        return;
    }

    if (id) {
        LOG_WARNING(logger_->quill_logger(), "[ProtocolClient] Dropping late response for request id {}", *id);
        return;
    }

    LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] Unclassifiable frame dropped | msg={}", text);
}

void ProtocolClient::handle_push(const std::string& type, const json::object& frame) {
    std::optional<EventKind> kind = classify_push_type(type);
    if (!kind) {
        LOG_WARNING(logger_->quill_logger(), "[ProtocolClient] Received unknown event type: {}", type);
        return;
    }

    json::object payload;
    if (const json::value* data = frame.if_contains("data")) {
        if (data->is_object()) {
            payload = data->as_object();
        } else {
            payload["data"] = *data;
        }
    }
    publish(*kind, std::move(payload), REMOTE_ORIGIN);
}

void ProtocolClient::on_transport_closed(const std::string& reason) {
    ConnectionState expected = ConnectionState::Connected;
    const bool was_connected = state_.compare_exchange_strong(expected, ConnectionState::Error);
    if (!was_connected) {
        // Lost while authenticating: connect() sees Error and fails through its cleanup path.
        expected = ConnectionState::Connecting;
        state_.compare_exchange_strong(expected, ConnectionState::Error);
    }

    LOG_ERROR(logger_->quill_logger(), "[ProtocolClient] Transport lost: {}", reason);
    fail_pending("Connection lost: " + reason);

    if (was_connected) {
        // The transport is already down; its resources are released by the next connect/disconnect.
        state_ = ConnectionState::Disconnected;
        publish(EventKind::System, json::object{{"event", "connection_lost"}, {"reason", reason}}, CLIENT_ORIGIN);
    }
}

void ProtocolClient::publish(EventKind kind, json::object payload, const char* origin) {
    event_engine_->put(Event(kind, std::move(payload), std::string(origin)));
}

//////////////////////////////////////////////////////////////////////////
// Trading operations
//////////////////////////////////////////////////////////////////////////

json::object ProtocolClient::create_order(const std::string& exchange, const std::string& market, OrderSide side,
                                          OrderType order_type, double amount, std::optional<double> price) {
    json::object request = make_create_order_request(exchange, market, side, order_type, amount, price);

    try {
        Response response = request_checked(std::move(request), "create order");
        json::object order = data_as_object(response);
        publish(EventKind::OrderUpdate, order, REMOTE_ORIGIN);
        return order;
    } catch (const ClientError& e) {
        std::string message = "Failed to create " + std::string(to_string(order_type)) + " " +
                              std::string(to_string(side)) + " order for " + market + " on " + exchange;
        publish(EventKind::Error,
                json::object{{"message", message}, {"error", e.what()}, {"exchange", exchange}, {"market", market}},
                CLIENT_ORIGIN);
        throw;
    }
}

json::object ProtocolClient::cancel_order(const std::string& exchange, const std::string& market,
                                          const std::string& order_id) {
    json::object request = make_cancel_order_request(exchange, market, order_id);

    try {
        Response response = request_checked(std::move(request), "cancel order");
        publish(EventKind::OrderUpdate,
                json::object{{"order_id", order_id},
                             {"status", to_string(OrderStatus::Cancelled)},
                             {"exchange", exchange},
                             {"market", market}},
                REMOTE_ORIGIN);
        return data_as_object(response);
    } catch (const ClientError& e) {
        publish(EventKind::Error,
                json::object{{"message", "Failed to cancel order " + order_id + " for " + market + " on " + exchange},
                             {"error", e.what()},
                             {"exchange", exchange},
                             {"market", market},
                             {"order_id", order_id}},
                CLIENT_ORIGIN);
        throw;
    }
}

json::object ProtocolClient::get_order_status(const std::string& exchange, const std::string& market,
                                              const std::string& order_id) {
    return data_as_object(request_checked(make_get_order_request(exchange, market, order_id), "get order status"));
}

json::object ProtocolClient::get_order_book(const std::string& exchange, const std::string& market, int depth) {
    return data_as_object(request_checked(make_get_order_book_request(exchange, market, depth), "get order book"));
}

json::object ProtocolClient::get_ticker(const std::string& exchange, const std::string& market) {
    return data_as_object(request_checked(make_get_ticker_request(exchange, market), "get ticker"));
}

json::object ProtocolClient::subscribe_to_order_book(const std::string& exchange, const std::string& market) {
    return request_checked(make_subscribe_request(SubscriptionChannel::OrderBook, exchange, market),
                           "subscribe to order book").raw;
}

json::object ProtocolClient::subscribe_to_trades(const std::string& exchange, const std::string& market) {
    return request_checked(make_subscribe_request(SubscriptionChannel::Trades, exchange, market),
                           "subscribe to trades").raw;
}

json::object ProtocolClient::get_balances(const std::string& exchange) {
    return data_as_object(request_checked(make_get_balances_request(exchange), "get balances"));
}

json::array ProtocolClient::get_open_orders(const std::string& exchange, const std::string& market) {
    return data_as_array(request_checked(make_get_open_orders_request(exchange, market), "get open orders"));
}

json::array ProtocolClient::get_order_history(const std::string& exchange, const std::string& market, int limit) {
    return data_as_array(request_checked(make_get_order_history_request(exchange, market, limit), "get order history"));
}
