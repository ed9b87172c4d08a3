#include "protocol_messages.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <boost/system/error_code.hpp>

namespace {

void require_non_empty(const std::string& value, const char* field) {
    if (value.empty()) {
        throw ValidationError(std::string(field) + " cannot be empty");
    }
}

json::object make_exchange_request(std::string_view type, const std::string& exchange) {
    require_non_empty(exchange, "exchange");
    json::object request;
    request["type"] = type;
    request["exchange"] = exchange;
    return request;
}

json::object make_market_request(std::string_view type, const std::string& exchange, const std::string& market) {
    require_non_empty(market, "market");
    json::object request = make_exchange_request(type, exchange);
    request["market"] = market;
    return request;
}

} // namespace

//////////////////////////////////////////////////////////////////////////
// Inbound frames
//////////////////////////////////////////////////////////////////////////

json::object parse_frame(std::string_view text) {
    boost::system::error_code ec;
    json::value parsed = json::parse(text, ec);
    if (ec) {
        throw ProtocolError("Received invalid JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw ProtocolError("Received a frame that is not a JSON object");
    }
    return std::move(parsed.as_object());
}

std::optional<std::string> frame_id(const json::object& frame) {
    const json::value* id = frame.if_contains("id");
    if (id == nullptr) {
        return std::nullopt;
    }
    if (id->is_string()) {
        return std::string(id->as_string());
    }
    if (id->is_int64()) {
        return std::to_string(id->as_int64());
    }
    if (id->is_uint64()) {
        return std::to_string(id->as_uint64());
    }
    return std::nullopt;
}

std::optional<std::string> frame_type(const json::object& frame) {
    const json::value* type = frame.if_contains("type");
    if (type == nullptr || !type->is_string()) {
        return std::nullopt;
    }
    return std::string(type->as_string());
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view fallback) {
    const json::value* v = obj.if_contains(key);
    if (v == nullptr || !v->is_string()) {
        return std::string(fallback);
    }
    return std::string(v->as_string());
}

Response parse_response(const json::object& frame) {
    Response response;
    response.id = frame_id(frame).value_or("");
    response.status = get_string(frame, "status");
    response.message = get_string(frame, "message");
    if (const json::value* data = frame.if_contains("data")) {
        response.data = *data;
    }
    response.raw = frame;
    return response;
}

std::optional<EventKind> classify_push_type(std::string_view type) {
    if (type == "order_update") return EventKind::OrderUpdate;
    if (type == "trade") return EventKind::TradeUpdate;
    if (type == "order_book_update" || type == "ticker_update") return EventKind::MarketData;
    if (type == "error") return EventKind::Error;
    if (type == "info") return EventKind::Info;
    return std::nullopt;
}

//////////////////////////////////////////////////////////////////////////
// Outbound requests
//////////////////////////////////////////////////////////////////////////

json::object make_authenticate_request(const std::string& api_key) {
    require_non_empty(api_key, "api_key");
    json::object request;
    request["type"] = "authenticate";
    request["api_key"] = api_key;
    return request;
}

json::object make_create_order_request(const std::string& exchange, const std::string& market,
                                       OrderSide side, OrderType order_type, double amount,
                                       std::optional<double> price) {
    if (order_type == OrderType::Limit && !price.has_value()) {
        throw ValidationError("Price is required for limit orders");
    }
    if (!(amount > 0.0)) {
        throw ValidationError("Order amount must be positive");
    }
    if (price.has_value() && !(*price > 0.0)) {
        throw ValidationError("Order price must be positive");
    }

    json::object request = make_market_request("create_order", exchange, market);
    request["side"] = to_string(side);
    request["order_type"] = to_string(order_type);
    request["amount"] = format_decimal(amount);
    if (order_type == OrderType::Limit) {
        request["price"] = format_decimal(*price);
    }
    return request;
}

json::object make_cancel_order_request(const std::string& exchange, const std::string& market,
                                       const std::string& order_id) {
    require_non_empty(order_id, "order_id");
    json::object request = make_market_request("cancel_order", exchange, market);
    request["order_id"] = order_id;
    return request;
}

json::object make_get_order_request(const std::string& exchange, const std::string& market,
                                    const std::string& order_id) {
    require_non_empty(order_id, "order_id");
    json::object request = make_market_request("get_order", exchange, market);
    request["order_id"] = order_id;
    return request;
}

json::object make_get_order_book_request(const std::string& exchange, const std::string& market, int depth) {
    if (depth <= 0) {
        throw ValidationError("Order book depth must be positive");
    }
    json::object request = make_market_request("get_order_book", exchange, market);
    request["depth"] = depth;
    return request;
}

json::object make_get_ticker_request(const std::string& exchange, const std::string& market) {
    return make_market_request("get_ticker", exchange, market);
}

json::object make_subscribe_request(SubscriptionChannel channel, const std::string& exchange,
                                    const std::string& market) {
    json::object request = make_market_request("subscribe", exchange, market);
    request["channel"] = to_string(channel);
    return request;
}

json::object make_get_balances_request(const std::string& exchange) {
    return make_exchange_request("get_balances", exchange);
}

json::object make_get_open_orders_request(const std::string& exchange, const std::string& market) {
    return make_market_request("get_open_orders", exchange, market);
}

json::object make_get_order_history_request(const std::string& exchange, const std::string& market, int limit) {
    if (limit <= 0) {
        throw ValidationError("Order history limit must be positive");
    }
    json::object request = make_market_request("get_order_history", exchange, market);
    request["limit"] = limit;
    return request;
}
