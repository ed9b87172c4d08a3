#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

#include "types.hpp"

namespace json = boost::json;

/**
 * @brief Correlated answer from the peer: {id, status, message?, data?}.
 *
 * A non-success status is an ordinary value here; callers decide whether to raise.
 */
struct Response {
    std::string id;
    std::string status;
    std::string message;
    json::value data;
    json::object raw;

    bool ok() const { return status == "success"; }
};

// Parses one inbound text frame. Throws ProtocolError if it is not a JSON object.
json::object parse_frame(std::string_view text);

Response parse_response(const json::object& frame);

// The frame's "id" as a string; numeric ids are stringified.
std::optional<std::string> frame_id(const json::object& frame);

// The frame's "type", when it is a string.
std::optional<std::string> frame_type(const json::object& frame);

/**
 * @brief Maps a push message type onto the in-process event kind.
 *
 * order_update -> OrderUpdate, trade -> TradeUpdate, order_book_update/ticker_update -> MarketData,
 * error -> Error, info -> Info. Anything else yields nullopt and is dropped by the caller.
 */
std::optional<EventKind> classify_push_type(std::string_view type);

// Looks up a string field, falling back to a default when missing or not a string.
std::string get_string(const json::object& obj, std::string_view key, std::string_view fallback = "");

//////////////////////////////////////////////////////////////////////////
// Outbound requests. The "id" is added by the client at send time.
//////////////////////////////////////////////////////////////////////////

json::object make_authenticate_request(const std::string& api_key);

// Throws ValidationError for a limit order without a price, or non-positive amount/price.
json::object make_create_order_request(const std::string& exchange, const std::string& market,
                                       OrderSide side, OrderType order_type, double amount,
                                       std::optional<double> price);

json::object make_cancel_order_request(const std::string& exchange, const std::string& market,
                                       const std::string& order_id);

json::object make_get_order_request(const std::string& exchange, const std::string& market,
                                    const std::string& order_id);

json::object make_get_order_book_request(const std::string& exchange, const std::string& market, int depth);

json::object make_get_ticker_request(const std::string& exchange, const std::string& market);

json::object make_subscribe_request(SubscriptionChannel channel, const std::string& exchange,
                                    const std::string& market);

json::object make_get_balances_request(const std::string& exchange);

json::object make_get_open_orders_request(const std::string& exchange, const std::string& market);

json::object make_get_order_history_request(const std::string& exchange, const std::string& market, int limit);
