#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Kinds of events distributed by the EventEngine.
enum class EventKind : uint8_t {
    MarketData = 1,
    OrderUpdate,
    TradeUpdate,
    StrategyUpdate,
    Error,
    Info,
    System
};

inline constexpr EventKind ALL_EVENT_KINDS[] = {
    EventKind::MarketData, EventKind::OrderUpdate, EventKind::TradeUpdate,
    EventKind::StrategyUpdate, EventKind::Error, EventKind::Info, EventKind::System
};

// Order vocabularies travel verbatim as lowercase tokens on the wire.
enum class OrderType : uint8_t { Limit, Market };

enum class OrderSide : uint8_t { Buy, Sell };

enum class OrderStatus : uint8_t { Open, PartiallyFilled, Filled, Cancelled, Failed };

enum class MarketType : uint8_t { Spot, Futures };

enum class ConnectionState : uint8_t { Disconnected, Connecting, Connected, Error };

enum class SubscriptionChannel : uint8_t { OrderBook, Trades };

std::string_view to_string(EventKind kind);
std::string_view to_string(OrderType type);
std::string_view to_string(OrderSide side);
std::string_view to_string(OrderStatus status);
std::string_view to_string(MarketType type);
std::string_view to_string(ConnectionState state);
std::string_view to_string(SubscriptionChannel channel);

std::optional<OrderType> parse_order_type(std::string_view token);
std::optional<OrderSide> parse_order_side(std::string_view token);
std::optional<OrderStatus> parse_order_status(std::string_view token);
std::optional<MarketType> parse_market_type(std::string_view token);
