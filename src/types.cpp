#include "types.hpp"

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::MarketData:     return "MARKET_DATA";
        case EventKind::OrderUpdate:    return "ORDER_UPDATE";
        case EventKind::TradeUpdate:    return "TRADE_UPDATE";
        case EventKind::StrategyUpdate: return "STRATEGY_UPDATE";
        case EventKind::Error:          return "ERROR";
        case EventKind::Info:           return "INFO";
        case EventKind::System:         return "SYSTEM";
    }
    return "UNKNOWN";
}

std::string_view to_string(OrderType type) {
    switch (type) {
        case OrderType::Limit:  return "limit";
        case OrderType::Market: return "market";
    }
    return "unknown";
}

std::string_view to_string(OrderSide side) {
    switch (side) {
        case OrderSide::Buy:  return "buy";
        case OrderSide::Sell: return "sell";
    }
    return "unknown";
}

std::string_view to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Open:            return "open";
        case OrderStatus::PartiallyFilled: return "partially_filled";
        case OrderStatus::Filled:          return "filled";
        case OrderStatus::Cancelled:       return "cancelled";
        case OrderStatus::Failed:          return "failed";
    }
    return "unknown";
}

std::string_view to_string(MarketType type) {
    switch (type) {
        case MarketType::Spot:    return "spot";
        case MarketType::Futures: return "futures";
    }
    return "unknown";
}

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

std::string_view to_string(SubscriptionChannel channel) {
    switch (channel) {
        case SubscriptionChannel::OrderBook: return "order_book";
        case SubscriptionChannel::Trades:    return "trades";
    }
    return "unknown";
}

std::optional<OrderType> parse_order_type(std::string_view token) {
    if (token == "limit") return OrderType::Limit;
    if (token == "market") return OrderType::Market;
    return std::nullopt;
}

std::optional<OrderSide> parse_order_side(std::string_view token) {
    if (token == "buy") return OrderSide::Buy;
    if (token == "sell") return OrderSide::Sell;
    return std::nullopt;
}

std::optional<OrderStatus> parse_order_status(std::string_view token) {
    if (token == "open") return OrderStatus::Open;
    if (token == "partially_filled") return OrderStatus::PartiallyFilled;
    if (token == "filled") return OrderStatus::Filled;
    if (token == "cancelled") return OrderStatus::Cancelled;
    if (token == "failed") return OrderStatus::Failed;
    return std::nullopt;
}

std::optional<MarketType> parse_market_type(std::string_view token) {
    if (token == "spot") return MarketType::Spot;
    if (token == "futures") return MarketType::Futures;
    return std::nullopt;
}
