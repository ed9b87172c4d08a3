#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include "types.hpp"

namespace json = boost::json;

/**
 * @class Event
 * @brief Immutable record distributed by the EventEngine.
 *
 * The payload is copied at construction, so a producer mutating its own object afterwards
 * never affects an event that is already queued or being dispatched. Equality compares
 * kind and payload only; the timestamp and origin are for observability.
 */
class Event {
public:
    Event(EventKind kind, json::object payload, std::optional<std::string> origin = std::nullopt);

    EventKind kind() const { return kind_; }
    const json::object& payload() const { return payload_; }
    int64_t created_at() const { return created_at_; }
    const std::optional<std::string>& origin() const { return origin_; }

    std::string to_string() const;

private:
    EventKind kind_;
    json::object payload_;
    int64_t created_at_;
    std::optional<std::string> origin_;
};

bool operator==(const Event& lhs, const Event& rhs);
bool operator!=(const Event& lhs, const Event& rhs);
