#include "event.hpp"
#include "utils.hpp"

Event::Event(EventKind kind, json::object payload, std::optional<std::string> origin)
    : kind_(kind), payload_(std::move(payload)), created_at_(get_time_now_nano()), origin_(std::move(origin)) {}

std::string Event::to_string() const {
    std::string out = "Event(type: ";
    out += ::to_string(kind_);
    out += ", data: ";
    out += json::serialize(payload_);
    out += ", time: ";
    out += convert_nanoseconds_to_timestamp(created_at_);
    if (origin_.has_value() && !origin_->empty()) {
        out += ", source: ";
        out += *origin_;
    }
    out += ")";
    return out;
}

bool operator==(const Event& lhs, const Event& rhs) {
    return lhs.kind() == rhs.kind() && lhs.payload() == rhs.payload();
}

bool operator!=(const Event& lhs, const Event& rhs) {
    return !(lhs == rhs);
}
