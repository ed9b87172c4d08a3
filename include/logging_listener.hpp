#pragma once

#include <memory>
#include <set>
#include <string>

#include "event_listener.hpp"
#include "logger.hpp"
#include "utils.hpp"

/**
 * @brief Writes every event on the bus to the log. Error events go out at error level.
 */
class LoggingListener : public EventListener {
public:
    explicit LoggingListener(std::shared_ptr<Logger> logger, std::string name = "event_logger")
        : EventListener(std::move(name), std::set<EventKind>(std::begin(ALL_EVENT_KINDS), std::end(ALL_EVENT_KINDS))),
          logger_(std::move(logger)) {}

    void handle_event(const Event& event) override {
        auto elapsed = get_time_now_nano() - event.created_at();
        if (event.kind() == EventKind::Error) {
            LOG_ERROR(logger_->quill_logger(), "{}: origin={}, payload={}, elapsed={}",
                      to_string(event.kind()), event.origin().value_or("-"),
                      json::serialize(event.payload()), elapsed);
        } else {
            LOG_INFO(logger_->quill_logger(), "{}: origin={}, payload={}, elapsed={}",
                     to_string(event.kind()), event.origin().value_or("-"),
                     json::serialize(event.payload()), elapsed);
        }
    }

private:
    std::shared_ptr<Logger> logger_;
};
