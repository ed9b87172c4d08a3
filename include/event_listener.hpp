#pragma once

#include <functional>
#include <initializer_list>
#include <set>
#include <string>

#include "event.hpp"

/**
 * @class EventListener
 * @brief A named subscriber declaring the event kinds it accepts.
 *
 * The name is for diagnostics only and is not required to be unique.
 */
class EventListener {
public:
    EventListener(std::string name, std::set<EventKind> accepted_kinds)
        : name_(std::move(name)), accepted_kinds_(std::move(accepted_kinds)) {}

    EventListener(std::string name, std::initializer_list<EventKind> accepted_kinds)
        : name_(std::move(name)), accepted_kinds_(accepted_kinds) {}

    virtual ~EventListener() = default;

    const std::string& name() const { return name_; }
    const std::set<EventKind>& accepted_kinds() const { return accepted_kinds_; }

    bool can_handle(EventKind kind) const {
        return accepted_kinds_.count(kind) != 0;
    }

    /**
     * @brief Called on the engine's dispatch thread for every accepted event.
     *
     * May throw; the engine logs the failure and carries on with the other listeners.
     */
    virtual void handle_event(const Event& event) = 0;

private:
    std::string name_;
    std::set<EventKind> accepted_kinds_;
};

// Listener backed by a plain callable.
class CallbackListener : public EventListener {
public:
    using Handler = std::function<void(const Event&)>;

    CallbackListener(std::string name, std::set<EventKind> accepted_kinds, Handler handler)
        : EventListener(std::move(name), std::move(accepted_kinds)), handler_(std::move(handler)) {}

    void handle_event(const Event& event) override {
        if (handler_) {
            handler_(event);
        }
    }

private:
    Handler handler_;
};
