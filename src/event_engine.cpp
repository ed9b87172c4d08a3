#include "event_engine.hpp"
#include "errors.hpp"

#include <algorithm>
#include <exception>
#include <string>

EventEngine::EventEngine(std::shared_ptr<Logger> logger, std::chrono::milliseconds poll_interval,
                         std::chrono::milliseconds stop_grace)
    : state_(std::make_shared<State>()), stop_grace_(stop_grace) {
    if (!logger) {
        throw ValidationError("EventEngine requires a logger");
    }
    if (poll_interval.count() <= 0) {
        throw ValidationError("EventEngine poll interval must be positive");
    }
    state_->logger = std::move(logger);
    state_->poll_interval = poll_interval;
}

EventEngine::~EventEngine() {
    stop();
}

//////////////////////////////////////////////////////////////////////////
// Listener registry
//////////////////////////////////////////////////////////////////////////

void EventEngine::register_listener(std::shared_ptr<EventListener> listener) {
    if (!listener) {
        throw ValidationError("Cannot register a null listener");
    }
    std::lock_guard<std::mutex> lock(state_->listeners_mutex);
    state_->listeners.push_back(std::move(listener));
}

void EventEngine::unregister_listener(const std::shared_ptr<EventListener>& listener) {
    std::lock_guard<std::mutex> lock(state_->listeners_mutex);
    auto& listeners = state_->listeners;
    auto it = std::find(listeners.begin(), listeners.end(), listener);
    if (it != listeners.end()) {
        listeners.erase(it);
    }
}

std::vector<std::shared_ptr<EventListener>> EventEngine::listeners() const {
    std::lock_guard<std::mutex> lock(state_->listeners_mutex);
    return state_->listeners;
}

//////////////////////////////////////////////////////////////////////////
// Producer side
//////////////////////////////////////////////////////////////////////////

void EventEngine::put(Event event) {
    auto shared = std::make_shared<const Event>(std::move(event));
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        state_->queue.push_back(std::move(shared));
    }
    state_->queue_cv.notify_one();
}

std::size_t EventEngine::pending() const {
    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    return state_->queue.size();
}

//////////////////////////////////////////////////////////////////////////
// Lifecycle
//////////////////////////////////////////////////////////////////////////

void EventEngine::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (state_->running.load()) {
        return;
    }

    // A previous thread that outlived its grace period may still be around; the new
    // generation tells it to exit as soon as it gets control back.
    uint64_t generation = state_->generation.fetch_add(1) + 1;
    state_->running.store(true);

    worker_thread_ = std::thread(&EventEngine::process_events, state_, generation);
    LOG_INFO(state_->logger->quill_logger(), "[EventEngine] Dispatch thread started");
}

void EventEngine::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!state_->running.exchange(false)) {
        return;
    }
    state_->queue_cv.notify_all();

    if (worker_thread_.joinable() && worker_thread_.get_id() == std::this_thread::get_id()) {
        // stop() called from a listener: the loop exits once the handler returns.
        worker_thread_.detach();
        return;
    }

    const uint64_t generation = state_->generation.load();
    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(state_->exit_mutex);
        exited = state_->exit_cv.wait_for(lock, stop_grace_,
                                          [&] { return state_->exited_generation >= generation; });
    }

    if (worker_thread_.joinable()) {
        if (exited) {
            worker_thread_.join();
        } else {
            LOG_WARNING(state_->logger->quill_logger(),
                        "[EventEngine] Dispatch thread did not exit within {} ms, detaching",
                        stop_grace_.count());
            worker_thread_.detach();
        }
    }
    LOG_INFO(state_->logger->quill_logger(), "[EventEngine] Dispatch thread stopped");
}

bool EventEngine::is_running() const {
    return state_->running.load();
}

//////////////////////////////////////////////////////////////////////////
// Dispatch loop
//////////////////////////////////////////////////////////////////////////

void EventEngine::process_events(std::shared_ptr<State> state, uint64_t generation) {
    auto active = [&state, generation] {
        return state->running.load() && state->generation.load() == generation;
    };

    while (active()) {
        std::shared_ptr<const Event> event;
        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);
            state->queue_cv.wait_for(lock, state->poll_interval,
                                     [&] { return !state->queue.empty() || !active(); });
            if (!active()) {
                break;
            }
            if (state->queue.empty()) {
                continue;
            }
            event = std::move(state->queue.front());
            state->queue.pop_front();
        }

        try {
            distribute_event(*state, *event);
        } catch (const std::exception& e) {
            LOG_ERROR(state->logger->quill_logger(), "[EventEngine] Error in event processing: {}", e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->exit_mutex);
        state->exited_generation = std::max(state->exited_generation, generation);
    }
    state->exit_cv.notify_all();
}

void EventEngine::distribute_event(State& state, const Event& event) {
    // Handlers run without the registry lock held, so they may (un)register listeners.
    std::vector<std::shared_ptr<EventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(state.listeners_mutex);
        listeners = state.listeners;
    }

    for (const auto& listener : listeners) {
        if (!listener->can_handle(event.kind())) {
            continue;
        }
        try {
            listener->handle_event(event);
        } catch (const std::exception& e) {
            LOG_ERROR(state.logger->quill_logger(), "[EventEngine] Error in listener {}: {}",
                      listener->name(), e.what());
        } catch (...) {
            LOG_ERROR(state.logger->quill_logger(), "[EventEngine] Non-standard exception in listener {}",
                      listener->name());
        }
    }
}
