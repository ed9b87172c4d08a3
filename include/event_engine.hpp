#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "event.hpp"
#include "event_listener.hpp"
#include "logger.hpp"

/**
 * @class EventEngine
 * @brief In-process publish/subscribe bus.
 *
 * Producers call put() from any thread; one dedicated dispatch thread dequeues events and
 * hands each one, in turn, to every registered listener that accepts its kind. A throwing
 * listener is logged and skipped, it never stops delivery to the others or the loop itself.
 */
class EventEngine {
public:
    explicit EventEngine(std::shared_ptr<Logger> logger,
                         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100),
                         std::chrono::milliseconds stop_grace = std::chrono::milliseconds(1000));
    ~EventEngine();

    EventEngine(const EventEngine&) = delete;
    EventEngine& operator=(const EventEngine&) = delete;

    void register_listener(std::shared_ptr<EventListener> listener);

    // No-op when the listener is not registered.
    void unregister_listener(const std::shared_ptr<EventListener>& listener);

    // Snapshot of the registered listeners, in registration order.
    std::vector<std::shared_ptr<EventListener>> listeners() const;

    // Never blocks on dispatch; the queue is unbounded.
    void put(Event event);

    /**
     * @brief Launches the dispatch thread. Calling it while running is a no-op.
     */
    void start();

    /**
     * @brief Signals the dispatch thread and waits up to the stop grace period for it to exit.
     *
     * If the thread is still busy in a listener when the grace period runs out it is detached
     * and stop() returns anyway.
     */
    void stop();

    bool is_running() const;

    // Events queued but not yet dispatched.
    std::size_t pending() const;

private:
    // Shared with the dispatch thread so that a detached thread never outlives its data.
    struct State {
        std::shared_ptr<Logger> logger;
        std::chrono::milliseconds poll_interval;

        std::deque<std::shared_ptr<const Event>> queue;
        mutable std::mutex queue_mutex;
        std::condition_variable queue_cv;

        std::vector<std::shared_ptr<EventListener>> listeners;
        mutable std::mutex listeners_mutex;

        std::atomic<bool> running{false};
        std::atomic<uint64_t> generation{0};

        uint64_t exited_generation = 0;
        std::mutex exit_mutex;
        std::condition_variable exit_cv;
    };

    static void process_events(std::shared_ptr<State> state, uint64_t generation);
    static void distribute_event(State& state, const Event& event);

    std::shared_ptr<State> state_;
    std::chrono::milliseconds stop_grace_;
    std::thread worker_thread_;
    std::mutex control_mutex_;
};
