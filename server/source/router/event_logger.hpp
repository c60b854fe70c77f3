/**
 * @file event_logger.hpp
 * @brief Logs registry notifications (joined, left, game ended)
 *
 * Drains the registry's three notification channels on its own thread so
 * registry mutations never wait on log output.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

#include "../proxy/signal.hpp"
#include "../state/registry.hpp"

namespace natrelay::router {

class EventLogger {
public:
    explicit EventLogger(state::Registry& registry);

    /**
     * @brief Destructor - stops the thread after draining pending events
     */
    ~EventLogger();

    EventLogger(const EventLogger&) = delete;
    EventLogger& operator=(const EventLogger&) = delete;

    bool Start();
    void Stop();

    /**
     * @brief Log every queued event without blocking
     * @return Number of events logged
     */
    size_t DrainPending();

    uint64_t GetEventCount() const { return m_event_count.load(); }

private:
    void Run();

    state::Registry& m_registry;

    proxy::Signal m_stop;
    std::mutex m_lifecycle_mutex;
    std::thread m_thread;

    std::atomic<uint64_t> m_event_count{0};
};

} // namespace natrelay::router
