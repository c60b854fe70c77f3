/**
 * @file event_logger.cpp
 * @brief Registry notification logger
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "event_logger.hpp"
#include "../debug/log.hpp"
#include <system_error>

namespace natrelay::router {

EventLogger::EventLogger(state::Registry& registry)
    : m_registry(registry)
{
}

EventLogger::~EventLogger() {
    Stop();
}

bool EventLogger::Start() {
    std::scoped_lock lock(m_lifecycle_mutex);

    if (m_thread.joinable()) {
        return true;
    }
    if (m_stop.IsFired() || !m_stop.IsValid()) {
        return false;
    }

    try {
        m_thread = std::thread(&EventLogger::Run, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start event logger thread: %s", e.what());
        return false;
    }
    return true;
}

void EventLogger::Stop() {
    std::scoped_lock lock(m_lifecycle_mutex);

    m_stop.Fire();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

size_t EventLogger::DrainPending() {
    size_t count = 0;

    state::PlayerAddr player;
    while (m_registry.GetPlayerJoinedEvents().TryPop(player)) {
        LOG_INFO("Player joined: %s (proxy port %u)",
                 network::AddressString(player.addr).c_str(), player.proxy_port);
        count++;
    }
    while (m_registry.GetPlayerLeftEvents().TryPop(player)) {
        LOG_INFO("Player left: %s (proxy port %u)",
                 network::AddressString(player.addr).c_str(), player.proxy_port);
        count++;
    }

    state::GameId game_id;
    while (m_registry.GetGameEndedEvents().TryPop(game_id)) {
        LOG_INFO("Game ended: %s", state::GameIdString(game_id).c_str());
        count++;
    }

    m_event_count += count;
    return count;
}

void EventLogger::Run() {
    while (true) {
        int ready = proxy::WaitAny({m_stop.GetFd(),
                                    m_registry.GetPlayerJoinedEvents().GetFd(),
                                    m_registry.GetPlayerLeftEvents().GetFd(),
                                    m_registry.GetGameEndedEvents().GetFd()}, -1);
        if (ready == proxy::WAIT_ERROR) {
            LOG_ERROR("Event logger wait failed, stopping");
            break;
        }

        DrainPending();

        if (ready == 0) {
            break;
        }
    }
}

} // namespace natrelay::router
