/**
 * @file player_relay.cpp
 * @brief Per-player UDP relay implementation
 *
 * ## Thread Model
 *
 * ```
 *   remote player ──UDP──► [socket] ──ReceiveLoop──► inbound channel (shared)
 *
 *   outbound channel ──SendLoop──► [socket] ──UDP──► Packet::dst_addr
 * ```
 *
 * Both threads share the socket descriptor. The socket is only closed by
 * Stop(), after both threads have been joined.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "player_relay.hpp"
#include "../debug/log.hpp"
#include <system_error>
#include <utility>

namespace natrelay::proxy {

namespace {

// WaitAny() slots, signals first so a pending close wins over pending data
constexpr int SLOT_DISCONNECT = 0;
constexpr int SLOT_SHUTDOWN = 1;
constexpr int SLOT_DATA = 2;

} // anonymous namespace

PlayerRelay::PlayerRelay(const network::SocketAddress& player_addr, uint16_t proxy_port,
                         PacketChannel& inbound, const Signal& shutdown,
                         size_t buffer_size)
    : m_player_addr(player_addr)
    , m_proxy_port(proxy_port)
    , m_inbound(inbound)
    , m_shutdown(shutdown)
    , m_recv_buffer(buffer_size == 0 ? DEFAULT_BUFFER_SIZE : buffer_size)
    , m_started(false)
    , m_stopped(false)
{
}

PlayerRelay::~PlayerRelay() {
    Stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

network::SocketResult PlayerRelay::Open(const char* bind_host) {
    if (!m_disconnect.IsValid() || !m_outbound.IsValid() ||
        !m_rx_done.IsValid() || !m_tx_done.IsValid()) {
        return network::SocketResult::SocketError;
    }

    network::SocketResult result = m_socket.bind(bind_host, m_proxy_port);
    if (result != network::SocketResult::Success) {
        return result;
    }

    if (m_proxy_port == 0) {
        m_proxy_port = m_socket.get_local_port();
    }

    LOG_VERBOSE("Relay for %s bound to UDP port %u",
                network::AddressString(m_player_addr).c_str(), m_proxy_port);
    return network::SocketResult::Success;
}

bool PlayerRelay::Start() {
    std::scoped_lock lock(m_lifecycle_mutex);

    if (m_started || m_stopped) {
        return m_started && !m_stopped;
    }
    if (!m_socket.is_valid()) {
        LOG_ERROR("Relay on port %u started before Open()", m_proxy_port);
        return false;
    }

    try {
        m_rx_thread = std::thread(&PlayerRelay::ReceiveLoop, this);
        m_tx_thread = std::thread(&PlayerRelay::SendLoop, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start relay threads on port %u: %s", m_proxy_port, e.what());
        m_stopped = true;
        m_disconnect.Fire();
        JoinAndClose();
        return false;
    }

    m_started = true;
    LOG_INFO("Listening on UDP port %u for %s", m_proxy_port,
             network::AddressString(m_player_addr).c_str());
    return true;
}

void PlayerRelay::Disconnect() {
    m_disconnect.Fire();
}

void PlayerRelay::Stop() {
    std::scoped_lock lock(m_lifecycle_mutex);

    if (m_stopped) {
        return;
    }
    m_stopped = true;

    m_disconnect.Fire();
    JoinAndClose();
}

void PlayerRelay::JoinAndClose() {
    if (m_rx_thread.joinable()) {
        m_rx_thread.join();
    } else {
        m_rx_done.Fire();
    }

    if (m_tx_thread.joinable()) {
        m_tx_thread.join();
    } else {
        m_tx_done.Fire();
    }

    m_socket.close();
}

bool PlayerRelay::Send(Packet packet) {
    if (m_disconnect.IsFired() || m_shutdown.IsFired()) {
        return false;
    }
    m_outbound.Push(std::move(packet));
    return true;
}

bool PlayerRelay::WaitForExit(int32_t timeout_ms) const {
    return m_rx_done.Wait(timeout_ms) && m_tx_done.Wait(timeout_ms);
}

RelayStats PlayerRelay::GetStats() const {
    RelayStats stats;
    stats.packets_received = m_packets_received.load();
    stats.packets_sent = m_packets_sent.load();
    stats.send_errors = m_send_errors.load();
    return stats;
}

// =============================================================================
// Receive Loop
// =============================================================================

void PlayerRelay::ReceiveLoop() {
    while (true) {
        int ready = WaitAny({m_disconnect.GetFd(), m_shutdown.GetFd(), m_socket.get_fd()}, -1);

        if (ready == SLOT_DISCONNECT || ready == SLOT_SHUTDOWN) {
            break;
        }
        if (ready != SLOT_DATA) {
            LOG_ERROR("Relay on port %u: wait failed, stopping receive loop", m_proxy_port);
            break;
        }

        size_t received = 0;
        network::SocketAddress from;
        network::SocketResult result = m_socket.recv_from(m_recv_buffer.data(), m_recv_buffer.size(),
                                                          received, from, 0);

        if (result == network::SocketResult::WouldBlock) {
            continue;
        }
        if (result == network::SocketResult::Closed) {
            break;
        }
        if (result != network::SocketResult::Success) {
            LOG_ERROR("Receive error on UDP port %u: %s", m_proxy_port,
                      network::socket_result_to_string(result));
            break;
        }

        Packet packet;
        packet.src_addr = from;
        packet.dst_port = m_proxy_port;
        packet.data.assign(m_recv_buffer.begin(), m_recv_buffer.begin() + received);

        m_packets_received++;
        m_inbound.Push(std::move(packet));
    }

    LOG_INFO("Stopped listening on UDP port %u", m_proxy_port);
    m_rx_done.Fire();
}

// =============================================================================
// Send Loop
// =============================================================================

void PlayerRelay::SendLoop() {
    while (true) {
        int ready = WaitAny({m_disconnect.GetFd(), m_shutdown.GetFd(), m_outbound.GetFd()}, -1);

        if (ready == SLOT_DISCONNECT || ready == SLOT_SHUTDOWN) {
            break;
        }
        if (ready != SLOT_DATA) {
            LOG_ERROR("Relay on port %u: wait failed, stopping send loop", m_proxy_port);
            break;
        }

        Packet packet;
        if (!m_outbound.TryPop(packet)) {
            continue;
        }

        size_t sent = 0;
        network::SocketResult result = m_socket.send_to(packet.data.data(), packet.data.size(),
                                                        packet.dst_addr, sent);
        if (result != network::SocketResult::Success) {
            m_send_errors++;
            LOG_WARN("Send from UDP port %u to %s failed: %s", m_proxy_port,
                     network::AddressString(packet.dst_addr).c_str(),
                     network::socket_result_to_string(result));
            continue;
        }

        m_packets_sent++;
    }

    LOG_VERBOSE("Stopped transmitting on UDP port %u", m_proxy_port);
    m_tx_done.Fire();
}

} // namespace natrelay::proxy
