/**
 * @file player_relay.hpp
 * @brief Per-player UDP relay (one proxy port, one player)
 *
 * A PlayerRelay owns the UDP socket bound to one player's proxy port and runs
 * two threads for the lifetime of the player's connection:
 *
 * - **receive loop**: every datagram arriving on the proxy port is copied
 *   into a Packet and pushed onto the inbound channel shared by all relays;
 * - **send loop**: every Packet pushed onto this relay's own outbound channel
 *   is written to the Packet's destination address from the proxy port.
 *
 * ## Termination
 *
 * Each loop waits with poll() on its data source and two Signals:
 *
 * ```
 *   receive loop: { disconnect, shutdown, socket }
 *   send loop:    { disconnect, shutdown, outbound channel }
 * ```
 *
 * `disconnect` belongs to this relay only (targeted close), `shutdown` is
 * shared by every relay (global shutdown). Firing either wakes both loops,
 * neither loop has to close the socket to get unblocked, and closing one
 * relay never touches another relay's socket.
 *
 * ## Lifecycle
 *
 * ```
 * Open() -> Start() -> ... -> Disconnect() -> Stop()
 * ```
 *
 * Stop() joins both threads before closing the socket, so once it returns the
 * proxy port can be bound again.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "../network/socket_address.hpp"
#include "../network/udp_socket.hpp"
#include "packet.hpp"
#include "signal.hpp"

namespace natrelay::proxy {

/**
 * @brief Relay traffic counters
 */
struct RelayStats {
    uint64_t packets_received;
    uint64_t packets_sent;
    uint64_t send_errors;
};

/**
 * @brief UDP bridge for one player
 *
 * Non-copyable. Held by shared_ptr so the registry can drop a player while
 * the relay is being stopped outside the registry lock.
 */
class PlayerRelay {
public:
    /**
     * @brief Construct an unbound relay
     *
     * @param player_addr Real address of the player this relay serves
     * @param proxy_port Proxy port to bind
     * @param inbound Channel shared by all relays, receives every datagram
     * @param shutdown Global shutdown signal (must outlive the relay)
     * @param buffer_size Maximum datagram size
     */
    PlayerRelay(const network::SocketAddress& player_addr, uint16_t proxy_port,
                PacketChannel& inbound, const Signal& shutdown,
                size_t buffer_size = DEFAULT_BUFFER_SIZE);

    /**
     * @brief Destructor - stops the relay
     */
    ~PlayerRelay();

    PlayerRelay(const PlayerRelay&) = delete;
    PlayerRelay& operator=(const PlayerRelay&) = delete;

    /**
     * @brief Bind the socket on the proxy port
     *
     * @param bind_host Local address to bind, nullptr for all interfaces
     * @return SocketResult::Success or the bind error
     */
    network::SocketResult Open(const char* bind_host = nullptr);

    /**
     * @brief Spawn the receive and send threads
     *
     * @return true if both threads are running
     */
    bool Start();

    /**
     * @brief Targeted close: wake both loops and make them exit
     *
     * Idempotent. Does not wait; call Stop() to join.
     */
    void Disconnect();

    /**
     * @brief Disconnect, join both loops and close the socket
     *
     * Idempotent. Must not be called from one of the relay's own threads.
     */
    void Stop();

    /**
     * @brief Queue a packet for the send loop
     *
     * @return false if the relay is already terminating
     */
    bool Send(Packet packet);

    /**
     * @brief Wait until both loops have exited
     *
     * @param timeout_ms Timeout for each loop (-1 = forever)
     * @return true if both loops have exited
     */
    bool WaitForExit(int32_t timeout_ms) const;

    bool IsReceiveLoopDone() const { return m_rx_done.IsFired(); }
    bool IsSendLoopDone() const { return m_tx_done.IsFired(); }

    const network::SocketAddress& GetPlayerAddress() const { return m_player_addr; }
    uint16_t GetProxyPort() const { return m_proxy_port; }

    RelayStats GetStats() const;

private:
    void ReceiveLoop();
    void SendLoop();

    /**
     * @brief Join whatever threads exist and close the socket
     * @note Caller holds m_lifecycle_mutex.
     */
    void JoinAndClose();

    network::SocketAddress m_player_addr;
    uint16_t m_proxy_port;
    PacketChannel& m_inbound;
    const Signal& m_shutdown;

    network::UdpSocket m_socket;
    PacketChannel m_outbound;
    std::vector<uint8_t> m_recv_buffer;

    Signal m_disconnect;
    Signal m_rx_done;
    Signal m_tx_done;

    std::mutex m_lifecycle_mutex;
    std::thread m_rx_thread;
    std::thread m_tx_thread;
    bool m_started;
    bool m_stopped;

    std::atomic<uint64_t> m_packets_received{0};
    std::atomic<uint64_t> m_packets_sent{0};
    std::atomic<uint64_t> m_send_errors{0};
};

} // namespace natrelay::proxy
