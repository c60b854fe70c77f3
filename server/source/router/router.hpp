/**
 * @file router.hpp
 * @brief Packet router: admission and fan-out between game members
 *
 * The router is the single consumer of the registry's inbound channel. It
 * also owns the gateway socket, the well-known UDP port where players that
 * have no proxy port yet make first contact.
 *
 * ## Packet Flow
 *
 * ```
 *   gateway socket ─┐
 *                   ├─► HandlePacket() ─► inspector ─► registry updates
 *   inbound chan ───┘                 │
 *                                     └─► for each other player of the game:
 *                                           dst_addr = player's real address
 *                                           player.relay->Send(packet)
 * ```
 *
 * The game's own protocol is not parsed here. A PacketInspector callback
 * (none by default) may report what it learned from the payload: game id,
 * player id, a player's name, NAT port. Without an inspector every player
 * stays in the zero game id and traffic is fanned out among them.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../network/udp_socket.hpp"
#include "../proxy/packet.hpp"
#include "../proxy/signal.hpp"
#include "../state/registry.hpp"

namespace natrelay::router {

/**
 * @brief What an inspector learned from one packet
 *
 * Only the fields whose has_* flag is set are applied.
 */
struct PacketObservation {
    bool has_game_id = false;
    state::GameId game_id{};

    bool has_player_id = false;
    int32_t player_id = state::UNASSIGNED_PLAYER_ID;

    /// Name reported for player @ref name_player_id of the sender's game
    bool has_name = false;
    int32_t name_player_id = state::UNASSIGNED_PLAYER_ID;
    std::string name;

    bool has_nat_port = false;
    uint16_t nat_port = 0;
};

/**
 * @brief Game protocol decoder hook
 *
 * Called once per routed packet, on the router thread.
 */
using PacketInspector = void (*)(const proxy::Packet& packet, PacketObservation& observation, void* user_data);

struct RouterStats {
    uint64_t packets_routed;     ///< Packets with at least one target
    uint64_t packets_forwarded;  ///< Copies pushed to relays
    uint64_t packets_dropped;    ///< Unknown senders, admission failures
    uint64_t players_admitted;
};

class Router {
public:
    /**
     * @param registry Registry to route for (must outlive the router)
     * @param buffer_size Gateway datagram buffer size
     */
    explicit Router(state::Registry& registry, size_t buffer_size = proxy::DEFAULT_BUFFER_SIZE);

    /**
     * @brief Destructor - stops the router thread
     */
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /**
     * @brief Install the packet inspector
     *
     * @note Call before Start().
     */
    void SetInspector(PacketInspector inspector, void* user_data);

    /**
     * @brief Bind the gateway socket
     *
     * @param host Bind address, nullptr or "" for all interfaces
     * @param port Gateway port (0 lets the kernel pick one)
     */
    network::SocketResult OpenGateway(const char* host, uint16_t port);

    /**
     * @brief Gateway port, 0 if the gateway is not open
     */
    uint16_t GetGatewayPort() const { return m_gateway.get_local_port(); }

    /**
     * @brief Start the routing thread
     */
    bool Start();

    /**
     * @brief Stop the routing thread and close the gateway
     *
     * The router also stops on its own when the registry shuts down.
     */
    void Stop();

    bool IsRunning() const { return m_running; }

    /**
     * @brief Route one packet synchronously
     *
     * A packet from an unknown sender is admitted when it arrived on the
     * gateway port and dropped otherwise.
     *
     * @return Number of relays the packet was forwarded to
     */
    size_t HandlePacket(const proxy::Packet& packet);

    RouterStats GetStats() const;

private:
    void Run();
    void ReceiveGateway();

    /**
     * @brief Resolve the sender, admitting it through the gateway if needed
     */
    bool ResolveSender(const proxy::Packet& packet, const PacketObservation& observation,
                       state::Player& sender);

    /**
     * @brief Record what the inspector reported about @p sender
     */
    void ApplyObservation(state::Player& sender, const PacketObservation& observation);

    state::Registry& m_registry;

    PacketInspector m_inspector;
    void* m_inspector_user_data;

    network::UdpSocket m_gateway;
    std::vector<uint8_t> m_gateway_buffer;

    proxy::Signal m_stop;
    std::mutex m_lifecycle_mutex;
    std::thread m_thread;
    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_packets_routed{0};
    std::atomic<uint64_t> m_packets_forwarded{0};
    std::atomic<uint64_t> m_packets_dropped{0};
    std::atomic<uint64_t> m_players_admitted{0};
};

} // namespace natrelay::router
