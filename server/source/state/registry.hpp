/**
 * @file registry.hpp
 * @brief Authoritative player/game registry
 *
 * The Registry owns every connected Player (and through it every
 * PlayerRelay), the map of active games, the proxy PortPool, the inbound
 * channel shared by all relays, the global shutdown Signal and the three
 * notification channels (player joined, player left, game ended).
 *
 * ## Locking
 *
 * One std::shared_mutex guards players, games and the port pool. Every
 * public method takes it itself: shared for lookups, exclusive for
 * mutations. Methods suffixed `Locked` are private and expect the caller to
 * already hold it, which is how operations compose (Remove recomputes the
 * game count without re-locking, for instance).
 *
 * Socket binding and thread joins never happen under the lock:
 *
 * ```
 * Admit:  lock{allocate port} -> bind + start relay -> lock{publish player}
 * Remove: lock{unlink player} -> stop relay         -> lock{release port}
 * ```
 *
 * The notification channels are unbounded, so a slow consumer never blocks
 * a mutation.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "registry_types.hpp"
#include "../proxy/channel.hpp"
#include "../proxy/packet.hpp"
#include "../proxy/port_pool.hpp"
#include "../proxy/signal.hpp"

namespace natrelay::state {

using PlayerEventChannel = proxy::Channel<PlayerAddr>;
using GameEventChannel = proxy::Channel<GameId>;

/**
 * @brief Player/game registry
 *
 * @example
 * @code
 * Registry registry(40001);
 *
 * Player player;
 * if (registry.Admit(addr, game_id, addr.port, player) == RegistryResult::Success) {
 *     // player.proxy_port is now listening
 * }
 *
 * registry.Remove(player.GetIdentity());
 * @endcode
 */
class Registry {
public:
    /**
     * @brief Create an empty registry
     *
     * @param first_proxy_port Base of the proxy port range
     * @param buffer_size Maximum datagram size for relays
     * @param relay_host Local address relays bind to, nullptr for all
     */
    explicit Registry(uint16_t first_proxy_port = proxy::DEFAULT_FIRST_PROXY_PORT,
                      size_t buffer_size = proxy::DEFAULT_BUFFER_SIZE,
                      const char* relay_host = nullptr);

    /**
     * @brief Destructor - performs Shutdown()
     */
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Check that the channels and the shutdown signal were created
     */
    bool IsValid() const;

    // ========================================================================
    // Lookups
    // ========================================================================

    /**
     * @brief Find a player by real address (IP and port)
     */
    RegistryResult FindByAddress(const network::SocketAddress& addr, Player& out) const;

    /**
     * @brief Find a player by proxy port
     *
     * @param[out] game_id Game the player belongs to
     * @param[out] out The player
     */
    RegistryResult FindByProxyPort(uint16_t proxy_port, GameId& game_id, Player& out) const;

    RegistryResult GetGameInfo(const GameId& game_id, GameInfo& out) const;

    /**
     * @brief Count players currently in a game (live count, not the stored one)
     */
    size_t CountPlayers(const GameId& game_id) const;

    size_t GetPlayerCount() const;
    size_t GetGameCount() const;

    /**
     * @brief Snapshot of all players, in join order (modulo swap removal)
     */
    std::vector<Player> GetPlayers() const;

    std::vector<Player> GetPlayersInGame(const GameId& game_id) const;

    std::vector<GameInfo> GetGames() const;

    bool IsPortAllocated(uint16_t port) const;

    /**
     * @brief Human-readable table of connected players
     */
    std::string FormatServerState() const;

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Admit a new player
     *
     * Allocates a proxy port, binds and starts its relay, and publishes the
     * Player with PlayerId -1 and the default name.
     *
     * @param addr Real address of the player
     * @param game_id Game the player joins
     * @param nat_port NAT-observed port of the player
     * @param[out] out The new player, or the existing one on AlreadyExists
     * @return Success, AlreadyExists, PortsExhausted, BindFailed,
     *         RelayStartFailed or ShuttingDown
     */
    RegistryResult Admit(const network::SocketAddress& addr, const GameId& game_id,
                         uint16_t nat_port, Player& out);

    /**
     * @brief Move a player to another game
     *
     * Resets the PlayerId to -1 and recomputes both games' counts.
     */
    RegistryResult ChangeGame(uint16_t proxy_port, const GameId& new_game_id);

    /**
     * @brief Recompute a game's stored player count
     *
     * A game left with no players is deleted and a game-ended event emitted.
     */
    void RecomputePlayerCount(const GameId& game_id);

    /**
     * @brief Remove a player and tear down its relay
     *
     * Returns once the relay threads have exited and its port is free.
     */
    RegistryResult Remove(const PlayerAddr& identity);

    RegistryResult SetNatPort(const PlayerAddr& identity, uint16_t nat_port);
    RegistryResult SetPlayerId(const PlayerAddr& identity, int32_t player_id);

    /**
     * @brief Record a player name reported by the game protocol
     *
     * The reporter is only used to find the game; the name is stored on the
     * player of that game whose PlayerId is @p player_id.
     */
    RegistryResult SetName(const PlayerAddr& reporter, int32_t player_id, const std::string& name);

    /**
     * @brief Note traffic from peer @p peer_id to the player @p identity
     */
    RegistryResult RecordPeerPacket(const PlayerAddr& identity, int32_t peer_id,
                                    const proxy::Packet& packet);

    /**
     * @brief Global shutdown
     *
     * Fires the shutdown signal, stops every relay, drops all players and
     * games and frees all ports. Idempotent. Admit fails afterwards.
     */
    void Shutdown();

    bool IsShuttingDown() const { return m_shutdown.IsFired(); }

    // ========================================================================
    // Conduits
    // ========================================================================

    proxy::PacketChannel& GetInbound() { return m_inbound; }
    const proxy::Signal& GetShutdownSignal() const { return m_shutdown; }

    PlayerEventChannel& GetPlayerJoinedEvents() { return m_joined_events; }
    PlayerEventChannel& GetPlayerLeftEvents() { return m_left_events; }
    GameEventChannel& GetGameEndedEvents() { return m_ended_events; }

private:
    // Caller holds m_mutex (shared is enough for the const ones)
    int FindIndexLocked(const PlayerAddr& identity) const;
    int FindIndexByAddressLocked(const network::SocketAddress& addr) const;
    int FindIndexByProxyPortLocked(uint16_t proxy_port) const;
    size_t CountPlayersLocked(const GameId& game_id) const;

    // Caller holds m_mutex exclusively
    void RecomputePlayerCountLocked(const GameId& game_id);

    void ReleasePort(uint16_t port);

    mutable std::shared_mutex m_mutex;
    std::vector<Player> m_players;
    std::map<GameId, GameInfo> m_games;
    proxy::PortPool m_ports;

    size_t m_buffer_size;
    std::string m_relay_host;

    proxy::PacketChannel m_inbound;
    proxy::Signal m_shutdown;

    PlayerEventChannel m_joined_events;
    PlayerEventChannel m_left_events;
    GameEventChannel m_ended_events;
};

} // namespace natrelay::state
