/**
 * @file registry.cpp
 * @brief Authoritative player/game registry implementation
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "registry.hpp"
#include "../debug/log.hpp"
#include "../proxy/player_relay.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

namespace natrelay::state {

// =============================================================================
// Helpers
// =============================================================================

void format_game_id(const GameId& id, char* buffer, size_t buffer_size) {
    static const char HEX[] = "0123456789abcdef";

    if (buffer == nullptr || buffer_size == 0) {
        return;
    }

    size_t pos = 0;
    for (uint8_t byte : id) {
        if (pos + 2 >= buffer_size) {
            break;
        }
        buffer[pos++] = HEX[byte >> 4];
        buffer[pos++] = HEX[byte & 0x0F];
    }
    buffer[pos] = '\0';
}

std::string clean_player_name(const std::string& name) {
    const std::string suffix = UNKNOWN_MACHINE_SUFFIX;

    if (name.size() < suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return name;
    }

    const size_t at = name.rfind('@');
    if (at == std::string::npos) {
        return name;
    }
    return name.substr(0, at);
}

// =============================================================================
// Construction
// =============================================================================

Registry::Registry(uint16_t first_proxy_port, size_t buffer_size, const char* relay_host)
    : m_ports(first_proxy_port)
    , m_buffer_size(buffer_size)
    , m_relay_host(relay_host != nullptr ? relay_host : "")
{
}

Registry::~Registry() {
    Shutdown();
}

bool Registry::IsValid() const {
    return m_inbound.IsValid() && m_shutdown.IsValid() &&
           m_joined_events.IsValid() && m_left_events.IsValid() && m_ended_events.IsValid();
}

// =============================================================================
// Unlocked Helpers
// =============================================================================

int Registry::FindIndexLocked(const PlayerAddr& identity) const {
    for (size_t i = 0; i < m_players.size(); i++) {
        if (m_players[i].addr == identity.addr && m_players[i].proxy_port == identity.proxy_port) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int Registry::FindIndexByAddressLocked(const network::SocketAddress& addr) const {
    for (size_t i = 0; i < m_players.size(); i++) {
        if (m_players[i].addr == addr) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int Registry::FindIndexByProxyPortLocked(uint16_t proxy_port) const {
    for (size_t i = 0; i < m_players.size(); i++) {
        if (m_players[i].proxy_port == proxy_port) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t Registry::CountPlayersLocked(const GameId& game_id) const {
    size_t count = 0;
    for (const Player& player : m_players) {
        if (player.game_id == game_id) {
            count++;
        }
    }
    return count;
}

void Registry::RecomputePlayerCountLocked(const GameId& game_id) {
    const size_t count = CountPlayersLocked(game_id);

    if (count == 0) {
        auto it = m_games.find(game_id);
        if (it != m_games.end()) {
            m_games.erase(it);
            m_ended_events.Push(game_id);
        }
        return;
    }

    GameInfo& game = m_games[game_id];
    game.game_id = game_id;
    game.player_count = count;
}

void Registry::ReleasePort(uint16_t port) {
    std::unique_lock lock(m_mutex);
    m_ports.Release(port);
}

// =============================================================================
// Lookups
// =============================================================================

RegistryResult Registry::FindByAddress(const network::SocketAddress& addr, Player& out) const {
    std::shared_lock lock(m_mutex);

    int index = FindIndexByAddressLocked(addr);
    if (index < 0) {
        return RegistryResult::NotFound;
    }
    out = m_players[index];
    return RegistryResult::Success;
}

RegistryResult Registry::FindByProxyPort(uint16_t proxy_port, GameId& game_id, Player& out) const {
    std::shared_lock lock(m_mutex);

    int index = FindIndexByProxyPortLocked(proxy_port);
    if (index < 0) {
        return RegistryResult::NotFound;
    }
    out = m_players[index];
    game_id = m_players[index].game_id;
    return RegistryResult::Success;
}

RegistryResult Registry::GetGameInfo(const GameId& game_id, GameInfo& out) const {
    std::shared_lock lock(m_mutex);

    auto it = m_games.find(game_id);
    if (it == m_games.end()) {
        return RegistryResult::NotFound;
    }
    out = it->second;
    return RegistryResult::Success;
}

size_t Registry::CountPlayers(const GameId& game_id) const {
    std::shared_lock lock(m_mutex);
    return CountPlayersLocked(game_id);
}

size_t Registry::GetPlayerCount() const {
    std::shared_lock lock(m_mutex);
    return m_players.size();
}

size_t Registry::GetGameCount() const {
    std::shared_lock lock(m_mutex);
    return m_games.size();
}

std::vector<Player> Registry::GetPlayers() const {
    std::shared_lock lock(m_mutex);
    return m_players;
}

std::vector<Player> Registry::GetPlayersInGame(const GameId& game_id) const {
    std::shared_lock lock(m_mutex);

    std::vector<Player> result;
    for (const Player& player : m_players) {
        if (player.game_id == game_id) {
            result.push_back(player);
        }
    }
    return result;
}

std::vector<GameInfo> Registry::GetGames() const {
    std::shared_lock lock(m_mutex);

    std::vector<GameInfo> result;
    result.reserve(m_games.size());
    for (const auto& [id, game] : m_games) {
        result.push_back(game);
    }
    return result;
}

bool Registry::IsPortAllocated(uint16_t port) const {
    std::shared_lock lock(m_mutex);
    return m_ports.IsAllocated(port);
}

std::string Registry::FormatServerState() const {
    std::shared_lock lock(m_mutex);

    std::string out;
    char line[160];

    std::snprintf(line, sizeof(line), "   %-21s    %-10s    %-16s    %-6s    %s\n",
                  "Player", "Proxy Port", "Game Id", "Id", "Name");
    out += line;

    for (const Player& player : m_players) {
        std::snprintf(line, sizeof(line), "   %-21s    %-10u    %-16s    %-6d    %s\n",
                      network::AddressString(player.addr).c_str(),
                      static_cast<unsigned>(player.proxy_port),
                      GameIdString(player.game_id).c_str(),
                      player.player_id,
                      player.name.c_str());
        out += line;
    }

    std::snprintf(line, sizeof(line), "   %zu player(s) in %zu game(s)\n",
                  m_players.size(), m_games.size());
    out += line;
    return out;
}

// =============================================================================
// Admission
// =============================================================================

/**
 * ## Admission Flow
 *
 * 1. Exclusive lock: refuse if shutting down or already admitted, then
 *    reserve a proxy port. The reservation keeps concurrent admissions from
 *    picking the same port while the lock is dropped.
 * 2. No lock: bind the relay socket and start its threads.
 * 3. Exclusive lock: re-check shutdown and duplicates (another thread may
 *    have admitted the same address meanwhile), then publish the player,
 *    recompute the game count and emit player-joined.
 *
 * Any failure after step 1 stops the relay and gives the port back.
 */
RegistryResult Registry::Admit(const network::SocketAddress& addr, const GameId& game_id,
                               uint16_t nat_port, Player& out) {
    uint16_t port = 0;
    {
        std::unique_lock lock(m_mutex);

        if (m_shutdown.IsFired()) {
            return RegistryResult::ShuttingDown;
        }

        int existing = FindIndexByAddressLocked(addr);
        if (existing >= 0) {
            out = m_players[existing];
            return RegistryResult::AlreadyExists;
        }

        port = m_ports.Allocate();
        if (port == 0) {
            LOG_ERROR("No free proxy port for %s", network::AddressString(addr).c_str());
            return RegistryResult::PortsExhausted;
        }
    }

    auto relay = std::make_shared<proxy::PlayerRelay>(addr, port, m_inbound, m_shutdown, m_buffer_size);

    network::SocketResult bind_result = relay->Open(m_relay_host.empty() ? nullptr : m_relay_host.c_str());
    if (bind_result != network::SocketResult::Success) {
        LOG_ERROR("Failed to bind UDP port %u for %s: %s", port,
                  network::AddressString(addr).c_str(),
                  network::socket_result_to_string(bind_result));
        relay.reset();
        ReleasePort(port);
        return RegistryResult::BindFailed;
    }

    if (!relay->Start()) {
        relay->Stop();
        ReleasePort(port);
        return RegistryResult::RelayStartFailed;
    }

    RegistryResult result = RegistryResult::Success;
    {
        std::unique_lock lock(m_mutex);

        if (m_shutdown.IsFired()) {
            result = RegistryResult::ShuttingDown;
        } else {
            int existing = FindIndexByAddressLocked(addr);
            if (existing >= 0) {
                out = m_players[existing];
                result = RegistryResult::AlreadyExists;
            } else {
                Player player;
                player.addr = addr;
                player.proxy_port = port;
                player.relay = relay;
                player.game_id = game_id;
                player.nat_port = nat_port;

                m_players.push_back(player);
                RecomputePlayerCountLocked(game_id);
                m_joined_events.Push(player.GetIdentity());

                out = std::move(player);
            }
        }
    }

    if (result != RegistryResult::Success) {
        relay->Stop();
        ReleasePort(port);
        return result;
    }

    LOG_VERBOSE("Admitted %s on proxy port %u (game %s)",
                network::AddressString(addr).c_str(), port, GameIdString(game_id).c_str());
    return RegistryResult::Success;
}

// =============================================================================
// Game Membership
// =============================================================================

RegistryResult Registry::ChangeGame(uint16_t proxy_port, const GameId& new_game_id) {
    std::unique_lock lock(m_mutex);

    int index = FindIndexByProxyPortLocked(proxy_port);
    if (index < 0) {
        return RegistryResult::NotFound;
    }

    Player& player = m_players[index];
    const GameId old_game_id = player.game_id;

    player.game_id = new_game_id;
    player.player_id = UNASSIGNED_PLAYER_ID;

    RecomputePlayerCountLocked(new_game_id);
    if (old_game_id != new_game_id) {
        RecomputePlayerCountLocked(old_game_id);
    }

    LOG_VERBOSE("Proxy port %u moved from game %s to %s", proxy_port,
                GameIdString(old_game_id).c_str(), GameIdString(new_game_id).c_str());
    return RegistryResult::Success;
}

void Registry::RecomputePlayerCount(const GameId& game_id) {
    std::unique_lock lock(m_mutex);
    RecomputePlayerCountLocked(game_id);
}

// =============================================================================
// Removal
// =============================================================================

/**
 * ## Removal Flow
 *
 * 1. Exclusive lock: fire the relay's disconnect signal, swap-remove the
 *    player, emit player-left and recompute the vacated game.
 * 2. No lock: Stop() joins both relay threads and closes the socket.
 * 3. Exclusive lock: release the proxy port. Doing this last means the port
 *    is never handed out while the old socket still holds it.
 */
RegistryResult Registry::Remove(const PlayerAddr& identity) {
    std::shared_ptr<proxy::PlayerRelay> relay;
    {
        std::unique_lock lock(m_mutex);

        int index = FindIndexLocked(identity);
        if (index < 0) {
            return RegistryResult::NotFound;
        }

        relay = std::move(m_players[index].relay);
        const GameId game_id = m_players[index].game_id;

        if (relay) {
            relay->Disconnect();
        }

        if (static_cast<size_t>(index) != m_players.size() - 1) {
            m_players[index] = std::move(m_players.back());
        }
        m_players.pop_back();

        m_left_events.Push(identity);
        RecomputePlayerCountLocked(game_id);
    }

    if (relay) {
        relay->Stop();
    }
    ReleasePort(identity.proxy_port);

    LOG_VERBOSE("Removed %s (proxy port %u)",
                network::AddressString(identity.addr).c_str(), identity.proxy_port);
    return RegistryResult::Success;
}

// =============================================================================
// Player Attributes
// =============================================================================

RegistryResult Registry::SetNatPort(const PlayerAddr& identity, uint16_t nat_port) {
    std::unique_lock lock(m_mutex);

    int index = FindIndexLocked(identity);
    if (index < 0) {
        return RegistryResult::NotFound;
    }
    m_players[index].nat_port = nat_port;
    return RegistryResult::Success;
}

RegistryResult Registry::SetPlayerId(const PlayerAddr& identity, int32_t player_id) {
    std::unique_lock lock(m_mutex);

    int index = FindIndexLocked(identity);
    if (index < 0) {
        return RegistryResult::NotFound;
    }
    m_players[index].player_id = player_id;
    return RegistryResult::Success;
}

RegistryResult Registry::SetName(const PlayerAddr& reporter, int32_t player_id, const std::string& name) {
    std::unique_lock lock(m_mutex);

    int reporter_index = FindIndexLocked(reporter);
    if (reporter_index < 0) {
        return RegistryResult::NotFound;
    }
    const GameId game_id = m_players[reporter_index].game_id;

    for (Player& player : m_players) {
        if (player.game_id == game_id && player.player_id == player_id) {
            player.name = clean_player_name(name);
            return RegistryResult::Success;
        }
    }
    return RegistryResult::NotFound;
}

RegistryResult Registry::RecordPeerPacket(const PlayerAddr& identity, int32_t peer_id,
                                          const proxy::Packet& packet) {
    std::unique_lock lock(m_mutex);

    int index = FindIndexLocked(identity);
    if (index < 0) {
        return RegistryResult::NotFound;
    }

    PeerInfo& peer = m_players[index].peers[peer_id];
    peer.last_seen = std::chrono::steady_clock::now();
    peer.last_packet = packet;
    return RegistryResult::Success;
}

// =============================================================================
// Shutdown
// =============================================================================

void Registry::Shutdown() {
    const bool first = m_shutdown.Fire();

    std::vector<std::shared_ptr<proxy::PlayerRelay>> relays;
    {
        std::unique_lock lock(m_mutex);

        relays.reserve(m_players.size());
        for (Player& player : m_players) {
            if (player.relay) {
                relays.push_back(std::move(player.relay));
            }
        }
        m_players.clear();
        m_games.clear();
    }

    for (auto& relay : relays) {
        relay->Stop();
    }

    {
        std::unique_lock lock(m_mutex);
        m_ports.ReleaseAll();
    }

    if (first) {
        LOG_INFO("Registry shut down (%zu relay(s) stopped)", relays.size());
    }
}

} // namespace natrelay::state
