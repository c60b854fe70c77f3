/**
 * @file registry_types.hpp
 * @brief Player and game value types held by the Registry
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "../network/socket_address.hpp"
#include "../proxy/packet.hpp"

namespace natrelay::proxy {
class PlayerRelay;
}

namespace natrelay::state {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t GAME_ID_SIZE = 8;

/** @brief PlayerId of a player the game protocol has not numbered yet */
constexpr int32_t UNASSIGNED_PLAYER_ID = -1;

/** @brief Display name until the game protocol reports one */
constexpr const char* DEFAULT_PLAYER_NAME = "<unknown>";

/** @brief Placeholder host name some clients append after '@' */
constexpr const char* UNKNOWN_MACHINE_SUFFIX = "Unknown Machine Name";

/** @brief "0011223344556677" + NUL */
constexpr size_t GAME_ID_STRING_LENGTH = GAME_ID_SIZE * 2 + 1;

// ============================================================================
// GameId
// ============================================================================

/**
 * @brief Opaque 8-byte game identifier
 */
using GameId = std::array<uint8_t, GAME_ID_SIZE>;

/**
 * @brief Format a GameId as 16 lowercase hex digits
 */
void format_game_id(const GameId& id, char* buffer, size_t buffer_size);

/**
 * @brief Stack buffer holding a formatted GameId, for log statements
 */
class GameIdString {
public:
    explicit GameIdString(const GameId& id) { format_game_id(id, m_buffer, sizeof(m_buffer)); }
    const char* c_str() const { return m_buffer; }

private:
    char m_buffer[GAME_ID_STRING_LENGTH];
};

// ============================================================================
// Player
// ============================================================================

/**
 * @brief Exact player identity: real address plus proxy port
 *
 * Carried by the joined/left notifications.
 */
struct PlayerAddr {
    network::SocketAddress addr;
    uint16_t proxy_port = 0;

    bool operator==(const PlayerAddr& other) const = default;
};

/**
 * @brief Last traffic seen from one peer of a player
 */
struct PeerInfo {
    std::chrono::steady_clock::time_point last_seen;
    proxy::Packet last_packet;
};

/**
 * @brief Connected player
 *
 * Registry lookups return copies; the relay is shared so a copy still
 * addresses the live relay.
 */
struct Player {
    network::SocketAddress addr;
    uint16_t proxy_port = 0;
    std::shared_ptr<proxy::PlayerRelay> relay;

    GameId game_id{};
    int32_t player_id = UNASSIGNED_PLAYER_ID;
    std::string name = DEFAULT_PLAYER_NAME;
    uint16_t nat_port = 0;

    std::map<int32_t, PeerInfo> peers;

    PlayerAddr GetIdentity() const { return PlayerAddr{addr, proxy_port}; }
};

// ============================================================================
// Game
// ============================================================================

struct GameInfo {
    GameId game_id{};
    size_t player_count = 0;
};

// ============================================================================
// Result Codes
// ============================================================================

enum class RegistryResult {
    Success = 0,
    NotFound,          // No player/game matched
    AlreadyExists,     // Address already admitted, existing player returned
    PortsExhausted,    // No free proxy port
    BindFailed,        // Proxy port could not be bound
    RelayStartFailed,  // Relay threads could not be created
    ShuttingDown       // Global shutdown has fired
};

inline const char* registry_result_to_string(RegistryResult result) {
    switch (result) {
        case RegistryResult::Success:          return "Success";
        case RegistryResult::NotFound:         return "NotFound";
        case RegistryResult::AlreadyExists:    return "AlreadyExists";
        case RegistryResult::PortsExhausted:   return "PortsExhausted";
        case RegistryResult::BindFailed:       return "BindFailed";
        case RegistryResult::RelayStartFailed: return "RelayStartFailed";
        case RegistryResult::ShuttingDown:     return "ShuttingDown";
        default:                               return "Unknown";
    }
}

/**
 * @brief Apply the display-name cleanup used by SetName
 *
 * "PLAYER1@Unknown Machine Name" becomes "PLAYER1". Names without the
 * placeholder suffix, or without any '@', are returned unchanged.
 */
std::string clean_player_name(const std::string& name);

} // namespace natrelay::state
