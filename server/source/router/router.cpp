/**
 * @file router.cpp
 * @brief Packet router implementation
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "router.hpp"
#include "../debug/log.hpp"
#include "../proxy/player_relay.hpp"
#include <system_error>
#include <utility>

namespace natrelay::router {

namespace {

constexpr int SLOT_STOP = 0;
constexpr int SLOT_SHUTDOWN = 1;
constexpr int SLOT_FIRST_SOURCE = 2;
constexpr int SLOT_SECOND_SOURCE = 3;

} // anonymous namespace

Router::Router(state::Registry& registry, size_t buffer_size)
    : m_registry(registry)
    , m_inspector(nullptr)
    , m_inspector_user_data(nullptr)
    , m_gateway_buffer(buffer_size == 0 ? proxy::DEFAULT_BUFFER_SIZE : buffer_size)
{
}

Router::~Router() {
    Stop();
}

void Router::SetInspector(PacketInspector inspector, void* user_data) {
    m_inspector = inspector;
    m_inspector_user_data = user_data;
}

network::SocketResult Router::OpenGateway(const char* host, uint16_t port) {
    network::SocketResult result = m_gateway.bind(host, port);
    if (result != network::SocketResult::Success) {
        LOG_ERROR("Failed to bind gateway %s:%u: %s",
                  (host != nullptr && host[0] != '\0') ? host : "0.0.0.0", port,
                  network::socket_result_to_string(result));
        return result;
    }

    LOG_INFO("Gateway listening on UDP port %u", m_gateway.get_local_port());
    return network::SocketResult::Success;
}

// =============================================================================
// Thread Control
// =============================================================================

bool Router::Start() {
    std::scoped_lock lock(m_lifecycle_mutex);

    if (m_running) {
        LOG_WARN("Router already running");
        return true;
    }
    if (m_stop.IsFired() || !m_stop.IsValid()) {
        return false;
    }

    try {
        m_thread = std::thread(&Router::Run, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start router thread: %s", e.what());
        return false;
    }

    m_running = true;
    return true;
}

void Router::Stop() {
    std::scoped_lock lock(m_lifecycle_mutex);

    m_stop.Fire();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
    m_gateway.close();
}

RouterStats Router::GetStats() const {
    RouterStats stats;
    stats.packets_routed = m_packets_routed.load();
    stats.packets_forwarded = m_packets_forwarded.load();
    stats.packets_dropped = m_packets_dropped.load();
    stats.players_admitted = m_players_admitted.load();
    return stats;
}

// =============================================================================
// Main Loop
// =============================================================================

void Router::Run() {
    LOG_VERBOSE("Router thread started");

    proxy::PacketChannel& inbound = m_registry.GetInbound();
    const int stop_fd = m_stop.GetFd();
    const int shutdown_fd = m_registry.GetShutdownSignal().GetFd();

    // Inbound and gateway swap priority every iteration
    bool gateway_first = false;

    while (true) {
        // A closed gateway has fd -1, which poll() ignores
        int ready = gateway_first
            ? proxy::WaitAny({stop_fd, shutdown_fd, m_gateway.get_fd(), inbound.GetFd()}, -1)
            : proxy::WaitAny({stop_fd, shutdown_fd, inbound.GetFd(), m_gateway.get_fd()}, -1);

        if (ready == SLOT_STOP || ready == SLOT_SHUTDOWN) {
            break;
        }
        if (ready != SLOT_FIRST_SOURCE && ready != SLOT_SECOND_SOURCE) {
            LOG_ERROR("Router wait failed, stopping");
            break;
        }

        const bool from_gateway = (ready == SLOT_FIRST_SOURCE) == gateway_first;
        gateway_first = !gateway_first;

        if (from_gateway) {
            ReceiveGateway();
        } else {
            proxy::Packet packet;
            if (inbound.TryPop(packet)) {
                HandlePacket(packet);
            }
        }
    }

    LOG_VERBOSE("Router thread stopped");
}

void Router::ReceiveGateway() {
    size_t received = 0;
    network::SocketAddress from;
    network::SocketResult result = m_gateway.recv_from(m_gateway_buffer.data(), m_gateway_buffer.size(),
                                                       received, from, 0);
    if (result == network::SocketResult::WouldBlock) {
        return;
    }
    if (result != network::SocketResult::Success) {
        LOG_WARN("Gateway receive failed: %s", network::socket_result_to_string(result));
        return;
    }

    proxy::Packet packet;
    packet.src_addr = from;
    packet.dst_port = m_gateway.get_local_port();
    packet.data.assign(m_gateway_buffer.begin(), m_gateway_buffer.begin() + received);

    HandlePacket(packet);
}

// =============================================================================
// Routing
// =============================================================================

size_t Router::HandlePacket(const proxy::Packet& packet) {
    PacketObservation observation;
    if (m_inspector != nullptr) {
        m_inspector(packet, observation, m_inspector_user_data);
    }

    state::Player sender;
    if (!ResolveSender(packet, observation, sender)) {
        m_packets_dropped++;
        return 0;
    }

    ApplyObservation(sender, observation);

    const state::PlayerAddr sender_identity = sender.GetIdentity();
    size_t forwarded = 0;

    for (const state::Player& target : m_registry.GetPlayersInGame(sender.game_id)) {
        if (target.GetIdentity() == sender_identity || !target.relay) {
            continue;
        }

        proxy::Packet copy = packet;
        copy.dst_addr = target.addr;
        copy.dst_port = target.proxy_port;

        if (sender.player_id != state::UNASSIGNED_PLAYER_ID &&
            m_registry.RecordPeerPacket(target.GetIdentity(), sender.player_id, packet) != state::RegistryResult::Success) {
            // Target left since the snapshot was taken
            continue;
        }

        if (target.relay->Send(std::move(copy))) {
            forwarded++;
        }
    }

    if (forwarded > 0) {
        m_packets_routed++;
        m_packets_forwarded += forwarded;
    }
    return forwarded;
}

bool Router::ResolveSender(const proxy::Packet& packet, const PacketObservation& observation,
                           state::Player& sender) {
    if (m_registry.FindByAddress(packet.src_addr, sender) == state::RegistryResult::Success) {
        return true;
    }

    const bool from_gateway = m_gateway.is_valid() && packet.dst_port == m_gateway.get_local_port();
    if (!from_gateway) {
        LOG_VERBOSE("Dropping packet from unknown sender %s on port %u",
                    network::AddressString(packet.src_addr).c_str(), packet.dst_port);
        return false;
    }

    state::GameId game_id{};
    if (observation.has_game_id) {
        game_id = observation.game_id;
    }
    const uint16_t nat_port = observation.has_nat_port ? observation.nat_port : packet.src_addr.port;

    state::RegistryResult result = m_registry.Admit(packet.src_addr, game_id, nat_port, sender);
    if (result == state::RegistryResult::AlreadyExists) {
        return true;
    }
    if (result != state::RegistryResult::Success) {
        LOG_WARN("Could not admit %s: %s", network::AddressString(packet.src_addr).c_str(),
                 state::registry_result_to_string(result));
        return false;
    }

    m_players_admitted++;
    return true;
}

void Router::ApplyObservation(state::Player& sender, const PacketObservation& observation) {
    const state::PlayerAddr identity = sender.GetIdentity();

    if (observation.has_game_id && observation.game_id != sender.game_id) {
        if (m_registry.ChangeGame(sender.proxy_port, observation.game_id) == state::RegistryResult::Success) {
            sender.game_id = observation.game_id;
            sender.player_id = state::UNASSIGNED_PLAYER_ID;
        }
    }

    if (observation.has_player_id && observation.player_id != sender.player_id) {
        if (m_registry.SetPlayerId(identity, observation.player_id) == state::RegistryResult::Success) {
            sender.player_id = observation.player_id;
        }
    }

    if (observation.has_name) {
        if (m_registry.SetName(identity, observation.name_player_id, observation.name) != state::RegistryResult::Success) {
            LOG_VERBOSE("No player %d in game %s to name \"%s\"", observation.name_player_id,
                        state::GameIdString(sender.game_id).c_str(), observation.name.c_str());
        }
    }

    if (observation.has_nat_port && observation.nat_port != sender.nat_port) {
        if (m_registry.SetNatPort(identity, observation.nat_port) == state::RegistryResult::Success) {
            sender.nat_port = observation.nat_port;
        }
    }
}

} // namespace natrelay::router
