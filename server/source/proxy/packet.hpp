/**
 * @file packet.hpp
 * @brief Relayed datagram value type
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../network/socket_address.hpp"
#include "channel.hpp"

namespace natrelay::proxy {

/**
 * @brief Default and maximum datagram buffer size for relays
 */
constexpr size_t DEFAULT_BUFFER_SIZE = 1024;

/**
 * @brief One datagram travelling through the relay
 *
 * Produced by a relay's receive loop (src_addr = observed sender,
 * dst_port = the relay's proxy port) and consumed by the router, or built
 * by the router (dst_addr = where the send loop must write it).
 * The payload is always an owned copy.
 */
struct Packet {
    network::SocketAddress src_addr;
    network::SocketAddress dst_addr;
    uint16_t dst_port = 0;
    std::vector<uint8_t> data;

    size_t size() const { return data.size(); }
};

using PacketChannel = Channel<Packet>;

} // namespace natrelay::proxy
