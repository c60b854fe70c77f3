/**
 * @file socket_address.cpp
 * @brief IPv4 socket address value type
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "socket_address.hpp"
#include <cstdio>
#include <cstring>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace natrelay::network {

bool SocketAddress::parse(const char* ip_str, uint16_t port, SocketAddress& out) {
    if (ip_str == nullptr || ip_str[0] == '\0') {
        return false;
    }

    in_addr parsed{};
    if (inet_pton(AF_INET, ip_str, &parsed) != 1) {
        return false;
    }

    out.ip = ntohl(parsed.s_addr);
    out.port = port;
    return true;
}

SocketAddress SocketAddress::from_sockaddr(const sockaddr_in& addr) {
    SocketAddress result;
    result.ip = ntohl(addr.sin_addr.s_addr);
    result.port = ntohs(addr.sin_port);
    return result;
}

void SocketAddress::to_sockaddr(sockaddr_in& addr) const {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(ip);
    addr.sin_port = htons(port);
}

void SocketAddress::format_ip(char* buffer, size_t buffer_size) const {
    std::snprintf(buffer, buffer_size, "%u.%u.%u.%u",
                  (ip >> 24) & 0xFF, (ip >> 16) & 0xFF,
                  (ip >> 8) & 0xFF, ip & 0xFF);
}

void SocketAddress::format(char* buffer, size_t buffer_size) const {
    std::snprintf(buffer, buffer_size, "%u.%u.%u.%u:%u",
                  (ip >> 24) & 0xFF, (ip >> 16) & 0xFF,
                  (ip >> 8) & 0xFF, ip & 0xFF, port);
}

} // namespace natrelay::network
