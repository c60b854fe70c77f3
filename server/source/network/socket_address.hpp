/**
 * @file socket_address.hpp
 * @brief IPv4 socket address value type
 *
 * Players are identified by the (IP, port) pair observed on their first
 * datagram. This type holds that pair in host byte order so it can be
 * compared, copied and printed without touching sockaddr structures.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>

struct sockaddr_in;

namespace natrelay::network {

/**
 * @brief Buffer size large enough for "255.255.255.255:65535"
 */
constexpr size_t MAX_ADDRESS_STRING_LENGTH = 22;

/**
 * @brief IPv4 address and UDP port, both in host byte order
 */
struct SocketAddress {
    uint32_t ip = 0;    ///< IPv4 address (host byte order)
    uint16_t port = 0;  ///< UDP port (host byte order)

    bool operator==(const SocketAddress& other) const = default;

    /**
     * @brief Parse a dotted-quad IPv4 string
     *
     * @param ip_str Address such as "192.168.1.10"
     * @param port Port number
     * @param[out] out Parsed address
     * @return true on success, false if @p ip_str is not a valid IPv4 address
     */
    static bool parse(const char* ip_str, uint16_t port, SocketAddress& out);

    /**
     * @brief Build from a kernel sockaddr_in (network byte order)
     */
    static SocketAddress from_sockaddr(const sockaddr_in& addr);

    /**
     * @brief Fill a kernel sockaddr_in (network byte order)
     */
    void to_sockaddr(sockaddr_in& addr) const;

    /**
     * @brief Format the IP part only ("1.2.3.4")
     */
    void format_ip(char* buffer, size_t buffer_size) const;

    /**
     * @brief Format as "1.2.3.4:9000"
     */
    void format(char* buffer, size_t buffer_size) const;

    /**
     * @brief Check whether the address is unset (0.0.0.0:0)
     */
    bool is_empty() const { return ip == 0 && port == 0; }
};

/**
 * @brief Small helper that formats an address into an owned buffer
 *
 * Meant for log statements:
 * @code
 * LOG_INFO("player %s", AddressString(addr).c_str());
 * @endcode
 */
class AddressString {
public:
    explicit AddressString(const SocketAddress& addr) { addr.format(m_buffer, sizeof(m_buffer)); }
    const char* c_str() const { return m_buffer; }

private:
    char m_buffer[MAX_ADDRESS_STRING_LENGTH + 1];
};

} // namespace natrelay::network
