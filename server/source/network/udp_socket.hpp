/**
 * @file udp_socket.hpp
 * @brief UDP Socket Wrapper for natrelay
 *
 * Thin RAII wrapper over a POSIX IPv4 datagram socket. Every relay owns one
 * of these bound to its proxy port, and the router owns one for the gateway
 * port.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include "socket_address.hpp"

namespace natrelay::network {

// ============================================================================
// Result Codes
// ============================================================================

enum class SocketResult {
    Success = 0,
    WouldBlock,        // Non-blocking operation would block
    Timeout,           // Operation timed out
    ConnectionRefused, // ICMP port unreachable reported by the kernel
    HostUnreachable,   // Cannot reach host
    NetworkDown,       // Network is down
    InvalidAddress,    // Invalid address format
    AddressInUse,      // Port already bound by another socket
    PermissionDenied,  // Privileged port or blocked by policy
    MessageTooLong,    // Datagram larger than the socket allows
    SocketError,       // Generic socket error
    Closed             // Socket was closed
};

// ============================================================================
// UdpSocket Class
// ============================================================================

/**
 * @brief UDP socket wrapper
 *
 * Non-copyable, move-only. Closed automatically on destruction.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * if (sock.bind(nullptr, 40001) == SocketResult::Success) {
 *     uint8_t buf[1024];
 *     size_t received;
 *     SocketAddress from;
 *     sock.recv_from(buf, sizeof(buf), received, from, 1000);
 *
 *     size_t sent;
 *     sock.send_to(buf, received, from, sent);
 * }
 * @endcode
 *
 * Individual instances are not thread-safe, with one exception the relay
 * depends on: one thread may block in recv_from() while another calls
 * send_to() on the same descriptor, which the kernel allows.
 */
class UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Moveable
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Create the socket and bind it to a local address
     *
     * @param host IPv4 address to bind, or nullptr / "" for all interfaces
     * @param port Local port (0 lets the kernel pick one)
     * @return SocketResult::Success, AddressInUse, InvalidAddress or error
     *
     * @note On failure the socket is left closed.
     */
    SocketResult bind(const char* host, uint16_t port);

    /**
     * @brief Send one datagram
     *
     * @param data Payload
     * @param size Payload size
     * @param to Destination address
     * @param[out] sent Number of bytes sent
     * @return SocketResult::Success or error
     */
    SocketResult send_to(const uint8_t* data, size_t size, const SocketAddress& to, size_t& sent);

    /**
     * @brief Receive one datagram
     *
     * Datagrams longer than @p buffer_size are truncated.
     *
     * @param buffer Buffer to receive into
     * @param buffer_size Size of buffer
     * @param[out] received Number of bytes received
     * @param[out] from Sender address
     * @param timeout_ms Receive timeout (0 = non-blocking, -1 = blocking)
     * @return SocketResult::Success, WouldBlock, Timeout, Closed or error
     */
    SocketResult recv_from(uint8_t* buffer, size_t buffer_size, size_t& received,
                           SocketAddress& from, int32_t timeout_ms = -1);

    /**
     * @brief Close the socket
     */
    void close();

    /**
     * @brief Check if socket is valid (has file descriptor)
     */
    bool is_valid() const;

    /**
     * @brief Get the native socket file descriptor
     * @return File descriptor or -1 if invalid
     */
    int get_fd() const { return m_fd; }

    /**
     * @brief Get the bound local port
     * @return Port in host byte order, or 0 if not bound
     */
    uint16_t get_local_port() const { return m_local_port; }

private:
    int m_fd;
    uint16_t m_local_port;

    /**
     * @brief Wait for socket to be readable (using poll)
     * @return SocketResult::Success, Timeout, or error
     */
    SocketResult wait_readable(int32_t timeout_ms);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Map a POSIX errno value to SocketResult
 */
SocketResult errno_to_result(int err);

/**
 * @brief Convert SocketResult to string for debugging
 */
inline const char* socket_result_to_string(SocketResult result) {
    switch (result) {
        case SocketResult::Success:           return "Success";
        case SocketResult::WouldBlock:        return "WouldBlock";
        case SocketResult::Timeout:           return "Timeout";
        case SocketResult::ConnectionRefused: return "ConnectionRefused";
        case SocketResult::HostUnreachable:   return "HostUnreachable";
        case SocketResult::NetworkDown:       return "NetworkDown";
        case SocketResult::InvalidAddress:    return "InvalidAddress";
        case SocketResult::AddressInUse:      return "AddressInUse";
        case SocketResult::PermissionDenied:  return "PermissionDenied";
        case SocketResult::MessageTooLong:    return "MessageTooLong";
        case SocketResult::SocketError:       return "SocketError";
        case SocketResult::Closed:            return "Closed";
        default:                              return "Unknown";
    }
}

} // namespace natrelay::network
