/**
 * @file udp_socket.cpp
 * @brief UDP Socket Implementation for natrelay
 *
 * ## Error Handling
 *
 * All operations return SocketResult enum values. errno_to_result() maps
 * POSIX errno codes to the enum so callers never inspect errno directly.
 *
 * ## Thread Safety
 *
 * Individual UdpSocket instances are NOT thread-safe. A relay shares its
 * socket between its receive and send loops, which is fine at the kernel
 * level because recvfrom() and sendto() on one datagram socket may run
 * concurrently; close() must only happen after both loops have exited.
 *
 * @see udp_socket.hpp for the public interface
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "udp_socket.hpp"
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>

namespace natrelay::network {

// =============================================================================
// Helper Functions
// =============================================================================

/**
 * @brief Map POSIX errno to SocketResult
 *
 * Common mappings:
 * - EAGAIN/EWOULDBLOCK -> WouldBlock (non-blocking operation)
 * - EADDRINUSE -> AddressInUse (proxy port taken by another process)
 * - ECONNREFUSED -> ConnectionRefused (ICMP port unreachable)
 * - EHOSTUNREACH -> HostUnreachable (routing failure)
 * - EBADF -> Closed (descriptor already closed)
 */
SocketResult errno_to_result(int err) {
    switch (err) {
        // Non-blocking operation would block
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
            return SocketResult::WouldBlock;

        case EADDRINUSE:
            return SocketResult::AddressInUse;
        case EACCES:
        case EPERM:
            return SocketResult::PermissionDenied;
        case EADDRNOTAVAIL:
            return SocketResult::InvalidAddress;

        case ECONNREFUSED:
            return SocketResult::ConnectionRefused;

        // Network reachability errors
        case EHOSTUNREACH:
        case ENETUNREACH:
            return SocketResult::HostUnreachable;
        case ENETDOWN:
            return SocketResult::NetworkDown;

        case EMSGSIZE:
            return SocketResult::MessageTooLong;

        case ETIMEDOUT:
            return SocketResult::Timeout;

        case EBADF:
        case ENOTSOCK:
            return SocketResult::Closed;

        // Everything else is a generic socket error
        default:
            return SocketResult::SocketError;
    }
}

// =============================================================================
// UdpSocket Class Implementation
// =============================================================================

UdpSocket::UdpSocket()
    : m_fd(-1)
    , m_local_port(0)
{
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : m_fd(other.m_fd)
    , m_local_port(other.m_local_port)
{
    other.m_fd = -1;
    other.m_local_port = 0;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();

        m_fd = other.m_fd;
        m_local_port = other.m_local_port;

        other.m_fd = -1;
        other.m_local_port = 0;
    }
    return *this;
}

/**
 * @brief Create the socket and bind it
 *
 * ## Bind Flow
 * 1. ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC)
 * 2. bind(host:port)
 * 3. getsockname() to learn the port when 0 was requested
 *
 * SO_REUSEADDR is deliberately not set: two UDP sockets on one port would
 * split a player's traffic between two relays.
 */
SocketResult UdpSocket::bind(const char* host, uint16_t port) {
    if (m_fd >= 0) {
        close();
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host == nullptr || host[0] == '\0') {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
        return SocketResult::InvalidAddress;
    }

    m_fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (m_fd < 0) {
        int err = errno;
        m_fd = -1;
        return errno_to_result(err);
    }

    if (::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close();
        return errno_to_result(err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        m_local_port = ntohs(bound.sin_port);
    } else {
        m_local_port = port;
    }

    return SocketResult::Success;
}

/**
 * @brief Send one datagram to @p to
 *
 * @return SocketResult::Closed if the socket is not open
 * @return SocketResult::MessageTooLong if the datagram exceeds the limit
 *
 * @note Uses MSG_NOSIGNAL for symmetry with stream sockets; datagram
 *       sockets never raise SIGPIPE.
 */
SocketResult UdpSocket::send_to(const uint8_t* data, size_t size, const SocketAddress& to, size_t& sent) {
    sent = 0;

    if (m_fd < 0) {
        return SocketResult::Closed;
    }

    sockaddr_in dest{};
    to.to_sockaddr(dest);

    ssize_t ret;
    do {
        ret = ::sendto(m_fd, data, size, MSG_NOSIGNAL,
                       reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        return errno_to_result(errno);
    }

    sent = static_cast<size_t>(ret);
    return SocketResult::Success;
}

/**
 * @brief Receive one datagram
 *
 * With a timeout, waits with poll() first so the call returns Timeout
 * instead of blocking forever.
 */
SocketResult UdpSocket::recv_from(uint8_t* buffer, size_t buffer_size, size_t& received,
                                  SocketAddress& from, int32_t timeout_ms) {
    received = 0;

    if (m_fd < 0) {
        return SocketResult::Closed;
    }

    if (timeout_ms >= 0) {
        SocketResult ready = wait_readable(timeout_ms);
        if (ready != SocketResult::Success) {
            return ready;
        }
    }

    sockaddr_in src{};
    socklen_t src_len = sizeof(src);

    ssize_t ret;
    do {
        ret = ::recvfrom(m_fd, buffer, buffer_size, 0,
                         reinterpret_cast<sockaddr*>(&src), &src_len);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        return errno_to_result(errno);
    }

    received = static_cast<size_t>(ret);
    from = SocketAddress::from_sockaddr(src);
    return SocketResult::Success;
}

void UdpSocket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_local_port = 0;
}

bool UdpSocket::is_valid() const {
    return m_fd >= 0;
}

SocketResult UdpSocket::wait_readable(int32_t timeout_ms) {
    pollfd pfd{};
    pfd.fd = m_fd;
    pfd.events = POLLIN;

    int ret;
    do {
        ret = ::poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        return errno_to_result(errno);
    }
    if (ret == 0) {
        return timeout_ms == 0 ? SocketResult::WouldBlock : SocketResult::Timeout;
    }
    if (pfd.revents & POLLNVAL) {
        return SocketResult::Closed;
    }
    return SocketResult::Success;
}

} // namespace natrelay::network
