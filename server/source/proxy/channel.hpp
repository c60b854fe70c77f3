/**
 * @file channel.hpp
 * @brief Unbounded multi-producer packet/event conduit
 *
 * A Channel is a mutex-protected FIFO paired with a semaphore eventfd whose
 * counter always equals the number of queued items. Producers never block,
 * which is what the registry needs for its notification conduits, and
 * consumers can poll() the descriptor together with sockets and Signals.
 *
 * ## Usage
 *
 * ```cpp
 * Channel<Packet> inbound;
 * inbound.Push(std::move(packet));
 *
 * // consumer
 * int idx = WaitAny({shutdown.GetFd(), inbound.GetFd()}, -1);
 * Packet p;
 * if (idx == 1 && inbound.TryPop(p)) { ... }
 * ```
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cerrno>
#include <deque>
#include <mutex>
#include <utility>
#include <sys/eventfd.h>
#include <unistd.h>

#include "signal.hpp"

namespace natrelay::proxy {

template<typename T>
class Channel {
public:
    Channel()
        : m_fd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK | EFD_SEMAPHORE))
    {
    }

    ~Channel() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool IsValid() const { return m_fd >= 0; }

    /**
     * @brief Descriptor that is readable while the channel is non-empty
     */
    int GetFd() const { return m_fd; }

    /**
     * @brief Append an item (never blocks)
     */
    void Push(T value) {
        std::scoped_lock lock(m_mutex);
        m_queue.push_back(std::move(value));
        Post();
    }

    /**
     * @brief Remove the oldest item if there is one
     * @return true if @p out was filled
     */
    bool TryPop(T& out) {
        std::scoped_lock lock(m_mutex);
        if (m_queue.empty()) {
            return false;
        }
        Consume();
        out = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    /**
     * @brief Wait up to @p timeout_ms for an item
     *
     * With several consumers this can return false before the timeout when
     * another consumer took the item first.
     */
    bool Pop(T& out, int32_t timeout_ms) {
        if (TryPop(out)) {
            return true;
        }
        if (m_fd < 0 || WaitAny({m_fd}, timeout_ms) != 0) {
            return false;
        }
        return TryPop(out);
    }

    size_t Size() const {
        std::scoped_lock lock(m_mutex);
        return m_queue.size();
    }

private:
    // Both helpers run under m_mutex so the counter tracks m_queue.size()

    void Post() {
        if (m_fd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t ret;
        do {
            ret = ::write(m_fd, &one, sizeof(one));
        } while (ret < 0 && errno == EINTR);
        // EAGAIN only when the counter is saturated, the fd is readable either way
    }

    void Consume() {
        if (m_fd < 0) {
            return;
        }
        uint64_t value;
        ssize_t ret;
        do {
            ret = ::read(m_fd, &value, sizeof(value));
        } while (ret < 0 && errno == EINTR);
    }

    int m_fd;
    mutable std::mutex m_mutex;
    std::deque<T> m_queue;
};

} // namespace natrelay::proxy
