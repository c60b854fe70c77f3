/**
 * @file signal.hpp
 * @brief Broadcast-closable one-shot signal
 *
 * A Signal starts unfired and can be fired exactly once. Once fired it stays
 * fired, and every thread waiting on it wakes up, no matter how many there
 * are. This is what relays use for termination:
 *
 * - each relay owns a private disconnect Signal (targeted close);
 * - the registry owns one shutdown Signal that every relay watches
 *   read-only (global shutdown).
 *
 * The signal is backed by an eventfd that is written once and never drained,
 * so it can be waited on with poll() alongside sockets and channels using
 * WaitAny().
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <atomic>
#include <initializer_list>

namespace natrelay::proxy {

/** @brief WaitAny() return value when the timeout expired */
constexpr int WAIT_TIMEOUT = -1;

/** @brief WaitAny() return value when poll() failed */
constexpr int WAIT_ERROR = -2;

/**
 * @brief Block until one of the descriptors becomes readable
 *
 * Descriptors are checked in list order, so earlier entries win when several
 * are ready at once.
 *
 * @param fds File descriptors to wait on
 * @param timeout_ms Timeout in milliseconds (-1 = wait forever)
 * @return Index of the first readable descriptor, WAIT_TIMEOUT or WAIT_ERROR
 */
int WaitAny(std::initializer_list<int> fds, int32_t timeout_ms);

/**
 * @brief One-shot, idempotent, broadcast signal
 */
class Signal {
public:
    Signal();
    ~Signal();

    // Non-copyable, non-movable (relays hold references)
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * @brief Check that the backing eventfd was created
     */
    bool IsValid() const { return m_fd >= 0; }

    /**
     * @brief Fire the signal
     *
     * @return true for the call that actually fired it, false if it was
     *         already fired
     *
     * @note Safe to call from any thread, any number of times.
     */
    bool Fire();

    /**
     * @brief Check whether the signal has fired
     */
    bool IsFired() const { return m_fired.load(std::memory_order_acquire); }

    /**
     * @brief Wait for the signal
     *
     * @param timeout_ms Timeout in milliseconds (-1 = wait forever)
     * @return true if the signal fired, false on timeout
     */
    bool Wait(int32_t timeout_ms) const;

    /**
     * @brief Descriptor that becomes (and stays) readable once fired
     */
    int GetFd() const { return m_fd; }

private:
    int m_fd;
    std::atomic<bool> m_fired{false};
};

} // namespace natrelay::proxy
