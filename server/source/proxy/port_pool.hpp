/**
 * @file port_pool.hpp
 * @brief Proxy port allocator with lowest-first hole reuse
 *
 * Every admitted player gets a dedicated UDP proxy port. The pool hands out
 * ports starting at a base (40001 by default) and always returns the lowest
 * port that is not currently assigned, so ports freed by departed players
 * are reused before the range grows.
 *
 * ## Design
 *
 * The assigned ports are kept as an ascending std::vector. Allocation scans
 * it from the front looking for the first gap, then inserts at that
 * position, so the vector stays sorted. This is O(n) per call, which is
 * fine for the tens of players a relay serves.
 *
 * ## Usage
 *
 * ```cpp
 * PortPool pool(40001);
 *
 * uint16_t port = pool.Allocate();   // 40001
 * if (port != 0) {
 *     // bind the relay socket
 * }
 *
 * pool.Release(port);
 * ```
 *
 * ## Thread Safety
 *
 * Not internally synchronized. The registry owns the pool and only calls it
 * while holding its write lock.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace natrelay::proxy {

/**
 * @brief Default first proxy port
 */
constexpr uint16_t DEFAULT_FIRST_PROXY_PORT = 40001;

/**
 * @brief Proxy port pool
 */
class PortPool {
public:
    /**
     * @brief Create an empty pool
     *
     * @param first_port Lowest port the pool will ever hand out (0 is
     *                   treated as 1)
     */
    explicit PortPool(uint16_t first_port = DEFAULT_FIRST_PROXY_PORT);

    PortPool(const PortPool&) = delete;
    PortPool& operator=(const PortPool&) = delete;

    /**
     * @brief Allocate the lowest free port at or above the base
     *
     * @return Port number in host byte order, or 0 if every port up to
     *         65535 is taken
     */
    uint16_t Allocate();

    /**
     * @brief Return a port to the pool
     *
     * Releasing a port that is not allocated is a no-op.
     */
    void Release(uint16_t port);

    /**
     * @brief Check if a port is currently allocated
     */
    bool IsAllocated(uint16_t port) const;

    /**
     * @brief Number of ports currently allocated
     */
    size_t GetAllocatedCount() const { return m_ports.size(); }

    /**
     * @brief Lowest port the pool hands out
     */
    uint16_t GetFirstPort() const { return m_first_port; }

    /**
     * @brief Release every allocated port
     */
    void ReleaseAll();

private:
    uint16_t m_first_port;

    /**
     * @brief Allocated ports, ascending
     */
    std::vector<uint16_t> m_ports;
};

} // namespace natrelay::proxy
