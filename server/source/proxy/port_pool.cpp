/**
 * @file port_pool.cpp
 * @brief Implementation of the proxy port pool
 *
 * See port_pool.hpp for design documentation.
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "port_pool.hpp"
#include <algorithm>

namespace natrelay::proxy {

PortPool::PortPool(uint16_t first_port)
    : m_first_port(first_port == 0 ? 1 : first_port)
{
}

// =============================================================================
// Port Allocation
// =============================================================================

uint16_t PortPool::Allocate() {
    // Walk the sorted list until the expected port is missing
    uint32_t candidate = m_first_port;
    auto it = m_ports.begin();
    while (it != m_ports.end() && *it == candidate) {
        ++candidate;
        ++it;
    }

    if (candidate > UINT16_MAX) {
        return 0;
    }

    const uint16_t port = static_cast<uint16_t>(candidate);
    m_ports.insert(it, port);
    return port;
}

// =============================================================================
// Port Release
// =============================================================================

void PortPool::Release(uint16_t port) {
    auto it = std::lower_bound(m_ports.begin(), m_ports.end(), port);
    if (it != m_ports.end() && *it == port) {
        m_ports.erase(it);
    }
}

void PortPool::ReleaseAll() {
    m_ports.clear();
}

// =============================================================================
// Query Methods
// =============================================================================

bool PortPool::IsAllocated(uint16_t port) const {
    return std::binary_search(m_ports.begin(), m_ports.end(), port);
}

} // namespace natrelay::proxy
