/**
 * @file signal.cpp
 * @brief Broadcast-closable one-shot signal
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include "signal.hpp"
#include "../debug/log.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace natrelay::proxy {

namespace {

constexpr size_t MAX_WAIT_FDS = 8;

} // anonymous namespace

int WaitAny(std::initializer_list<int> fds, int32_t timeout_ms) {
    if (fds.size() == 0 || fds.size() > MAX_WAIT_FDS) {
        return WAIT_ERROR;
    }

    pollfd pfds[MAX_WAIT_FDS];
    nfds_t count = 0;
    for (int fd : fds) {
        pfds[count].fd = fd;
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        count++;
    }

    int ret;
    do {
        ret = ::poll(pfds, count, timeout_ms);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        LOG_ERROR("poll() failed: %s", std::strerror(errno));
        return WAIT_ERROR;
    }
    if (ret == 0) {
        return WAIT_TIMEOUT;
    }

    for (nfds_t i = 0; i < count; i++) {
        if (pfds[i].revents & POLLNVAL) {
            return WAIT_ERROR;
        }
        if (pfds[i].revents & (POLLIN | POLLERR | POLLHUP)) {
            return static_cast<int>(i);
        }
    }

    return WAIT_TIMEOUT;
}

// =============================================================================
// Signal
// =============================================================================

Signal::Signal()
    : m_fd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK))
{
    if (m_fd < 0) {
        LOG_ERROR("eventfd() failed: %s", std::strerror(errno));
    }
}

Signal::~Signal() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool Signal::Fire() {
    if (m_fired.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    if (m_fd >= 0) {
        // The counter is never read back, so the fd stays readable for every waiter
        uint64_t one = 1;
        ssize_t ret;
        do {
            ret = ::write(m_fd, &one, sizeof(one));
        } while (ret < 0 && errno == EINTR);

        if (ret < 0) {
            LOG_ERROR("Signal write failed: %s", std::strerror(errno));
        }
    }

    return true;
}

bool Signal::Wait(int32_t timeout_ms) const {
    if (IsFired()) {
        return true;
    }
    if (m_fd < 0) {
        return false;
    }

    WaitAny({m_fd}, timeout_ms);
    return IsFired();
}

} // namespace natrelay::proxy
