/**
 * @file main.cpp
 * @brief natrelay - UDP NAT-traversal relay for peer-to-peer games
 *
 * Every remote player gets a dedicated proxy port on this host. Peers of the
 * same game talk to each other through those ports, so the relay can group
 * players into games and forward traffic regardless of NAT restrictions.
 *
 * Usage: natrelay [config.ini]
 *
 * @copyright Copyright (c) 2026 natrelay contributors
 * @license GPL-2.0-or-later
 */

#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <string>

#include "config/config.hpp"
#include "debug/log.hpp"
#include "router/event_logger.hpp"
#include "router/router.hpp"
#include "state/registry.hpp"

namespace {

using namespace natrelay;

/**
 * @brief Block SIGINT/SIGTERM in this thread and every thread it spawns
 *
 * The main thread then collects them with sigtimedwait().
 */
bool block_termination_signals(sigset_t& set) {
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);

    int err = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (err != 0) {
        LOG_ERROR("pthread_sigmask failed: %s", std::strerror(err));
        return false;
    }
    return true;
}

/**
 * @brief Wait for a termination signal, dumping server state periodically
 */
void wait_for_termination(const sigset_t& set, const state::Registry& registry,
                          uint32_t status_interval_s) {
    while (true) {
        int sig;
        if (status_interval_s == 0) {
            sig = sigwaitinfo(&set, nullptr);
        } else {
            timespec timeout{};
            timeout.tv_sec = static_cast<time_t>(status_interval_s);
            sig = sigtimedwait(&set, nullptr, &timeout);
        }

        if (sig == SIGINT || sig == SIGTERM) {
            LOG_INFO("Received %s", sig == SIGINT ? "SIGINT" : "SIGTERM");
            return;
        }
        if (sig < 0 && errno == EAGAIN) {
            if (registry.GetPlayerCount() > 0) {
                std::string state = registry.FormatServerState();
                LOG_INFO("Server state:");
                debug::g_logger.log_lines(debug::LogLevel::Info, state.c_str());
            }
            continue;
        }
        if (sig < 0 && errno != EINTR) {
            LOG_ERROR("Signal wait failed: %s", std::strerror(errno));
            return;
        }
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    const char* config_path = argc > 1 ? argv[1] : config::CONFIG_PATH;

    // Ensure config file exists (create with defaults if not)
    config::ConfigResult created = config::ensure_config_exists(config_path);

    config::Config cfg = config::get_default_config();
    config::ConfigResult loaded = config::load_config(config_path, cfg);

    debug::g_logger.init(cfg.debug);
    LOG_INFO("natrelay starting");

    if (created != config::ConfigResult::Success) {
        LOG_WARN("Could not create %s: %s", config_path, config::config_result_to_string(created));
    }
    if (loaded == config::ConfigResult::Success) {
        LOG_INFO("Config loaded from %s", config_path);
    } else {
        LOG_WARN("Config %s: %s, using defaults for rejected values", config_path,
                 config::config_result_to_string(loaded));
    }
    LOG_VERBOSE("Gateway: %s:%u, proxy ports from %u, buffer %u bytes",
                cfg.server.host, cfg.server.port, cfg.relay.first_port, cfg.relay.buffer_size);

    sigset_t signals;
    if (!block_termination_signals(signals)) {
        return 1;
    }

    // Relays bind the same interface as the gateway
    state::Registry registry(cfg.relay.first_port, cfg.relay.buffer_size, cfg.server.host);
    if (!registry.IsValid()) {
        LOG_ERROR("Failed to create registry conduits");
        return 1;
    }

    router::EventLogger events(registry);
    router::Router router(registry, cfg.relay.buffer_size);

    if (router.OpenGateway(cfg.server.host, cfg.server.port) != network::SocketResult::Success) {
        return 1;
    }
    if (!events.Start() || !router.Start()) {
        LOG_ERROR("Failed to start worker threads");
        return 1;
    }

    LOG_INFO("natrelay running, proxy ports start at %u", cfg.relay.first_port);

    wait_for_termination(signals, registry, cfg.relay.status_interval_s);

    LOG_INFO("natrelay shutting down");
    router.Stop();
    registry.Shutdown();
    events.Stop();

    debug::g_logger.close();
    return 0;
}
