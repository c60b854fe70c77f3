/**
 * @file socket_tests.cpp
 * @brief Unit tests for the UDP socket wrapper and socket addresses
 *
 * Uses the loopback interface only.
 */

#include "network/socket_address.hpp"
#include "network/udp_socket.hpp"

#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <cerrno>
#include <utility>
#include <netinet/in.h>
#include <arpa/inet.h>

using namespace natrelay::network;

// ============================================================================
// Test Framework (minimal, no external dependencies)
// ============================================================================

static int g_tests_run = 0;
static int g_tests_passed = 0;
static int g_tests_failed = 0;

#define TEST(name) \
    static void test_##name(); \
    static struct TestRegister_##name { \
        TestRegister_##name() { register_test(#name, test_##name); } \
    } g_test_register_##name; \
    static void test_##name()

#define ASSERT_TRUE(cond) \
    do { \
        if (!(cond)) { \
            printf("  FAIL: %s (line %d)\n", #cond, __LINE__); \
            throw std::runtime_error("Test assertion failed"); \
        } \
    } while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a != _b) { \
            printf("  FAIL: %s == %s (line %d)\n", #a, #b, __LINE__); \
            printf("    got: %lld vs %lld\n", (long long)_a, (long long)_b); \
            throw std::runtime_error("Test assertion failed"); \
        } \
    } while(0)

#define ASSERT_NE(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a == _b) { \
            printf("  FAIL: %s != %s (line %d)\n", #a, #b, __LINE__); \
            throw std::runtime_error("Test assertion failed"); \
        } \
    } while(0)

#define ASSERT_STREQ(a, b) \
    do { \
        const char* _a = (a); \
        const char* _b = (b); \
        if (std::strcmp(_a, _b) != 0) { \
            printf("  FAIL: %s == %s (line %d)\n", #a, #b, __LINE__); \
            printf("    got: \"%s\" vs \"%s\"\n", _a, _b); \
            throw std::runtime_error("Test assertion failed"); \
        } \
    } while(0)

struct TestEntry {
    const char* name;
    void (*func)();
};

static TestEntry g_tests[128];
static int g_test_count = 0;

static void register_test(const char* name, void (*func)()) {
    if (g_test_count < 128) {
        g_tests[g_test_count++] = {name, func};
    }
}

static SocketAddress loopback(uint16_t port) {
    SocketAddress addr;
    SocketAddress::parse("127.0.0.1", port, addr);
    return addr;
}

// ============================================================================
// SocketAddress Tests
// ============================================================================

TEST(address_parse_valid) {
    SocketAddress addr;
    ASSERT_TRUE(SocketAddress::parse("1.2.3.4", 9000, addr));
    ASSERT_EQ(addr.ip, 0x01020304u);
    ASSERT_EQ(addr.port, 9000);
}

TEST(address_parse_invalid) {
    SocketAddress addr;
    ASSERT_FALSE(SocketAddress::parse("1.2.3", 9000, addr));
    ASSERT_FALSE(SocketAddress::parse("not an address", 9000, addr));
    ASSERT_FALSE(SocketAddress::parse("", 9000, addr));
    ASSERT_FALSE(SocketAddress::parse(nullptr, 9000, addr));
}

TEST(address_format) {
    SocketAddress addr;
    SocketAddress::parse("192.168.10.200", 40001, addr);

    char buffer[MAX_ADDRESS_STRING_LENGTH + 1];
    addr.format(buffer, sizeof(buffer));
    ASSERT_STREQ(buffer, "192.168.10.200:40001");

    addr.format_ip(buffer, sizeof(buffer));
    ASSERT_STREQ(buffer, "192.168.10.200");

    ASSERT_STREQ(AddressString(addr).c_str(), "192.168.10.200:40001");
}

TEST(address_format_longest) {
    SocketAddress addr;
    SocketAddress::parse("255.255.255.255", 65535, addr);
    ASSERT_STREQ(AddressString(addr).c_str(), "255.255.255.255:65535");
}

TEST(address_equality) {
    SocketAddress a;
    SocketAddress b;
    SocketAddress::parse("5.6.7.8", 9000, a);
    SocketAddress::parse("5.6.7.8", 9000, b);
    ASSERT_TRUE(a == b);

    b.port = 9001;
    ASSERT_FALSE(a == b);
}

TEST(address_sockaddr_conversion) {
    SocketAddress addr;
    SocketAddress::parse("10.0.0.1", 1234, addr);

    sockaddr_in raw{};
    addr.to_sockaddr(raw);
    ASSERT_EQ(raw.sin_family, AF_INET);
    ASSERT_EQ(ntohs(raw.sin_port), 1234);
    ASSERT_EQ(ntohl(raw.sin_addr.s_addr), 0x0A000001u);

    SocketAddress back = SocketAddress::from_sockaddr(raw);
    ASSERT_TRUE(back == addr);
}

TEST(address_is_empty) {
    SocketAddress addr;
    ASSERT_TRUE(addr.is_empty());
    addr.port = 1;
    ASSERT_FALSE(addr.is_empty());
}

// ============================================================================
// UdpSocket Lifecycle Tests
// ============================================================================

TEST(socket_default_invalid) {
    UdpSocket sock;
    ASSERT_FALSE(sock.is_valid());
    ASSERT_EQ(sock.get_fd(), -1);
    ASSERT_EQ(sock.get_local_port(), 0);
}

TEST(socket_bind_ephemeral) {
    UdpSocket sock;
    ASSERT_EQ(sock.bind("127.0.0.1", 0), SocketResult::Success);
    ASSERT_TRUE(sock.is_valid());
    ASSERT_NE(sock.get_local_port(), 0);
}

TEST(socket_bind_invalid_host) {
    UdpSocket sock;
    ASSERT_EQ(sock.bind("999.1.1.1", 0), SocketResult::InvalidAddress);
    ASSERT_FALSE(sock.is_valid());
}

TEST(socket_bind_port_in_use) {
    UdpSocket first;
    ASSERT_EQ(first.bind("127.0.0.1", 0), SocketResult::Success);

    UdpSocket second;
    ASSERT_EQ(second.bind("127.0.0.1", first.get_local_port()), SocketResult::AddressInUse);
    ASSERT_FALSE(second.is_valid());
}

TEST(socket_close_frees_port) {
    UdpSocket first;
    ASSERT_EQ(first.bind("127.0.0.1", 0), SocketResult::Success);
    uint16_t port = first.get_local_port();
    first.close();
    ASSERT_FALSE(first.is_valid());

    UdpSocket second;
    ASSERT_EQ(second.bind("127.0.0.1", port), SocketResult::Success);
}

TEST(socket_move_constructor) {
    UdpSocket a;
    ASSERT_EQ(a.bind("127.0.0.1", 0), SocketResult::Success);
    int fd = a.get_fd();
    uint16_t port = a.get_local_port();

    UdpSocket b(std::move(a));
    ASSERT_FALSE(a.is_valid());
    ASSERT_EQ(b.get_fd(), fd);
    ASSERT_EQ(b.get_local_port(), port);
}

TEST(socket_move_assignment) {
    UdpSocket a;
    ASSERT_EQ(a.bind("127.0.0.1", 0), SocketResult::Success);
    int fd = a.get_fd();

    UdpSocket b;
    b = std::move(a);
    ASSERT_FALSE(a.is_valid());
    ASSERT_EQ(b.get_fd(), fd);
}

TEST(socket_closed_operations) {
    UdpSocket sock;
    uint8_t buf[16] = {0};
    size_t n = 0;
    SocketAddress from;

    ASSERT_EQ(sock.send_to(buf, sizeof(buf), loopback(9), n), SocketResult::Closed);
    ASSERT_EQ(sock.recv_from(buf, sizeof(buf), n, from, 0), SocketResult::Closed);
    ASSERT_EQ(sock.get_local_port(), 0);
    ASSERT_FALSE(sock.is_valid());
}

// ============================================================================
// Datagram Tests
// ============================================================================

TEST(send_and_receive) {
    UdpSocket server;
    UdpSocket client;
    ASSERT_EQ(server.bind("127.0.0.1", 0), SocketResult::Success);
    ASSERT_EQ(client.bind("127.0.0.1", 0), SocketResult::Success);

    const uint8_t payload[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x01};
    size_t sent = 0;
    ASSERT_EQ(client.send_to(payload, sizeof(payload), loopback(server.get_local_port()), sent),
              SocketResult::Success);
    ASSERT_EQ(sent, sizeof(payload));

    uint8_t buf[64];
    size_t received = 0;
    SocketAddress from;
    ASSERT_EQ(server.recv_from(buf, sizeof(buf), received, from, 1000), SocketResult::Success);
    ASSERT_EQ(received, sizeof(payload));
    ASSERT_TRUE(std::memcmp(buf, payload, sizeof(payload)) == 0);
    ASSERT_TRUE(from == loopback(client.get_local_port()));
}

TEST(receive_timeout) {
    UdpSocket sock;
    ASSERT_EQ(sock.bind("127.0.0.1", 0), SocketResult::Success);

    uint8_t buf[16];
    size_t received = 0;
    SocketAddress from;
    ASSERT_EQ(sock.recv_from(buf, sizeof(buf), received, from, 20), SocketResult::Timeout);
    ASSERT_EQ(received, 0u);
}

TEST(receive_would_block) {
    UdpSocket sock;
    ASSERT_EQ(sock.bind("127.0.0.1", 0), SocketResult::Success);

    uint8_t buf[16];
    size_t received = 0;
    SocketAddress from;
    ASSERT_EQ(sock.recv_from(buf, sizeof(buf), received, from, 0), SocketResult::WouldBlock);
}

TEST(oversized_datagram_truncated) {
    UdpSocket server;
    UdpSocket client;
    ASSERT_EQ(server.bind("127.0.0.1", 0), SocketResult::Success);
    ASSERT_EQ(client.bind("127.0.0.1", 0), SocketResult::Success);

    uint8_t payload[100];
    std::memset(payload, 0xAB, sizeof(payload));
    size_t sent = 0;
    ASSERT_EQ(client.send_to(payload, sizeof(payload), loopback(server.get_local_port()), sent),
              SocketResult::Success);

    uint8_t buf[10];
    size_t received = 0;
    SocketAddress from;
    ASSERT_EQ(server.recv_from(buf, sizeof(buf), received, from, 1000), SocketResult::Success);
    ASSERT_EQ(received, sizeof(buf));
}

TEST(errno_mapping) {
    ASSERT_EQ(errno_to_result(EADDRINUSE), SocketResult::AddressInUse);
    ASSERT_EQ(errno_to_result(EAGAIN), SocketResult::WouldBlock);
    ASSERT_EQ(errno_to_result(EBADF), SocketResult::Closed);
    ASSERT_EQ(errno_to_result(EHOSTUNREACH), SocketResult::HostUnreachable);
    ASSERT_EQ(errno_to_result(EIO), SocketResult::SocketError);
}

TEST(result_to_string) {
    ASSERT_STREQ(socket_result_to_string(SocketResult::Success), "Success");
    ASSERT_STREQ(socket_result_to_string(SocketResult::AddressInUse), "AddressInUse");
    ASSERT_STREQ(socket_result_to_string(SocketResult::Closed), "Closed");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    printf("=== natrelay Socket Unit Tests ===\n\n");
    printf("Running %d tests...\n\n", g_test_count);

    for (int i = 0; i < g_test_count; i++) {
        g_tests_run++;
        printf("[%d/%d] %s...", i + 1, g_test_count, g_tests[i].name);
        fflush(stdout);

        try {
            g_tests[i].func();
            printf(" OK\n");
            g_tests_passed++;
        } catch (const std::exception& e) {
            g_tests_failed++;
        }
    }

    printf("\n========================================\n");
    printf("Results: %d passed, %d failed, %d total\n",
           g_tests_passed, g_tests_failed, g_tests_run);

    if (g_tests_failed == 0) {
        printf("ALL TESTS PASSED\n");
    } else {
        printf("FAILED\n");
    }

    return g_tests_failed > 0 ? 1 : 0;
}
