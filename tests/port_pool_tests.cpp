/**
 * @file port_pool_tests.cpp
 * @brief Unit tests for the proxy port pool
 *
 * Allocation order, lowest-first hole reuse, release semantics and range
 * exhaustion.
 */

#include "proxy/port_pool.hpp"

#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <vector>

using namespace natrelay::proxy;

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

// ============================================================================
// Allocation Tests
// ============================================================================

TEST(first_allocation_is_base) {
    PortPool pool;
    ASSERT_EQ(pool.Allocate(), 40001);
    ASSERT_EQ(pool.GetFirstPort(), 40001);
}

TEST(sequential_allocation) {
    PortPool pool(40001);
    ASSERT_EQ(pool.Allocate(), 40001);
    ASSERT_EQ(pool.Allocate(), 40002);
    ASSERT_EQ(pool.Allocate(), 40003);
    ASSERT_EQ(pool.GetAllocatedCount(), 3u);
}

TEST(custom_base) {
    PortPool pool(5000);
    ASSERT_EQ(pool.Allocate(), 5000);
    ASSERT_EQ(pool.Allocate(), 5001);
}

TEST(allocated_ports_are_distinct) {
    PortPool pool(40001);
    std::set<uint16_t> seen;

    for (int i = 0; i < 200; i++) {
        uint16_t port = pool.Allocate();
        ASSERT_NE(port, 0);
        ASSERT_TRUE(seen.insert(port).second);
        if (i % 3 == 0) {
            pool.Release(port);
            seen.erase(port);
        }
    }
    ASSERT_EQ(pool.GetAllocatedCount(), seen.size());
}

// ============================================================================
// Hole Reuse Tests
// ============================================================================

TEST(released_port_reused) {
    PortPool pool(40001);
    pool.Allocate();                 // 40001
    uint16_t second = pool.Allocate(); // 40002
    pool.Allocate();                 // 40003

    pool.Release(second);
    ASSERT_FALSE(pool.IsAllocated(40002));
    ASSERT_EQ(pool.Allocate(), 40002);
}

TEST(lowest_hole_first) {
    PortPool pool(40001);
    for (int i = 0; i < 5; i++) {
        pool.Allocate();             // 40001..40005
    }

    pool.Release(40004);
    pool.Release(40002);

    ASSERT_EQ(pool.Allocate(), 40002);
    ASSERT_EQ(pool.Allocate(), 40004);
    ASSERT_EQ(pool.Allocate(), 40006);
}

TEST(release_base_port) {
    PortPool pool(40001);
    pool.Allocate();
    pool.Allocate();

    pool.Release(40001);
    ASSERT_EQ(pool.Allocate(), 40001);
}

TEST(release_everything_restarts_at_base) {
    PortPool pool(40001);
    pool.Allocate();
    pool.Allocate();
    pool.Allocate();

    pool.ReleaseAll();
    ASSERT_EQ(pool.GetAllocatedCount(), 0u);
    ASSERT_EQ(pool.Allocate(), 40001);
}

// ============================================================================
// Release Semantics Tests
// ============================================================================

TEST(release_unallocated_is_noop) {
    PortPool pool(40001);
    pool.Allocate();

    pool.Release(40500);
    pool.Release(1);
    ASSERT_EQ(pool.GetAllocatedCount(), 1u);
    ASSERT_TRUE(pool.IsAllocated(40001));
}

TEST(double_release_is_noop) {
    PortPool pool(40001);
    pool.Allocate();
    pool.Allocate();

    pool.Release(40001);
    pool.Release(40001);
    ASSERT_EQ(pool.GetAllocatedCount(), 1u);
    ASSERT_TRUE(pool.IsAllocated(40002));
}

TEST(is_allocated) {
    PortPool pool(40001);
    ASSERT_FALSE(pool.IsAllocated(40001));
    pool.Allocate();
    ASSERT_TRUE(pool.IsAllocated(40001));
    ASSERT_FALSE(pool.IsAllocated(40002));
}

// ============================================================================
// Exhaustion Tests
// ============================================================================

TEST(exhaustion_returns_zero) {
    PortPool pool(65534);
    ASSERT_EQ(pool.Allocate(), 65534);
    ASSERT_EQ(pool.Allocate(), 65535);
    ASSERT_EQ(pool.Allocate(), 0);
    ASSERT_EQ(pool.GetAllocatedCount(), 2u);

    pool.Release(65534);
    ASSERT_EQ(pool.Allocate(), 65534);
}

TEST(zero_base_treated_as_one) {
    PortPool pool(0);
    ASSERT_EQ(pool.Allocate(), 1);
}

// ============================================================================
// Main
// ============================================================================

int main() {
    printf("=== natrelay PortPool Unit Tests ===\n\n");
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
