/**
 * @file config_tests.cpp
 * @brief Unit tests for configuration loading
 *
 * Tests for parsing INI config files, default values and value validation.
 */

#include "config/config.hpp"

#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace natrelay::config;

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

// Helper to create temp config file
class TempConfigFile {
public:
    TempConfigFile(const char* content) {
        snprintf(m_path, sizeof(m_path), "/tmp/natrelay_test_config_%d_%d.ini", getpid(), rand());
        std::ofstream f(m_path);
        if (f.is_open()) {
            f << content;
            f.close();
        }
    }

    ~TempConfigFile() {
        std::remove(m_path);
    }

    const char* path() const { return m_path; }

private:
    char m_path[256];
};

// ============================================================================
// Default Values Tests
// ============================================================================

TEST(default_values) {
    Config config = get_default_config();

    ASSERT_STREQ(config.server.host, "0.0.0.0");
    ASSERT_EQ(config.server.port, 50000);

    ASSERT_EQ(config.relay.first_port, 40001);
    ASSERT_EQ(config.relay.buffer_size, 1024u);
    ASSERT_EQ(config.relay.status_interval_s, 60u);

    ASSERT_EQ(config.debug.enabled, true);
    ASSERT_EQ(config.debug.level, 2u);
    ASSERT_EQ(config.debug.log_to_file, false);
    ASSERT_STREQ(config.debug.log_path, "natrelay.log");
}

TEST(missing_file_keeps_defaults) {
    Config config = get_default_config();
    ConfigResult result = load_config("/tmp/natrelay_does_not_exist.ini", config);

    ASSERT_EQ(result, ConfigResult::FileNotFound);
    ASSERT_EQ(config.server.port, 50000);
    ASSERT_EQ(config.relay.first_port, 40001);
}

// ============================================================================
// Section Parsing Tests
// ============================================================================

TEST(parse_server_section) {
    TempConfigFile file(
        "[server]\n"
        "host = 127.0.0.1\n"
        "port = 6000\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_STREQ(config.server.host, "127.0.0.1");
    ASSERT_EQ(config.server.port, 6000);
}

TEST(parse_relay_section) {
    TempConfigFile file(
        "[relay]\n"
        "first_port = 45000\n"
        "buffer_size = 2048\n"
        "status_interval = 0\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.relay.first_port, 45000);
    ASSERT_EQ(config.relay.buffer_size, 2048u);
    ASSERT_EQ(config.relay.status_interval_s, 0u);
}

TEST(parse_debug_section) {
    TempConfigFile file(
        "[debug]\n"
        "enabled = 0\n"
        "level = 3\n"
        "log_to_file = yes\n"
        "log_path = /var/log/natrelay.log\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.debug.enabled, false);
    ASSERT_EQ(config.debug.level, 3u);
    ASSERT_EQ(config.debug.log_to_file, true);
    ASSERT_STREQ(config.debug.log_path, "/var/log/natrelay.log");
}

TEST(comments_and_whitespace) {
    TempConfigFile file(
        "; comment\n"
        "# another comment\n"
        "\n"
        "   [relay]   \n"
        "   first_port   =   41000   \n"
        "\t\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.relay.first_port, 41000);
}

TEST(unknown_sections_and_keys_ignored) {
    TempConfigFile file(
        "[mystery]\n"
        "port = 1\n"
        "[server]\n"
        "colour = blue\n"
        "port = 51000\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.server.port, 51000);
}

TEST(keys_outside_section_ignored) {
    TempConfigFile file(
        "port = 1234\n"
        "[server]\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.server.port, 50000);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(invalid_port_rejected) {
    TempConfigFile file(
        "[server]\n"
        "port = 0\n"
        "[relay]\n"
        "first_port = 70000\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.server.port, 50000);
    ASSERT_EQ(config.relay.first_port, 40001);
}

TEST(non_numeric_rejected) {
    TempConfigFile file(
        "[relay]\n"
        "buffer_size = large\n"
        "status_interval = 10s\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.relay.buffer_size, 1024u);
    ASSERT_EQ(config.relay.status_interval_s, 60u);
}

TEST(buffer_size_limits) {
    TempConfigFile file(
        "[relay]\n"
        "buffer_size = 65508\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.relay.buffer_size, 1024u);
}

TEST(log_level_limit) {
    TempConfigFile file(
        "[debug]\n"
        "level = 4\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_EQ(config.debug.level, 2u);
}

TEST(valid_values_survive_rejected_neighbours) {
    TempConfigFile file(
        "[server]\n"
        "port = abc\n"
        "host = 10.0.0.1\n");

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::ParseError);
    ASSERT_STREQ(config.server.host, "10.0.0.1");
}

// ============================================================================
// Save / Ensure Tests
// ============================================================================

TEST(save_and_reload) {
    char path[128];
    snprintf(path, sizeof(path), "/tmp/natrelay_test_save_%d.ini", getpid());

    Config config = get_default_config();
    config.server.port = 52000;
    config.relay.first_port = 42000;
    config.relay.status_interval_s = 5;
    config.debug.level = 3;

    ASSERT_EQ(save_config(path, config), ConfigResult::Success);

    Config loaded = get_default_config();
    ASSERT_EQ(load_config(path, loaded), ConfigResult::Success);
    ASSERT_EQ(loaded.server.port, 52000);
    ASSERT_EQ(loaded.relay.first_port, 42000);
    ASSERT_EQ(loaded.relay.status_interval_s, 5u);
    ASSERT_EQ(loaded.debug.level, 3u);
    ASSERT_STREQ(loaded.server.host, "0.0.0.0");

    std::remove(path);
}

TEST(ensure_config_creates_defaults) {
    char path[128];
    snprintf(path, sizeof(path), "/tmp/natrelay_test_ensure_%d.ini", getpid());
    std::remove(path);

    ASSERT_EQ(ensure_config_exists(path), ConfigResult::Success);

    struct stat st;
    ASSERT_EQ(stat(path, &st), 0);

    Config config = get_default_config();
    config.server.port = 1;
    ASSERT_EQ(load_config(path, config), ConfigResult::Success);
    ASSERT_EQ(config.server.port, 50000);

    std::remove(path);
}

TEST(ensure_config_keeps_existing) {
    TempConfigFile file(
        "[server]\n"
        "port = 53000\n");

    ASSERT_EQ(ensure_config_exists(file.path()), ConfigResult::Success);

    Config config = get_default_config();
    ASSERT_EQ(load_config(file.path(), config), ConfigResult::Success);
    ASSERT_EQ(config.server.port, 53000);
}

TEST(result_to_string) {
    ASSERT_STREQ(config_result_to_string(ConfigResult::Success), "Success");
    ASSERT_STREQ(config_result_to_string(ConfigResult::FileNotFound), "FileNotFound");
    ASSERT_STREQ(config_result_to_string(ConfigResult::ParseError), "ParseError");
    ASSERT_STREQ(config_result_to_string(ConfigResult::IoError), "IoError");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    printf("=== natrelay Config Unit Tests ===\n\n");
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
