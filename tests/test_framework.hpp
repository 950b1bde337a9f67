/**
 * @file test_framework.hpp
 * @brief Minimal self-registering test framework shared by all test files
 *
 * Usage:
 * @code
 * TEST(something_works) {
 *     ASSERT_EQ(compute(), 42);
 * }
 *
 * int main() {
 *     return run_all_tests("Something");
 * }
 * @endcode
 *
 * Tests register during static initialization and run in declaration
 * order from run_all_tests(). An assertion failure prints the expression
 * and line, then aborts the current test only.
 *
 * @copyright Copyright (c) 2026 sumo_mitm contributors
 * @license GPL-2.0-or-later
 */

#pragma once

#include <cstdio>
#include <cstring>
#include <stdexcept>

// ============================================================================
// Registry
// ============================================================================

struct TestEntry {
    const char* name;
    void (*func)();
};

constexpr int MAX_TESTS = 128;

inline TestEntry g_tests[MAX_TESTS];
inline int g_test_count = 0;

inline void register_test(const char* name, void (*func)()) {
    if (g_test_count < MAX_TESTS) {
        g_tests[g_test_count++] = {name, func};
    }
}

/**
 * @brief Thrown by the ASSERT_* macros
 */
struct TestFailure : std::runtime_error {
    TestFailure() : std::runtime_error("Test assertion failed") {}
};

// ============================================================================
// Macros
// ============================================================================

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
            throw TestFailure(); \
        } \
    } while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (!(_a == _b)) { \
            printf("  FAIL: %s == %s (line %d)\n", #a, #b, __LINE__); \
            throw TestFailure(); \
        } \
    } while(0)

#define ASSERT_NE(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a == _b) { \
            printf("  FAIL: %s != %s (line %d)\n", #a, #b, __LINE__); \
            throw TestFailure(); \
        } \
    } while(0)

#define ASSERT_STREQ(a, b) \
    do { \
        const char* _a = (a); \
        const char* _b = (b); \
        if (std::strcmp(_a, _b) != 0) { \
            printf("  FAIL: %s == %s (line %d)\n", #a, #b, __LINE__); \
            printf("    got: \"%s\" vs \"%s\"\n", _a, _b); \
            throw TestFailure(); \
        } \
    } while(0)

// ============================================================================
// Runner
// ============================================================================

inline int run_all_tests(const char* suite) {
    int passed = 0;
    int failed = 0;

    printf("=== sumo_mitm %s Tests ===\n\n", suite);
    printf("Running %d tests...\n\n", g_test_count);

    for (int i = 0; i < g_test_count; i++) {
        printf("[%d/%d] %s...", i + 1, g_test_count, g_tests[i].name);
        fflush(stdout);

        try {
            g_tests[i].func();
            printf(" OK\n");
            passed++;
        } catch (const TestFailure&) {
            failed++;
        } catch (const std::exception& e) {
            printf("  FAIL: exception: %s\n", e.what());
            failed++;
        }
    }

    printf("\n========================================\n");
    printf("Results: %d passed, %d failed, %d total\n", passed, failed, g_test_count);
    fputs(failed == 0 ? "ALL TESTS PASSED\n" : "FAILED\n", stdout);

    return failed > 0 ? 1 : 0;
}
