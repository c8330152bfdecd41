#pragma once

/**
 * @file test_utils.h
 * @brief Utilities for testing the chunk pipeline components
 *
 * Provides assertion macros, a test registry and deterministic clocks
 * without external test frameworks
 */

#include <iostream>
#include <stdexcept>
#include <chrono>
#include <cmath>
#include <mutex>
#include <string>
#include <vector>
#include "cache_entry.h"

// ============================================================
// Test Assertion Macros
// ============================================================

#define ASSERT_TRUE(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_TRUE failed: " #condition); \
        } \
    } while(0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define ASSERT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_EQ failed: " #a " != " #b); \
        } \
    } while(0)

#define ASSERT_NE(a, b) ASSERT_TRUE((a) != (b))

#define ASSERT_LT(a, b) ASSERT_TRUE((a) < (b))
#define ASSERT_LE(a, b) ASSERT_TRUE((a) <= (b))
#define ASSERT_GT(a, b) ASSERT_TRUE((a) > (b))
#define ASSERT_GE(a, b) ASSERT_TRUE((a) >= (b))

#define ASSERT_NULL(ptr) ASSERT_EQ((ptr), nullptr)
#define ASSERT_NOT_NULL(ptr) ASSERT_TRUE((ptr) != nullptr)

#define ASSERT_NEAR(a, b, tolerance) \
    do { \
        if (std::fabs(static_cast<double>(a) - static_cast<double>(b)) > (tolerance)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_NEAR failed: " #a " vs " #b); \
        } \
    } while(0)

#define ASSERT_THROWS(statement, exception_type) \
    do { \
        bool caught_expected = false; \
        try { \
            statement; \
        } catch (const exception_type&) { \
            caught_expected = true; \
        } \
        if (!caught_expected) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_THROWS failed: " #statement " did not throw " #exception_type); \
        } \
    } while(0)

// ============================================================
// Test Results Tracking
// ============================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string error;
    double duration_ms;
};

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void add_result(const TestResult& result) {
        results.push_back(result);
    }

    void print_summary() {
        std::cout << "\n========================================\n";
        std::cout << "TEST SUMMARY\n";
        std::cout << "========================================\n";

        int passed = 0, failed = 0;
        double total_time = 0.0;

        for (const auto& result : results) {
            if (result.passed) {
                std::cout << "✓ " << result.name << " (" << result.duration_ms << " ms)\n";
                passed++;
            } else {
                std::cout << "✗ " << result.name << " (" << result.duration_ms << " ms)\n";
                std::cout << "  ERROR: " << result.error << "\n";
                failed++;
            }
            total_time += result.duration_ms;
        }

        std::cout << "\n" << passed << " passed, " << failed << " failed\n";
        std::cout << "Total time: " << total_time << " ms\n";
        std::cout << "========================================\n";

        if (failed > 0) {
            throw std::runtime_error(std::to_string(failed) + " test(s) failed");
        }
    }

private:
    std::vector<TestResult> results;
};

// ============================================================
// Test Macros for Running Tests
// ============================================================

#define TEST(test_name) \
    void test_##test_name(); \
    namespace { \
        struct TestRunner_##test_name { \
            TestRunner_##test_name() { \
                register_test(#test_name, &test_##test_name); \
            } \
        } runner_##test_name; \
    } \
    void test_##test_name()

static std::vector<std::pair<std::string, void(*)()>> all_tests;

inline void register_test(const std::string& name, void (*fn)()) {
    all_tests.push_back({name, fn});
}

inline void run_all_tests() {
    for (const auto& [name, fn] : all_tests) {
        TestResult result;
        result.name = name;

        auto start = std::chrono::high_resolution_clock::now();
        try {
            fn();
            result.passed = true;
        } catch (const std::exception& e) {
            result.passed = false;
            result.error = e.what();
        }
        auto end = std::chrono::high_resolution_clock::now();
        result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

        TestRunner::instance().add_result(result);
    }

    TestRunner::instance().print_summary();
}

// ============================================================
// Manual Clock
// ============================================================

/**
 * @brief Clock that only moves when a test advances it
 *
 * Pass source() wherever a TimeSource is expected; the returned function
 * refers back to this object, so the clock must outlive the cache.
 */
class ManualClock {
public:
    ManualClock() : now_(CacheClock::time_point() + std::chrono::hours(1)) {}

    CacheClock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    TimeSource source() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    CacheClock::time_point now_;
};
