/**
 * @file TestUtils.h
 * @brief Shared testing utilities for the Callout test suites
 *
 * Provides common macros, color codes, golden key material and helper
 * functions for all test executables.
 */

#pragma once

#include "Callout/Logger.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// ANSI Color Codes
// ============================================================================

#define COLOR_RESET   "\033[0m"
#define COLOR_GREEN   "\033[32m"
#define COLOR_RED     "\033[31m"
#define COLOR_BLUE    "\033[34m"
#define COLOR_CYAN    "\033[36m"

// ============================================================================
// Global Test Counters
// ============================================================================

namespace TestGlobals {
    extern int g_testsRun;
    extern int g_testsPassed;
    extern int g_testsFailed;
}

// ============================================================================
// Test Macros
// ============================================================================

#define TEST_START(name) \
    do { \
        std::cout << COLOR_BLUE << "[TEST] " << name << COLOR_RESET << std::endl; \
        TestGlobals::g_testsRun++; \
    } while(0)

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cout << COLOR_RED << "  ✗ FAILED: " << message << COLOR_RESET << std::endl; \
            TestGlobals::g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << COLOR_GREEN << "  ✓ PASSED" << COLOR_RESET << std::endl; \
        TestGlobals::g_testsPassed++; \
        return true; \
    } while(0)

#define TEST_STEP(message) \
    do { \
        std::cout << "  → " << message << std::endl; \
    } while(0)

// ============================================================================
// Standard Test Keys
// ============================================================================

// 0x46 repeated 32 times; the EIP-155 example key
constexpr const char* TEST_PRIVATE_KEY =
    "0x4646464646464646464646464646464646464646464646464646464646464646";
constexpr const char* TEST_PUBLIC_KEY =
    "0x044bc2a31265153f07e70e0bab08724e6b85e217f8cd628ceb62974247bb493382"
    "ce28cab79ad7119ee1ad3ebcdb98a16805211530ecc6cfefa1b88e6dff99232a";
constexpr const char* TEST_ADDRESS = "0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F";

// Private key 1
constexpr const char* SECOND_PRIVATE_KEY =
    "0x0000000000000000000000000000000000000000000000000000000000000001";
constexpr const char* SECOND_PUBLIC_KEY =
    "0x0479be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
    "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";
constexpr const char* SECOND_ADDRESS = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";

namespace TestUtils {

/**
 * @brief Prints test summary statistics
 * @param suiteName Name of the test suite
 */
inline void printTestSummary(const std::string& suiteName) {
    std::cout << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "  " << suiteName << " Summary" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << "Total tests run:    " << TestGlobals::g_testsRun << std::endl;
    std::cout << COLOR_GREEN << "Tests passed:       " << TestGlobals::g_testsPassed << COLOR_RESET << std::endl;

    if (TestGlobals::g_testsFailed > 0) {
        std::cout << COLOR_RED << "Tests failed:       " << TestGlobals::g_testsFailed << COLOR_RESET << std::endl;
        std::cout << COLOR_RED << "✗ Some tests failed" << COLOR_RESET << std::endl;
    } else {
        std::cout << "Tests failed:       " << TestGlobals::g_testsFailed << std::endl;
        std::cout << COLOR_GREEN << "✓ All tests passed!" << COLOR_RESET << std::endl;
    }
}

/**
 * @brief Prints test suite header
 * @param suiteName Name of the test suite
 */
inline void printTestHeader(const std::string& suiteName) {
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "  " << suiteName << COLOR_RESET << std::endl;
    std::cout << COLOR_BLUE << "========================================" << COLOR_RESET << std::endl << std::endl;
}

/**
 * @brief Initializes the logger for testing
 * @param logPath Path to the log file (empty for in-memory entries only)
 */
inline void initializeTestLogger(const std::string& logPath) {
    Callout::Logger::getInstance().initialize(logPath, Callout::LogLevel::DEBUG, false);
}

inline void shutdownTestLogger() {
    Callout::Logger::getInstance().shutdown();
}

/**
 * @brief Whether a recent log entry from component contains text in its message or details
 */
inline bool logContains(const std::string& component, const std::string& text) {
    for (const auto& entry : Callout::Logger::getInstance().recentEntries()) {
        if (entry.component == component &&
            (entry.message.find(text) != std::string::npos ||
             entry.details.find(text) != std::string::npos)) {
            return true;
        }
    }
    return false;
}

} // namespace TestUtils
