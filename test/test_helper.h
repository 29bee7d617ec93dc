// test_helper.h - Minimal test framework (no external dependencies)
// Common assert/pass/fail functions and temp file helpers for all unit tests

#ifndef RULEAUDIT_TEST_HELPER_H
#define RULEAUDIT_TEST_HELPER_H

#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <type_traits>
#include <unistd.h>
#include <vector>

//=============================================================================
// ANSI Color Codes
//=============================================================================

#define TEST_GREEN "\033[0;32m"
#define TEST_RED   "\033[0;31m"
#define TEST_NC    "\033[0m"

//=============================================================================
// Test State (global)
//=============================================================================

namespace test {

inline int& tests_run() { static int n = 0; return n; }
inline int& tests_passed() { static int n = 0; return n; }
inline int& tests_failed() { static int n = 0; return n; }
inline std::vector<std::string>& failed_tests() { static std::vector<std::string> v; return v; }
inline std::string& last_error() { static std::string s; return s; }

//=============================================================================
// Test Runner
//=============================================================================

inline void run_test(const char* name, std::function<void()> fn) {
    ++tests_run();
    last_error().clear();
    try {
        fn();
        ++tests_passed();
        std::cout << TEST_GREEN "[PASS]" TEST_NC " " << name << "\n";
    } catch (const std::exception& e) {
        ++tests_failed();
        failed_tests().push_back(name);
        std::cout << TEST_RED "[FAIL]" TEST_NC " " << name;
        if (!last_error().empty()) {
            std::cout << " (" << last_error() << ")";
        }
        std::cout << "\n";
    } catch (...) {
        ++tests_failed();
        failed_tests().push_back(name);
        std::cout << TEST_RED "[FAIL]" TEST_NC " " << name << " (unknown exception)\n";
    }
}

//=============================================================================
// Test Summary
//=============================================================================

inline int print_summary() {
    std::cout << "\nTest Summary:\n";
    std::cout << "-------------\n";
    std::cout << "Total:  " << tests_run() << "\n";
    std::cout << "Passed: " << tests_passed() << "\n";
    std::cout << "Failed: " << tests_failed() << "\n";

    if (!failed_tests().empty()) {
        std::cout << "\nFailed tests:\n";
        for (const auto& name : failed_tests()) {
            std::cout << "  - " << name << "\n";
        }
    }

    return tests_failed() > 0 ? 1 : 0;
}

} // namespace test

//=============================================================================
// TEST Macro
//=============================================================================

#define TEST(name) \
    void test_##name(); \
    struct TestRunner_##name { \
        TestRunner_##name() { test::run_test(#name, test_##name); } \
    } test_runner_instance_##name; \
    void test_##name()

//=============================================================================
// Assert Macros
//=============================================================================

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        test::last_error() = std::string("ASSERT_TRUE: ") + #cond; \
        throw std::runtime_error(test::last_error()); \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        test::last_error() = std::string("ASSERT_FALSE: ") + #cond; \
        throw std::runtime_error(test::last_error()); \
    } \
} while(0)

// Helper to convert values to printable form (handles enums)
namespace test {
template<typename T>
auto to_printable(T val) -> typename std::enable_if<std::is_enum<T>::value, typename std::underlying_type<T>::type>::type {
    return static_cast<typename std::underlying_type<T>::type>(val);
}
template<typename T>
auto to_printable(T val) -> typename std::enable_if<!std::is_enum<T>::value, T>::type {
    return val;
}
} // namespace test

#define ASSERT_EQ(a, b) do { \
    auto va = (a); auto vb = (b); \
    if (va != vb) { \
        std::ostringstream ss; \
        ss << #a << " (" << test::to_printable(va) << ") != " << #b << " (" << test::to_printable(vb) << ")"; \
        test::last_error() = ss.str(); \
        throw std::runtime_error(test::last_error()); \
    } \
} while(0)

#define ASSERT_CONTAINS(haystack, needle) do { \
    std::string hs = (haystack); std::string nd = (needle); \
    if (hs.find(nd) == std::string::npos) { \
        test::last_error() = std::string("ASSERT_CONTAINS: ") + #haystack + " lacks \"" + nd + "\""; \
        throw std::runtime_error(test::last_error()); \
    } \
} while(0)

#define ASSERT_NOT_CONTAINS(haystack, needle) do { \
    std::string hs = (haystack); std::string nd = (needle); \
    if (hs.find(nd) != std::string::npos) { \
        test::last_error() = std::string("ASSERT_NOT_CONTAINS: ") + #haystack + " has \"" + nd + "\""; \
        throw std::runtime_error(test::last_error()); \
    } \
} while(0)

//=============================================================================
// File Helpers
//=============================================================================

namespace test {

inline std::string temp_file(const std::string& suffix) {
    return "/tmp/rule_audit_test_" + std::to_string(getpid()) + "_" + suffix;
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f.write(content.data(), content.size());
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline void remove_file(const std::string& path) {
    unlink(path.c_str());
}

// Occurrences of needle in haystack
inline size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace test

#endif // RULEAUDIT_TEST_HELPER_H
