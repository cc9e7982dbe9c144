/**
 * @file test_common.h
 * @brief Minimal check helpers shared by the test executables
 */

#pragma once

#include <cmath>
#include <iostream>
#include <string>

namespace bragi_test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline void check(bool condition, const char* expression, const char* file, int line) {
    if (!condition) {
        std::cerr << "  FAILED: " << expression << " (" << file << ":" << line << ")\n";
        failures()++;
    }
}

inline bool near(double a, double b, double tolerance) {
    return std::fabs(a - b) <= tolerance;
}

inline void section(const std::string& name) {
    std::cout << "[TEST] " << name << "\n";
}

inline int finish(const std::string& suite) {
    if (failures() == 0) {
        std::cout << "✓ " << suite << ": all checks passed\n";
        return 0;
    }
    std::cerr << "✗ " << suite << ": " << failures() << " check(s) failed\n";
    return 1;
}

} // namespace bragi_test

#define CHECK(cond) bragi_test::check((cond), #cond, __FILE__, __LINE__)

#define CHECK_THROWS(expr, type)                                                  \
    do {                                                                          \
        bool caught_ = false;                                                     \
        try {                                                                     \
            expr;                                                                 \
        } catch (const type&) {                                                   \
            caught_ = true;                                                       \
        } catch (const std::exception& e_) {                                      \
            std::cerr << "  unexpected exception: " << e_.what() << "\n";         \
        }                                                                         \
        bragi_test::check(caught_, #expr " throws " #type, __FILE__, __LINE__);   \
    } while (0)
