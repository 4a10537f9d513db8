#pragma once

#include <cmath>
#include <cstdarg>
#include <cstdio>

// Shared failure reporting for the test executables. Each test's main() declares
// `bool success = true;` and returns `success ? 0 : 1`.
namespace test {

inline void logFailureFmt(const char* file, int line, const char* fmt, ...) {
    std::fprintf(stderr, "failure (%s:%d): ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

inline bool approx(float a, float b, float eps = 1e-4f) { return std::fabs(a - b) <= eps; }

} // namespace test

#define CHECK(cond, msg, ...) \
    do { \
        if (!(cond)) { \
            test::logFailureFmt(__FILE__, __LINE__, msg, ##__VA_ARGS__); \
            success = false; \
        } \
    } while (0)
