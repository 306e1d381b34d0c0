#pragma once
#include <cmath>
#include <cstdio>
#include <cstring>

// Minimal expectation macros shared by the host tests. Each test executable defines one
// translation unit, so s_failures is per executable.
static int s_failures = 0;

#define EXPECT_TRUE(expr)                                                                                               \
    do                                                                                                                  \
    {                                                                                                                   \
        if (!(expr))                                                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%d expected true: %s\n", __LINE__, #expr);                                     \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ_INT(actual, expected)                                                                                 \
    do                                                                                                                  \
    {                                                                                                                   \
        const long _a = (long)(actual);                                                                                \
        const long _e = (long)(expected);                                                                              \
        if (_a != _e)                                                                                                  \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%d expected %s=%ld got %ld\n", __LINE__, #actual, _e, _a);                    \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_NEAR(actual, expected, tol)                                                                              \
    do                                                                                                                  \
    {                                                                                                                   \
        const double _a = (double)(actual);                                                                            \
        const double _e = (double)(expected);                                                                          \
        if (!(std::fabs(_a - _e) <= (double)(tol)))                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%d expected %s=%.6f got %.6f\n", __LINE__, #actual, _e, _a);                  \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_STREQ(actual, expected)                                                                                  \
    do                                                                                                                  \
    {                                                                                                                   \
        const char *_a = (actual);                                                                                     \
        const char *_e = (expected);                                                                                   \
        if (!_a || !_e || std::strcmp(_a, _e) != 0)                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%d expected %s=\"%s\" got \"%s\"\n", __LINE__, #actual,                       \
                         _e ? _e : "(null)", _a ? _a : "(null)");                                                     \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

static inline int report(const char *suite)
{
    if (s_failures != 0)
    {
        std::fprintf(stderr, "%s tests failed: %d\n", suite, s_failures);
        return 1;
    }
    std::printf("%s tests passed\n", suite);
    return 0;
}
