#include <cstdio>
#include <cstring>
#include "time_format.h"
#include "test_expect.h"

static void test_format_seconds()
{
    char buf[32];
    EXPECT_TRUE(time_format::formatIsoUtc(1700000000u, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "2023-11-14T22:13:20Z");
    EXPECT_TRUE(time_format::isValidIsoUtc(buf));

    // Unsynced clock
    EXPECT_FALSE(time_format::formatIsoUtc(12345u, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "");

    char tiny[20];
    EXPECT_FALSE(time_format::formatIsoUtc(1700000000u, tiny, sizeof(tiny)));
    EXPECT_FALSE(time_format::formatIsoUtc(1700000000u, nullptr, 32));
}

static void test_format_millis()
{
    char buf[32];
    EXPECT_TRUE(time_format::formatIsoUtcMs(1700000000123ull, buf, sizeof(buf)));
    EXPECT_STREQ(buf, "2023-11-14T22:13:20.123Z");
    EXPECT_TRUE(time_format::isValidIsoUtc(buf));

    EXPECT_FALSE(time_format::formatIsoUtcMs(5000ull, buf, sizeof(buf)));

    // Uptime-based instants before NTP sync.
    EXPECT_TRUE(time_format::formatIsoUtcMs(0ull, buf, sizeof(buf), 0));
    EXPECT_STREQ(buf, "1970-01-01T00:00:00.000Z");
    EXPECT_TRUE(time_format::formatIsoUtcMs(90061005ull, buf, sizeof(buf), 0));
    EXPECT_STREQ(buf, "1970-01-02T01:01:01.005Z");

    char exact[25];
    EXPECT_TRUE(time_format::formatIsoUtcMs(1700000000123ull, exact, sizeof(exact)));
    char short_[24];
    EXPECT_FALSE(time_format::formatIsoUtcMs(1700000000123ull, short_, sizeof(short_)));
}

static void test_validator()
{
    EXPECT_TRUE(time_format::isValidIsoUtc("2024-02-29T23:59:59Z"));
    EXPECT_TRUE(time_format::isValidIsoUtc("2024-02-29T23:59:59.999Z"));

    EXPECT_FALSE(time_format::isValidIsoUtc(nullptr));
    EXPECT_FALSE(time_format::isValidIsoUtc(""));
    EXPECT_FALSE(time_format::isValidIsoUtc("\x01" "024-02-29T23:59:59Z"));
    EXPECT_FALSE(time_format::isValidIsoUtc("2024-02-29 23:59:59Z"));
    EXPECT_FALSE(time_format::isValidIsoUtc("2024-02-29T23:59:59"));
    EXPECT_FALSE(time_format::isValidIsoUtc("2024-02-29T23:59:59+00:00"));
    EXPECT_FALSE(time_format::isValidIsoUtc("2024-2-29T23:59:59Z"));
    EXPECT_FALSE(time_format::isValidIsoUtc("2024-02-29T23:59:59,123Z"));
    EXPECT_FALSE(time_format::isValidIsoUtc("abcd-02-29T23:59:59Z"));
}

int main()
{
    test_format_seconds();
    test_format_millis();
    test_validator();
    return report("time_format");
}
