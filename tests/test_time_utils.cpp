#include "usage_common.h"

#include <gtest/gtest.h>

TEST(TimeUtilsTest, ParsesZuluAndOffsets) {
    time_t t = 0;
    ASSERT_TRUE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00Z", &t));
    EXPECT_EQ(t, 1767225600);

    ASSERT_TRUE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00.123456+00:00", &t));
    EXPECT_EQ(t, 1767225600);

    ASSERT_TRUE(parse_iso8601_utc_to_time_t("2026-01-01T02:00:00+02:00", &t));
    EXPECT_EQ(t, 1767225600);

    ASSERT_TRUE(parse_iso8601_utc_to_time_t("2025-12-31T19:30:00-0430", &t));
    EXPECT_EQ(t, 1767225600);

    ASSERT_TRUE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00", &t));
    EXPECT_EQ(t, 1767225600);
}

TEST(TimeUtilsTest, RejectsMalformedTimestamps) {
    time_t t = 0;
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("", &t));
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("2026-01-01", &t));
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("yesterday at noon", &t));
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00+2", &t));
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00Zjunk", &t));
    EXPECT_FALSE(parse_iso8601_utc_to_time_t("2026-01-01T00:00:00Z", nullptr));
}

TEST(TimeUtilsTest, TightDuration) {
    EXPECT_EQ(format_duration_tight(0), "now");
    EXPECT_EQ(format_duration_tight(-20), "now");
    EXPECT_EQ(format_duration_tight(30), "0m");
    EXPECT_EQ(format_duration_tight(45 * 60), "45m");
    EXPECT_EQ(format_duration_tight(2 * 3600 + 5 * 60), "2h05m");
    EXPECT_EQ(format_duration_tight(3 * 86400 + 5 * 3600 + 59), "3d5h");
}

TEST(TimeUtilsTest, CompactDuration) {
    EXPECT_EQ(format_duration_compact(0), "now");
    EXPECT_EQ(format_duration_compact(59), "now");
    EXPECT_EQ(format_duration_compact(45 * 60), "45m");
    EXPECT_EQ(format_duration_compact(2 * 3600 + 15 * 60), "2h 15m");
    EXPECT_EQ(format_duration_compact(2 * 3600), "2h");
    EXPECT_EQ(format_duration_compact(3 * 86400 + 5 * 3600), "3d 5h");
}

TEST(TimeUtilsTest, TruncateForDisplay) {
    EXPECT_EQ(truncate_for_display("short", 10), "short");
    EXPECT_EQ(truncate_for_display(std::string(50, 'x'), 10), "xxxxxxxxxx...");
}

TEST(RequestResultTest, ClassifiesFailures) {
    RequestResult r;
    r.http_code = 401;
    EXPECT_TRUE(is_auth_failure(r));
    r.http_code = 403;
    EXPECT_TRUE(is_auth_failure(r));
    r.http_code = 500;
    EXPECT_FALSE(is_auth_failure(r));
    EXPECT_EQ(describe_request_failure(r), "HTTP 500");

    r.curl_code = CURLE_OPERATION_TIMEDOUT;
    r.http_code = 0;
    EXPECT_FALSE(is_auth_failure(r));
    EXPECT_EQ(describe_request_failure(r), "Connection timed out");

    EXPECT_TRUE(is_http_success(200));
    EXPECT_FALSE(is_http_success(404));
}
