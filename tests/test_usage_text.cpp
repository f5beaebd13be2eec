#include "usage_common.h"
#include "usage_text.h"

#include <gtest/gtest.h>

static constexpr time_t kNow = 1767225600;

static const char* kOverLimitBody = R"({
  "five_hour": {"utilization": 130, "resets_at": null},
  "seven_day": {"utilization": 64.6, "resets_at": null},
  "seven_day_sonnet": {"utilization": 0, "resets_at": null},
  "extra_usage": {"is_enabled": true, "used_credits": 7000, "monthly_limit": 5000}
})";

class UsageTextTest : public ::testing::Test {
protected:
    void SetUp() override { app_log_set_file(""); }

    DisplayState evaluate(const char* body) {
        return evaluate_snapshot(parse_usage_response(body, kNow), kNow);
    }
};

TEST_F(UsageTextTest, OverLimitBucketPrintsClampedPercent) {
    DisplayState s = evaluate(kOverLimitBody);
    const BucketView& v = s.bucket(BucketKind::Rolling5h);
    ASSERT_EQ(v.percent, 100);

    const std::string line = render_bucket_text(v);
    EXPECT_NE(line.find("100%"), std::string::npos) << line;
    EXPECT_EQ(line.find("130"), std::string::npos) << line;
    EXPECT_NE(line.find("(no active window)"), std::string::npos) << line;
}

TEST_F(UsageTextTest, BucketTextMatchesEvaluatedPercent) {
    DisplayState s = evaluate(kOverLimitBody);
    const BucketView& v = s.bucket(BucketKind::Opus7d);
    ASSERT_EQ(v.percent, 65);
    EXPECT_NE(render_bucket_text(v).find(" 65%"), std::string::npos);
}

TEST_F(UsageTextTest, ExtraLineUsesClampedPercent) {
    DisplayState s = evaluate(kOverLimitBody);
    const std::string line = render_extra_line(s.bucket(BucketKind::ExtraCredit), false);
    EXPECT_NE(line.find("$70.00 / $50.00 (100%)"), std::string::npos) << line;
}

TEST_F(UsageTextTest, DisabledExtraLine) {
    BucketView v;
    v.kind = BucketKind::ExtraCredit;
    v.participates = false;
    EXPECT_NE(render_extra_line(v, false).find("Not enabled"), std::string::npos);
}

TEST_F(UsageTextTest, TinyLine) {
    DisplayState s;
    EXPECT_EQ(render_tiny_line(s, false), "--%");

    s.has_data = true;
    s.status = DisplayStatus::Live;
    s.percent = 42;
    s.countdown_known = true;
    s.countdown_seconds = 2 * 3600 + 14 * 60;
    EXPECT_EQ(render_tiny_line(s, false), "42% 2h14m");

    s.status = DisplayStatus::Stale;
    EXPECT_EQ(render_tiny_line(s, false), "42% 2h14m (stale)");
}

TEST_F(UsageTextTest, ColorsOnlyWhenEnabled) {
    EXPECT_EQ(color_for_severity(Severity::Critical, false), "");
    EXPECT_EQ(color_for_severity(Severity::Critical, true), "\033[31m");
    EXPECT_EQ(color_reset(false), "");
}
