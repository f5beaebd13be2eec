#include "usage_common.h"
#include "usage_evaluator.h"

#include <gtest/gtest.h>

static constexpr time_t kNow = 1767225600;  // 2026-01-01T00:00:00Z

static UsageSnapshot make_snapshot(double five_hour, double week, double sonnet,
                                   std::optional<time_t> five_hour_reset = std::nullopt) {
    std::vector<UsageBucket> buckets;
    UsageBucket b;
    b.kind = BucketKind::Rolling5h;
    b.used = five_hour;
    b.reset_at = five_hour_reset;
    buckets.push_back(b);

    b = UsageBucket();
    b.kind = BucketKind::Opus7d;
    b.used = week;
    buckets.push_back(b);

    b = UsageBucket();
    b.kind = BucketKind::Sonnet7d;
    b.used = sonnet;
    buckets.push_back(b);

    b = UsageBucket();
    b.kind = BucketKind::ExtraCredit;
    b.enabled = false;
    b.used = 0.0;
    b.limit = 0.0;
    buckets.push_back(b);

    return UsageSnapshot(std::move(buckets), kNow);
}

class UsageEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override { app_log_set_file(""); }
};

TEST_F(UsageEvaluatorTest, PercentIsClampedAndRounded) {
    UsageBucket b;
    b.used = 42.4;
    EXPECT_EQ(bucket_percent(b), 42);
    b.used = 42.5;
    EXPECT_EQ(bucket_percent(b), 43);
    b.used = 250.0;
    EXPECT_EQ(bucket_percent(b), 100);
    b.used = 5.0;
    b.limit = 0.0;
    EXPECT_EQ(bucket_percent(b), 0);
}

TEST_F(UsageEvaluatorTest, SeverityTiers) {
    EXPECT_EQ(severity_for_percent(0), Severity::Ok);
    EXPECT_EQ(severity_for_percent(65), Severity::Ok);
    EXPECT_EQ(severity_for_percent(69), Severity::Ok);
    EXPECT_EQ(severity_for_percent(70), Severity::Warn);
    EXPECT_EQ(severity_for_percent(75), Severity::Warn);
    EXPECT_EQ(severity_for_percent(89), Severity::Warn);
    EXPECT_EQ(severity_for_percent(90), Severity::Critical);
    EXPECT_EQ(severity_for_percent(95), Severity::Critical);
    EXPECT_EQ(severity_for_percent(100), Severity::Critical);
}

TEST_F(UsageEvaluatorTest, SeverityNeverDecreasesWithUsage) {
    Severity prev = Severity::Ok;
    for (int pct = 0; pct <= 100; ++pct) {
        Severity s = severity_for_percent(pct);
        EXPECT_GE(static_cast<int>(s), static_cast<int>(prev)) << "at " << pct << "%";
        prev = s;
    }
}

TEST_F(UsageEvaluatorTest, SeverityUsesRoundedPercent) {
    DisplayState s = evaluate_snapshot(make_snapshot(69.6, 0, 0), kNow);
    EXPECT_EQ(s.percent, 70);
    EXPECT_EQ(s.severity, Severity::Warn);
}

TEST_F(UsageEvaluatorTest, OverallSeverityIsWorstBucket) {
    DisplayState s = evaluate_snapshot(make_snapshot(10, 95, 20), kNow);
    EXPECT_EQ(s.percent, 10);
    EXPECT_EQ(s.bucket(BucketKind::Rolling5h).severity, Severity::Ok);
    EXPECT_EQ(s.bucket(BucketKind::Opus7d).severity, Severity::Critical);
    EXPECT_EQ(s.severity, Severity::Critical);
    EXPECT_EQ(s.status, DisplayStatus::Live);
    EXPECT_TRUE(s.has_data);
}

TEST_F(UsageEvaluatorTest, CountdownFromPrimaryBucket) {
    DisplayState s = evaluate_snapshot(make_snapshot(42, 0, 0, kNow + 2 * 3600 + 14 * 60), kNow);
    EXPECT_TRUE(s.countdown_known);
    EXPECT_EQ(s.countdown_seconds, 2 * 3600 + 14 * 60);
    EXPECT_FALSE(s.refetch_requested);
    EXPECT_EQ(format_duration_tight(s.countdown_seconds), "2h14m");
}

TEST_F(UsageEvaluatorTest, CountdownUnknownWithoutReset) {
    DisplayState s = evaluate_snapshot(make_snapshot(0, 0, 0), kNow);
    EXPECT_FALSE(s.countdown_known);
    EXPECT_EQ(s.countdown_seconds, 0);
    EXPECT_FALSE(s.refetch_requested);
}

TEST_F(UsageEvaluatorTest, PastResetFloorsAtZeroAndRequestsRefetch) {
    DisplayState s = evaluate_snapshot(make_snapshot(80, 0, 0, kNow - 30), kNow);
    EXPECT_TRUE(s.countdown_known);
    EXPECT_EQ(s.countdown_seconds, 0);
    EXPECT_TRUE(s.refetch_requested);
    EXPECT_EQ(countdown_seconds(kNow - 1, kNow), 0);
}

TEST_F(UsageEvaluatorTest, SameInputsGiveSameState) {
    UsageSnapshot snap = make_snapshot(33.3, 71, 5, kNow + 600);
    EXPECT_TRUE(evaluate_snapshot(snap, kNow) == evaluate_snapshot(snap, kNow));
}

TEST_F(UsageEvaluatorTest, DisabledExtraDoesNotParticipate) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets[3].enabled = false;
    buckets[3].used = 500.0;
    buckets[3].limit = 100.0;
    DisplayState s = evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow);
    EXPECT_FALSE(s.bucket(BucketKind::ExtraCredit).participates);
    EXPECT_EQ(s.bucket(BucketKind::ExtraCredit).percent, 0);
    EXPECT_EQ(s.severity, Severity::Ok);
}

TEST_F(UsageEvaluatorTest, EnabledExtraRaisesSeverity) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets[3].enabled = true;
    buckets[3].used = 46.0;
    buckets[3].limit = 50.0;
    DisplayState s = evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow);
    EXPECT_EQ(s.bucket(BucketKind::ExtraCredit).percent, 92);
    EXPECT_EQ(s.severity, Severity::Critical);
    EXPECT_EQ(s.percent, 10);
}

TEST_F(UsageEvaluatorTest, MissingBucketThrows) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets.erase(buckets.begin() + 1);
    EXPECT_THROW(evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow), ParseError);
}

TEST_F(UsageEvaluatorTest, DuplicateBucketThrows) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets.push_back(buckets[0]);
    EXPECT_THROW(evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow), ParseError);
}

TEST_F(UsageEvaluatorTest, NegativeOrNonFiniteUsageThrows) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets[0].used = -1.0;
    EXPECT_THROW(evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow), ParseError);

    buckets[0].used = std::nan("");
    EXPECT_THROW(evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow), ParseError);
}

TEST_F(UsageEvaluatorTest, ZeroLimitOnQuotaBucketThrows) {
    std::vector<UsageBucket> buckets = make_snapshot(10, 10, 10).buckets();
    buckets[2].limit = 0.0;
    EXPECT_THROW(evaluate_snapshot(UsageSnapshot(buckets, kNow), kNow), ParseError);
}

TEST_F(UsageEvaluatorTest, StatusNames) {
    EXPECT_STREQ(severity_name(Severity::Warn), "WARN");
    EXPECT_STREQ(display_status_name(DisplayStatus::Unauthenticated), "unauthenticated");
}
