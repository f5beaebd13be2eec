#ifndef USAGE_EVALUATOR_H
#define USAGE_EVALUATOR_H

#include "usage_model.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>

// ============================================================================
// Severity tiers
// ============================================================================

enum class Severity {
    Ok,
    Warn,
    Critical,
};

struct SeverityTier {
    int floor_pct;
    Severity severity;
};

// Ordered highest floor first; the first tier whose floor <= percent wins.
// 70/90 are provisional defaults.
static constexpr std::array<SeverityTier, 3> kSeverityTiers = {{
    {90, Severity::Critical},
    {70, Severity::Warn},
    {0, Severity::Ok},
}};

// Rolling window drives the pill and its countdown.
static constexpr BucketKind kPrimaryBucket = BucketKind::Rolling5h;

// ============================================================================
// Display state
// ============================================================================

enum class DisplayStatus {
    Live,             // computed from a fresh snapshot
    Stale,            // network failure, last values kept
    Unknown,          // malformed response
    Unauthenticated,  // missing or rejected credential
};

struct BucketView {
    BucketKind kind = BucketKind::Rolling5h;
    int percent = 0;
    Severity severity = Severity::Ok;
    bool participates = true;   // false for a disabled ExtraCredit bucket
    bool has_reset = false;
    time_t reset_at = 0;
    int64_t countdown_seconds = 0;
    double used = 0.0;
    double limit = 0.0;
};

struct DisplayState {
    DisplayStatus status = DisplayStatus::Unknown;
    bool has_data = false;
    int percent = 0;
    Severity severity = Severity::Ok;
    int64_t countdown_seconds = 0;
    bool countdown_known = false;
    bool refetch_requested = false;
    std::array<BucketView, kBucketKindCount> buckets{};
    std::string message;
    time_t fetched_at = 0;

    const BucketView& bucket(BucketKind kind) const { return buckets[static_cast<size_t>(kind)]; }
};

using DisplayStatePtr = std::shared_ptr<const DisplayState>;

bool operator==(const BucketView& a, const BucketView& b);
bool operator==(const DisplayState& a, const DisplayState& b);

// ============================================================================
// Function Declarations
// ============================================================================

// used / limit as a display percentage: clamped to [0, 100] and rounded
int bucket_percent(const UsageBucket& bucket);

// Tier lookup for a display percentage
Severity severity_for_percent(int percent);

// Seconds until reset_at, floored at zero
int64_t countdown_seconds(time_t reset_at, time_t now);

// Compute the display state for a snapshot at time now. Throws ParseError
// if a bucket kind is missing or duplicated or a bucket is malformed.
DisplayState evaluate_snapshot(const UsageSnapshot& snapshot, time_t now);

const char* severity_name(Severity severity);
const char* display_status_name(DisplayStatus status);

#endif // USAGE_EVALUATOR_H
