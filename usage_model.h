#ifndef USAGE_MODEL_H
#define USAGE_MODEL_H

#include <ctime>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// Data Structures
// ============================================================================

// Quota buckets reported by the usage endpoint, in display order.
enum class BucketKind {
    Rolling5h,
    Opus7d,
    Sonnet7d,
    ExtraCredit,
};

static constexpr int kBucketKindCount = 4;

static constexpr BucketKind kAllBucketKinds[kBucketKindCount] = {
    BucketKind::Rolling5h,
    BucketKind::Opus7d,
    BucketKind::Sonnet7d,
    BucketKind::ExtraCredit,
};

// Malformed API response or an inconsistent snapshot.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// One quota reading. Quota buckets are percentages against a limit of 100;
// ExtraCredit is dollars against the monthly cap.
struct UsageBucket {
    BucketKind kind = BucketKind::Rolling5h;
    double used = 0.0;
    double limit = 100.0;
    std::optional<time_t> reset_at;
    bool enabled = true;
};

// All bucket readings from one API response. Never modified after
// construction; the next poll replaces it wholesale.
class UsageSnapshot {
public:
    UsageSnapshot(std::vector<UsageBucket> buckets, time_t fetched_at)
        : buckets_(std::move(buckets)), fetched_at_(fetched_at) {}

    const std::vector<UsageBucket>& buckets() const { return buckets_; }
    time_t fetched_at() const { return fetched_at_; }

    // First bucket of the given kind, or nullptr
    const UsageBucket* find(BucketKind kind) const;

private:
    const std::vector<UsageBucket> buckets_;
    const time_t fetched_at_;
};

using SnapshotPtr = std::shared_ptr<const UsageSnapshot>;

// ============================================================================
// Function Declarations
// ============================================================================

// JSON key used by the usage endpoint ("five_hour", ...)
const char* bucket_json_key(BucketKind kind);

// Human label ("5-Hour Rolling", ...)
const char* bucket_label(BucketKind kind);

// Short label for the tray pill ("5h", "Week", ...)
const char* bucket_short_label(BucketKind kind);

// Parse a usage endpoint response body. Throws ParseError.
UsageSnapshot parse_usage_response(const std::string& body, time_t fetched_at);

#endif // USAGE_MODEL_H
