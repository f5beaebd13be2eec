#include "usage_evaluator.h"

#include <algorithm>
#include <cmath>

bool operator==(const BucketView& a, const BucketView& b) {
    return a.kind == b.kind && a.percent == b.percent && a.severity == b.severity &&
           a.participates == b.participates && a.has_reset == b.has_reset &&
           a.reset_at == b.reset_at && a.countdown_seconds == b.countdown_seconds &&
           a.used == b.used && a.limit == b.limit;
}

bool operator==(const DisplayState& a, const DisplayState& b) {
    return a.status == b.status && a.has_data == b.has_data && a.percent == b.percent &&
           a.severity == b.severity && a.countdown_seconds == b.countdown_seconds &&
           a.countdown_known == b.countdown_known && a.refetch_requested == b.refetch_requested &&
           a.buckets == b.buckets && a.message == b.message && a.fetched_at == b.fetched_at;
}

int bucket_percent(const UsageBucket& bucket) {
    if (!(bucket.limit > 0.0)) {
        return 0;
    }
    double pct = bucket.used / bucket.limit * 100.0;
    if (!std::isfinite(pct) || pct < 0.0) pct = 0.0;
    if (pct > 100.0) pct = 100.0;
    return static_cast<int>(std::lround(pct));
}

Severity severity_for_percent(int percent) {
    for (const SeverityTier& tier : kSeverityTiers) {
        if (percent >= tier.floor_pct) {
            return tier.severity;
        }
    }
    return Severity::Ok;
}

int64_t countdown_seconds(time_t reset_at, time_t now) {
    const int64_t remaining = static_cast<int64_t>(reset_at) - static_cast<int64_t>(now);
    return remaining > 0 ? remaining : 0;
}

static void validate_bucket(const UsageBucket& b) {
    const char* key = bucket_json_key(b.kind);
    if (!std::isfinite(b.used) || b.used < 0.0) {
        throw ParseError(std::string(key) + ": used must be a non-negative number");
    }
    if (!std::isfinite(b.limit)) {
        throw ParseError(std::string(key) + ": limit must be finite");
    }
    const bool needs_limit = b.kind != BucketKind::ExtraCredit || b.enabled;
    if (needs_limit && !(b.limit > 0.0)) {
        throw ParseError(std::string(key) + ": limit must be positive");
    }
}

DisplayState evaluate_snapshot(const UsageSnapshot& snapshot, time_t now) {
    std::array<const UsageBucket*, kBucketKindCount> by_kind{};
    for (const UsageBucket& b : snapshot.buckets()) {
        const size_t idx = static_cast<size_t>(b.kind);
        if (idx >= by_kind.size()) {
            throw ParseError("unknown bucket kind");
        }
        if (by_kind[idx]) {
            throw ParseError(std::string("duplicate bucket '") + bucket_json_key(b.kind) + "'");
        }
        validate_bucket(b);
        by_kind[idx] = &b;
    }

    DisplayState out;
    out.status = DisplayStatus::Live;
    out.has_data = true;
    out.fetched_at = snapshot.fetched_at();

    Severity overall = Severity::Ok;
    for (BucketKind kind : kAllBucketKinds) {
        const UsageBucket* b = by_kind[static_cast<size_t>(kind)];
        if (!b) {
            throw ParseError(std::string("missing bucket '") + bucket_json_key(kind) + "'");
        }

        BucketView& v = out.buckets[static_cast<size_t>(kind)];
        v.kind = kind;
        v.used = b->used;
        v.limit = b->limit;
        v.participates = b->kind != BucketKind::ExtraCredit || b->enabled;
        v.percent = v.participates ? bucket_percent(*b) : 0;
        v.severity = severity_for_percent(v.percent);
        if (b->reset_at) {
            v.has_reset = true;
            v.reset_at = *b->reset_at;
            v.countdown_seconds = countdown_seconds(*b->reset_at, now);
        }

        if (v.participates) {
            overall = std::max(overall, v.severity);
        }
    }

    const BucketView& primary = out.bucket(kPrimaryBucket);
    out.severity = overall;
    out.percent = primary.percent;
    out.countdown_known = primary.has_reset;
    out.countdown_seconds = primary.countdown_seconds;
    out.refetch_requested = primary.has_reset && primary.reset_at <= now;

    return out;
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Ok:       return "OK";
        case Severity::Warn:     return "WARN";
        case Severity::Critical: return "CRITICAL";
    }
    return "OK";
}

const char* display_status_name(DisplayStatus status) {
    switch (status) {
        case DisplayStatus::Live:            return "live";
        case DisplayStatus::Stale:           return "stale";
        case DisplayStatus::Unknown:         return "unknown";
        case DisplayStatus::Unauthenticated: return "unauthenticated";
    }
    return "unknown";
}
