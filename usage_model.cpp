#include "usage_model.h"

#include "usage_common.h"

const UsageBucket* UsageSnapshot::find(BucketKind kind) const {
    for (const UsageBucket& b : buckets_) {
        if (b.kind == kind) {
            return &b;
        }
    }
    return nullptr;
}

const char* bucket_json_key(BucketKind kind) {
    switch (kind) {
        case BucketKind::Rolling5h:   return "five_hour";
        case BucketKind::Opus7d:      return "seven_day";
        case BucketKind::Sonnet7d:    return "seven_day_sonnet";
        case BucketKind::ExtraCredit: return "extra_usage";
    }
    return "";
}

const char* bucket_label(BucketKind kind) {
    switch (kind) {
        case BucketKind::Rolling5h:   return "5-Hour Rolling";
        case BucketKind::Opus7d:      return "7-Day (Opus)";
        case BucketKind::Sonnet7d:    return "7-Day (Sonnet)";
        case BucketKind::ExtraCredit: return "Extra Usage";
    }
    return "";
}

const char* bucket_short_label(BucketKind kind) {
    switch (kind) {
        case BucketKind::Rolling5h:   return "5h";
        case BucketKind::Opus7d:      return "Week";
        case BucketKind::Sonnet7d:    return "Sonnet";
        case BucketKind::ExtraCredit: return "Extra";
    }
    return "";
}

// ============================================================================
// JSON helpers
// ============================================================================

static double number_field(const json& obj, const char* key, const char* bucket_key, bool required) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            throw ParseError(std::string(bucket_key) + "." + key + " missing");
        }
        return 0.0;
    }
    if (!it->is_number()) {
        throw ParseError(std::string(bucket_key) + "." + key + " is not a number");
    }
    const double v = it->get<double>();
    if (!std::isfinite(v)) {
        throw ParseError(std::string(bucket_key) + "." + key + " is not finite");
    }
    return v;
}

static UsageBucket parse_quota_bucket(const json& root, BucketKind kind) {
    const char* key = bucket_json_key(kind);
    auto it = root.find(key);
    if (it == root.end()) {
        throw ParseError(std::string("missing bucket '") + key + "'");
    }
    if (!it->is_object()) {
        throw ParseError(std::string("bucket '") + key + "' is not an object");
    }

    UsageBucket b;
    b.kind = kind;
    b.used = number_field(*it, "utilization", key, true);
    b.limit = 100.0;
    if (b.used < 0.0) {
        throw ParseError(std::string(key) + ".utilization is negative");
    }

    auto reset = it->find("resets_at");
    if (reset != it->end() && !reset->is_null()) {
        if (!reset->is_string()) {
            throw ParseError(std::string(key) + ".resets_at is not a string");
        }
        time_t t = 0;
        if (!parse_iso8601_utc_to_time_t(reset->get<std::string>(), &t)) {
            throw ParseError(std::string(key) + ".resets_at is not an ISO 8601 timestamp");
        }
        b.reset_at = t;
    }
    return b;
}

static UsageBucket parse_extra_bucket(const json& root) {
    const char* key = bucket_json_key(BucketKind::ExtraCredit);
    auto it = root.find(key);
    if (it == root.end()) {
        throw ParseError(std::string("missing bucket '") + key + "'");
    }

    UsageBucket b;
    b.kind = BucketKind::ExtraCredit;
    b.enabled = false;
    b.used = 0.0;
    b.limit = 0.0;

    if (it->is_null()) {
        return b;
    }
    if (!it->is_object()) {
        throw ParseError(std::string("bucket '") + key + "' is not an object");
    }

    auto enabled = it->find("is_enabled");
    if (enabled != it->end() && !enabled->is_null()) {
        if (!enabled->is_boolean()) {
            throw ParseError(std::string(key) + ".is_enabled is not a boolean");
        }
        b.enabled = enabled->get<bool>();
    }

    // Amounts arrive in cents.
    b.used = number_field(*it, "used_credits", key, false) / 100.0;
    b.limit = number_field(*it, "monthly_limit", key, false) / 100.0;
    if (b.used < 0.0 || b.limit < 0.0) {
        throw ParseError(std::string(key) + " has a negative amount");
    }
    return b;
}

UsageSnapshot parse_usage_response(const std::string& body, time_t fetched_at) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ParseError("response is not a JSON object");
    }

    std::vector<UsageBucket> buckets;
    buckets.reserve(kBucketKindCount);
    buckets.push_back(parse_quota_bucket(j, BucketKind::Rolling5h));
    buckets.push_back(parse_quota_bucket(j, BucketKind::Opus7d));
    buckets.push_back(parse_quota_bucket(j, BucketKind::Sonnet7d));
    buckets.push_back(parse_extra_bucket(j));

    return UsageSnapshot(std::move(buckets), fetched_at);
}
