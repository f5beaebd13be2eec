#include "usage_text.h"

#include "usage_common.h"

// ============================================================================
// Terminal UI - Color Functions
// ============================================================================

std::string color_for_severity(Severity severity, bool use_colors) {
    if (!use_colors) {
        return "";
    }

    switch (severity) {
        case Severity::Ok:       return "\033[32m"; // Green
        case Severity::Warn:     return "\033[33m"; // Yellow
        case Severity::Critical: return "\033[31m"; // Red
    }
    return "";
}

std::string color_reset(bool use_colors) {
    return use_colors ? "\033[0m" : "";
}

// ============================================================================
// Terminal UI - Rendering
// ============================================================================

std::string render_bucket_text(const BucketView& v) {
    std::ostringstream out;
    out << std::left << std::setw(16) << (std::string(bucket_label(v.kind)) + ":") << std::right
        << std::setw(3) << v.percent << "%";
    if (v.has_reset) {
        out << "  (resets " << format_local_time(v.reset_at) << ", "
            << (v.countdown_seconds > 0 ? "in " : "") << format_duration_compact(v.countdown_seconds) << ")";
    } else {
        out << "  (no active window)";
    }
    return out.str();
}

std::string render_extra_line(const BucketView& v, bool use_colors) {
    std::ostringstream out;
    out << std::left << std::setw(16) << (std::string(bucket_label(v.kind)) + ":") << std::right;
    if (!v.participates) {
        out << "Not enabled";
        return out.str();
    }
    out << color_for_severity(v.severity, use_colors)
        << std::fixed << std::setprecision(2) << "$" << v.used << " / $" << v.limit
        << " (" << v.percent << "%)" << color_reset(use_colors);
    return out.str();
}

std::string render_tiny_line(const DisplayState& s, bool use_colors) {
    std::ostringstream out;
    if (!s.has_data) {
        out << "--%";
        return out.str();
    }
    out << color_for_severity(s.severity, use_colors) << s.percent << "%" << color_reset(use_colors);
    if (s.countdown_known) {
        out << " " << format_duration_tight(s.countdown_seconds);
    }
    if (s.status != DisplayStatus::Live) {
        out << " (" << display_status_name(s.status) << ")";
    }
    return out.str();
}

