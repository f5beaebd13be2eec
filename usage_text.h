#ifndef USAGE_TEXT_H
#define USAGE_TEXT_H

#include "usage_evaluator.h"

#include <string>

// ============================================================================
// Function Declarations - Terminal rendering
// ============================================================================

// ANSI colour for a severity; empty when colours are off
std::string color_for_severity(Severity severity, bool use_colors);
std::string color_reset(bool use_colors);

// "5-Hour Rolling:  42%  (resets Thu Jan 01, 02:14, in 2h 14m)"
// Shows the evaluated display percent, so it always agrees with severity.
std::string render_bucket_text(const BucketView& v);

// Extra credit in dollars, or "Not enabled"
std::string render_extra_line(const BucketView& v, bool use_colors);

// "42% 2h14m", with the status appended when not live
std::string render_tiny_line(const DisplayState& s, bool use_colors);

#endif // USAGE_TEXT_H
