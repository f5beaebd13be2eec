#ifndef USAGE_COMMON_H
#define USAGE_COMMON_H

#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <unistd.h>
#include <fstream>
#include <sys/stat.h>
#include <optional>
#include <cmath>

using json = nlohmann::json;

// ============================================================================
// Constants
// ============================================================================

static constexpr const char* kUsageApiUrl = "https://api.anthropic.com/api/oauth/usage";
static constexpr const char* kOauthBetaHeader = "oauth-2025-04-20";
static constexpr long kRequestTimeoutSeconds = 10;

static constexpr int kPollIntervalDefault = 30;
static constexpr int kPollIntervalMin = 15;
static constexpr int kPollIntervalMax = 120;

// ============================================================================
// Data Structures
// ============================================================================

// Structure to hold HTTP request results
struct RequestResult {
    CURLcode curl_code = CURLE_OK;
    long http_code = 0;
    std::string body;
    std::string curl_error;
};

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

// ============================================================================
// Function Declarations - CURL Utilities
// ============================================================================

// Callback function to write curl response to string
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

// GET the usage endpoint with the given OAuth access token
RequestResult fetch_usage(const std::string& access_token);

// Check if response is successful HTTP code
bool is_http_success(long code);

// 401/403: the token was rejected
bool is_auth_failure(const RequestResult& r);

// Short, user-facing description of a failed request (never the raw body)
std::string describe_request_failure(const RequestResult& r);

// ============================================================================
// Function Declarations - String Utilities
// ============================================================================

// Truncate string for display
std::string truncate_for_display(const std::string& s, size_t max_len);

// ============================================================================
// Function Declarations - Time Utilities
// ============================================================================

// Parse ISO 8601 timestamp (Z, +HH:MM offsets, fractional seconds) to UTC time_t
bool parse_iso8601_utc_to_time_t(const std::string& iso_timestamp, time_t* out);

// Format duration in compact form ("3d 5h", "2h 15m", "45m", "now")
std::string format_duration_compact(int64_t seconds);

// Format duration in tight form for the tray pill ("3d5h", "2h05m", "45m", "now")
std::string format_duration_tight(int64_t seconds);

// Format a UTC time_t as a readable local date/time
std::string format_local_time(time_t utc);

// Get current timestamp as string
std::string get_timestamp_string();

// ============================================================================
// Function Declarations - Paths
// ============================================================================

// $HOME, falling back to the passwd entry
std::string get_home_dir();

// $XDG_CONFIG_HOME or ~/.config
std::string get_config_dir();

// $XDG_CACHE_HOME or ~/.cache
std::string get_cache_dir();

// mkdir -p with the given mode for newly created components
bool ensure_dir_exists(const std::string& dir, mode_t mode);

// ============================================================================
// Function Declarations - Logging
// ============================================================================

// Set syslog ident and whether lines are mirrored to stderr; Debug is only
// emitted when verbose.
void app_log_init(const char* ident, bool verbose);

// Override the log file path (empty disables the file sink)
void app_log_set_file(const std::string& path);

// Append a timestamped line to the log file and syslog
void app_log(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

#endif // USAGE_COMMON_H
