#include "usage_common.h"

#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <pwd.h>
#include <syslog.h>
#include <sys/types.h>

// ============================================================================
// CURL Utilities Implementation
// ============================================================================

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append((char*)contents, total_size);
    return total_size;
}

RequestResult fetch_usage(const std::string& access_token) {
    RequestResult out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.curl_code = CURLE_FAILED_INIT;
        out.curl_error = "curl_easy_init failed";
        return out;
    }

    std::string response;

    const std::string auth_header = "Authorization: Bearer " + access_token;
    const std::string beta_header = std::string("anthropic-beta: ") + kOauthBetaHeader;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, beta_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, kUsageApiUrl);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_SSLVERSION, (long)CURL_SSLVERSION_TLSv1_2);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kRequestTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    out.curl_code = curl_easy_perform(curl);
    out.body = std::move(response);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    out.http_code = http_code;
    if (errbuf[0] != '\0') {
        out.curl_error = errbuf;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return out;
}

bool is_http_success(long code) {
    return code >= 200 && code < 300;
}

bool is_auth_failure(const RequestResult& r) {
    return r.curl_code == CURLE_OK && (r.http_code == 401 || r.http_code == 403);
}

std::string describe_request_failure(const RequestResult& r) {
    if (r.curl_code != CURLE_OK) {
        if (r.curl_code == CURLE_OPERATION_TIMEDOUT) {
            return "Connection timed out";
        }
        if (r.curl_code == CURLE_PEER_FAILED_VERIFICATION || r.curl_code == CURLE_SSL_CACERT_BADFILE ||
            r.curl_code == CURLE_SSL_CONNECT_ERROR) {
            return "SSL certificate error";
        }
        return "Connection failed";
    }
    if (!is_http_success(r.http_code)) {
        return "HTTP " + std::to_string(r.http_code);
    }
    return std::string();
}

// ============================================================================
// String Utilities Implementation
// ============================================================================

std::string truncate_for_display(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) {
        return s;
    }
    return s.substr(0, max_len) + "...";
}

// ============================================================================
// Time Utilities Implementation
// ============================================================================

bool parse_iso8601_utc_to_time_t(const std::string& iso_timestamp, time_t* out) {
    if (!out) {
        return false;
    }
    if (iso_timestamp.length() < 19) {
        return false;
    }

    struct tm tm_info = {};
    std::istringstream ss(iso_timestamp.substr(0, 19));
    ss >> std::get_time(&tm_info, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    time_t utc_time = timegm(&tm_info);
    if (utc_time == -1) {
        return false;
    }

    // Skip fractional seconds, then apply the zone designator (none = UTC).
    size_t pos = 19;
    if (pos < iso_timestamp.size() && iso_timestamp[pos] == '.') {
        ++pos;
        while (pos < iso_timestamp.size() && std::isdigit(static_cast<unsigned char>(iso_timestamp[pos]))) {
            ++pos;
        }
    }

    if (pos < iso_timestamp.size()) {
        const char zone = iso_timestamp[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            // +HH:MM or +HHMM
            std::string digits;
            for (size_t i = pos + 1; i < iso_timestamp.size(); ++i) {
                if (iso_timestamp[i] == ':') continue;
                if (!std::isdigit(static_cast<unsigned char>(iso_timestamp[i]))) {
                    return false;
                }
                digits.push_back(iso_timestamp[i]);
            }
            if (digits.size() != 4) {
                return false;
            }
            const int hh = std::stoi(digits.substr(0, 2));
            const int mm = std::stoi(digits.substr(2, 2));
            if (hh > 23 || mm > 59) {
                return false;
            }
            const time_t offset = static_cast<time_t>(hh * 3600 + mm * 60);
            utc_time = (zone == '+') ? utc_time - offset : utc_time + offset;
            pos = iso_timestamp.size();
        } else {
            return false;
        }
        if (pos != iso_timestamp.size()) {
            return false;
        }
    }

    *out = utc_time;
    return true;
}

std::string format_duration_compact(int64_t seconds) {
    if (seconds <= 0) {
        return "now";
    }

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;

    std::ostringstream out;
    if (days > 0) {
        out << days << "d";
        if (hours > 0) {
            out << " " << hours << "h";
        }
        return out.str();
    }
    if (hours > 0) {
        out << hours << "h";
        if (minutes > 0) {
            out << " " << minutes << "m";
        }
        return out.str();
    }
    if (minutes > 0) {
        out << minutes << "m";
        return out.str();
    }
    return "now";
}

std::string format_duration_tight(int64_t seconds) {
    if (seconds <= 0) {
        return "now";
    }

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;

    std::ostringstream out;
    if (days > 0) {
        out << days << "d" << hours << "h";
        return out.str();
    }
    if (hours > 0) {
        out << hours << "h" << std::setw(2) << std::setfill('0') << minutes << "m";
        return out.str();
    }
    out << minutes << "m";
    return out.str();
}

std::string format_local_time(time_t utc) {
    struct tm local_tm = {};
    if (!localtime_r(&utc, &local_tm)) {
        return "Unknown";
    }

    char buffer[80];
    strftime(buffer, sizeof(buffer), "%a %b %d, %H:%M", &local_tm);
    return std::string(buffer);
}

std::string get_timestamp_string() {
    time_t now = time(nullptr);
    struct tm local_tm = {};
    localtime_r(&now, &local_tm);
    char buffer[80];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);
    return std::string(buffer);
}

// ============================================================================
// Paths Implementation
// ============================================================================

std::string get_home_dir() {
    const char* home = getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir && pw->pw_dir[0] != '\0') {
        return pw->pw_dir;
    }
    return std::string();
}

static std::string xdg_dir(const char* env_name, const char* home_rel) {
    const char* v = getenv(env_name);
    if (v && *v == '/') {
        return v;
    }
    std::string home = get_home_dir();
    if (home.empty()) {
        return std::string();
    }
    return home + home_rel;
}

std::string get_config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string get_cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", "/.cache");
}

bool ensure_dir_exists(const std::string& dir, mode_t mode) {
    if (dir.empty()) {
        return false;
    }

    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    const size_t slash = dir.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!ensure_dir_exists(dir.substr(0, slash), mode)) {
            return false;
        }
    }

    if (mkdir(dir.c_str(), mode) != 0 && errno != EEXIST) {
        return false;
    }
    return true;
}

// ============================================================================
// Logging Implementation
// ============================================================================

static std::mutex g_log_mu;
static std::string g_log_ident = "pinch";
static std::string g_log_file;
static bool g_log_file_resolved = false;
static bool g_log_verbose = false;

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

static int syslog_priority(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return LOG_DEBUG;
        case LogLevel::Info:  return LOG_INFO;
        case LogLevel::Warn:  return LOG_WARNING;
        case LogLevel::Error: return LOG_ERR;
    }
    return LOG_INFO;
}

// Called with g_log_mu held.
static const std::string& resolve_log_file() {
    if (!g_log_file_resolved) {
        g_log_file_resolved = true;
        std::string dir = get_cache_dir();
        if (dir.empty()) {
            g_log_file = "/tmp/pinch.log";
        } else {
            dir += "/pinch";
            g_log_file = ensure_dir_exists(dir, 0700) ? dir + "/pinch.log" : std::string();
        }
    }
    return g_log_file;
}

void app_log_init(const char* ident, bool verbose) {
    std::lock_guard<std::mutex> lock(g_log_mu);
    if (ident && *ident) {
        g_log_ident = ident;
    }
    g_log_verbose = verbose;
}

void app_log_set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mu);
    g_log_file = path;
    g_log_file_resolved = true;
}

void app_log(LogLevel level, const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_log_mu);

    if (level == LogLevel::Debug && !g_log_verbose) {
        return;
    }

    char msg[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    const std::string ts = get_timestamp_string();

    const std::string& path = resolve_log_file();
    if (!path.empty()) {
        FILE* f = fopen(path.c_str(), "a");
        if (f) {
            fprintf(f, "[%s] %s %s: %s\n", ts.c_str(), level_name(level), g_log_ident.c_str(), msg);
            fclose(f);
        }
    }

    if (g_log_verbose) {
        fprintf(stderr, "[%s] %s: %s\n", ts.c_str(), level_name(level), msg);
    }

    openlog(g_log_ident.c_str(), LOG_PID, LOG_USER);
    syslog(syslog_priority(level), "%s", msg);
    closelog();
}
