#include "credentials.h"

#include "usage_common.h"

// Year 9999; anything later is not a real expiry.
static constexpr double kMaxExpirySeconds = 253402300800.0;

std::string default_credentials_path() {
    const char* env = getenv("PINCH_CREDENTIALS");
    if (env && *env) {
        return env;
    }
    std::string home = get_home_dir();
    if (home.empty()) {
        return std::string();
    }
    return home + "/.claude/.credentials.json";
}

Credential read_credential(const std::string& path, time_t now) {
    Credential out;

    std::ifstream file(path);
    if (path.empty() || !file.is_open()) {
        app_log(LogLevel::Warn, "Credentials file not found: %s", path.c_str());
        out.status = CredentialStatus::Missing;
        return out;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error&) {
        // Never echo the parser message: it may quote file contents.
        app_log(LogLevel::Error, "Failed to parse credentials file");
        out.status = CredentialStatus::Malformed;
        return out;
    }

    auto oauth = j.is_object() ? j.find("claudeAiOauth") : j.end();
    if (oauth == j.end() || !oauth->is_object()) {
        app_log(LogLevel::Error, "No OAuth section in credentials file");
        out.status = CredentialStatus::Missing;
        return out;
    }

    auto token = oauth->find("accessToken");
    if (token == oauth->end() || !token->is_string() || token->get<std::string>().empty()) {
        app_log(LogLevel::Error, "No accessToken found in credentials file");
        out.status = CredentialStatus::Missing;
        return out;
    }
    out.access_token = token->get<std::string>();

    // expiresAt is epoch milliseconds.
    auto expires = oauth->find("expiresAt");
    if (expires != oauth->end() && expires->is_number()) {
        const double ms = expires->get<double>();
        // Out-of-range values are treated as no expiry.
        const double seconds = ms / 1000.0;
        if (std::isfinite(seconds) && seconds > 0.0 && seconds < kMaxExpirySeconds) {
            out.expires_at = static_cast<time_t>(seconds);
        } else if (ms != 0.0) {
            app_log(LogLevel::Warn, "Ignoring out-of-range expiresAt in credentials file");
        }
    }

    out.status = CredentialStatus::Ok;
    if (out.expires_at) {
        if (*out.expires_at <= now) {
            out.status = CredentialStatus::Expired;
        } else if (*out.expires_at - now <= kTokenExpiringSeconds) {
            out.status = CredentialStatus::Expiring;
        }
    }
    return out;
}

bool credential_usable(const Credential& c) {
    switch (c.status) {
        case CredentialStatus::Ok:
        case CredentialStatus::Expiring:
        case CredentialStatus::Expired:
            return !c.access_token.empty();
        case CredentialStatus::Missing:
        case CredentialStatus::Malformed:
            return false;
    }
    return false;
}

const char* credential_status_name(CredentialStatus status) {
    switch (status) {
        case CredentialStatus::Ok:        return "ok";
        case CredentialStatus::Expiring:  return "expiring";
        case CredentialStatus::Expired:   return "expired";
        case CredentialStatus::Missing:   return "missing";
        case CredentialStatus::Malformed: return "malformed";
    }
    return "missing";
}
