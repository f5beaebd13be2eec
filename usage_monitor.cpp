#include "usage_monitor.h"

#include <chrono>

static constexpr const char* kNoTokenMessage = "No OAuth token found - sign in with the claude CLI";
static constexpr const char* kTokenRejectedMessage = "Token expired - sign in again, then Refresh";
static constexpr const char* kBadResponseMessage = "Unexpected response from usage API";

// ============================================================================
// DisplayChannel
// ============================================================================

void DisplayChannel::publish(DisplayStatePtr state) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_ || !state) {
            return;
        }
        queue_.push_back(std::move(state));
    }
    cv_.notify_one();
}

DisplayStatePtr DisplayChannel::try_receive() {
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty()) {
        return nullptr;
    }
    DisplayStatePtr s = std::move(queue_.front());
    queue_.pop_front();
    return s;
}

DisplayStatePtr DisplayChannel::wait_receive(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return nullptr;
    }
    DisplayStatePtr s = std::move(queue_.front());
    queue_.pop_front();
    return s;
}

DisplayStatePtr DisplayChannel::drain_latest() {
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty()) {
        return nullptr;
    }
    DisplayStatePtr s = std::move(queue_.back());
    queue_.clear();
    return s;
}

size_t DisplayChannel::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void DisplayChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

// ============================================================================
// UsageMonitor
// ============================================================================

UsageMonitor::UsageMonitor(CredentialSource credentials, UsageFetcher fetcher,
                           std::shared_ptr<DisplayChannel> channel)
    : credentials_(std::move(credentials)), fetcher_(std::move(fetcher)), channel_(std::move(channel)) {}

DisplayStatePtr UsageMonitor::poll_once(time_t now) {
    Credential cred = credentials_(now);
    if (!credential_usable(cred)) {
        app_log(LogLevel::Warn, "No usable credential (%s)", credential_status_name(cred.status));
        return fail(DisplayStatus::Unauthenticated, kNoTokenMessage);
    }
    if (cred.status == CredentialStatus::Expired) {
        // The owning CLI may have refreshed the file already; try anyway.
        app_log(LogLevel::Warn, "Token past its expiry time, attempting fetch anyway");
    } else if (cred.status == CredentialStatus::Expiring) {
        app_log(LogLevel::Info, "Token expiring soon");
    }

    RequestResult result = fetcher_(cred.access_token);

    if (is_auth_failure(result)) {
        app_log(LogLevel::Info, "Got HTTP %ld, re-reading credentials", result.http_code);
        Credential fresh = credentials_(now);
        if (credential_usable(fresh) && fresh.access_token != cred.access_token) {
            result = fetcher_(fresh.access_token);
            if (!is_auth_failure(result)) {
                app_log(LogLevel::Info, "Recovered from HTTP 401 with refreshed token");
            }
        }
        fresh.access_token.clear();
    }
    cred.access_token.clear();

    if (is_auth_failure(result)) {
        app_log(LogLevel::Warn, "Usage API rejected the token (HTTP %ld)", result.http_code);
        return fail(DisplayStatus::Unauthenticated, kTokenRejectedMessage);
    }

    if (result.curl_code != CURLE_OK || !is_http_success(result.http_code)) {
        const std::string reason = describe_request_failure(result);
        if (result.curl_code != CURLE_OK) {
            app_log(LogLevel::Warn, "Request failed: %s (%s)", curl_easy_strerror(result.curl_code),
                    result.curl_error.c_str());
        } else {
            app_log(LogLevel::Warn, "Usage API HTTP %ld: %s", result.http_code,
                    truncate_for_display(result.body, 200).c_str());
        }
        return fail(DisplayStatus::Stale, reason);
    }

    SnapshotPtr snapshot;
    DisplayState state;
    try {
        snapshot = std::make_shared<const UsageSnapshot>(parse_usage_response(result.body, now));
        state = evaluate_snapshot(*snapshot, now);
    } catch (const ParseError& e) {
        app_log(LogLevel::Error, "Failed to parse usage response: %s", e.what());
        return fail(DisplayStatus::Unknown, kBadResponseMessage);
    }

    DisplayStatePtr published = std::make_shared<const DisplayState>(std::move(state));
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (consecutive_failures_ > 0) {
            app_log(LogLevel::Info, "Poll recovered after %d errors", consecutive_failures_);
        }
        consecutive_failures_ = 0;
        snapshot_ = snapshot;
        current_ = published;
        last_good_ = published;
    }

    app_log(LogLevel::Debug, "Poll ok: 5h %d%% severity %s", published->percent,
            severity_name(published->severity));
    publish(published);
    return published;
}

DisplayStatePtr UsageMonitor::tick(time_t now, bool* refetch) {
    if (refetch) {
        *refetch = false;
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (!snapshot_) {
        return current_;
    }

    DisplayState state;
    try {
        state = evaluate_snapshot(*snapshot_, now);
    } catch (const ParseError& e) {
        app_log(LogLevel::Error, "Re-evaluating snapshot failed: %s", e.what());
        return current_;
    }

    // A failed poll since the snapshot keeps its status on screen.
    if (current_) {
        state.status = current_->status;
        state.message = current_->message;
    }

    if (state.refetch_requested) {
        const time_t reset_at = state.bucket(kPrimaryBucket).reset_at;
        if (!have_refetched_reset_ || refetched_reset_at_ != reset_at) {
            have_refetched_reset_ = true;
            refetched_reset_at_ = reset_at;
            if (refetch) {
                *refetch = true;
            }
        }
    }

    current_ = std::make_shared<const DisplayState>(std::move(state));
    return current_;
}

DisplayStatePtr UsageMonitor::current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
}

DisplayStatePtr UsageMonitor::last_good() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_good_;
}

SnapshotPtr UsageMonitor::latest_snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return snapshot_;
}

int UsageMonitor::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mu_);
    return consecutive_failures_;
}

DisplayStatePtr UsageMonitor::fail(DisplayStatus status, const std::string& message) {
    DisplayStatePtr published;
    {
        std::lock_guard<std::mutex> lock(mu_);
        consecutive_failures_ += 1;
        app_log(LogLevel::Warn, "Poll error (%d consecutive): %s", consecutive_failures_, message.c_str());

        DisplayState state = last_good_ ? *last_good_ : DisplayState();
        state.status = status;
        state.message = message;
        state.refetch_requested = false;
        published = std::make_shared<const DisplayState>(std::move(state));
        current_ = published;
    }
    publish(published);
    return published;
}

void UsageMonitor::publish(const DisplayStatePtr& state) {
    if (channel_) {
        channel_->publish(state);
    }
}

CredentialSource file_credential_source(const std::string& path) {
    return [path](time_t now) { return read_credential(path, now); };
}
