#ifndef USAGE_MONITOR_H
#define USAGE_MONITOR_H

#include "credentials.h"
#include "usage_common.h"
#include "usage_evaluator.h"
#include "usage_model.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

// ============================================================================
// DisplayChannel
// ============================================================================

// FIFO of immutable display states. The poll worker publishes, the UI
// thread drains.
class DisplayChannel {
public:
    void publish(DisplayStatePtr state);

    // Next pending state, or nullptr when empty
    DisplayStatePtr try_receive();

    // Block up to timeout_ms for the next state; nullptr on timeout or close
    DisplayStatePtr wait_receive(int timeout_ms);

    // Most recent pending state, discarding older ones
    DisplayStatePtr drain_latest();

    size_t pending() const;

    // Wake waiters; later publishes are dropped
    void close();

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<DisplayStatePtr> queue_;
    bool closed_ = false;
};

// ============================================================================
// UsageMonitor
// ============================================================================

using CredentialSource = std::function<Credential(time_t now)>;
using UsageFetcher = std::function<RequestResult(const std::string& access_token)>;

// One poll cycle: credential -> fetch -> parse -> evaluate -> publish.
// poll_once() runs on the fetch worker, tick() on the UI thread.
class UsageMonitor {
public:
    // The monitor shares ownership of the channel so a detached worker can
    // still publish after the UI side has let go of it.
    UsageMonitor(CredentialSource credentials, UsageFetcher fetcher,
                 std::shared_ptr<DisplayChannel> channel = nullptr);

    // Run a full cycle and publish the resulting state. Never throws for
    // network, auth or parse failures; those become Stale, Unauthenticated
    // and Unknown states that keep the last good values.
    DisplayStatePtr poll_once(time_t now);

    // Recompute countdowns from the latest snapshot. *refetch is set once
    // per expired reset time.
    DisplayStatePtr tick(time_t now, bool* refetch);

    DisplayStatePtr current() const;
    DisplayStatePtr last_good() const;
    SnapshotPtr latest_snapshot() const;
    int consecutive_failures() const;

private:
    DisplayStatePtr fail(DisplayStatus status, const std::string& message);
    void publish(const DisplayStatePtr& state);

    CredentialSource credentials_;
    UsageFetcher fetcher_;
    std::shared_ptr<DisplayChannel> channel_;

    mutable std::mutex mu_;
    SnapshotPtr snapshot_;
    DisplayStatePtr current_;
    DisplayStatePtr last_good_;
    int consecutive_failures_ = 0;
    bool have_refetched_reset_ = false;
    time_t refetched_reset_at_ = 0;
};

// Credential source reading the given file on every poll
CredentialSource file_credential_source(const std::string& path);

#endif // USAGE_MONITOR_H
