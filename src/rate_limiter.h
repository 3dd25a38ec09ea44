#pragma once

#include "codegate/constants.h"
#include <string>
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <chrono>

namespace codegate {

// Per-caller admission limits, checked before any snippet is validated or run
class RateLimiter {
public:
    struct Config {
        int max_concurrent_requests;
        int max_requests_per_minute;
        int cleanup_after_minutes;

        Config() :
            max_concurrent_requests(MAX_CONCURRENT_REQUESTS_PER_CALLER),
            max_requests_per_minute(MAX_REQUESTS_PER_MINUTE),
            cleanup_after_minutes(10) {}
    };

    struct QuotaInfo {
        int active_requests = 0;
        int requests_this_minute = 0;
        bool can_submit = false;
        std::string reason;
    };

    explicit RateLimiter(const Config& config = Config());

    QuotaInfo check_quota(const std::string& caller);

    // Checks and records in one step; false (with nothing recorded) when over a limit
    bool register_request_start(const std::string& caller, const std::string& request_id);
    void register_request_end(const std::string& caller, const std::string& request_id);

    // Forgets callers idle for longer than cleanup_after_minutes
    void cleanup_old_entries();

private:
    using Clock = std::chrono::steady_clock;

    Config config_;
    mutable std::mutex mutex_;

    struct CallerState {
        std::set<std::string> active_requests;
        std::deque<Clock::time_point> submissions;
        Clock::time_point last_seen;
    };

    std::map<std::string, CallerState> callers_;

    void prune_history(CallerState& state, Clock::time_point now);
    QuotaInfo quota_locked(CallerState& state, Clock::time_point now);
};

} // namespace codegate
