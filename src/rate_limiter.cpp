#include "rate_limiter.h"
#include <iostream>

namespace codegate {

RateLimiter::RateLimiter(const Config& config) : config_(config) {}

void RateLimiter::prune_history(CallerState& state, Clock::time_point now) {
    auto window_start = now - std::chrono::minutes(1);
    while (!state.submissions.empty() && state.submissions.front() < window_start) {
        state.submissions.pop_front();
    }
}

RateLimiter::QuotaInfo RateLimiter::quota_locked(CallerState& state, Clock::time_point now) {
    prune_history(state, now);

    QuotaInfo info;
    info.active_requests = static_cast<int>(state.active_requests.size());
    info.requests_this_minute = static_cast<int>(state.submissions.size());

    if (info.active_requests >= config_.max_concurrent_requests) {
        info.reason = "Too many concurrent requests (max " +
                      std::to_string(config_.max_concurrent_requests) + ")";
    } else if (info.requests_this_minute >= config_.max_requests_per_minute) {
        info.reason = "Too many requests per minute (max " +
                      std::to_string(config_.max_requests_per_minute) + ")";
    } else {
        info.can_submit = true;
    }
    return info;
}

RateLimiter::QuotaInfo RateLimiter::check_quota(const std::string& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto& state = callers_[caller];
    state.last_seen = now;
    return quota_locked(state, now);
}

bool RateLimiter::register_request_start(const std::string& caller, const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto& state = callers_[caller];
    state.last_seen = now;

    if (!quota_locked(state, now).can_submit) {
        return false;
    }
    state.active_requests.insert(request_id);
    state.submissions.push_back(now);
    return true;
}

void RateLimiter::register_request_end(const std::string& caller, const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = callers_.find(caller);
    if (it == callers_.end()) return;
    it->second.active_requests.erase(request_id);
    it->second.last_seen = Clock::now();
}

void RateLimiter::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto idle_limit = std::chrono::minutes(config_.cleanup_after_minutes);

    size_t removed = 0;
    for (auto it = callers_.begin(); it != callers_.end();) {
        if (it->second.active_requests.empty() && now - it->second.last_seen > idle_limit) {
            it = callers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        std::cerr << "[RateLimiter] Cleaned up " << removed << " idle callers" << std::endl;
    }
}

} // namespace codegate
