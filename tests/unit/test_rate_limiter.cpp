#include <gtest/gtest.h>
#include "rate_limiter.h"
#include <thread>
#include <chrono>
#include <vector>

namespace codegate {
namespace {

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        RateLimiter::Config config;
        config.max_concurrent_requests = 2;
        config.max_requests_per_minute = 5;
        config.cleanup_after_minutes = 60;

        limiter = std::make_unique<RateLimiter>(config);
    }

    std::unique_ptr<RateLimiter> limiter;
};

TEST_F(RateLimiterTest, BasicQuotaCheck) {
    auto quota = limiter->check_quota("caller-a");

    EXPECT_TRUE(quota.can_submit);
    EXPECT_EQ(quota.active_requests, 0);
    EXPECT_EQ(quota.requests_this_minute, 0);
    EXPECT_TRUE(quota.reason.empty());
}

TEST_F(RateLimiterTest, ConcurrentLimit) {
    std::string caller = "caller-b";

    EXPECT_TRUE(limiter->register_request_start(caller, "r1"));
    EXPECT_TRUE(limiter->register_request_start(caller, "r2"));

    auto quota = limiter->check_quota(caller);
    EXPECT_EQ(quota.active_requests, 2);
    EXPECT_FALSE(quota.can_submit);
    EXPECT_EQ(quota.reason, "Too many concurrent requests (max 2)");

    // Rejected starts are not recorded
    EXPECT_FALSE(limiter->register_request_start(caller, "r3"));
    EXPECT_EQ(limiter->check_quota(caller).requests_this_minute, 2);
}

TEST_F(RateLimiterTest, RequestEndFreesASlot) {
    std::string caller = "caller-c";
    limiter->register_request_start(caller, "r1");
    limiter->register_request_start(caller, "r2");

    limiter->register_request_end(caller, "r1");

    auto quota = limiter->check_quota(caller);
    EXPECT_EQ(quota.active_requests, 1);
    EXPECT_TRUE(quota.can_submit);
}

TEST_F(RateLimiterTest, PerMinuteLimit) {
    std::string caller = "caller-d";

    for (int i = 0; i < 5; i++) {
        std::string id = "r" + std::to_string(i);
        ASSERT_TRUE(limiter->register_request_start(caller, id));
        limiter->register_request_end(caller, id);
    }

    auto quota = limiter->check_quota(caller);
    EXPECT_EQ(quota.requests_this_minute, 5);
    EXPECT_FALSE(quota.can_submit);
    EXPECT_NE(quota.reason.find("per minute"), std::string::npos);
}

TEST_F(RateLimiterTest, CallersAreIndependent) {
    limiter->register_request_start("busy", "r1");
    limiter->register_request_start("busy", "r2");

    auto quota = limiter->check_quota("idle");
    EXPECT_TRUE(quota.can_submit);
    EXPECT_EQ(quota.active_requests, 0);
}

TEST_F(RateLimiterTest, EndForUnknownCallerIsANoOp) {
    limiter->register_request_end("never-seen", "r1");

    EXPECT_TRUE(limiter->check_quota("never-seen").can_submit);
}

TEST_F(RateLimiterTest, EndForUnknownRequestKeepsOthersActive) {
    limiter->register_request_start("caller-e", "known");

    limiter->register_request_end("caller-e", "unknown");

    EXPECT_EQ(limiter->check_quota("caller-e").active_requests, 1);
}

TEST_F(RateLimiterTest, CleanupPreservesRecentCallers) {
    limiter->register_request_start("caller-f", "active");
    limiter->register_request_start("caller-g", "done");
    limiter->register_request_end("caller-g", "done");

    limiter->cleanup_old_entries();

    EXPECT_EQ(limiter->check_quota("caller-f").active_requests, 1);
    EXPECT_EQ(limiter->check_quota("caller-g").requests_this_minute, 1);
}

TEST_F(RateLimiterTest, ConcurrentAccess) {
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; i++) {
        threads.emplace_back([this, i]() {
            std::string caller = "caller-" + std::to_string(i);
            for (int j = 0; j < 4; j++) {
                std::string id = "r" + std::to_string(j);
                if (limiter->register_request_start(caller, id)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    limiter->register_request_end(caller, id);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < 8; i++) {
        auto quota = limiter->check_quota("caller-" + std::to_string(i));
        EXPECT_EQ(quota.requests_this_minute, 4);
        EXPECT_EQ(quota.active_requests, 0);
    }
}

TEST_F(RateLimiterTest, DefaultConfigUsesConstants) {
    RateLimiter defaults;

    auto quota = defaults.check_quota("anyone");

    EXPECT_TRUE(quota.can_submit);
    for (int i = 0; i < MAX_CONCURRENT_REQUESTS_PER_CALLER; i++) {
        EXPECT_TRUE(defaults.register_request_start("anyone", "r" + std::to_string(i)));
    }
    EXPECT_FALSE(defaults.register_request_start("anyone", "overflow"));
}

}  // namespace
}  // namespace codegate
