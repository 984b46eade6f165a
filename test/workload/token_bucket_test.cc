#include <gtest/gtest.h>
#include "../../src/workload/token_bucket.h"
#include "../../src/common/errors.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace Vigil;
using namespace std::chrono_literals;

namespace {

// Spins worker_count threads acquiring one token at a time for run_for and
// returns the number of grants.
uint64_t DriveBucket(TokenBucket& bucket, int worker_count, std::chrono::milliseconds run_for) {
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> granted{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            while (!stop.load()) {
                if (bucket.Acquire(1.0, 100ms) == AcquireStatus::GRANTED) {
                    granted.fetch_add(1);
                }
            }
        });
    }
    std::this_thread::sleep_for(run_for);
    stop.store(true);
    bucket.Stop();
    for (auto& t : workers) {
        t.join();
    }
    return granted.load();
}

} // namespace

class TokenBucketRateTest : public ::testing::TestWithParam<int> {};

TEST_P(TokenBucketRateTest, ConvergesOnTargetRate) {
    const double rate = 200.0;
    const auto run_for = 10s;
    TokenBucket bucket(rate, TokenBucket::DefaultCapacity(rate));

    uint64_t granted = DriveBucket(bucket, GetParam(), run_for);

    const double expected = rate * 10.0;
    EXPECT_GE(granted, expected * 0.95) << "workers=" << GetParam();
    EXPECT_LE(granted, expected * 1.05) << "workers=" << GetParam();
    EXPECT_EQ(bucket.grants(), granted);
}

INSTANTIATE_TEST_SUITE_P(WorkerCounts, TokenBucketRateTest, ::testing::Values(1, 16));

TEST(TokenBucketTest, NeverOversubscribesUnderContention) {
    const double rate = 500.0;
    const double capacity = 1000.0;
    // The window opens before the bucket exists, so it covers all refill
    const auto start = std::chrono::steady_clock::now();
    // Start full to make the burst part of the bound matter
    TokenBucket bucket(rate, capacity, capacity);

    std::atomic<bool> stop{false};
    std::atomic<bool> violated{false};
    std::vector<std::thread> workers;
    for (int i = 0; i < 32; ++i) {
        workers.emplace_back([&]() {
            while (!stop.load()) {
                bucket.Acquire(1.0, 50ms);
                const double consumed = bucket.consumed_tokens();
                const double elapsed = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start).count();
                if (consumed > capacity + rate * elapsed + 1e-6) {
                    violated.store(true);
                }
            }
        });
    }
    std::this_thread::sleep_for(2s);
    stop.store(true);
    bucket.Stop();
    for (auto& t : workers) {
        t.join();
    }
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_FALSE(violated.load());
    EXPECT_LE(bucket.consumed_tokens(), capacity + rate * elapsed);
    EXPECT_GE(bucket.consumed_tokens(), capacity);
}

TEST(TokenBucketTest, StartsEmpty) {
    TokenBucket bucket(10.0, 10.0);
    EXPECT_FALSE(bucket.TryAcquire());
    EXPECT_LT(bucket.AvailableTokens(), 1.0);
}

TEST(TokenBucketTest, ResetDiscardsAccumulatedBurst) {
    TokenBucket bucket(100.0, 100.0);
    std::this_thread::sleep_for(300ms);
    EXPECT_GT(bucket.AvailableTokens(), 20.0);
    ASSERT_TRUE(bucket.TryAcquire());

    bucket.Reset();
    EXPECT_LT(bucket.AvailableTokens(), 5.0);
    EXPECT_EQ(bucket.grants(), 1u);

    // Refill restarts from the reset point
    std::this_thread::sleep_for(100ms);
    EXPECT_GE(bucket.AvailableTokens(), 5.0);
}

TEST(TokenBucketTest, TokensNeverExceedCapacity) {
    TokenBucket bucket(1000.0, 1000.0, 1000.0);
    std::this_thread::sleep_for(50ms);
    EXPECT_LE(bucket.AvailableTokens(), bucket.capacity());
}

TEST(TokenBucketTest, TimesOutAtDeadline) {
    // One token every 10 seconds
    TokenBucket bucket(0.1, 1.0);
    const auto start = std::chrono::steady_clock::now();
    AcquireStatus status = bucket.Acquire(1.0, 200ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(status, AcquireStatus::TIMEOUT);
    EXPECT_GE(waited, 200ms);
    EXPECT_LT(waited, 1s);
    EXPECT_EQ(bucket.grants(), 0u);
}

TEST(TokenBucketTest, WaitsForRefill) {
    TokenBucket bucket(20.0, 20.0);
    const auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(bucket.Acquire(1.0, 2s), AcquireStatus::GRANTED);
    // One token at 20/s takes about 50ms
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(TokenBucketTest, StopWakesWaiters) {
    TokenBucket bucket(0.1, 1.0);
    std::atomic<int> stopped{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&]() {
            if (bucket.Acquire(1.0, 30s) == AcquireStatus::STOPPED) {
                stopped.fetch_add(1);
            }
        });
    }
    std::this_thread::sleep_for(100ms);
    const auto start = std::chrono::steady_clock::now();
    bucket.Stop();
    for (auto& t : waiters) {
        t.join();
    }
    EXPECT_EQ(stopped.load(), 4);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(bucket.stopped());
    EXPECT_EQ(bucket.Acquire(1.0, 10ms), AcquireStatus::STOPPED);
}

TEST(TokenBucketTest, RejectsRequestLargerThanCapacity) {
    TokenBucket bucket(5.0, 5.0, 5.0);
    EXPECT_EQ(bucket.Acquire(6.0, 10ms), AcquireStatus::EXCEEDS_CAPACITY);
    EXPECT_FALSE(bucket.TryAcquire(6.0));
    EXPECT_EQ(bucket.Acquire(5.0, 10ms), AcquireStatus::GRANTED);
}

TEST(TokenBucketTest, InvalidConstructionThrows) {
    EXPECT_THROW(TokenBucket(0.0, 1.0), ConfigurationError);
    EXPECT_THROW(TokenBucket(-5.0, 1.0), ConfigurationError);
    EXPECT_THROW(TokenBucket(100.0, 50.0), ConfigurationError);
}

TEST(TokenBucketTest, DefaultCapacityIsAtLeastOne) {
    EXPECT_DOUBLE_EQ(TokenBucket::DefaultCapacity(0.5), 1.0);
    EXPECT_DOUBLE_EQ(TokenBucket::DefaultCapacity(250.0), 250.0);
}
