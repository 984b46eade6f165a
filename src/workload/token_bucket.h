#ifndef VIGIL_WORKLOAD_TOKEN_BUCKET_H_
#define VIGIL_WORKLOAD_TOKEN_BUCKET_H_

#include <chrono>
#include <cstdint>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace Vigil {

enum class AcquireStatus {
	GRANTED,
	TIMEOUT,
	STOPPED,
	// n is larger than the bucket can ever hold
	EXCEEDS_CAPACITY,
};

const char* AcquireStatusName(AcquireStatus status);

/**
 * Shared token bucket gating every worker of a pool.
 *
 * Refill is lazy: each acquisition attempt adds elapsed * rate tokens, capped
 * at capacity. A caller that finds too few tokens sleeps for the expected
 * refill time and re-checks, since other acquirers may win the race.
 * Acquisition order is not FIFO. All state is guarded by one mutex, so no
 * two acquisitions can spend the same tokens.
 */
class TokenBucket {
public:
	using Clock = std::chrono::steady_clock;

	/**
	 * @param rate_per_sec refill rate, must be positive
	 * @param capacity burst ceiling, must be >= rate_per_sec
	 * @param initial_tokens tokens at construction, clamped to [0, capacity]
	 * @throws ConfigurationError on a non-positive rate or too small capacity
	 */
	TokenBucket(double rate_per_sec, double capacity, double initial_tokens = 0.0);

	// Bucket with capacity max(rate, 1) that starts empty.
	static double DefaultCapacity(double rate_per_sec);

	TokenBucket(const TokenBucket&) = delete;
	TokenBucket& operator=(const TokenBucket&) = delete;

	AcquireStatus Acquire(double n, Clock::time_point deadline);
	AcquireStatus Acquire(double n, Clock::duration timeout) {
		return Acquire(n, Clock::now() + timeout);
	}
	AcquireStatus Acquire() { return Acquire(1.0, Clock::time_point::max()); }

	// Non-blocking variant.
	bool TryAcquire(double n = 1.0);

	// Wakes every waiter; current and later Acquire calls return STOPPED.
	void Stop();
	bool stopped() const;

	// Empties the bucket and restarts refill from now. Totals are kept.
	void Reset();

	// Refills, then reports the current token count.
	double AvailableTokens();

	double rate() const { return rate_; }
	double capacity() const { return capacity_; }

	// Totals since construction
	uint64_t grants() const;
	double consumed_tokens() const;

private:
	void RefillLocked(Clock::time_point now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	const double rate_;
	const double capacity_;

	mutable absl::Mutex mu_;
	absl::CondVar cv_;
	double tokens_ ABSL_GUARDED_BY(mu_);
	Clock::time_point last_refill_ ABSL_GUARDED_BY(mu_);
	bool stopped_ ABSL_GUARDED_BY(mu_) = false;
	uint64_t grants_ ABSL_GUARDED_BY(mu_) = 0;
	double consumed_ ABSL_GUARDED_BY(mu_) = 0.0;
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_TOKEN_BUCKET_H_
