#include "token_bucket.h"

#include <algorithm>
#include <cmath>
#include <string>

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/errors.h"

namespace Vigil {

namespace {
// Lower bound on a single sleep so a waiter a hair short of a token does not spin.
constexpr std::chrono::microseconds kMinWait(100);
}

const char* AcquireStatusName(AcquireStatus status) {
	switch (status) {
		case AcquireStatus::GRANTED:
			return "granted";
		case AcquireStatus::TIMEOUT:
			return "timeout";
		case AcquireStatus::STOPPED:
			return "stopped";
		case AcquireStatus::EXCEEDS_CAPACITY:
			return "exceeds_capacity";
	}
	return "unknown";
}

TokenBucket::TokenBucket(double rate_per_sec, double capacity, double initial_tokens)
	: rate_(rate_per_sec), capacity_(capacity) {
	if (!(rate_per_sec > 0.0) || !std::isfinite(rate_per_sec)) {
		throw ConfigurationError("Token bucket rate must be positive, got " + std::to_string(rate_per_sec));
	}
	if (!(capacity >= rate_per_sec) || !std::isfinite(capacity)) {
		throw ConfigurationError("Token bucket capacity " + std::to_string(capacity) +
				" must be at least the rate " + std::to_string(rate_per_sec));
	}
	absl::MutexLock lock(&mu_);
	tokens_ = std::clamp(initial_tokens, 0.0, capacity_);
	last_refill_ = Clock::now();
}

double TokenBucket::DefaultCapacity(double rate_per_sec) {
	return std::max(rate_per_sec, 1.0);
}

void TokenBucket::RefillLocked(Clock::time_point now) {
	if (now <= last_refill_) {
		return;
	}
	const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
	tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
	last_refill_ = now;
}

AcquireStatus TokenBucket::Acquire(double n, Clock::time_point deadline) {
	if (n > capacity_) {
		LOG(ERROR) << "Requested " << n << " tokens from a bucket of capacity " << capacity_;
		return AcquireStatus::EXCEEDS_CAPACITY;
	}

	absl::MutexLock lock(&mu_);
	while (true) {
		if (stopped_) {
			return AcquireStatus::STOPPED;
		}
		const Clock::time_point now = Clock::now();
		RefillLocked(now);
		if (tokens_ >= n) {
			tokens_ -= n;
			consumed_ += n;
			++grants_;
			return AcquireStatus::GRANTED;
		}
		if (now >= deadline) {
			return AcquireStatus::TIMEOUT;
		}

		// Sleep until enough tokens are expected, but never past the deadline
		auto need = std::chrono::duration_cast<Clock::duration>(
				std::chrono::duration<double>((n - tokens_) / rate_));
		need = std::max<Clock::duration>(need, kMinWait);
		if (deadline - now < need) {
			need = deadline - now;
		}
		cv_.WaitWithTimeout(&mu_, absl::FromChrono(need));
	}
}

bool TokenBucket::TryAcquire(double n) {
	absl::MutexLock lock(&mu_);
	if (stopped_ || n > capacity_) {
		return false;
	}
	RefillLocked(Clock::now());
	if (tokens_ >= n) {
		tokens_ -= n;
		consumed_ += n;
		++grants_;
		return true;
	}
	return false;
}

void TokenBucket::Stop() {
	absl::MutexLock lock(&mu_);
	stopped_ = true;
	cv_.SignalAll();
}

bool TokenBucket::stopped() const {
	absl::MutexLock lock(&mu_);
	return stopped_;
}

void TokenBucket::Reset() {
	absl::MutexLock lock(&mu_);
	tokens_ = 0.0;
	last_refill_ = Clock::now();
}

double TokenBucket::AvailableTokens() {
	absl::MutexLock lock(&mu_);
	RefillLocked(Clock::now());
	return tokens_;
}

uint64_t TokenBucket::grants() const {
	absl::MutexLock lock(&mu_);
	return grants_;
}

double TokenBucket::consumed_tokens() const {
	absl::MutexLock lock(&mu_);
	return consumed_;
}

} // namespace Vigil
