#ifndef VIGIL_WORKLOAD_SHUTDOWN_SIGNAL_H_
#define VIGIL_WORKLOAD_SHUTDOWN_SIGNAL_H_

#include <atomic>
#include <chrono>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace Vigil {

// One-shot cancellation flag shared by the dispatcher and its workers.
class ShutdownSignal {
public:
	void Raise() {
		absl::MutexLock lock(&mu_);
		raised_.store(true, std::memory_order_release);
		cv_.SignalAll();
	}

	bool raised() const { return raised_.load(std::memory_order_acquire); }

	// Sleeps up to timeout. Returns true if the signal was raised.
	bool WaitFor(std::chrono::milliseconds timeout) {
		const absl::Time deadline = absl::Now() + absl::FromChrono(timeout);
		absl::MutexLock lock(&mu_);
		while (!raised()) {
			if (cv_.WaitWithDeadline(&mu_, deadline)) {
				break;
			}
		}
		return raised();
	}

private:
	absl::Mutex mu_;
	absl::CondVar cv_;
	std::atomic<bool> raised_{false};
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_SHUTDOWN_SIGNAL_H_
