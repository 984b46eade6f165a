#ifndef VIGIL_MONITOR_HEARTBEAT_MONITOR_H_
#define VIGIL_MONITOR_HEARTBEAT_MONITOR_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "storage/document_store.h"

namespace Vigil {

enum class HealthState {
	HEALTHY,
	DEGRADED,
};

const char* HealthStateName(HealthState state);

struct HeartbeatState {
	HealthState health = HealthState::HEALTHY;
	int consecutive_failures = 0;
	std::optional<std::chrono::steady_clock::time_point> last_success;
	uint64_t probes = 0;
	uint64_t failures = 0;
	std::string last_error;
};

struct HealthTransition {
	HealthState from;
	HealthState to;
	int consecutive_failures;
	// Error of the probe that caused the transition; empty on recovery
	std::string error;
};

/**
 * Periodic connectivity probe, independent of the workload rate limiter.
 *
 * A success resets the consecutive failure count and marks the connection
 * healthy. The failure that brings the count to failure_threshold marks it
 * degraded. The listener fires once per change of health, on the probing
 * thread, never while the state lock is held.
 */
class HeartbeatMonitor {
public:
	using Probe = std::function<StorageResult()>;
	using TransitionListener = std::function<void(const HealthTransition&)>;

	/**
	 * @throws ConfigurationError if failure_threshold < 1
	 */
	explicit HeartbeatMonitor(int failure_threshold);
	~HeartbeatMonitor();

	HeartbeatMonitor(const HeartbeatMonitor&) = delete;
	HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

	// Must be set before Start.
	void SetTransitionListener(TransitionListener listener);

	/**
	 * Probes immediately, then every interval until Stop.
	 * @throws ConfigurationError for a non-positive interval or empty probe
	 * @throws std::logic_error if already running
	 */
	void Start(std::chrono::milliseconds interval, Probe probe);

	// Cancels future probes. A probe already in flight completes first.
	void Stop();

	/**
	 * Runs one probe on the calling thread and records its outcome.
	 * An exception from the probe counts as a failure.
	 * @return true if the probe succeeded
	 */
	bool ProbeOnce(const Probe& probe);

	HeartbeatState state() const;
	bool healthy() const;
	int failure_threshold() const { return failure_threshold_; }

private:
	void ProbeLoop(std::chrono::milliseconds interval);
	void RecordOutcome(bool ok, const std::string& error);

	const int failure_threshold_;
	TransitionListener listener_;
	Probe probe_;
	std::thread heartbeat_thread_;

	mutable absl::Mutex mu_;
	absl::CondVar stop_cv_;
	bool shutdown_ ABSL_GUARDED_BY(mu_) = false;
	HeartbeatState state_ ABSL_GUARDED_BY(mu_);
};

} // namespace Vigil

#endif // VIGIL_MONITOR_HEARTBEAT_MONITOR_H_
