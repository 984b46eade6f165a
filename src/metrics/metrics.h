#ifndef VIGIL_METRICS_METRICS_H_
#define VIGIL_METRICS_METRICS_H_

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "latency_stats.h"
#include "storage/document_store.h"
#include "workload/workload_types.h"

namespace Vigil {

enum class OperationOutcome {
	SUCCESS,
	// The store returned a non-OK result
	OPERATION_ERROR,
	// The store call threw
	UNEXPECTED_ERROR,
};

const char* OperationOutcomeName(OperationOutcome outcome);

struct OperationEvent {
	int worker_id = -1;
	OperationKind kind = OperationKind::FIND;
	std::string key_id;
	OperationOutcome outcome = OperationOutcome::SUCCESS;
	std::chrono::microseconds duration{0};
	StorageCode code = StorageCode::OK;
	bool transient = false;
	std::string message;
};

/**
 * Counters of one worker. Only the owning worker writes; the aggregator
 * reads concurrently, so every field is a relaxed atomic.
 */
class WorkerStats {
public:
	struct Snapshot {
		std::array<uint64_t, kNumOperationKinds> attempts{};
		std::array<uint64_t, kNumOperationKinds> successes{};
		std::array<uint64_t, kNumOperationKinds> failures{};
		uint64_t unexpected = 0;
		uint64_t acquire_timeouts = 0;

		uint64_t total_attempts() const;
		uint64_t total_successes() const;
		uint64_t total_failures() const;
		Snapshot& operator+=(const Snapshot& other);
	};

	explicit WorkerStats(int worker_id) : worker_id_(worker_id) {}

	void RecordAttempt(OperationKind kind) { Bump(attempts_[KindIndex(kind)]); }
	void RecordOutcome(OperationKind kind, OperationOutcome outcome);
	void RecordAcquireTimeout() { Bump(acquire_timeouts_); }

	Snapshot snapshot() const;
	int worker_id() const { return worker_id_; }

private:
	static void Bump(std::atomic<uint64_t>& counter) {
		counter.store(counter.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
	}

	const int worker_id_;
	std::array<std::atomic<uint64_t>, kNumOperationKinds> attempts_{};
	std::array<std::atomic<uint64_t>, kNumOperationKinds> successes_{};
	std::array<std::atomic<uint64_t>, kNumOperationKinds> failures_{};
	std::atomic<uint64_t> unexpected_{0};
	std::atomic<uint64_t> acquire_timeouts_{0};
};

/**
 * The one metrics object shared by all workers. Owns the per-worker
 * counters and keeps latency samples per kind for the current window.
 */
class MetricsAggregator {
public:
	struct KindWindow {
		uint64_t successes = 0;
		uint64_t failures = 0;
		LatencySampler::Summary latency;
	};

	struct Window {
		double seconds = 0.0;
		uint64_t operations = 0;
		uint64_t unexpected = 0;
		std::array<KindWindow, kNumOperationKinds> kinds{};
		// Samples dropped once the per-window cap was reached
		uint64_t dropped_samples = 0;

		double ops_per_sec() const { return seconds > 0.0 ? operations / seconds : 0.0; }
	};

	explicit MetricsAggregator(size_t max_samples_per_window = max_latency_samples_per_window);

	MetricsAggregator(const MetricsAggregator&) = delete;
	MetricsAggregator& operator=(const MetricsAggregator&) = delete;

	// The returned pointer stays valid for the aggregator's lifetime.
	WorkerStats* RegisterWorker(int worker_id);

	void Record(const OperationEvent& event);
	void RecordGrant() { grants_.fetch_add(1, std::memory_order_relaxed); }

	// Restarts the run clock and the current window at now.
	void MarkStart();

	// Closes the current window and starts a new one.
	Window TakeWindow();

	WorkerStats::Snapshot Totals() const;
	std::vector<WorkerStats::Snapshot> PerWorker() const;
	uint64_t grants() const { return grants_.load(std::memory_order_relaxed); }
	double elapsed_seconds() const;

private:
	std::atomic<uint64_t> grants_{0};

	mutable absl::Mutex mu_;
	std::chrono::steady_clock::time_point started_ ABSL_GUARDED_BY(mu_);
	std::vector<std::unique_ptr<WorkerStats>> workers_ ABSL_GUARDED_BY(mu_);
	// One per operation kind
	std::vector<LatencySampler> samplers_ ABSL_GUARDED_BY(mu_);
	WorkerStats::Snapshot window_base_ ABSL_GUARDED_BY(mu_);
	std::chrono::steady_clock::time_point window_start_ ABSL_GUARDED_BY(mu_);
};

/**
 * Logs one throughput line per interval, then a summary on Stop.
 */
class StatsReporter {
public:
	StatsReporter(MetricsAggregator* metrics, double target_ops_per_sec,
			std::chrono::seconds interval);
	~StatsReporter();

	void Start();
	void Stop();

	// Closes a window and logs it. Also used by Stop for the tail window.
	MetricsAggregator::Window ReportWindow();
	void LogFinalSummary() const;

private:
	void ReportLoop();

	MetricsAggregator* metrics_;
	const double target_ops_per_sec_;
	const std::chrono::seconds interval_;
	std::thread report_thread_;

	absl::Mutex mu_;
	absl::CondVar stop_cv_;
	bool shutdown_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Vigil

#endif // VIGIL_METRICS_METRICS_H_
