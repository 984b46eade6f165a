#ifndef VIGIL_WORKLOAD_WORKER_POOL_H_
#define VIGIL_WORKLOAD_WORKER_POOL_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "document_factory.h"
#include "key_router.h"
#include "metrics/error_sink.h"
#include "metrics/metrics.h"
#include "operation_selector.h"
#include "shutdown_signal.h"
#include "storage/document_store.h"
#include "token_bucket.h"

namespace Vigil {

struct WorkerPoolOptions {
	// Bound on one acquisition attempt; a timeout is simply retried
	std::chrono::milliseconds acquire_timeout{acquire_timeout_ms};
	// Pause after a failed operation
	std::chrono::milliseconds error_backoff{error_backoff_ms};
	bool upsert_on_update = true;
	// 0 seeds every worker from std::random_device
	uint64_t seed = 0;
};

struct DrainReport {
	bool drained = true;
	int workers = 0;
	int abandoned = 0;
	std::chrono::milliseconds waited{0};
};

/**
 * Runs N workers against one shared token bucket.
 *
 * Each worker loops: check the shutdown signal, acquire one token, pick an
 * operation kind, build its key, call the store, classify and report the
 * outcome. Operation errors never stop a worker; only the shutdown signal
 * does. Shutdown stops new acquisitions at once and waits up to a grace
 * period for in-flight calls. Workers still running at the deadline are
 * abandoned (detached), so every collaborator is shared with them.
 */
class WorkerPool {
public:
	struct Collaborators {
		std::shared_ptr<TokenBucket> limiter;
		std::shared_ptr<const OperationSelector> selector;
		std::shared_ptr<DocumentKeyRouter> router;
		std::shared_ptr<DocumentStore> store;
		std::shared_ptr<MetricsAggregator> metrics;
		std::shared_ptr<ErrorSink> errors;
	};

	// @throws ConfigurationError if a collaborator is missing
	WorkerPool(Collaborators collaborators, WorkerPoolOptions options = WorkerPoolOptions());
	~WorkerPool();

	WorkerPool(const WorkerPool&) = delete;
	WorkerPool& operator=(const WorkerPool&) = delete;

	/**
	 * Starts worker_count workers and returns. They run until shutdown is
	 * raised, either by the caller or by Shutdown().
	 * @throws ConfigurationError if worker_count < 1
	 * @throws std::logic_error if the pool was already started
	 */
	void Run(int worker_count, std::shared_ptr<ShutdownSignal> shutdown);

	/**
	 * Raises the shutdown signal, stops the limiter and waits up to grace for
	 * every worker to exit. Idempotent; later calls return the first report.
	 */
	DrainReport Shutdown(std::chrono::milliseconds grace);

	int active_workers() const;

private:
	// Everything a worker touches; outlives the pool while abandoned workers run.
	struct Context {
		Collaborators collaborators;
		WorkerPoolOptions options;
		std::shared_ptr<ShutdownSignal> shutdown;

		absl::Mutex mu;
		absl::CondVar exited_cv;
		int active ABSL_GUARDED_BY(mu) = 0;
		std::vector<bool> exited ABSL_GUARDED_BY(mu);
	};

	static void WorkerLoop(std::shared_ptr<Context> ctx, WorkerStats* stats, int worker_id, uint64_t seed);
	static OperationEvent Execute(Context& ctx, OperationKind kind, DocumentFactory& factory, int worker_id);

	std::shared_ptr<Context> ctx_;
	std::vector<std::thread> threads_;
	bool started_ = false;
	bool stopped_ = false;
	DrainReport report_;
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_WORKER_POOL_H_
