#ifndef VIGIL_WORKLOAD_WORKLOAD_RUNNER_H_
#define VIGIL_WORKLOAD_WORKLOAD_RUNNER_H_

#include <chrono>
#include <memory>

#include "metrics/error_sink.h"
#include "metrics/metrics.h"
#include "metrics/result_writer.h"
#include "monitor/heartbeat_monitor.h"
#include "storage/document_store.h"
#include "worker_pool.h"
#include "workload_settings.h"

namespace Vigil {

/**
 * Owns one run: collection preparation and preload, the heartbeat, the
 * worker pool and the periodic reporter.
 */
class WorkloadRunner {
public:
	/**
	 * @throws ConfigurationError if the settings cannot build a limiter,
	 *         selector, router or heartbeat
	 */
	WorkloadRunner(const WorkloadSettings& settings, std::shared_ptr<DocumentStore> store,
			std::shared_ptr<ErrorSink> errors);
	~WorkloadRunner();

	WorkloadRunner(const WorkloadRunner&) = delete;
	WorkloadRunner& operator=(const WorkloadRunner&) = delete;

	// Prepare, preload, then start heartbeat, workers and reporter.
	void Start();

	// Drains the workers and stops everything else. Idempotent.
	RunSummary Stop();

	// Index on k plus the shard key for the topology.
	static CollectionLayout LayoutFor(ClusterTopology topology);

	// Best effort; failures are logged and reported.
	void PrepareCollection();

	/**
	 * Tops the collection up to total_docs and seeds the router.
	 * @return the number of sequences known to exist afterwards
	 */
	int64_t Preload();

	const HeartbeatMonitor& heartbeat() const { return heartbeat_; }
	MetricsAggregator& metrics() { return *metrics_; }
	const DocumentKeyRouter& router() const { return *router_; }

private:
	void OnHealthTransition(const HealthTransition& transition);

	const WorkloadSettings settings_;
	std::shared_ptr<DocumentStore> store_;
	std::shared_ptr<ErrorSink> errors_;

	std::shared_ptr<TokenBucket> limiter_;
	std::shared_ptr<const OperationSelector> selector_;
	std::shared_ptr<DocumentKeyRouter> router_;
	std::shared_ptr<MetricsAggregator> metrics_;
	std::shared_ptr<ShutdownSignal> shutdown_;

	HeartbeatMonitor heartbeat_;
	std::unique_ptr<WorkerPool> pool_;
	std::unique_ptr<StatsReporter> reporter_;

	std::chrono::steady_clock::time_point started_at_;
	bool running_ = false;
	bool stopped_ = false;
	RunSummary summary_;
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_WORKLOAD_RUNNER_H_
