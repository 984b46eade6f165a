#include "workload_runner.h"

#include <algorithm>
#include <random>

#include <glog/logging.h>

namespace Vigil {

namespace {

vigil::storage::IndexSpec Index(const std::string& field, bool hashed) {
	vigil::storage::IndexSpec spec;
	spec.set_field(field);
	spec.set_hashed(hashed);
	return spec;
}

} // namespace

WorkloadRunner::WorkloadRunner(const WorkloadSettings& settings, std::shared_ptr<DocumentStore> store,
		std::shared_ptr<ErrorSink> errors)
	: settings_(settings),
	  store_(std::move(store)),
	  errors_(errors ? std::move(errors) : std::make_shared<LogErrorSink>()),
	  limiter_(std::make_shared<TokenBucket>(settings.ops_per_sec,
			  TokenBucket::DefaultCapacity(settings.ops_per_sec))),
	  selector_(std::make_shared<OperationSelector>(settings.mix)),
	  router_(std::make_shared<DocumentKeyRouter>(settings.topology, settings.zones)),
	  metrics_(std::make_shared<MetricsAggregator>()),
	  shutdown_(std::make_shared<ShutdownSignal>()),
	  heartbeat_(settings.heartbeat.failure_threshold) {
	WorkerPoolOptions options;
	options.acquire_timeout = settings_.acquire_timeout;
	options.error_backoff = settings_.error_backoff;
	options.upsert_on_update = settings_.upsert_on_update;
	pool_ = std::make_unique<WorkerPool>(
			WorkerPool::Collaborators{limiter_, selector_, router_, store_, metrics_, errors_}, options);
	reporter_ = std::make_unique<StatsReporter>(metrics_.get(), settings_.ops_per_sec,
			settings_.reporting.report_interval);
	heartbeat_.SetTransitionListener([this](const HealthTransition& t) { OnHealthTransition(t); });
}

WorkloadRunner::~WorkloadRunner() {
	if (running_) {
		Stop();
	}
}

CollectionLayout WorkloadRunner::LayoutFor(ClusterTopology topology) {
	CollectionLayout layout;
	*layout.add_indexes() = Index("k", false);
	switch (topology) {
		case ClusterTopology::REPLICA_SET:
			break;
		case ClusterTopology::SHARDED:
			*layout.add_shard_key() = Index("_id", true);
			break;
		case ClusterTopology::GEOSHARDED:
			*layout.add_shard_key() = Index("location", false);
			*layout.add_shard_key() = Index("_id", true);
			break;
	}
	return layout;
}

void WorkloadRunner::PrepareCollection() {
	StorageResult result;
	try {
		result = store_->PrepareCollection(LayoutFor(settings_.topology));
	} catch (const std::exception& e) {
		result = StorageResult::Error(StorageCode::INTERNAL, false, e.what());
	}
	if (result.ok()) {
		VLOG(1) << "Collection " << settings_.store.db << "." << settings_.store.collection << " prepared for "
			<< ClusterTopologyName(settings_.topology);
		return;
	}
	LOG(WARNING) << "Collection preparation failed, continuing: " << result.message;
	errors_->Report(ErrorEvent{"prepare", std::nullopt, "", StorageCodeName(result.code), result.message, -1});
}

int64_t WorkloadRunner::Preload() {
	const int64_t target = std::max<int64_t>(0, settings_.total_docs);
	int64_t existing = 0;
	StorageResult count = store_->EstimatedCount(&existing);
	if (!count.ok()) {
		LOG(WARNING) << "Could not read collection size: " << count.message;
		errors_->Report(ErrorEvent{"preload", std::nullopt, "", StorageCodeName(count.code), count.message, -1});
		existing = 0;
	}

	// The router hands out sequences above everything that may already exist
	router_->SetKnownSequences(std::max(existing, target));

	const int64_t to_insert = target - existing;
	if (to_insert <= 0) {
		LOG(INFO) << "Dataset already sized: existing=" << existing << " target=" << target;
		return router_->known_sequences();
	}
	LOG(INFO) << "Preloading dataset: inserting " << to_insert << " docs (existing=" << existing
		<< " target=" << target << ")";

	DocumentFactory factory(router_.get(), std::random_device{}());
	std::vector<Document> batch;
	batch.reserve(settings_.preload_batch_size);
	int64_t inserted_total = 0;
	size_t failed_batches = 0;

	auto flush = [&]() {
		size_t inserted = 0;
		StorageResult r;
		try {
			r = store_->InsertMany(batch, &inserted);
		} catch (const std::exception& e) {
			r = StorageResult::Error(StorageCode::INTERNAL, false, e.what());
		}
		inserted_total += static_cast<int64_t>(inserted);
		if (!r.ok()) {
			++failed_batches;
			LOG(WARNING) << "Preload batch failed (" << inserted << "/" << batch.size() << " inserted): " << r.message;
			errors_->Report(ErrorEvent{"preload", OperationKind::INSERT, "", StorageCodeName(r.code), r.message, -1});
		}
		batch.clear();
	};

	for (int64_t i = 0; i < to_insert; ++i) {
		if (shutdown_->raised()) {
			break;
		}
		batch.push_back(factory.Make(existing + i));
		if (batch.size() >= settings_.preload_batch_size) {
			flush();
			VLOG(1) << "Preloaded " << inserted_total << "/" << to_insert;
		}
	}
	if (!batch.empty()) {
		flush();
	}

	if (failed_batches > 0) {
		LOG(WARNING) << "Preload finished with " << failed_batches << " failed batches; inserted "
			<< inserted_total << " of " << to_insert;
	} else {
		LOG(INFO) << "Preload complete: " << inserted_total << " docs";
	}
	return router_->known_sequences();
}

void WorkloadRunner::OnHealthTransition(const HealthTransition& t) {
	if (t.to == HealthState::DEGRADED) {
		LOG(ERROR) << "Connectivity degraded after " << t.consecutive_failures
			<< " consecutive heartbeat failures: " << t.error;
		errors_->Report(ErrorEvent{"heartbeat", std::nullopt, "", "DEGRADED",
				"connectivity degraded: " + t.error, -1});
	} else {
		LOG(INFO) << "Connectivity recovered";
		errors_->Report(ErrorEvent{"heartbeat", std::nullopt, "", "RECOVERED", "connectivity recovered", -1});
	}
}

void WorkloadRunner::Start() {
	if (running_ || stopped_) {
		return;
	}
	LOG(INFO) << "Workload: " << settings_.workers << " workers, " << settings_.ops_per_sec
		<< " ops/s, mix " << settings_.mix.ToString() << ", topology " << ClusterTopologyName(settings_.topology);

	PrepareCollection();
	Preload();

	std::shared_ptr<DocumentStore> store = store_;
	const std::chrono::milliseconds timeout = settings_.heartbeat.timeout;
	heartbeat_.Start(settings_.heartbeat.interval, [store, timeout]() { return store->Ping(timeout); });

	// Preload time counts toward neither the rate budget nor the measured run
	limiter_->Reset();
	metrics_->MarkStart();
	started_at_ = std::chrono::steady_clock::now();
	pool_->Run(settings_.workers, shutdown_);
	reporter_->Start();
	running_ = true;
}

RunSummary WorkloadRunner::Stop() {
	if (stopped_) {
		return summary_;
	}
	stopped_ = true;
	running_ = false;

	LOG(INFO) << "Stopping workload";
	shutdown_->Raise();
	DrainReport drain = pool_->Shutdown(settings_.shutdown_grace);
	heartbeat_.Stop();
	reporter_->Stop();
	reporter_->ReportWindow();
	reporter_->LogFinalSummary();

	const WorkerStats::Snapshot totals = metrics_->Totals();
	const double elapsed = started_at_.time_since_epoch().count() == 0 ? 0.0
		: std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
	summary_.topology = ClusterTopologyName(settings_.topology);
	summary_.target_ops_per_sec = settings_.ops_per_sec;
	summary_.workers = settings_.workers;
	summary_.duration_sec = elapsed;
	const uint64_t completed = totals.total_successes() + totals.total_failures();
	summary_.achieved_ops_per_sec = elapsed > 0.0 ? completed / elapsed : 0.0;
	summary_.successes = totals.successes;
	summary_.failures = totals.failures;
	summary_.unexpected = totals.unexpected;
	summary_.drained = drain.drained;
	summary_.abandoned_workers = drain.abandoned;
	return summary_;
}

} // namespace Vigil
