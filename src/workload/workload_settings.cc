#include "workload_settings.h"

#include <cmath>

#include "common/errors.h"

namespace Vigil {

namespace {

void RequirePositive(int64_t value, const char* name) {
	if (value <= 0) {
		throw ConfigurationError(std::string(name) + " must be positive, got " + std::to_string(value));
	}
}

} // namespace

WorkloadSettings BuildWorkloadSettings(const VigilConfig& config) {
	WorkloadSettings s;

	s.store.uri = config.storage.uri.get();
	if (s.store.uri.empty()) {
		throw ConfigurationError("--uri or VIGIL_URI must be provided");
	}
	s.store.db = config.storage.db.get();
	s.store.collection = config.storage.collection.get();
	if (s.store.db.empty() || s.store.collection.empty()) {
		throw ConfigurationError("Database and collection names must not be empty");
	}
	s.store.max_pool_size = config.storage.max_pool_size.get();
	RequirePositive(s.store.max_pool_size, "max_pool_size");
	s.store.app_name = config.storage.app_name.get();
	s.store.operation_timeout = std::chrono::milliseconds(config.storage.operation_timeout_ms.get());
	RequirePositive(s.store.operation_timeout.count(), "operation_timeout_ms");

	const auto& w = config.workload;
	s.total_docs = static_cast<int64_t>(w.total_docs.get());
	s.ops_per_sec = w.ops_per_sec.get();
	if (!(s.ops_per_sec > 0.0) || !std::isfinite(s.ops_per_sec)) {
		throw ConfigurationError("ops_per_sec must be positive, got " + std::to_string(s.ops_per_sec));
	}
	s.workers = w.workers.get();
	if (s.workers < 1) {
		throw ConfigurationError("workers must be at least 1, got " + std::to_string(s.workers));
	}
	s.mix = ParseOperationMix(w.op_mix.get());
	s.topology = ParseClusterTopology(w.cluster_type.get());
	s.store.topology = s.topology;
	s.zones = ParseZoneSet(w.zones.get());
	if (s.topology == ClusterTopology::GEOSHARDED && s.zones.empty()) {
		throw ConfigurationError("geosharded topology requires at least one zone");
	}
	s.acquire_timeout = std::chrono::milliseconds(w.acquire_timeout_ms.get());
	RequirePositive(s.acquire_timeout.count(), "acquire_timeout_ms");
	s.error_backoff = std::chrono::milliseconds(w.error_backoff_ms.get());
	if (s.error_backoff.count() < 0) {
		throw ConfigurationError("error_backoff_ms must not be negative");
	}
	s.shutdown_grace = std::chrono::milliseconds(w.shutdown_grace_ms.get());
	if (s.shutdown_grace.count() < 0) {
		throw ConfigurationError("shutdown_grace_ms must not be negative");
	}
	s.preload_batch_size = w.preload_batch_size.get();
	RequirePositive(static_cast<int64_t>(s.preload_batch_size), "preload_batch_size");
	s.upsert_on_update = w.upsert_on_update.get();
	s.duration = std::chrono::seconds(w.duration_sec.get());
	if (s.duration.count() < 0) {
		throw ConfigurationError("duration_sec must not be negative");
	}

	const auto& h = config.heartbeat;
	s.heartbeat.interval = std::chrono::milliseconds(h.interval_ms.get());
	RequirePositive(s.heartbeat.interval.count(), "heartbeat interval_ms");
	s.heartbeat.failure_threshold = h.failure_threshold.get();
	RequirePositive(s.heartbeat.failure_threshold, "heartbeat failure_threshold");
	s.heartbeat.timeout = std::chrono::milliseconds(h.timeout_ms.get());
	RequirePositive(s.heartbeat.timeout.count(), "heartbeat timeout_ms");

	const auto& r = config.reporting;
	s.reporting.error_sink = r.error_sink.get();
	s.reporting.log_level = r.log_level.get();
	s.reporting.report_interval = std::chrono::seconds(r.report_interval_sec.get());
	if (s.reporting.report_interval.count() < 0) {
		throw ConfigurationError("report_interval_sec must not be negative");
	}
	s.reporting.results_file = r.results_file.get();
	return s;
}

} // namespace Vigil
