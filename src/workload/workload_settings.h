#ifndef VIGIL_WORKLOAD_WORKLOAD_SETTINGS_H_
#define VIGIL_WORKLOAD_WORKLOAD_SETTINGS_H_

#include <chrono>
#include <cstdint>
#include <string>

#include "common/configuration.h"
#include "storage/store_factory.h"
#include "workload_types.h"

namespace Vigil {

// Validated, strongly typed view of VigilConfig.
struct WorkloadSettings {
	StoreOptions store;

	int64_t total_docs = 1000;
	double ops_per_sec = 50.0;
	int workers = 4;
	OperationMix mix;
	ClusterTopology topology = ClusterTopology::REPLICA_SET;
	ZoneSet zones;
	std::chrono::milliseconds acquire_timeout{1000};
	std::chrono::milliseconds error_backoff{50};
	std::chrono::milliseconds shutdown_grace{5000};
	size_t preload_batch_size = 1000;
	bool upsert_on_update = true;
	// Zero runs until signalled
	std::chrono::seconds duration{0};

	struct Heartbeat {
		std::chrono::milliseconds interval{1000};
		int failure_threshold = 3;
		std::chrono::milliseconds timeout{5000};
	} heartbeat;

	struct Reporting {
		std::string error_sink;
		std::string log_level = "INFO";
		std::chrono::seconds report_interval{10};
		std::string results_file;
	} reporting;
};

/**
 * @throws ConfigurationError listing the first invalid option
 */
WorkloadSettings BuildWorkloadSettings(const VigilConfig& config);

} // namespace Vigil

#endif // VIGIL_WORKLOAD_WORKLOAD_SETTINGS_H_
