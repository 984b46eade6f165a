#ifndef VIGIL_STORAGE_STORE_FACTORY_H_
#define VIGIL_STORAGE_STORE_FACTORY_H_

#include <chrono>
#include <memory>
#include <string>

#include "document_store.h"
#include "workload/workload_types.h"

namespace Vigil {

struct StoreOptions {
	// memory://<name>[?latency_ms=N&failure_rate=F] or grpc://host:port
	std::string uri;
	std::string db = "liveness";
	std::string collection = "probe";
	int max_pool_size = 50;
	std::string app_name = "vigil-liveness-monitor";
	std::chrono::milliseconds operation_timeout{10000};
	// Reported by stores that simulate a cluster
	ClusterTopology topology = ClusterTopology::REPLICA_SET;
};

/**
 * Opens the store named by options.uri.
 * @throws ConfigurationError for an empty URI, an unsupported scheme or a
 *         malformed memory:// parameter
 */
std::unique_ptr<DocumentStore> OpenDocumentStore(const StoreOptions& options);

} // namespace Vigil

#endif // VIGIL_STORAGE_STORE_FACTORY_H_
