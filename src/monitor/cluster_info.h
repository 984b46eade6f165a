#ifndef VIGIL_MONITOR_CLUSTER_INFO_H_
#define VIGIL_MONITOR_CLUSTER_INFO_H_

#include <string>

#include "storage/document_store.h"
#include "workload/workload_types.h"

namespace Vigil {

// Human readable topology, e.g. "geosharded (global)".
std::string DescribeTopology(const ClusterDescription& description);

// True when the reported topology is compatible with the configured one.
bool TopologyMatches(const ClusterDescription& description, ClusterTopology configured);

/**
 * Logs the cluster description reported by the store and warns when it does
 * not match the configured topology. Never fails the caller.
 * @return true if a description was obtained and matches
 */
bool LogClusterInfo(DocumentStore& store, ClusterTopology configured);

} // namespace Vigil

#endif // VIGIL_MONITOR_CLUSTER_INFO_H_
