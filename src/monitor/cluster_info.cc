#include "cluster_info.h"

#include <sstream>

#include <glog/logging.h>

namespace Vigil {

std::string DescribeTopology(const ClusterDescription& description) {
	const std::string& t = description.topology();
	if (t == "geosharded") return "geosharded (global)";
	if (t.empty()) return "unknown";
	return t;
}

bool TopologyMatches(const ClusterDescription& description, ClusterTopology configured) {
	const std::string& t = description.topology();
	switch (configured) {
		case ClusterTopology::REPLICA_SET:
			return t == "replica_set" || t == "standalone";
		case ClusterTopology::SHARDED:
			// A zoned cluster still hash-shards
			return t == "sharded" || t == "geosharded";
		case ClusterTopology::GEOSHARDED:
			return t == "geosharded";
	}
	return false;
}

bool LogClusterInfo(DocumentStore& store, ClusterTopology configured) {
	ClusterDescription description;
	StorageResult result;
	try {
		result = store.DescribeCluster(&description);
	} catch (const std::exception& e) {
		VLOG(1) << "Cluster description failed: " << e.what();
		return false;
	}
	if (!result.ok()) {
		VLOG(1) << "Cluster description unavailable: " << StorageCodeName(result.code) << " " << result.message;
		return false;
	}

	std::ostringstream line;
	line << "Cluster topology: " << DescribeTopology(description);
	if (!description.replica_set_name().empty()) {
		line << ", replica set " << description.replica_set_name();
	}
	if (description.shards_size() > 0) {
		line << ", shards [";
		for (int i = 0; i < description.shards_size(); ++i) {
			if (i > 0) line << ", ";
			line << description.shards(i);
		}
		line << "]";
	}
	if (description.collection_sharded()) {
		line << ", collection sharded";
	}
	LOG(INFO) << line.str();
	for (const auto& shard : description.collection_shards()) {
		VLOG(1) << "  shard " << shard.name() << ": " << shard.count() << " docs, " << shard.size_bytes() << " bytes";
	}

	if (!TopologyMatches(description, configured)) {
		LOG(WARNING) << "Configured cluster_type " << ClusterTopologyName(configured)
			<< " does not match reported topology " << DescribeTopology(description);
		return false;
	}
	return true;
}

} // namespace Vigil
