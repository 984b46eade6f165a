#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <document_store.pb.h>

namespace Vigil {

using vigil::storage::ClusterDescription;
using vigil::storage::CollectionLayout;
using vigil::storage::Document;
using vigil::storage::DocumentKey;
using vigil::storage::UpdateSpec;

// Note: keep in sync with StorageCodeName() and the gRPC status mapping.
enum class StorageCode : uint32_t {
	OK,
	NOT_FOUND,
	TIMEOUT,
	UNAVAILABLE,
	REJECTED,
	INTERNAL,
};

const char* StorageCodeName(StorageCode code);

/**
 * Outcome of a single storage call. transient is a hint from the client
 * that retrying the same call later may succeed.
 */
struct StorageResult {
	StorageCode code = StorageCode::OK;
	bool transient = false;
	std::string message;

	bool ok() const { return code == StorageCode::OK; }

	static StorageResult Ok() { return StorageResult{}; }
	static StorageResult Error(StorageCode code, bool transient, std::string message) {
		return StorageResult{code, transient, std::move(message)};
	}
};

/**
 * Storage collaborator used by the workload engine. Connection management,
 * pooling, retries and the wire protocol live behind this interface.
 * Implementations must be safe to call from many workers at once.
 */
class DocumentStore {
public:
	virtual ~DocumentStore() = default;

	// A miss is not an error: returns OK with *found == false.
	virtual StorageResult Find(const DocumentKey& key, Document* document, bool* found) = 0;
	virtual StorageResult Insert(const Document& document) = 0;
	// Unordered bulk insert; *inserted receives the number written even on partial failure.
	virtual StorageResult InsertMany(const std::vector<Document>& documents, size_t* inserted) = 0;
	// NOT_FOUND when the key matches nothing and update.upsert() is false.
	virtual StorageResult Update(const DocumentKey& key, const UpdateSpec& update) = 0;
	// Lightweight round trip used by the heartbeat.
	virtual StorageResult Ping(std::chrono::milliseconds timeout) = 0;
	virtual StorageResult EstimatedCount(int64_t* count) = 0;
	// Best effort index and shard key setup.
	virtual StorageResult PrepareCollection(const CollectionLayout& layout) = 0;
	virtual StorageResult DescribeCluster(ClusterDescription* description) = 0;
};

} // namespace Vigil
