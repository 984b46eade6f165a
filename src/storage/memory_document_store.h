#ifndef VIGIL_STORAGE_MEMORY_DOCUMENT_STORE_H_
#define VIGIL_STORAGE_MEMORY_DOCUMENT_STORE_H_

#include <array>
#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "document_store.h"
#include "workload/workload_types.h"

namespace Vigil {

struct MemoryStoreOptions {
	std::string name = "default";
	// Reported by DescribeCluster
	ClusterTopology topology = ClusterTopology::REPLICA_SET;
	// Added to every call
	std::chrono::microseconds latency{0};
	// Probability in [0, 1] that a data call fails with a transient UNAVAILABLE
	double failure_rate = 0.0;
};

/**
 * In-process document store keyed by id, split into shards with a
 * reader/writer lock each. Used for tests and memory:// dry runs.
 *
 * A key that carries a location only matches a document stored under the
 * same location, as a zone-targeted query would on a geo-sharded cluster.
 */
class MemoryDocumentStore : public DocumentStore {
public:
	explicit MemoryDocumentStore(MemoryStoreOptions options = MemoryStoreOptions());

	MemoryDocumentStore(const MemoryDocumentStore&) = delete;
	MemoryDocumentStore& operator=(const MemoryDocumentStore&) = delete;

	StorageResult Find(const DocumentKey& key, Document* document, bool* found) override;
	StorageResult Insert(const Document& document) override;
	StorageResult InsertMany(const std::vector<Document>& documents, size_t* inserted) override;
	StorageResult Update(const DocumentKey& key, const UpdateSpec& update) override;
	StorageResult Ping(std::chrono::milliseconds timeout) override;
	StorageResult EstimatedCount(int64_t* count) override;
	StorageResult PrepareCollection(const CollectionLayout& layout) override;
	StorageResult DescribeCluster(ClusterDescription* description) override;

	// Fault injection
	void SetLatency(std::chrono::microseconds latency);
	void SetFailureRate(double rate);
	// An unavailable store fails every call, Ping included.
	void SetAvailable(bool available);

	size_t size() const { return static_cast<size_t>(count_.load(std::memory_order_relaxed)); }
	CollectionLayout layout() const;
	bool prepared() const;

private:
	// Number of shards - power of 2 so the index is a mask
	static const size_t NUM_SHARDS = 64;

	struct Shard {
		absl::flat_hash_map<std::string, Document> data;
		mutable std::shared_mutex mutex;

		Shard() = default;
		Shard(const Shard&) = delete;
		Shard& operator=(const Shard&) = delete;
	};

	inline size_t getShardIndex(const std::string& id) const {
		return std::hash<std::string>{}(id) & (NUM_SHARDS - 1);
	}

	// Applies injected latency and failures shared by every data call.
	StorageResult SimulateCall();
	bool InsertLocked(Shard& shard, const Document& document);

	const std::string name_;
	const ClusterTopology topology_;

	std::array<Shard, NUM_SHARDS> shards_;
	std::atomic<int64_t> count_{0};

	std::atomic<int64_t> latency_us_;
	std::atomic<double> failure_rate_;
	std::atomic<bool> available_{true};

	mutable absl::Mutex layout_mu_;
	CollectionLayout layout_ ABSL_GUARDED_BY(layout_mu_);
	bool prepared_ ABSL_GUARDED_BY(layout_mu_) = false;
};

} // namespace Vigil

#endif // VIGIL_STORAGE_MEMORY_DOCUMENT_STORE_H_
