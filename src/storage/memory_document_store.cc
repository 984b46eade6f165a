#include "memory_document_store.h"

#include <algorithm>
#include <mutex>
#include <random>
#include <thread>

#include <glog/logging.h>

namespace Vigil {

namespace {

std::mt19937_64& ThreadRng() {
	thread_local std::mt19937_64 rng(std::random_device{}());
	return rng;
}

bool LocationMatches(const DocumentKey& key, const Document& doc) {
	if (!key.has_location()) {
		return true;
	}
	return doc.has_location() && doc.location() == key.location();
}

} // namespace

MemoryDocumentStore::MemoryDocumentStore(MemoryStoreOptions options)
	: name_(std::move(options.name)),
	  topology_(options.topology),
	  latency_us_(options.latency.count()),
	  failure_rate_(std::clamp(options.failure_rate, 0.0, 1.0)) {
	VLOG(1) << "Memory document store '" << name_ << "' created as " << ClusterTopologyName(topology_);
}

void MemoryDocumentStore::SetLatency(std::chrono::microseconds latency) {
	latency_us_.store(latency.count(), std::memory_order_relaxed);
}

void MemoryDocumentStore::SetFailureRate(double rate) {
	failure_rate_.store(std::clamp(rate, 0.0, 1.0), std::memory_order_relaxed);
}

void MemoryDocumentStore::SetAvailable(bool available) {
	available_.store(available, std::memory_order_relaxed);
}

StorageResult MemoryDocumentStore::SimulateCall() {
	const int64_t latency_us = latency_us_.load(std::memory_order_relaxed);
	if (latency_us > 0) {
		std::this_thread::sleep_for(std::chrono::microseconds(latency_us));
	}
	if (!available_.load(std::memory_order_relaxed)) {
		return StorageResult::Error(StorageCode::UNAVAILABLE, true, "store '" + name_ + "' is unavailable");
	}
	const double rate = failure_rate_.load(std::memory_order_relaxed);
	if (rate > 0.0) {
		std::uniform_real_distribution<double> uniform(0.0, 1.0);
		if (uniform(ThreadRng()) < rate) {
			return StorageResult::Error(StorageCode::UNAVAILABLE, true, "injected failure");
		}
	}
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::Find(const DocumentKey& key, Document* document, bool* found) {
	*found = false;
	StorageResult sim = SimulateCall();
	if (!sim.ok()) {
		return sim;
	}
	Shard& shard = shards_[getShardIndex(key.id())];
	std::shared_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.data.find(key.id());
	if (it != shard.data.end() && LocationMatches(key, it->second)) {
		*found = true;
		if (document != nullptr) {
			*document = it->second;
		}
	}
	return StorageResult::Ok();
}

bool MemoryDocumentStore::InsertLocked(Shard& shard, const Document& document) {
	auto [it, inserted] = shard.data.try_emplace(document.id(), document);
	if (inserted) {
		count_.fetch_add(1, std::memory_order_relaxed);
	}
	return inserted;
}

StorageResult MemoryDocumentStore::Insert(const Document& document) {
	StorageResult sim = SimulateCall();
	if (!sim.ok()) {
		return sim;
	}
	if (document.id().empty()) {
		return StorageResult::Error(StorageCode::REJECTED, false, "document without id");
	}
	Shard& shard = shards_[getShardIndex(document.id())];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	if (!InsertLocked(shard, document)) {
		return StorageResult::Error(StorageCode::REJECTED, false, "duplicate id " + document.id());
	}
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::InsertMany(const std::vector<Document>& documents, size_t* inserted) {
	*inserted = 0;
	StorageResult sim = SimulateCall();
	if (!sim.ok()) {
		return sim;
	}

	// Group by shard to take each lock once
	absl::flat_hash_map<size_t, std::vector<const Document*>> by_shard;
	for (const Document& doc : documents) {
		by_shard[getShardIndex(doc.id())].push_back(&doc);
	}

	// Unordered: a rejected document does not stop the rest
	size_t rejected = 0;
	for (const auto& [index, docs] : by_shard) {
		std::unique_lock<std::shared_mutex> lock(shards_[index].mutex);
		for (const Document* doc : docs) {
			if (!doc->id().empty() && InsertLocked(shards_[index], *doc)) {
				++(*inserted);
			} else {
				++rejected;
			}
		}
	}
	if (rejected > 0) {
		return StorageResult::Error(StorageCode::REJECTED, false,
				std::to_string(rejected) + " of " + std::to_string(documents.size()) + " documents rejected");
	}
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::Update(const DocumentKey& key, const UpdateSpec& update) {
	StorageResult sim = SimulateCall();
	if (!sim.ok()) {
		return sim;
	}
	Shard& shard = shards_[getShardIndex(key.id())];
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.data.find(key.id());
	if (it != shard.data.end()) {
		if (!LocationMatches(key, it->second)) {
			// Same id under another zone; an upsert would collide on the id
			return update.upsert()
				? StorageResult::Error(StorageCode::REJECTED, false, "id " + key.id() + " exists in another location")
				: StorageResult::Error(StorageCode::NOT_FOUND, false, "no document " + key.id());
		}
		Document& doc = it->second;
		doc.set_n(doc.n() + update.inc_n());
		doc.set_ts(update.set_ts());
		return StorageResult::Ok();
	}
	if (!update.upsert()) {
		return StorageResult::Error(StorageCode::NOT_FOUND, false, "no document " + key.id());
	}

	Document doc;
	doc.set_id(key.id());
	doc.set_k(key.k());
	if (key.has_location()) {
		doc.set_location(key.location());
	}
	doc.set_n(update.inc_n());
	doc.set_ts(update.set_ts());
	InsertLocked(shard, doc);
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::Ping(std::chrono::milliseconds timeout) {
	const auto latency = std::chrono::microseconds(latency_us_.load(std::memory_order_relaxed));
	if (latency > timeout) {
		std::this_thread::sleep_for(timeout);
		return StorageResult::Error(StorageCode::TIMEOUT, true, "ping timed out");
	}
	if (latency.count() > 0) {
		std::this_thread::sleep_for(latency);
	}
	if (!available_.load(std::memory_order_relaxed)) {
		return StorageResult::Error(StorageCode::UNAVAILABLE, true, "store '" + name_ + "' is unavailable");
	}
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::EstimatedCount(int64_t* count) {
	*count = 0;
	if (!available_.load(std::memory_order_relaxed)) {
		return StorageResult::Error(StorageCode::UNAVAILABLE, true, "store '" + name_ + "' is unavailable");
	}
	*count = count_.load(std::memory_order_relaxed);
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::PrepareCollection(const CollectionLayout& layout) {
	if (!available_.load(std::memory_order_relaxed)) {
		return StorageResult::Error(StorageCode::UNAVAILABLE, true, "store '" + name_ + "' is unavailable");
	}
	absl::MutexLock lock(&layout_mu_);
	layout_ = layout;
	prepared_ = true;
	return StorageResult::Ok();
}

StorageResult MemoryDocumentStore::DescribeCluster(ClusterDescription* description) {
	description->Clear();
	description->set_topology(ClusterTopologyName(topology_));
	if (topology_ == ClusterTopology::REPLICA_SET) {
		description->set_replica_set_name(name_);
	} else {
		for (int i = 0; i < 3; ++i) {
			description->add_shards(name_ + "-shard-" + std::to_string(i));
		}
	}
	absl::MutexLock lock(&layout_mu_);
	description->set_collection_sharded(prepared_ && layout_.shard_key_size() > 0);
	return StorageResult::Ok();
}

CollectionLayout MemoryDocumentStore::layout() const {
	absl::MutexLock lock(&layout_mu_);
	return layout_;
}

bool MemoryDocumentStore::prepared() const {
	absl::MutexLock lock(&layout_mu_);
	return prepared_;
}

} // namespace Vigil
