#ifndef VIGIL_WORKLOAD_KEY_ROUTER_H_
#define VIGIL_WORKLOAD_KEY_ROUTER_H_

#include <atomic>
#include <cstdint>
#include <random>
#include <string>

#include "storage/document_store.h"
#include "workload_types.h"

namespace Vigil {

// splitmix64 finalizer. A bijection on 64-bit values, so distinct inputs
// always produce distinct outputs.
inline uint64_t Mix64(uint64_t x) {
	x += 0x9e3779b97f4a7c15ULL;
	x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
	x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
	return x ^ (x >> 31);
}

/**
 * Builds document keys shaped for the configured cluster topology.
 *
 * Every key is a pure function of its sequence number:
 *  - replica_set: id is the zero padded hex sequence, no location
 *  - sharded: id is the hex of a 64-bit bijective mix of the sequence, so ids
 *    are unique and spread uniformly by the store's hashed shard key
 *  - geosharded: same id as sharded plus a location taken from the zone set
 * Readers and updaters therefore recompute the routing fields from the
 * sequence alone, without a lookup.
 *
 * The sequence counter is the only mutable state and is atomic.
 */
class DocumentKeyRouter {
public:
	/**
	 * @throws ConfigurationError if topology is geosharded and zones is empty
	 */
	DocumentKeyRouter(ClusterTopology topology, ZoneSet zones);

	DocumentKeyRouter(const DocumentKeyRouter&) = delete;
	DocumentKeyRouter& operator=(const DocumentKeyRouter&) = delete;

	DocumentKey BuildKey(int64_t sequence) const;

	// Location for a sequence; empty unless the topology is geosharded.
	std::string LocationFor(int64_t sequence) const;

	// Claims the next unused sequence for an insert.
	int64_t NextInsertSequence();

	/**
	 * Uniform draw from the sequences handed out so far (preloaded plus
	 * inserted). Returns 0 when none exist yet.
	 */
	int64_t RandomExistingSequence(std::mt19937_64& rng) const;

	// Sequences [0, count) are taken to exist; the next insert gets count.
	void SetKnownSequences(int64_t count);
	int64_t known_sequences() const { return next_sequence_.load(std::memory_order_acquire); }

	ClusterTopology topology() const { return topology_; }
	const ZoneSet& zones() const { return zones_; }

private:
	const ClusterTopology topology_;
	const ZoneSet zones_;
	std::atomic<int64_t> next_sequence_{0};
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_KEY_ROUTER_H_
