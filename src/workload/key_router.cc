#include "key_router.h"

#include <cstdio>

#include "common/errors.h"

namespace Vigil {

namespace {
// Decorrelates zone choice from the id bits
constexpr uint64_t kZoneSalt = 0x5a6f6e65ULL;

std::string Hex64(uint64_t value) {
	char buf[17];
	std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
	return std::string(buf);
}
} // namespace

DocumentKeyRouter::DocumentKeyRouter(ClusterTopology topology, ZoneSet zones)
	: topology_(topology), zones_(std::move(zones)) {
	if (topology_ == ClusterTopology::GEOSHARDED && zones_.empty()) {
		throw ConfigurationError("geosharded topology requires a non-empty zone set");
	}
}

DocumentKey DocumentKeyRouter::BuildKey(int64_t sequence) const {
	DocumentKey key;
	key.set_k(sequence);
	const uint64_t seq = static_cast<uint64_t>(sequence);
	switch (topology_) {
		case ClusterTopology::REPLICA_SET:
			key.set_id(Hex64(seq));
			break;
		case ClusterTopology::SHARDED:
			key.set_id(Hex64(Mix64(seq)));
			break;
		case ClusterTopology::GEOSHARDED:
			key.set_id(Hex64(Mix64(seq)));
			key.set_location(LocationFor(sequence));
			break;
	}
	return key;
}

std::string DocumentKeyRouter::LocationFor(int64_t sequence) const {
	if (topology_ != ClusterTopology::GEOSHARDED) {
		return std::string();
	}
	const uint64_t h = Mix64(static_cast<uint64_t>(sequence) ^ kZoneSalt);
	return zones_[h % zones_.size()];
}

int64_t DocumentKeyRouter::NextInsertSequence() {
	return next_sequence_.fetch_add(1, std::memory_order_acq_rel);
}

int64_t DocumentKeyRouter::RandomExistingSequence(std::mt19937_64& rng) const {
	const int64_t known = known_sequences();
	if (known <= 0) {
		return 0;
	}
	std::uniform_int_distribution<int64_t> dist(0, known - 1);
	return dist(rng);
}

void DocumentKeyRouter::SetKnownSequences(int64_t count) {
	next_sequence_.store(count < 0 ? 0 : count, std::memory_order_release);
}

} // namespace Vigil
