#ifndef VIGIL_WORKLOAD_WORKLOAD_TYPES_H_
#define VIGIL_WORKLOAD_WORKLOAD_TYPES_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Vigil {

// Operation kinds
enum class OperationKind : uint8_t {
	FIND,
	INSERT,
	UPDATE,
};

inline constexpr size_t kNumOperationKinds = 3;

inline constexpr std::array<OperationKind, kNumOperationKinds> kAllOperationKinds = {
	OperationKind::FIND, OperationKind::INSERT, OperationKind::UPDATE};

inline size_t KindIndex(OperationKind kind) { return static_cast<size_t>(kind); }

const char* OperationKindName(OperationKind kind);

/**
 * Parses "find", "insert" or "update" (case-insensitive).
 * @throws ConfigurationError for any other name
 */
OperationKind ParseOperationKind(const std::string& name);

// Cluster data-distribution strategy, fixed for the process lifetime.
enum class ClusterTopology : uint8_t {
	REPLICA_SET,
	SHARDED,
	GEOSHARDED,
};

const char* ClusterTopologyName(ClusterTopology topology);

/**
 * @throws ConfigurationError unless name is replica_set, sharded or geosharded
 */
ClusterTopology ParseClusterTopology(const std::string& name);

/**
 * Relative weight per operation kind. Weights are non-negative and at least
 * one is positive; they need not sum to 100.
 */
struct OperationMix {
	std::array<double, kNumOperationKinds> weights{};

	double weight(OperationKind kind) const { return weights[KindIndex(kind)]; }
	double total() const;
	std::string ToString() const;
};

/**
 * Parses "find=70,insert=20,update=10". Kinds not mentioned get weight 0.
 * @throws ConfigurationError on unknown kinds, malformed or negative
 *         weights, duplicates, or when every weight is zero
 */
OperationMix ParseOperationMix(const std::string& spec);

// Fixed, ordered location identifiers for geo-zoned placement.
using ZoneSet = std::vector<std::string>;

// ISO 3166 alpha-2 codes used when no zones are configured.
const ZoneSet& DefaultZoneSet();

/**
 * Splits a comma separated list; an empty or blank list yields DefaultZoneSet().
 * @throws ConfigurationError on duplicate zone identifiers
 */
ZoneSet ParseZoneSet(const std::string& spec);

} // namespace Vigil

#endif // VIGIL_WORKLOAD_WORKLOAD_TYPES_H_
