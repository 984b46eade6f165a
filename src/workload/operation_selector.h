#ifndef VIGIL_WORKLOAD_OPERATION_SELECTOR_H_
#define VIGIL_WORKLOAD_OPERATION_SELECTOR_H_

#include <array>
#include <random>

#include "workload_types.h"

namespace Vigil {

/**
 * Weighted random choice among operation kinds.
 *
 * Weights are normalised once at construction into a cumulative table, so a
 * draw is one uniform sample plus a search. The selector itself is immutable
 * and shared by all workers; each worker passes its own random engine.
 */
class OperationSelector {
public:
	/**
	 * @throws ConfigurationError if a weight is negative or not finite, or if
	 *         no weight is positive
	 */
	explicit OperationSelector(const OperationMix& mix);

	OperationKind Select(std::mt19937_64& rng) const;

	// Normalised probability of kind; the values sum to 1.
	double probability(OperationKind kind) const;

	const OperationMix& mix() const { return mix_; }

private:
	OperationMix mix_;
	// cumulative_[i] is the probability of drawing any of the first i+1 kinds
	std::array<double, kNumOperationKinds> cumulative_{};
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_OPERATION_SELECTOR_H_
