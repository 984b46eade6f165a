#include "operation_selector.h"

#include <algorithm>
#include <cmath>

#include "common/errors.h"

namespace Vigil {

OperationSelector::OperationSelector(const OperationMix& mix) : mix_(mix) {
	for (OperationKind kind : kAllOperationKinds) {
		double w = mix.weight(kind);
		if (!std::isfinite(w) || w < 0.0) {
			throw ConfigurationError(std::string("Invalid weight for ") + OperationKindName(kind));
		}
	}
	const double total = mix.total();
	if (!(total > 0.0)) {
		throw ConfigurationError("Operation mix has no positive weight");
	}

	double running = 0.0;
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		running += mix.weights[i] / total;
		cumulative_[i] = running;
	}
	// Absorb rounding so a draw near 1.0 still lands on the last positive kind
	for (size_t i = kNumOperationKinds; i-- > 0;) {
		if (mix.weights[i] > 0.0) {
			for (size_t j = i; j < kNumOperationKinds; ++j) {
				cumulative_[j] = 1.0;
			}
			break;
		}
	}
}

OperationKind OperationSelector::Select(std::mt19937_64& rng) const {
	std::uniform_real_distribution<double> uniform(0.0, 1.0);
	const double u = uniform(rng);
	// First bucket whose upper edge is strictly above u. Zero-weight kinds have
	// an empty interval and are skipped by upper_bound.
	auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), u);
	if (it == cumulative_.end()) {
		--it;
	}
	return kAllOperationKinds[static_cast<size_t>(it - cumulative_.begin())];
}

double OperationSelector::probability(OperationKind kind) const {
	return mix_.weight(kind) / mix_.total();
}

} // namespace Vigil
