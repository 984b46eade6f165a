#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace Vigil {

/**
 * Latency samples of one operation kind for one reporting window.
 * Samples beyond the cap are counted but not kept, so a long window under
 * high load cannot grow without bound.
 */
class LatencySampler {
public:
	struct Summary {
		size_t count = 0;
		double min_us = 0.0;
		double max_us = 0.0;
		double average_us = 0.0;
		double p50_us = 0.0;
		double p95_us = 0.0;
		double p99_us = 0.0;
	};

	explicit LatencySampler(size_t max_samples) : max_samples_(max_samples) {}

	// Returns false when the sample was dropped.
	bool Add(int64_t micros) {
		if (samples_.size() >= max_samples_) {
			++dropped_;
			return false;
		}
		samples_.push_back(micros);
		return true;
	}

	size_t size() const { return samples_.size(); }
	uint64_t dropped() const { return dropped_; }

	// Hands the samples over and starts an empty window.
	std::vector<int64_t> Take() {
		std::vector<int64_t> out;
		out.swap(samples_);
		dropped_ = 0;
		return out;
	}

	// Nearest-rank percentiles; reorders the samples.
	static Summary Summarize(std::vector<int64_t>& samples) {
		Summary s;
		if (samples.empty()) {
			return s;
		}
		std::sort(samples.begin(), samples.end());
		s.count = samples.size();
		s.min_us = static_cast<double>(samples.front());
		s.max_us = static_cast<double>(samples.back());
		long double sum = 0.0L;
		for (int64_t v : samples) {
			sum += v;
		}
		s.average_us = static_cast<double>(sum / s.count);
		s.p50_us = NearestRank(samples, 0.50);
		s.p95_us = NearestRank(samples, 0.95);
		s.p99_us = NearestRank(samples, 0.99);
		return s;
	}

private:
	static double NearestRank(const std::vector<int64_t>& sorted, double p) {
		size_t rank = static_cast<size_t>(std::ceil(p * sorted.size()));
		rank = std::clamp<size_t>(rank, 1, sorted.size());
		return static_cast<double>(sorted[rank - 1]);
	}

	const size_t max_samples_;
	std::vector<int64_t> samples_;
	uint64_t dropped_ = 0;
};

} // namespace Vigil
