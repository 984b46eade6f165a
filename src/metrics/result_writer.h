#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "workload/workload_types.h"

namespace Vigil {

struct RunSummary {
	std::string topology;
	double target_ops_per_sec = 0.0;
	double achieved_ops_per_sec = 0.0;
	int workers = 0;
	double duration_sec = 0.0;
	std::array<uint64_t, kNumOperationKinds> successes{};
	std::array<uint64_t, kNumOperationKinds> failures{};
	uint64_t unexpected = 0;
	bool drained = true;
	int abandoned_workers = 0;
};

/**
 * Appends one CSV row per run to a results file
 */
class ResultWriter {
public:
	/**
	 * @param path results file; empty disables recording
	 */
	explicit ResultWriter(const std::string& path);

	bool enabled() const { return !result_path_.empty(); }

	/**
	 * Writes the row, creating the file with a header when it is new
	 * @return false if the file could not be written
	 */
	bool Write(const RunSummary& summary);

private:
	std::string result_path_;
};

} // namespace Vigil
