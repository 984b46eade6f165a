#include "result_writer.h"

#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Vigil {

ResultWriter::ResultWriter(const std::string& path) : result_path_(path) {
	if (result_path_.empty()) {
		return;
	}
	// Create output directory if it doesn't exist
	fs::path parent = fs::path(result_path_).parent_path();
	if (!parent.empty()) {
		try {
			fs::create_directories(parent);
		} catch (const fs::filesystem_error& e) {
			LOG(ERROR) << "Failed to create result directory: " << e.what();
		}
	}
}

bool ResultWriter::Write(const RunSummary& summary) {
	if (!enabled()) {
		return true;
	}

	std::error_code ec;
	bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;

	std::ofstream file(result_path_, std::ios::app);
	if (!file.is_open()) {
		LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
		return false;
	}

	if (headers_needed) {
		file << "timestamp,"
			<< "topology,"
			<< "target_ops_per_sec,"
			<< "achieved_ops_per_sec,"
			<< "workers,"
			<< "duration_sec,";
		for (OperationKind kind : kAllOperationKinds) {
			file << OperationKindName(kind) << "_ok," << OperationKindName(kind) << "_err,";
		}
		file << "unexpected,"
			<< "drained,"
			<< "abandoned_workers\n";
		LOG(INFO) << "Created new result file with headers: " << result_path_;
	}

	auto formatFloat = [](double value) -> std::string {
		if (value == 0.0) return "0";
		std::stringstream ss;
		ss << std::fixed << std::setprecision(2) << value;
		return ss.str();
	};

	auto now = std::chrono::system_clock::now();
	auto time_t_now = std::chrono::system_clock::to_time_t(now);
	std::tm tm_now{};
	localtime_r(&time_t_now, &tm_now);

	file << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << ","
		<< summary.topology << ","
		<< formatFloat(summary.target_ops_per_sec) << ","
		<< formatFloat(summary.achieved_ops_per_sec) << ","
		<< summary.workers << ","
		<< formatFloat(summary.duration_sec) << ",";
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		file << summary.successes[i] << "," << summary.failures[i] << ",";
	}
	file << summary.unexpected << ","
		<< (summary.drained ? "true" : "false") << ","
		<< summary.abandoned_workers << "\n";

	file.close();
	if (file.fail()) {
		LOG(ERROR) << "Failed writing results to " << result_path_;
		return false;
	}
	LOG(INFO) << "Results written to: " << result_path_;
	return true;
}

} // namespace Vigil
