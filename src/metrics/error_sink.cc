#include "error_sink.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"

namespace fs = std::filesystem;

namespace Vigil {

namespace {

// Quotes a CSV field when it contains a separator, quote or newline.
std::string CsvField(const std::string& value) {
	if (value.find_first_of(",\"\n") == std::string::npos) {
		return value;
	}
	std::string quoted = "\"";
	for (char c : value) {
		if (c == '"') quoted += '"';
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

} // namespace

std::string FormatErrorEvent(const ErrorEvent& event) {
	std::ostringstream out;
	out << "[" << event.source << "]";
	if (event.kind.has_value()) {
		out << " op=" << OperationKindName(*event.kind);
	}
	if (!event.key.empty()) {
		out << " key=" << event.key;
	}
	if (event.worker_id >= 0) {
		out << " worker=" << event.worker_id;
	}
	if (!event.code.empty()) {
		out << " code=" << event.code;
	}
	out << " " << event.message;
	return out.str();
}

void LogErrorSink::Report(const ErrorEvent& event) {
	LOG(WARNING) << FormatErrorEvent(event);
}

FileErrorSink::FileErrorSink(const std::string& path) : path_(path) {
	bool headers_needed = true;
	std::error_code ec;
	if (fs::exists(path_, ec) && fs::file_size(path_, ec) > 0) {
		headers_needed = false;
	}
	absl::MutexLock lock(&mu_);
	out_.open(path_, std::ios::app);
	if (!out_.is_open()) {
		throw ConfigurationError("Cannot open error sink file " + path_ + ": " + strerror(errno));
	}
	if (headers_needed) {
		out_ << "timestamp_ms,source,op,key,worker,code,message\n";
		out_.flush();
	}
}

void FileErrorSink::Report(const ErrorEvent& event) {
	const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();
	absl::MutexLock lock(&mu_);
	out_ << now_ms << ","
		<< CsvField(event.source) << ","
		<< (event.kind.has_value() ? OperationKindName(*event.kind) : "") << ","
		<< CsvField(event.key) << ","
		<< event.worker_id << ","
		<< CsvField(event.code) << ","
		<< CsvField(event.message) << "\n";
	out_.flush();
	if (!out_) {
		LOG(ERROR) << "Write to error sink file " << path_ << " failed";
		out_.clear();
	}
}

void CompositeErrorSink::Report(const ErrorEvent& event) {
	for (const auto& sink : sinks_) {
		sink->Report(event);
	}
}

std::unique_ptr<ErrorSink> MakeErrorSink(const std::string& target) {
	auto sink = std::make_unique<CompositeErrorSink>();
	sink->Add(std::make_unique<LogErrorSink>());
	if (target.empty()) {
		return sink;
	}

	const std::string file_prefix = "file://";
	if (target.compare(0, file_prefix.size(), file_prefix) == 0) {
		sink->Add(std::make_unique<FileErrorSink>(target.substr(file_prefix.size())));
	} else if (target.find("://") != std::string::npos) {
		LOG(WARNING) << "Error sink target '" << target << "' is not supported; errors go to the log only";
		return sink;
	} else {
		sink->Add(std::make_unique<FileErrorSink>(target));
	}
	LOG(INFO) << "Error sink enabled: " << target;
	return sink;
}

} // namespace Vigil
