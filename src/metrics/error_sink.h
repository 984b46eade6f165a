#ifndef VIGIL_METRICS_ERROR_SINK_H_
#define VIGIL_METRICS_ERROR_SINK_H_

#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "workload/workload_types.h"

namespace Vigil {

struct ErrorEvent {
	// operation, prepare, preload or heartbeat
	std::string source;
	std::optional<OperationKind> kind;
	std::string key;
	std::string code;
	std::string message;
	int worker_id = -1;
};

std::string FormatErrorEvent(const ErrorEvent& event);

// Receives errors from many threads at once.
class ErrorSink {
public:
	virtual ~ErrorSink() = default;
	virtual void Report(const ErrorEvent& event) = 0;
};

class LogErrorSink : public ErrorSink {
public:
	void Report(const ErrorEvent& event) override;
};

/**
 * Appends one CSV line per event. The header is written when the file is new.
 */
class FileErrorSink : public ErrorSink {
public:
	// @throws ConfigurationError if the file cannot be opened for append
	explicit FileErrorSink(const std::string& path);

	void Report(const ErrorEvent& event) override;
	const std::string& path() const { return path_; }

private:
	const std::string path_;
	absl::Mutex mu_;
	std::ofstream out_ ABSL_GUARDED_BY(mu_);
};

class CompositeErrorSink : public ErrorSink {
public:
	void Add(std::unique_ptr<ErrorSink> sink) { sinks_.push_back(std::move(sink)); }
	void Report(const ErrorEvent& event) override;
	size_t size() const { return sinks_.size(); }

private:
	std::vector<std::unique_ptr<ErrorSink>> sinks_;
};

/**
 * Builds the sink for an error_sink target. Logging is always on. A plain
 * path or file:// URI adds a FileErrorSink. Other targets are reported as
 * unsupported and ignored.
 */
std::unique_ptr<ErrorSink> MakeErrorSink(const std::string& target);

} // namespace Vigil

#endif // VIGIL_METRICS_ERROR_SINK_H_
