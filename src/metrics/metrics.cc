#include "metrics.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include "absl/time/time.h"

namespace Vigil {

const char* OperationOutcomeName(OperationOutcome outcome) {
	switch (outcome) {
		case OperationOutcome::SUCCESS:
			return "success";
		case OperationOutcome::OPERATION_ERROR:
			return "operation_error";
		case OperationOutcome::UNEXPECTED_ERROR:
			return "unexpected_error";
	}
	return "unknown";
}

//----------------------------------------------------------------------------
// WorkerStats
//----------------------------------------------------------------------------

uint64_t WorkerStats::Snapshot::total_attempts() const {
	uint64_t sum = 0;
	for (uint64_t v : attempts) sum += v;
	return sum;
}

uint64_t WorkerStats::Snapshot::total_successes() const {
	uint64_t sum = 0;
	for (uint64_t v : successes) sum += v;
	return sum;
}

uint64_t WorkerStats::Snapshot::total_failures() const {
	uint64_t sum = 0;
	for (uint64_t v : failures) sum += v;
	return sum;
}

WorkerStats::Snapshot& WorkerStats::Snapshot::operator+=(const Snapshot& other) {
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		attempts[i] += other.attempts[i];
		successes[i] += other.successes[i];
		failures[i] += other.failures[i];
	}
	unexpected += other.unexpected;
	acquire_timeouts += other.acquire_timeouts;
	return *this;
}

void WorkerStats::RecordOutcome(OperationKind kind, OperationOutcome outcome) {
	switch (outcome) {
		case OperationOutcome::SUCCESS:
			Bump(successes_[KindIndex(kind)]);
			break;
		case OperationOutcome::UNEXPECTED_ERROR:
			// Counted as a failure of its kind as well
			Bump(unexpected_);
			Bump(failures_[KindIndex(kind)]);
			break;
		case OperationOutcome::OPERATION_ERROR:
			Bump(failures_[KindIndex(kind)]);
			break;
	}
}

WorkerStats::Snapshot WorkerStats::snapshot() const {
	Snapshot s;
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		s.attempts[i] = attempts_[i].load(std::memory_order_relaxed);
		s.successes[i] = successes_[i].load(std::memory_order_relaxed);
		s.failures[i] = failures_[i].load(std::memory_order_relaxed);
	}
	s.unexpected = unexpected_.load(std::memory_order_relaxed);
	s.acquire_timeouts = acquire_timeouts_.load(std::memory_order_relaxed);
	return s;
}

//----------------------------------------------------------------------------
// MetricsAggregator
//----------------------------------------------------------------------------

MetricsAggregator::MetricsAggregator(size_t max_samples_per_window) {
	absl::MutexLock lock(&mu_);
	samplers_.reserve(kNumOperationKinds);
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		samplers_.emplace_back(max_samples_per_window);
	}
	started_ = std::chrono::steady_clock::now();
	window_start_ = started_;
}

void MetricsAggregator::MarkStart() {
	absl::MutexLock lock(&mu_);
	started_ = std::chrono::steady_clock::now();
	window_start_ = started_;
}

WorkerStats* MetricsAggregator::RegisterWorker(int worker_id) {
	absl::MutexLock lock(&mu_);
	workers_.push_back(std::make_unique<WorkerStats>(worker_id));
	return workers_.back().get();
}

void MetricsAggregator::Record(const OperationEvent& event) {
	absl::MutexLock lock(&mu_);
	samplers_[KindIndex(event.kind)].Add(event.duration.count());
}

WorkerStats::Snapshot MetricsAggregator::Totals() const {
	absl::MutexLock lock(&mu_);
	WorkerStats::Snapshot total;
	for (const auto& worker : workers_) {
		total += worker->snapshot();
	}
	return total;
}

std::vector<WorkerStats::Snapshot> MetricsAggregator::PerWorker() const {
	absl::MutexLock lock(&mu_);
	std::vector<WorkerStats::Snapshot> out;
	out.reserve(workers_.size());
	for (const auto& worker : workers_) {
		out.push_back(worker->snapshot());
	}
	return out;
}

double MetricsAggregator::elapsed_seconds() const {
	absl::MutexLock lock(&mu_);
	return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}

MetricsAggregator::Window MetricsAggregator::TakeWindow() {
	std::array<std::vector<int64_t>, kNumOperationKinds> samples;
	Window window;
	WorkerStats::Snapshot now_totals;
	{
		absl::MutexLock lock(&mu_);
		for (const auto& worker : workers_) {
			now_totals += worker->snapshot();
		}
		const auto now = std::chrono::steady_clock::now();
		window.seconds = std::chrono::duration<double>(now - window_start_).count();
		for (size_t i = 0; i < kNumOperationKinds; ++i) {
			window.kinds[i].successes = now_totals.successes[i] - window_base_.successes[i];
			window.kinds[i].failures = now_totals.failures[i] - window_base_.failures[i];
			window.operations += window.kinds[i].successes + window.kinds[i].failures;
			window.dropped_samples += samplers_[i].dropped();
			samples[i] = samplers_[i].Take();
		}
		window.unexpected = now_totals.unexpected - window_base_.unexpected;
		window_base_ = now_totals;
		window_start_ = now;
	}
	// Sorting happens outside the lock so workers are not held up
	for (size_t i = 0; i < kNumOperationKinds; ++i) {
		window.kinds[i].latency = LatencySampler::Summarize(samples[i]);
	}
	return window;
}

//----------------------------------------------------------------------------
// StatsReporter
//----------------------------------------------------------------------------

StatsReporter::StatsReporter(MetricsAggregator* metrics, double target_ops_per_sec,
		std::chrono::seconds interval)
	: metrics_(metrics), target_ops_per_sec_(target_ops_per_sec), interval_(interval) {}

StatsReporter::~StatsReporter() {
	Stop();
}

void StatsReporter::Start() {
	if (interval_.count() <= 0 || report_thread_.joinable()) {
		return;
	}
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = false;
	}
	report_thread_ = std::thread([this]() {
		this->ReportLoop();
	});
}

void StatsReporter::Stop() {
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = true;
		stop_cv_.SignalAll();
	}
	if (report_thread_.joinable()) {
		report_thread_.join();
	}
}

void StatsReporter::ReportLoop() {
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			const absl::Time wake = absl::Now() + absl::FromChrono(interval_);
			while (!shutdown_) {
				if (stop_cv_.WaitWithDeadline(&mu_, wake)) {
					break;
				}
			}
			if (shutdown_) {
				return;
			}
		}
		ReportWindow();
	}
}

MetricsAggregator::Window StatsReporter::ReportWindow() {
	MetricsAggregator::Window w = metrics_->TakeWindow();

	std::ostringstream line;
	line << std::fixed << std::setprecision(1)
		<< "ops/s=" << w.ops_per_sec() << " target=" << target_ops_per_sec_
		<< " window=" << w.seconds << "s";
	uint64_t failures = 0;
	for (OperationKind kind : kAllOperationKinds) {
		const auto& k = w.kinds[KindIndex(kind)];
		failures += k.failures;
		line << " | " << OperationKindName(kind) << " ok=" << k.successes << " err=" << k.failures;
		if (k.latency.count > 0) {
			line << std::setprecision(2)
				<< " p50=" << k.latency.p50_us / 1000.0 << "ms"
				<< " p95=" << k.latency.p95_us / 1000.0 << "ms"
				<< " p99=" << k.latency.p99_us / 1000.0 << "ms"
				<< std::setprecision(1);
		}
	}
	if (w.unexpected > 0) {
		line << " | unexpected=" << w.unexpected;
	}
	if (w.dropped_samples > 0) {
		line << " | dropped_samples=" << w.dropped_samples;
	}

	if (failures > 0) {
		LOG(WARNING) << line.str();
	} else {
		LOG(INFO) << line.str();
	}
	return w;
}

void StatsReporter::LogFinalSummary() const {
	const WorkerStats::Snapshot totals = metrics_->Totals();
	const double elapsed = metrics_->elapsed_seconds();
	const uint64_t completed = totals.total_successes() + totals.total_failures();
	LOG(INFO) << std::fixed << std::setprecision(1)
		<< "Run summary: " << completed << " operations in " << elapsed << "s ("
		<< (elapsed > 0.0 ? completed / elapsed : 0.0) << " ops/s, target " << target_ops_per_sec_ << ")"
		<< ", grants=" << metrics_->grants();
	for (OperationKind kind : kAllOperationKinds) {
		const size_t i = KindIndex(kind);
		LOG(INFO) << "  " << OperationKindName(kind) << ": ok=" << totals.successes[i]
			<< " err=" << totals.failures[i];
	}
	if (totals.unexpected > 0) {
		LOG(WARNING) << "  unexpected errors: " << totals.unexpected;
	}
}

} // namespace Vigil
