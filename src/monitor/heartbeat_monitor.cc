#include "heartbeat_monitor.h"

#include <stdexcept>

#include <glog/logging.h>
#include "absl/time/time.h"

#include "common/errors.h"

namespace Vigil {

const char* HealthStateName(HealthState state) {
	switch (state) {
		case HealthState::HEALTHY:
			return "healthy";
		case HealthState::DEGRADED:
			return "degraded";
	}
	return "unknown";
}

HeartbeatMonitor::HeartbeatMonitor(int failure_threshold)
	: failure_threshold_(failure_threshold) {
	if (failure_threshold < 1) {
		throw ConfigurationError("Heartbeat failure threshold must be at least 1, got " +
				std::to_string(failure_threshold));
	}
}

HeartbeatMonitor::~HeartbeatMonitor() {
	Stop();
}

void HeartbeatMonitor::SetTransitionListener(TransitionListener listener) {
	listener_ = std::move(listener);
}

void HeartbeatMonitor::Start(std::chrono::milliseconds interval, Probe probe) {
	if (interval.count() <= 0) {
		throw ConfigurationError("Heartbeat interval must be positive");
	}
	if (!probe) {
		throw ConfigurationError("Heartbeat probe is empty");
	}
	if (heartbeat_thread_.joinable()) {
		throw std::logic_error("Heartbeat monitor already running");
	}
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = false;
	}
	probe_ = std::move(probe);
	heartbeat_thread_ = std::thread([this, interval]() {
		this->ProbeLoop(interval);
	});
	VLOG(1) << "Heartbeat started, interval=" << interval.count() << "ms threshold=" << failure_threshold_;
}

void HeartbeatMonitor::Stop() {
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = true;
		stop_cv_.SignalAll();
	}
	if (heartbeat_thread_.joinable()) {
		heartbeat_thread_.join();
	}
}

void HeartbeatMonitor::ProbeLoop(std::chrono::milliseconds interval) {
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			if (shutdown_) {
				return;
			}
		}
		ProbeOnce(probe_);

		// Sleep for one interval, waking early on Stop
		absl::MutexLock lock(&mu_);
		const absl::Time wake = absl::Now() + absl::FromChrono(interval);
		while (!shutdown_) {
			if (stop_cv_.WaitWithDeadline(&mu_, wake)) {
				break;
			}
		}
		if (shutdown_) {
			return;
		}
	}
}

bool HeartbeatMonitor::ProbeOnce(const Probe& probe) {
	bool ok = false;
	std::string error;
	try {
		StorageResult result = probe();
		ok = result.ok();
		if (!ok) {
			error = std::string(StorageCodeName(result.code)) + ": " + result.message;
		}
	} catch (const std::exception& e) {
		error = std::string("probe threw: ") + e.what();
	}
	if (!ok) {
		LOG(WARNING) << "Heartbeat probe failed: " << error;
	}
	RecordOutcome(ok, error);
	return ok;
}

void HeartbeatMonitor::RecordOutcome(bool ok, const std::string& error) {
	std::optional<HealthTransition> transition;
	{
		absl::MutexLock lock(&mu_);
		++state_.probes;
		if (ok) {
			state_.consecutive_failures = 0;
			state_.last_success = std::chrono::steady_clock::now();
			if (state_.health != HealthState::HEALTHY) {
				transition = HealthTransition{state_.health, HealthState::HEALTHY, 0, ""};
				state_.health = HealthState::HEALTHY;
			}
		} else {
			++state_.failures;
			++state_.consecutive_failures;
			state_.last_error = error;
			if (state_.health == HealthState::HEALTHY &&
					state_.consecutive_failures >= failure_threshold_) {
				transition = HealthTransition{state_.health, HealthState::DEGRADED,
					state_.consecutive_failures, error};
				state_.health = HealthState::DEGRADED;
			}
		}
	}
	if (transition.has_value() && listener_) {
		try {
			listener_(*transition);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Health transition listener threw: " << e.what();
		}
	}
}

HeartbeatState HeartbeatMonitor::state() const {
	absl::MutexLock lock(&mu_);
	return state_;
}

bool HeartbeatMonitor::healthy() const {
	absl::MutexLock lock(&mu_);
	return state_.health == HealthState::HEALTHY;
}

} // namespace Vigil
