#include <signal.h>
#include <time.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <glog/logging.h>
#include <cxxopts.hpp>

#include "common/configuration.h"
#include "common/env_flags.h"
#include "common/errors.h"
#include "common/log_level.h"
#include "metrics/error_sink.h"
#include "metrics/result_writer.h"
#include "monitor/cluster_info.h"
#include "storage/store_factory.h"
#include "workload/workload_runner.h"
#include "workload/workload_settings.h"

using namespace Vigil;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitStartupFailure = 1;
constexpr int kExitConfigError = 2;

// --env_file has to be known before the real parse so the file can feed
// VIGIL_* defaults.
std::string FindEnvFileArg(int argc, char* argv[]) {
	const std::string flag = "--env_file";
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == flag && i + 1 < argc) {
			return argv[i + 1];
		}
		if (arg.compare(0, flag.size() + 1, flag + "=") == 0) {
			return arg.substr(flag.size() + 1);
		}
	}
	return ".env";
}

// Waits for SIGINT/SIGTERM, or until duration elapses when it is positive.
void WaitForStop(const sigset_t& signals, std::chrono::seconds duration) {
	int sig = 0;
	if (duration.count() <= 0) {
		while (sigwait(&signals, &sig) != 0) {
		}
		LOG(INFO) << "Received " << strsignal(sig);
		return;
	}

	const auto deadline = std::chrono::steady_clock::now() + duration;
	while (true) {
		const auto left = deadline - std::chrono::steady_clock::now();
		if (left <= std::chrono::steady_clock::duration::zero()) {
			LOG(INFO) << "Run duration of " << duration.count() << "s elapsed";
			return;
		}
		const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(left).count();
		timespec ts;
		ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
		ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
		sig = sigtimedwait(&signals, nullptr, &ts);
		if (sig > 0) {
			LOG(INFO) << "Received " << strsignal(sig);
			return;
		}
		// EAGAIN on timeout, EINTR on an unrelated signal: re-check the deadline
	}
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	const std::string env_file = FindEnvFileArg(argc, argv);
	int loaded = LoadEnvFile(env_file);
	if (loaded > 0) {
		LOG(INFO) << "Loaded " << loaded << " variables from " << env_file;
	}

	cxxopts::Options options = Configuration::buildCommandLineOptions();
	Configuration& config = Configuration::getInstance();
	WorkloadSettings settings;
	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return kExitOk;
		}
		if (!config.overrideFromCommandLine(result)) {
			LOG(ERROR) << "Failed to load configuration";
			return kExitConfigError;
		}
		ApplyLogLevel(config.config().reporting.log_level.get());
		if (!config.validate()) {
			for (const auto& error : config.getValidationErrors()) {
				LOG(ERROR) << "Configuration error: " << error;
			}
			return kExitConfigError;
		}
		settings = BuildWorkloadSettings(config.config());
	} catch (const ConfigurationError& e) {
		LOG(ERROR) << "Configuration error: " << e.what();
		return kExitConfigError;
	} catch (const std::exception& e) {
		// cxxopts parse errors
		LOG(ERROR) << "Invalid command line: " << e.what();
		return kExitConfigError;
	}

	// Block the stop signals before any thread starts so every thread inherits the mask
	sigset_t stop_signals;
	sigemptyset(&stop_signals);
	sigaddset(&stop_signals, SIGINT);
	sigaddset(&stop_signals, SIGTERM);
	if (pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr) != 0) {
		LOG(ERROR) << "pthread_sigmask failed: " << strerror(errno);
		return kExitStartupFailure;
	}

	std::shared_ptr<DocumentStore> store;
	std::shared_ptr<ErrorSink> errors;
	std::unique_ptr<WorkloadRunner> runner;
	try {
		errors = MakeErrorSink(settings.reporting.error_sink);
		store = OpenDocumentStore(settings.store);
		LogClusterInfo(*store, settings.topology);
		runner = std::make_unique<WorkloadRunner>(settings, store, errors);
		runner->Start();
	} catch (const ConfigurationError& e) {
		LOG(ERROR) << "Configuration error: " << e.what();
		return kExitConfigError;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Startup failed: " << e.what();
		return kExitStartupFailure;
	}

	WaitForStop(stop_signals, settings.duration);

	RunSummary summary = runner->Stop();
	ResultWriter writer(settings.reporting.results_file);
	writer.Write(summary);

	LOG(INFO) << "Shutdown complete";
	return kExitOk;
}
