#pragma once

#include <cstdint>

/// Heartbeat configs
/// The interval between two connectivity probes
const int64_t heartbeat_period_ms = 1000;
/// The timeout for a single probe.
const int64_t heartbeat_timeout_ms = 5000;
/// Consecutive probe failures before the connection is reported as degraded.
const int64_t heartbeat_failure_threshold = 3;

/// Workload configs
const int64_t acquire_timeout_ms = 1000;
/// Pause after a failed operation so persistent errors do not hot-loop a worker.
const int64_t error_backoff_ms = 50;
const int64_t shutdown_grace_ms = 5000;
const int64_t preload_batch_size = 1000;

/// Upper bound on latency samples kept per operation kind between two reports.
const int64_t max_latency_samples_per_window = 100000;
