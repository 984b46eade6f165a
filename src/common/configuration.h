#ifndef VIGIL_CONFIGURATION_H_
#define VIGIL_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#include <cxxopts.hpp>

#include "config.h"

namespace YAML {
class Node;
}

namespace Vigil {

/**
 * Configuration value that can be overridden by environment variables.
 * Precedence: command line > environment > file > default.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (override_.has_value()) {
            return override_.value();
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // File-level value; still shadowed by the environment.
    void set(T value) { value_ = value; }
    // Command-line value; shadows everything.
    void setOverride(T value) { override_ = value; }
    void clearOverride() { override_.reset(); }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::optional<T> override_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct VigilConfig {
    struct Storage {
        ConfigValue<std::string> uri{"", "VIGIL_URI"};
        ConfigValue<std::string> db{"liveness", "VIGIL_DB"};
        ConfigValue<std::string> collection{"probe", "VIGIL_COLLECTION"};
        // Passed through to the storage client; the engine does not enforce it.
        ConfigValue<int> max_pool_size{50, "VIGIL_MAX_POOL_SIZE"};
        ConfigValue<std::string> app_name{"vigil-liveness-monitor", "VIGIL_APP_NAME"};
        ConfigValue<int> operation_timeout_ms{10000, "VIGIL_OPERATION_TIMEOUT_MS"};
    } storage;

    struct Workload {
        ConfigValue<size_t> total_docs{1000, "VIGIL_TOTAL_DOCS"};
        ConfigValue<double> ops_per_sec{50.0, "VIGIL_OPS_PER_SEC"};
        ConfigValue<int> workers{4, "VIGIL_WORKERS"};
        ConfigValue<std::string> op_mix{"find=70,insert=20,update=10", "VIGIL_OP_MIX"};
        // replica_set, sharded or geosharded
        ConfigValue<std::string> cluster_type{"replica_set", "VIGIL_CLUSTER_TYPE"};
        // Comma separated zone identifiers; empty selects the built-in ISO list.
        ConfigValue<std::string> zones{"", "VIGIL_ZONES"};
        ConfigValue<int> acquire_timeout_ms{static_cast<int>(::acquire_timeout_ms), "VIGIL_ACQUIRE_TIMEOUT_MS"};
        ConfigValue<int> error_backoff_ms{static_cast<int>(::error_backoff_ms), "VIGIL_ERROR_BACKOFF_MS"};
        ConfigValue<int> shutdown_grace_ms{static_cast<int>(::shutdown_grace_ms), "VIGIL_SHUTDOWN_GRACE_MS"};
        ConfigValue<size_t> preload_batch_size{static_cast<size_t>(::preload_batch_size), "VIGIL_PRELOAD_BATCH_SIZE"};
        ConfigValue<bool> upsert_on_update{true, "VIGIL_UPSERT_ON_UPDATE"};
        // 0 runs until SIGINT/SIGTERM
        ConfigValue<int> duration_sec{0, "VIGIL_DURATION_SEC"};
    } workload;

    struct Heartbeat {
        ConfigValue<int> interval_ms{static_cast<int>(heartbeat_period_ms), "VIGIL_HEARTBEAT_INTERVAL_MS"};
        ConfigValue<int> failure_threshold{static_cast<int>(heartbeat_failure_threshold), "VIGIL_HEARTBEAT_FAILURE_THRESHOLD"};
        ConfigValue<int> timeout_ms{static_cast<int>(heartbeat_timeout_ms), "VIGIL_HEARTBEAT_TIMEOUT_MS"};
    } heartbeat;

    struct Reporting {
        ConfigValue<std::string> error_sink{"", "VIGIL_ERROR_SINK"};
        ConfigValue<std::string> log_level{"INFO", "VIGIL_LOG_LEVEL"};
        ConfigValue<int> report_interval_sec{10, "VIGIL_REPORT_INTERVAL_SEC"};
        ConfigValue<std::string> results_file{"", "VIGIL_RESULTS_FILE"};
    } reporting;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Command line flags understood by overrideFromCommandLine
    static cxxopts::Options buildCommandLineOptions();

    // Override with parsed command line arguments. Loads --config first.
    bool overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Get the configuration
    const VigilConfig& config() const { return config_; }
    VigilConfig& config() { return config_; }

    // Restore every value to its built-in default. Used by tests.
    void reset() { config_ = VigilConfig{}; }

    // Helper methods for common access patterns
    std::string getUri() const { return config_.storage.uri.get(); }
    double getOpsPerSec() const { return config_.workload.ops_per_sec.get(); }
    int getWorkers() const { return config_.workload.workers.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    VigilConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies a parsed document; shared by file and string loading.
    bool applyYAML(const YAML::Node& yaml);
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Vigil

#endif // VIGIL_CONFIGURATION_H_
