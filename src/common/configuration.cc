#include "configuration.h"
#include "env_flags.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Vigil {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (IsEnvTrueValue(env_val)) {
            return true;
        } else if (IsEnvFalseValue(env_val)) {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["vigil"]) {
        LOG(WARNING) << "Configuration has no top-level 'vigil' section; nothing applied";
        return true;
    }
    auto root = yaml["vigil"];

    // Storage
    if (root["storage"]) {
        auto storage = root["storage"];
        if (storage["uri"]) config_.storage.uri.set(storage["uri"].as<std::string>());
        if (storage["db"]) config_.storage.db.set(storage["db"].as<std::string>());
        if (storage["collection"]) config_.storage.collection.set(storage["collection"].as<std::string>());
        if (storage["max_pool_size"]) config_.storage.max_pool_size.set(storage["max_pool_size"].as<int>());
        if (storage["app_name"]) config_.storage.app_name.set(storage["app_name"].as<std::string>());
        if (storage["operation_timeout_ms"]) config_.storage.operation_timeout_ms.set(storage["operation_timeout_ms"].as<int>());
    }

    // Workload
    if (root["workload"]) {
        auto workload = root["workload"];
        if (workload["total_docs"]) config_.workload.total_docs.set(workload["total_docs"].as<size_t>());
        if (workload["ops_per_sec"]) config_.workload.ops_per_sec.set(workload["ops_per_sec"].as<double>());
        if (workload["workers"]) config_.workload.workers.set(workload["workers"].as<int>());
        if (workload["cluster_type"]) config_.workload.cluster_type.set(workload["cluster_type"].as<std::string>());
        if (workload["acquire_timeout_ms"]) config_.workload.acquire_timeout_ms.set(workload["acquire_timeout_ms"].as<int>());
        if (workload["error_backoff_ms"]) config_.workload.error_backoff_ms.set(workload["error_backoff_ms"].as<int>());
        if (workload["shutdown_grace_ms"]) config_.workload.shutdown_grace_ms.set(workload["shutdown_grace_ms"].as<int>());
        if (workload["preload_batch_size"]) config_.workload.preload_batch_size.set(workload["preload_batch_size"].as<size_t>());
        if (workload["upsert_on_update"]) config_.workload.upsert_on_update.set(workload["upsert_on_update"].as<bool>());
        if (workload["duration_sec"]) config_.workload.duration_sec.set(workload["duration_sec"].as<int>());

        // op_mix accepts either "find=70,insert=20" or a map {find: 70, insert: 20}
        if (workload["op_mix"]) {
            auto mix = workload["op_mix"];
            if (mix.IsMap()) {
                std::string joined;
                for (const auto& entry : mix) {
                    if (!joined.empty()) joined += ",";
                    joined += entry.first.as<std::string>() + "=" + entry.second.as<std::string>();
                }
                config_.workload.op_mix.set(joined);
            } else {
                config_.workload.op_mix.set(mix.as<std::string>());
            }
        }

        // zones accepts a sequence or a comma separated string
        if (workload["zones"]) {
            auto zones = workload["zones"];
            if (zones.IsSequence()) {
                std::string joined;
                for (const auto& zone : zones) {
                    if (!joined.empty()) joined += ",";
                    joined += zone.as<std::string>();
                }
                config_.workload.zones.set(joined);
            } else {
                config_.workload.zones.set(zones.as<std::string>());
            }
        }
    }

    // Heartbeat
    if (root["heartbeat"]) {
        auto heartbeat = root["heartbeat"];
        if (heartbeat["interval_ms"]) config_.heartbeat.interval_ms.set(heartbeat["interval_ms"].as<int>());
        if (heartbeat["failure_threshold"]) config_.heartbeat.failure_threshold.set(heartbeat["failure_threshold"].as<int>());
        if (heartbeat["timeout_ms"]) config_.heartbeat.timeout_ms.set(heartbeat["timeout_ms"].as<int>());
    }

    // Reporting
    if (root["reporting"]) {
        auto reporting = root["reporting"];
        if (reporting["error_sink"]) config_.reporting.error_sink.set(reporting["error_sink"].as<std::string>());
        if (reporting["log_level"]) config_.reporting.log_level.set(reporting["log_level"].as<std::string>());
        if (reporting["report_interval_sec"]) config_.reporting.report_interval_sec.set(reporting["report_interval_sec"].as<int>());
        if (reporting["results_file"]) config_.reporting.results_file.set(reporting["results_file"].as<std::string>());
    }

    return true;
}

cxxopts::Options Configuration::buildCommandLineOptions() {
    cxxopts::Options options("vigil", "Rate-controlled synthetic workload and liveness probe for a document storage cluster");

    options.add_options()
        ("h,help", "Print usage")
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("env_file", "dotenv file loaded before parsing (default ./.env)", cxxopts::value<std::string>())
        ("uri", "Storage connection URI (memory://name or grpc://host:port), or env VIGIL_URI",
            cxxopts::value<std::string>())
        ("db", "Database name", cxxopts::value<std::string>())
        ("coll", "Collection name", cxxopts::value<std::string>())
        ("total_docs", "Target total docs to pre-load", cxxopts::value<size_t>())
        ("ops_per_sec", "Total operations per second across all workers", cxxopts::value<double>())
        ("workers", "Number of worker threads", cxxopts::value<int>())
        ("max_pool_size", "Storage client connection pool size", cxxopts::value<int>())
        ("op_mix", "Operation mix percentages, e.g. find=70,insert=20,update=10",
            cxxopts::value<std::string>())
        ("cluster_type", "Cluster type for sharding strategy (replica_set, sharded, geosharded)",
            cxxopts::value<std::string>())
        ("zones", "Comma separated zone identifiers for geosharded clusters", cxxopts::value<std::string>())
        ("error_sink", "Error sink target (file path); optional", cxxopts::value<std::string>())
        ("log_level", "TRACE, DEBUG, INFO, WARNING or ERROR", cxxopts::value<std::string>())
        ("duration_sec", "Stop after this many seconds; 0 runs until signalled", cxxopts::value<int>())
        ("heartbeat_interval_ms", "Connectivity probe period", cxxopts::value<int>())
        ("heartbeat_failure_threshold", "Consecutive probe failures before degraded", cxxopts::value<int>())
        ("shutdown_grace_ms", "Time allowed for in-flight operations to drain", cxxopts::value<int>())
        ("results_file", "Append a CSV summary row to this file", cxxopts::value<std::string>());

    return options;
}

bool Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    // File first so flags given next to --config still win
    if (result.count("config")) {
        if (!loadFromFile(result["config"].as<std::string>())) {
            return false;
        }
    }

    if (result.count("uri")) config_.storage.uri.setOverride(result["uri"].as<std::string>());
    if (result.count("db")) config_.storage.db.setOverride(result["db"].as<std::string>());
    if (result.count("coll")) config_.storage.collection.setOverride(result["coll"].as<std::string>());
    if (result.count("max_pool_size")) config_.storage.max_pool_size.setOverride(result["max_pool_size"].as<int>());
    if (result.count("total_docs")) config_.workload.total_docs.setOverride(result["total_docs"].as<size_t>());
    if (result.count("ops_per_sec")) config_.workload.ops_per_sec.setOverride(result["ops_per_sec"].as<double>());
    if (result.count("workers")) config_.workload.workers.setOverride(result["workers"].as<int>());
    if (result.count("op_mix")) config_.workload.op_mix.setOverride(result["op_mix"].as<std::string>());
    if (result.count("cluster_type")) config_.workload.cluster_type.setOverride(result["cluster_type"].as<std::string>());
    if (result.count("zones")) config_.workload.zones.setOverride(result["zones"].as<std::string>());
    if (result.count("duration_sec")) config_.workload.duration_sec.setOverride(result["duration_sec"].as<int>());
    if (result.count("shutdown_grace_ms")) config_.workload.shutdown_grace_ms.setOverride(result["shutdown_grace_ms"].as<int>());
    if (result.count("heartbeat_interval_ms")) config_.heartbeat.interval_ms.setOverride(result["heartbeat_interval_ms"].as<int>());
    if (result.count("heartbeat_failure_threshold")) config_.heartbeat.failure_threshold.setOverride(result["heartbeat_failure_threshold"].as<int>());
    if (result.count("error_sink")) config_.reporting.error_sink.setOverride(result["error_sink"].as<std::string>());
    if (result.count("log_level")) config_.reporting.log_level.setOverride(result["log_level"].as<std::string>());
    if (result.count("results_file")) config_.reporting.results_file.setOverride(result["results_file"].as<std::string>());

    return true;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.storage.uri.get().empty()) {
        validation_errors_.push_back("--uri or VIGIL_URI must be provided");
    }
    if (config_.storage.db.get().empty() || config_.storage.collection.get().empty()) {
        validation_errors_.push_back("Database and collection names must not be empty");
    }
    if (config_.storage.max_pool_size.get() < 1) {
        validation_errors_.push_back("max_pool_size must be at least 1");
    }
    if (config_.storage.operation_timeout_ms.get() < 1) {
        validation_errors_.push_back("operation_timeout_ms must be at least 1");
    }

    // Rate and concurrency
    if (!(config_.workload.ops_per_sec.get() > 0.0)) {
        validation_errors_.push_back("ops_per_sec must be positive");
    }
    if (config_.workload.workers.get() < 1) {
        validation_errors_.push_back("workers must be at least 1");
    }
    if (config_.workload.acquire_timeout_ms.get() < 1) {
        validation_errors_.push_back("acquire_timeout_ms must be at least 1");
    }
    if (config_.workload.error_backoff_ms.get() < 0) {
        validation_errors_.push_back("error_backoff_ms cannot be negative");
    }
    if (config_.workload.shutdown_grace_ms.get() < 0) {
        validation_errors_.push_back("shutdown_grace_ms cannot be negative");
    }
    if (config_.workload.preload_batch_size.get() < 1) {
        validation_errors_.push_back("preload_batch_size must be at least 1");
    }
    if (config_.workload.duration_sec.get() < 0) {
        validation_errors_.push_back("duration_sec cannot be negative");
    }

    const std::string cluster_type = config_.workload.cluster_type.get();
    if (cluster_type != "replica_set" && cluster_type != "sharded" && cluster_type != "geosharded") {
        validation_errors_.push_back("cluster_type must be one of replica_set, sharded, geosharded (got '" +
                                     cluster_type + "')");
    }

    // Heartbeat
    if (config_.heartbeat.interval_ms.get() < 1) {
        validation_errors_.push_back("heartbeat interval_ms must be at least 1");
    }
    if (config_.heartbeat.failure_threshold.get() < 1) {
        validation_errors_.push_back("heartbeat failure_threshold must be at least 1");
    }
    if (config_.heartbeat.timeout_ms.get() < 1) {
        validation_errors_.push_back("heartbeat timeout_ms must be at least 1");
    }

    if (config_.reporting.report_interval_sec.get() < 1) {
        validation_errors_.push_back("report_interval_sec must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Vigil
