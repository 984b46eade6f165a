#include "store_factory.h"

#include <sstream>

#include <glog/logging.h>

#include "common/errors.h"
#include "grpc_document_store.h"
#include "memory_document_store.h"

namespace Vigil {

namespace {

const char kMemoryScheme[] = "memory://";
const char kGrpcScheme[] = "grpc://";

bool StartsWith(const std::string& s, const std::string& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}

// Applies "latency_ms=5&failure_rate=0.1" to the memory store options.
void ParseMemoryParams(const std::string& query, MemoryStoreOptions& options) {
	std::stringstream ss(query);
	std::string param;
	while (std::getline(ss, param, '&')) {
		if (param.empty()) continue;
		size_t eq = param.find('=');
		if (eq == std::string::npos) {
			throw ConfigurationError("Malformed memory store parameter '" + param + "'");
		}
		const std::string name = param.substr(0, eq);
		const std::string value = param.substr(eq + 1);
		try {
			if (name == "latency_ms") {
				options.latency = std::chrono::microseconds(static_cast<int64_t>(std::stod(value) * 1000.0));
			} else if (name == "failure_rate") {
				options.failure_rate = std::stod(value);
			} else {
				throw ConfigurationError("Unknown memory store parameter '" + name + "'");
			}
		} catch (const std::invalid_argument&) {
			throw ConfigurationError("Memory store parameter " + name + " is not a number: '" + value + "'");
		} catch (const std::out_of_range&) {
			throw ConfigurationError("Memory store parameter " + name + " is out of range: '" + value + "'");
		}
	}
}

} // namespace

std::unique_ptr<DocumentStore> OpenDocumentStore(const StoreOptions& options) {
	if (options.uri.empty()) {
		throw ConfigurationError("--uri or VIGIL_URI must be provided");
	}

	if (StartsWith(options.uri, kMemoryScheme)) {
		std::string rest = options.uri.substr(sizeof(kMemoryScheme) - 1);
		MemoryStoreOptions memory;
		memory.topology = options.topology;
		size_t q = rest.find('?');
		if (q != std::string::npos) {
			ParseMemoryParams(rest.substr(q + 1), memory);
			rest = rest.substr(0, q);
		}
		if (!rest.empty()) {
			memory.name = rest;
		}
		LOG(INFO) << "Using in-memory document store '" << memory.name << "'";
		return std::make_unique<MemoryDocumentStore>(memory);
	}

	if (StartsWith(options.uri, kGrpcScheme)) {
		GrpcStoreOptions grpc_options;
		grpc_options.target = options.uri.substr(sizeof(kGrpcScheme) - 1);
		if (grpc_options.target.empty()) {
			throw ConfigurationError("grpc:// URI without host:port");
		}
		grpc_options.db = options.db;
		grpc_options.collection = options.collection;
		grpc_options.pool_size = options.max_pool_size;
		grpc_options.app_name = options.app_name;
		grpc_options.operation_timeout = options.operation_timeout;
		return std::make_unique<GrpcDocumentStore>(grpc_options);
	}

	size_t scheme_end = options.uri.find("://");
	std::string scheme = scheme_end == std::string::npos ? options.uri : options.uri.substr(0, scheme_end);
	throw ConfigurationError("Unsupported storage URI scheme '" + scheme + "' (expected memory:// or grpc://)");
}

} // namespace Vigil
