#include "workload_types.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include "common/errors.h"

namespace Vigil {

namespace {

std::string Trim(const std::string& s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
	while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
	return s.substr(begin, end - begin);
}

std::string ToLower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

std::vector<std::string> SplitComma(const std::string& s) {
	std::vector<std::string> parts;
	std::stringstream ss(s);
	std::string item;
	while (std::getline(ss, item, ',')) {
		item = Trim(item);
		if (!item.empty()) {
			parts.push_back(item);
		}
	}
	return parts;
}

} // namespace

const char* OperationKindName(OperationKind kind) {
	switch (kind) {
		case OperationKind::FIND:
			return "find";
		case OperationKind::INSERT:
			return "insert";
		case OperationKind::UPDATE:
			return "update";
	}
	return "unknown";
}

OperationKind ParseOperationKind(const std::string& name) {
	const std::string lower = ToLower(Trim(name));
	for (OperationKind kind : kAllOperationKinds) {
		if (lower == OperationKindName(kind)) {
			return kind;
		}
	}
	throw ConfigurationError("Unknown operation kind '" + name + "' (expected find, insert or update)");
}

const char* ClusterTopologyName(ClusterTopology topology) {
	switch (topology) {
		case ClusterTopology::REPLICA_SET:
			return "replica_set";
		case ClusterTopology::SHARDED:
			return "sharded";
		case ClusterTopology::GEOSHARDED:
			return "geosharded";
	}
	return "unknown";
}

ClusterTopology ParseClusterTopology(const std::string& name) {
	const std::string lower = ToLower(Trim(name));
	if (lower == "replica_set") return ClusterTopology::REPLICA_SET;
	if (lower == "sharded") return ClusterTopology::SHARDED;
	if (lower == "geosharded") return ClusterTopology::GEOSHARDED;
	throw ConfigurationError("Invalid cluster topology '" + name +
			"' (expected replica_set, sharded or geosharded)");
}

double OperationMix::total() const {
	double sum = 0.0;
	for (double w : weights) {
		sum += w;
	}
	return sum;
}

std::string OperationMix::ToString() const {
	std::ostringstream out;
	bool first = true;
	for (OperationKind kind : kAllOperationKinds) {
		if (!first) out << ",";
		out << OperationKindName(kind) << "=" << weight(kind);
		first = false;
	}
	return out.str();
}

OperationMix ParseOperationMix(const std::string& spec) {
	OperationMix mix;
	std::array<bool, kNumOperationKinds> seen{};

	for (const std::string& entry : SplitComma(spec)) {
		size_t eq = entry.find('=');
		if (eq == std::string::npos) {
			throw ConfigurationError("Malformed operation mix entry '" + entry + "' (expected kind=weight)");
		}
		OperationKind kind = ParseOperationKind(entry.substr(0, eq));
		const std::string value = Trim(entry.substr(eq + 1));

		double weight = 0.0;
		size_t consumed = 0;
		try {
			weight = std::stod(value, &consumed);
		} catch (const std::exception&) {
			consumed = 0;
		}
		if (value.empty() || consumed != value.size() || !std::isfinite(weight)) {
			throw ConfigurationError("Operation mix weight for " + std::string(OperationKindName(kind)) +
					" is not a number: '" + value + "'");
		}
		if (weight < 0.0) {
			throw ConfigurationError("Operation mix weight for " + std::string(OperationKindName(kind)) +
					" is negative");
		}
		if (seen[KindIndex(kind)]) {
			throw ConfigurationError("Operation kind " + std::string(OperationKindName(kind)) +
					" listed twice in operation mix");
		}
		seen[KindIndex(kind)] = true;
		mix.weights[KindIndex(kind)] = weight;
	}

	if (!(mix.total() > 0.0)) {
		throw ConfigurationError("Operation mix '" + spec + "' has no positive weight");
	}
	return mix;
}

const ZoneSet& DefaultZoneSet() {
	static const ZoneSet zones = {
		"US", "CA", "GB", "DE", "FR", "IN", "JP", "CN", "BR", "AU",
		"SG", "NL", "SE", "CH", "IT", "ES", "MX", "KR", "ZA", "AE",
	};
	return zones;
}

ZoneSet ParseZoneSet(const std::string& spec) {
	ZoneSet zones = SplitComma(spec);
	if (zones.empty()) {
		return DefaultZoneSet();
	}
	ZoneSet sorted = zones;
	std::sort(sorted.begin(), sorted.end());
	auto dup = std::adjacent_find(sorted.begin(), sorted.end());
	if (dup != sorted.end()) {
		throw ConfigurationError("Zone '" + *dup + "' listed twice");
	}
	return zones;
}

} // namespace Vigil
