#ifndef VIGIL_WORKLOAD_DOCUMENT_FACTORY_H_
#define VIGIL_WORKLOAD_DOCUMENT_FACTORY_H_

#include <cstdint>
#include <random>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "key_router.h"
#include "storage/document_store.h"

namespace Vigil {

/**
 * Generates insert documents with heterogeneous payloads: optional fields,
 * variable length arrays and values whose type changes between documents.
 * Not thread safe; every worker owns one.
 */
class DocumentFactory {
public:
	DocumentFactory(const DocumentKeyRouter* router, uint64_t seed);

	Document Make(int64_t sequence);
	Document Make(const DocumentKey& key);

	std::mt19937_64& rng() { return rng_; }

private:
	google::protobuf::Struct MakePayload(const std::string& country_code);
	google::protobuf::Value MakeProfile(const std::string& country_code);
	std::string RandomAlnum(size_t length);
	const std::string& Pick(const std::vector<std::string>& values);
	bool Chance(double p);

	const DocumentKeyRouter* router_;
	std::mt19937_64 rng_;
};

} // namespace Vigil

#endif // VIGIL_WORKLOAD_DOCUMENT_FACTORY_H_
