#ifndef VIGIL_STORAGE_GRPC_DOCUMENT_STORE_H_
#define VIGIL_STORAGE_GRPC_DOCUMENT_STORE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <document_store.grpc.pb.h>

#include "document_store.h"

namespace Vigil {

struct GrpcStoreOptions {
	// host:port
	std::string target;
	std::string db;
	std::string collection;
	int pool_size = 50;
	std::string app_name;
	std::chrono::milliseconds operation_timeout{10000};
};

// Maps a gRPC status onto the storage taxonomy, including the transient hint.
StorageResult FromGrpcStatus(const grpc::Status& status);

/**
 * DocumentStore backed by the vigil.storage.DocumentStore gRPC service.
 * Calls are spread round-robin over pool_size independent channels; each call
 * carries a deadline of operation_timeout.
 */
class GrpcDocumentStore : public DocumentStore {
public:
	explicit GrpcDocumentStore(const GrpcStoreOptions& options);

	StorageResult Find(const DocumentKey& key, Document* document, bool* found) override;
	StorageResult Insert(const Document& document) override;
	StorageResult InsertMany(const std::vector<Document>& documents, size_t* inserted) override;
	StorageResult Update(const DocumentKey& key, const UpdateSpec& update) override;
	StorageResult Ping(std::chrono::milliseconds timeout) override;
	StorageResult EstimatedCount(int64_t* count) override;
	StorageResult PrepareCollection(const CollectionLayout& layout) override;
	StorageResult DescribeCluster(ClusterDescription* description) override;

private:
	vigil::storage::DocumentStore::Stub* NextStub();
	void SetDeadline(grpc::ClientContext* context, std::chrono::milliseconds timeout) const;

	const GrpcStoreOptions options_;
	std::vector<std::unique_ptr<vigil::storage::DocumentStore::Stub>> stubs_;
	std::atomic<size_t> next_stub_{0};
};

} // namespace Vigil

#endif // VIGIL_STORAGE_GRPC_DOCUMENT_STORE_H_
