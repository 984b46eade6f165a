#include "grpc_document_store.h"

#include <algorithm>

#include <glog/logging.h>

namespace Vigil {

using vigil::storage::CountRequest;
using vigil::storage::CountResponse;
using vigil::storage::DescribeRequest;
using vigil::storage::FindRequest;
using vigil::storage::FindResponse;
using vigil::storage::InsertRequest;
using vigil::storage::InsertResponse;
using vigil::storage::PingRequest;
using vigil::storage::PingResponse;
using vigil::storage::PrepareRequest;
using vigil::storage::PrepareResponse;
using vigil::storage::UpdateRequest;
using vigil::storage::UpdateResponse;

StorageResult FromGrpcStatus(const grpc::Status& status) {
	switch (status.error_code()) {
		case grpc::StatusCode::OK:
			return StorageResult::Ok();
		case grpc::StatusCode::DEADLINE_EXCEEDED:
			return StorageResult::Error(StorageCode::TIMEOUT, true, status.error_message());
		case grpc::StatusCode::UNAVAILABLE:
		case grpc::StatusCode::RESOURCE_EXHAUSTED:
		case grpc::StatusCode::ABORTED:
			return StorageResult::Error(StorageCode::UNAVAILABLE, true, status.error_message());
		case grpc::StatusCode::NOT_FOUND:
			return StorageResult::Error(StorageCode::NOT_FOUND, false, status.error_message());
		case grpc::StatusCode::ALREADY_EXISTS:
		case grpc::StatusCode::INVALID_ARGUMENT:
		case grpc::StatusCode::FAILED_PRECONDITION:
		case grpc::StatusCode::PERMISSION_DENIED:
		case grpc::StatusCode::UNAUTHENTICATED:
			return StorageResult::Error(StorageCode::REJECTED, false, status.error_message());
		default:
			return StorageResult::Error(StorageCode::INTERNAL, false, status.error_message());
	}
}

GrpcDocumentStore::GrpcDocumentStore(const GrpcStoreOptions& options) : options_(options) {
	const int pool_size = std::max(1, options_.pool_size);
	stubs_.reserve(pool_size);
	for (int i = 0; i < pool_size; ++i) {
		grpc::ChannelArguments args;
		if (!options_.app_name.empty()) {
			args.SetUserAgentPrefix(options_.app_name);
		}
		// Without a local subchannel pool every channel would share one connection
		args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);
		auto channel = grpc::CreateCustomChannel(options_.target, grpc::InsecureChannelCredentials(), args);
		stubs_.push_back(vigil::storage::DocumentStore::NewStub(channel));
	}
	LOG(INFO) << "gRPC document store " << options_.target << " with " << pool_size << " channels";
}

vigil::storage::DocumentStore::Stub* GrpcDocumentStore::NextStub() {
	size_t index = next_stub_.fetch_add(1, std::memory_order_relaxed) % stubs_.size();
	return stubs_[index].get();
}

void GrpcDocumentStore::SetDeadline(grpc::ClientContext* context, std::chrono::milliseconds timeout) const {
	context->set_deadline(std::chrono::system_clock::now() + timeout);
}

StorageResult GrpcDocumentStore::Find(const DocumentKey& key, Document* document, bool* found) {
	*found = false;
	FindRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);
	*req.mutable_key() = key;
	FindResponse res;

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->Find(&context, req, &res);
	if (!status.ok()) {
		// Absence is a miss, not a failed operation
		if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
			return StorageResult::Ok();
		}
		return FromGrpcStatus(status);
	}
	*found = res.found();
	if (res.found() && document != nullptr) {
		*document = res.document();
	}
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::Insert(const Document& document) {
	size_t inserted = 0;
	return InsertMany(std::vector<Document>{document}, &inserted);
}

StorageResult GrpcDocumentStore::InsertMany(const std::vector<Document>& documents, size_t* inserted) {
	*inserted = 0;
	InsertRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);
	req.set_ordered(false);
	for (const Document& doc : documents) {
		*req.add_documents() = doc;
	}
	InsertResponse res;

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->Insert(&context, req, &res);
	if (!status.ok()) {
		return FromGrpcStatus(status);
	}
	*inserted = static_cast<size_t>(res.inserted_count());
	if (*inserted < documents.size()) {
		return StorageResult::Error(StorageCode::REJECTED, false,
				std::to_string(documents.size() - *inserted) + " of " + std::to_string(documents.size()) +
				" documents rejected");
	}
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::Update(const DocumentKey& key, const UpdateSpec& update) {
	UpdateRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);
	*req.mutable_key() = key;
	*req.mutable_update() = update;
	UpdateResponse res;

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->Update(&context, req, &res);
	if (!status.ok()) {
		return FromGrpcStatus(status);
	}
	if (res.matched_count() == 0 && !res.upserted()) {
		return StorageResult::Error(StorageCode::NOT_FOUND, false, "no document " + key.id());
	}
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::Ping(std::chrono::milliseconds timeout) {
	PingRequest req;
	PingResponse res;
	grpc::ClientContext context;
	SetDeadline(&context, timeout);
	grpc::Status status = NextStub()->Ping(&context, req, &res);
	if (!status.ok()) {
		return FromGrpcStatus(status);
	}
	if (!res.ok()) {
		return StorageResult::Error(StorageCode::UNAVAILABLE, true, "server reported not ok");
	}
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::EstimatedCount(int64_t* count) {
	*count = 0;
	CountRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);
	CountResponse res;

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->EstimatedCount(&context, req, &res);
	if (!status.ok()) {
		return FromGrpcStatus(status);
	}
	*count = res.count();
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::PrepareCollection(const CollectionLayout& layout) {
	PrepareRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);
	*req.mutable_layout() = layout;
	PrepareResponse res;

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->PrepareCollection(&context, req, &res);
	if (!status.ok()) {
		return FromGrpcStatus(status);
	}
	if (res.already_sharded()) {
		VLOG(1) << "Collection " << options_.db << "." << options_.collection << " already sharded";
	}
	if (!res.message().empty()) {
		VLOG(1) << "PrepareCollection: " << res.message();
	}
	return StorageResult::Ok();
}

StorageResult GrpcDocumentStore::DescribeCluster(ClusterDescription* description) {
	DescribeRequest req;
	req.set_db(options_.db);
	req.set_collection(options_.collection);

	grpc::ClientContext context;
	SetDeadline(&context, options_.operation_timeout);
	grpc::Status status = NextStub()->DescribeCluster(&context, req, description);
	return FromGrpcStatus(status);
}

} // namespace Vigil
