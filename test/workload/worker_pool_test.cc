#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/workload/worker_pool.h"
#include "../../src/storage/memory_document_store.h"
#include "../../src/common/errors.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace Vigil;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class MockDocumentStore : public DocumentStore {
public:
    MOCK_METHOD(StorageResult, Find, (const DocumentKey& key, Document* document, bool* found), (override));
    MOCK_METHOD(StorageResult, Insert, (const Document& document), (override));
    MOCK_METHOD(StorageResult, InsertMany, (const std::vector<Document>& documents, size_t* inserted), (override));
    MOCK_METHOD(StorageResult, Update, (const DocumentKey& key, const UpdateSpec& update), (override));
    MOCK_METHOD(StorageResult, Ping, (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(StorageResult, EstimatedCount, (int64_t* count), (override));
    MOCK_METHOD(StorageResult, PrepareCollection, (const CollectionLayout& layout), (override));
    MOCK_METHOD(StorageResult, DescribeCluster, (ClusterDescription* description), (override));
};

class MockErrorSink : public ErrorSink {
public:
    MOCK_METHOD(void, Report, (const ErrorEvent& event), (override));
};

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        limiter_ = std::make_shared<TokenBucket>(200.0, 200.0);
        router_ = std::make_shared<DocumentKeyRouter>(ClusterTopology::REPLICA_SET, DefaultZoneSet());
        router_->SetKnownSequences(100);
        metrics_ = std::make_shared<MetricsAggregator>();
        errors_ = std::make_shared<NiceMock<MockErrorSink>>();
        options_.acquire_timeout = 50ms;
        options_.error_backoff = 1ms;
        options_.seed = 42;
    }

    std::unique_ptr<WorkerPool> MakePool(std::shared_ptr<DocumentStore> store, const std::string& mix) {
        auto selector = std::make_shared<OperationSelector>(ParseOperationMix(mix));
        return std::make_unique<WorkerPool>(
            WorkerPool::Collaborators{limiter_, selector, router_, store, metrics_, errors_}, options_);
    }

    std::shared_ptr<TokenBucket> limiter_;
    std::shared_ptr<DocumentKeyRouter> router_;
    std::shared_ptr<MetricsAggregator> metrics_;
    std::shared_ptr<NiceMock<MockErrorSink>> errors_;
    WorkerPoolOptions options_;
};

TEST_F(WorkerPoolTest, ClassifiesOutcomes) {
    auto store = std::make_shared<NiceMock<MockDocumentStore>>();
    ON_CALL(*store, Find(_, _, _)).WillByDefault(Invoke([](const DocumentKey&, Document*, bool* found) {
        *found = true;
        return StorageResult::Ok();
    }));
    ON_CALL(*store, Insert(_)).WillByDefault(
        Return(StorageResult::Error(StorageCode::TIMEOUT, true, "socket timeout")));
    ON_CALL(*store, Update(_, _)).WillByDefault(
        Invoke([](const DocumentKey&, const UpdateSpec&) -> StorageResult {
            throw std::runtime_error("driver bug");
        }));

    std::atomic<int> operation_errors{0};
    std::atomic<int> unexpected{0};
    EXPECT_CALL(*errors_, Report(_)).WillRepeatedly(Invoke([&](const ErrorEvent& e) {
        EXPECT_EQ(e.source, "operation");
        ASSERT_TRUE(e.kind.has_value());
        EXPECT_FALSE(e.key.empty());
        if (*e.kind == OperationKind::INSERT) {
            EXPECT_EQ(e.code, "TIMEOUT/transient");
            operation_errors.fetch_add(1);
        } else if (*e.kind == OperationKind::UPDATE) {
            EXPECT_EQ(e.code, "EXCEPTION");
            EXPECT_EQ(e.message, "driver bug");
            unexpected.fetch_add(1);
        } else {
            ADD_FAILURE() << "find reported as an error";
        }
    }));

    auto pool = MakePool(store, "find=1,insert=1,update=1");
    pool->Run(4, std::make_shared<ShutdownSignal>());
    std::this_thread::sleep_for(1s);
    DrainReport report = pool->Shutdown(1s);
    EXPECT_TRUE(report.drained);

    WorkerStats::Snapshot totals = metrics_->Totals();
    const size_t find = KindIndex(OperationKind::FIND);
    const size_t insert = KindIndex(OperationKind::INSERT);
    const size_t update = KindIndex(OperationKind::UPDATE);
    EXPECT_GT(totals.successes[find], 0u);
    EXPECT_EQ(totals.failures[find], 0u);
    EXPECT_EQ(totals.successes[insert], 0u);
    EXPECT_EQ(totals.failures[insert], static_cast<uint64_t>(operation_errors.load()));
    EXPECT_EQ(totals.successes[update], 0u);
    EXPECT_EQ(totals.unexpected, static_cast<uint64_t>(unexpected.load()));
    EXPECT_GT(operation_errors.load(), 0);
    EXPECT_GT(unexpected.load(), 0);
    EXPECT_EQ(totals.total_attempts(), totals.total_successes() + totals.total_failures());
}

TEST_F(WorkerPoolTest, DrainsWhenCallsAreFast) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto pool = MakePool(store, "find=70,insert=20,update=10");
    pool->Run(8, std::make_shared<ShutdownSignal>());
    std::this_thread::sleep_for(500ms);

    DrainReport report = pool->Shutdown(2s);
    EXPECT_TRUE(report.drained);
    EXPECT_EQ(report.workers, 8);
    EXPECT_EQ(report.abandoned, 0);
    EXPECT_LT(report.waited, 2s);
    EXPECT_EQ(pool->active_workers(), 0);
    EXPECT_GT(metrics_->Totals().total_successes(), 0u);
}

TEST_F(WorkerPoolTest, AbandonsSlowWorkersAtGraceDeadline) {
    auto store = std::make_shared<MemoryDocumentStore>();
    store->SetLatency(std::chrono::microseconds(1500000));
    auto pool = MakePool(store, "find=1");
    pool->Run(3, std::make_shared<ShutdownSignal>());
    // Let every worker get into its slow call
    std::this_thread::sleep_for(300ms);

    const auto start = std::chrono::steady_clock::now();
    DrainReport report = pool->Shutdown(300ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(report.drained);
    EXPECT_EQ(report.abandoned, 3);
    EXPECT_GE(waited, 300ms);
    EXPECT_LT(waited, 400ms);

    // Abandoned workers still finish their call and exit on their own
    for (int i = 0; i < 300 && pool->active_workers() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(pool->active_workers(), 0);
}

TEST_F(WorkerPoolTest, NoAcquisitionAfterShutdown) {
    auto store = std::make_shared<NiceMock<MockDocumentStore>>();
    std::atomic<int> calls{0};
    ON_CALL(*store, Find(_, _, _)).WillByDefault(Invoke([&calls](const DocumentKey&, Document*, bool* found) {
        calls.fetch_add(1);
        *found = false;
        return StorageResult::Ok();
    }));
    auto pool = MakePool(store, "find=1");
    auto signal = std::make_shared<ShutdownSignal>();
    pool->Run(4, signal);
    std::this_thread::sleep_for(300ms);

    // The signal alone must stop acquisition, with the limiter still open
    signal->Raise();
    for (int i = 0; i < 200 && pool->active_workers() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(pool->active_workers(), 0);
    ASSERT_FALSE(limiter_->stopped());
    const uint64_t grants = limiter_->grants();
    const int calls_after_signal = calls.load();

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(limiter_->grants(), grants);
    EXPECT_EQ(calls.load(), calls_after_signal);

    DrainReport report = pool->Shutdown(1s);
    EXPECT_TRUE(report.drained);
    EXPECT_EQ(limiter_->Acquire(1.0, 10ms), AcquireStatus::STOPPED);
}

TEST_F(WorkerPoolTest, ThrowingErrorSinkKeepsWorkersRunning) {
    auto store = std::make_shared<NiceMock<MockDocumentStore>>();
    ON_CALL(*store, Insert(_)).WillByDefault(
        Return(StorageResult::Error(StorageCode::UNAVAILABLE, true, "no primary")));
    EXPECT_CALL(*errors_, Report(_)).WillRepeatedly(::testing::Throw(std::runtime_error("disk full")));

    auto pool = MakePool(store, "insert=1");
    pool->Run(2, std::make_shared<ShutdownSignal>());
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(pool->active_workers(), 2);

    DrainReport report = pool->Shutdown(1s);
    EXPECT_TRUE(report.drained);
    EXPECT_GT(metrics_->Totals().failures[KindIndex(OperationKind::INSERT)], 5u);
}

TEST_F(WorkerPoolTest, ExternalSignalStopsWorkers) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto pool = MakePool(store, "insert=1");
    auto signal = std::make_shared<ShutdownSignal>();
    pool->Run(2, signal);
    std::this_thread::sleep_for(200ms);
    signal->Raise();
    for (int i = 0; i < 200 && pool->active_workers() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(pool->active_workers(), 0);
    EXPECT_TRUE(pool->Shutdown(100ms).drained);
    // Inserted documents took fresh sequences past the known range
    EXPECT_GT(router_->known_sequences(), 100);
    EXPECT_EQ(store->size(), static_cast<size_t>(router_->known_sequences() - 100));
}

TEST_F(WorkerPoolTest, AggregateRateFollowsLimiter) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto pool = MakePool(store, "find=70,insert=20,update=10");
    pool->Run(16, std::make_shared<ShutdownSignal>());
    std::this_thread::sleep_for(2s);
    pool->Shutdown(1s);
    // 200 ops/s from an empty bucket
    EXPECT_NEAR(static_cast<double>(metrics_->Totals().total_attempts()), 400.0, 40.0);
}

TEST_F(WorkerPoolTest, RejectsInvalidRun) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto pool = MakePool(store, "find=1");
    EXPECT_THROW(pool->Run(0, nullptr), ConfigurationError);
    pool->Run(1, nullptr);
    EXPECT_THROW(pool->Run(1, nullptr), std::logic_error);
    pool->Shutdown(1s);

    WorkerPool::Collaborators missing;
    EXPECT_THROW(WorkerPool{missing}, ConfigurationError);
}
