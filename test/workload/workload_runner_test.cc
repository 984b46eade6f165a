#include <gtest/gtest.h>
#include "../../src/workload/workload_runner.h"
#include "../../src/storage/memory_document_store.h"

#include <chrono>
#include <thread>

using namespace Vigil;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public ErrorSink {
public:
    void Report(const ErrorEvent& event) override {
        absl::MutexLock lock(&mu_);
        events_.push_back(event);
    }

    size_t CountSource(const std::string& source, const std::string& code = "") {
        absl::MutexLock lock(&mu_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.source == source && (code.empty() || e.code == code)) ++n;
        }
        return n;
    }

private:
    absl::Mutex mu_;
    std::vector<ErrorEvent> events_;
};

// Memory store whose bulk inserts are slow, so only the preload phase drags.
class SlowBulkInsertStore : public MemoryDocumentStore {
public:
    explicit SlowBulkInsertStore(std::chrono::milliseconds delay) : delay_(delay) {}

    StorageResult InsertMany(const std::vector<Document>& documents, size_t* inserted) override {
        std::this_thread::sleep_for(delay_);
        return MemoryDocumentStore::InsertMany(documents, inserted);
    }

private:
    std::chrono::milliseconds delay_;
};

WorkloadSettings TestSettings(ClusterTopology topology) {
    WorkloadSettings s;
    s.store.uri = "memory://runner";
    s.store.db = "liveness";
    s.store.collection = "probe";
    s.total_docs = 250;
    s.ops_per_sec = 100.0;
    s.workers = 4;
    s.mix = ParseOperationMix("find=70,insert=20,update=10");
    s.topology = topology;
    s.store.topology = topology;
    s.zones = DefaultZoneSet();
    s.acquire_timeout = 100ms;
    s.error_backoff = 5ms;
    s.shutdown_grace = 1000ms;
    s.preload_batch_size = 100;
    s.heartbeat.interval = 20ms;
    s.heartbeat.failure_threshold = 2;
    s.heartbeat.timeout = 100ms;
    s.reporting.report_interval = 0s;
    return s;
}

} // namespace

TEST(WorkloadRunnerTest, LayoutFollowsTopology) {
    CollectionLayout rs = WorkloadRunner::LayoutFor(ClusterTopology::REPLICA_SET);
    ASSERT_EQ(rs.indexes_size(), 1);
    EXPECT_EQ(rs.indexes(0).field(), "k");
    EXPECT_EQ(rs.shard_key_size(), 0);

    CollectionLayout sharded = WorkloadRunner::LayoutFor(ClusterTopology::SHARDED);
    ASSERT_EQ(sharded.shard_key_size(), 1);
    EXPECT_EQ(sharded.shard_key(0).field(), "_id");
    EXPECT_TRUE(sharded.shard_key(0).hashed());

    CollectionLayout geo = WorkloadRunner::LayoutFor(ClusterTopology::GEOSHARDED);
    ASSERT_EQ(geo.shard_key_size(), 2);
    EXPECT_EQ(geo.shard_key(0).field(), "location");
    EXPECT_FALSE(geo.shard_key(0).hashed());
    EXPECT_EQ(geo.shard_key(1).field(), "_id");
}

TEST(WorkloadRunnerTest, PreloadFillsToTarget) {
    auto store = std::make_shared<MemoryDocumentStore>();
    WorkloadRunner runner(TestSettings(ClusterTopology::SHARDED), store, std::make_shared<RecordingSink>());
    EXPECT_EQ(runner.Preload(), 250);
    EXPECT_EQ(store->size(), 250u);
    EXPECT_EQ(runner.router().known_sequences(), 250);

    // Every preloaded key can be found through the router
    Document doc;
    bool found = false;
    ASSERT_TRUE(store->Find(runner.router().BuildKey(249), &doc, &found).ok());
    EXPECT_TRUE(found);
}

TEST(WorkloadRunnerTest, PreloadTopsUpExistingCollection) {
    auto store = std::make_shared<MemoryDocumentStore>();
    {
        WorkloadSettings s = TestSettings(ClusterTopology::GEOSHARDED);
        s.total_docs = 100;
        WorkloadRunner first(s, store, std::make_shared<RecordingSink>());
        first.Preload();
    }
    ASSERT_EQ(store->size(), 100u);

    WorkloadRunner second(TestSettings(ClusterTopology::GEOSHARDED), store, std::make_shared<RecordingSink>());
    EXPECT_EQ(second.Preload(), 250);
    EXPECT_EQ(store->size(), 250u);
}

TEST(WorkloadRunnerTest, PreloadSkipsWhenAlreadySized) {
    auto store = std::make_shared<MemoryDocumentStore>();
    WorkloadSettings s = TestSettings(ClusterTopology::REPLICA_SET);
    WorkloadRunner first(s, store, std::make_shared<RecordingSink>());
    first.Preload();

    s.total_docs = 10;
    WorkloadRunner second(s, store, std::make_shared<RecordingSink>());
    // Inserts must continue past the existing documents
    EXPECT_EQ(second.Preload(), 250);
    EXPECT_EQ(store->size(), 250u);
}

TEST(WorkloadRunnerTest, RunsAndStops) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto sink = std::make_shared<RecordingSink>();
    WorkloadRunner runner(TestSettings(ClusterTopology::SHARDED), store, sink);
    runner.Start();
    EXPECT_TRUE(store->prepared());
    std::this_thread::sleep_for(1s);

    RunSummary summary = runner.Stop();
    EXPECT_TRUE(summary.drained);
    EXPECT_EQ(summary.abandoned_workers, 0);
    EXPECT_EQ(summary.topology, "sharded");
    EXPECT_EQ(summary.workers, 4);
    uint64_t total = 0;
    for (size_t i = 0; i < kNumOperationKinds; ++i) {
        total += summary.successes[i];
        EXPECT_EQ(summary.failures[i], 0u);
    }
    EXPECT_GT(total, 50u);
    EXPECT_LE(total, 130u);
    EXPECT_TRUE(runner.heartbeat().healthy());
    EXPECT_EQ(sink->CountSource("operation"), 0u);

    // Second stop returns the same summary
    EXPECT_EQ(runner.Stop().workers, 4);
}

TEST(WorkloadRunnerTest, PreloadTimeIsNotMeasured) {
    WorkloadSettings settings = TestSettings(ClusterTopology::REPLICA_SET);
    settings.total_docs = 300;
    // Three batches of 400ms each
    auto store = std::make_shared<SlowBulkInsertStore>(400ms);
    WorkloadRunner runner(settings, store, std::make_shared<RecordingSink>());
    runner.Start();
    EXPECT_EQ(store->size(), 300u);
    std::this_thread::sleep_for(2s);

    RunSummary summary = runner.Stop();
    EXPECT_LT(summary.duration_sec, 2.5);
    EXPECT_NEAR(summary.achieved_ops_per_sec, 100.0, 15.0);
}

TEST(WorkloadRunnerTest, WorkersStartWithEmptyBucket) {
    WorkloadSettings settings = TestSettings(ClusterTopology::REPLICA_SET);
    settings.total_docs = 300;
    WorkloadRunner runner(settings, std::make_shared<SlowBulkInsertStore>(400ms),
            std::make_shared<RecordingSink>());
    runner.Start();
    std::this_thread::sleep_for(300ms);
    const uint64_t early_grants = runner.metrics().grants();
    runner.Stop();

    // About 30 at 100 ops/s; a bucket left to fill during preload would hand out 100 at once
    EXPECT_LT(early_grants, 60u);
}

TEST(WorkloadRunnerTest, ReportsDegradedAndRecovered) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto sink = std::make_shared<RecordingSink>();
    WorkloadRunner runner(TestSettings(ClusterTopology::REPLICA_SET), store, sink);
    runner.Start();

    store->SetAvailable(false);
    for (int i = 0; i < 100 && runner.heartbeat().healthy(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(runner.heartbeat().healthy());
    EXPECT_EQ(sink->CountSource("heartbeat", "DEGRADED"), 1u);

    store->SetAvailable(true);
    for (int i = 0; i < 100 && !runner.heartbeat().healthy(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(runner.heartbeat().healthy());

    RunSummary summary = runner.Stop();
    EXPECT_EQ(sink->CountSource("heartbeat", "RECOVERED"), 1u);
    // Operations kept failing while the store was down, and the workers survived
    EXPECT_GT(sink->CountSource("operation"), 0u);
    EXPECT_TRUE(summary.drained);
}
