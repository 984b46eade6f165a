#include <gtest/gtest.h>
#include "../../src/workload/key_router.h"
#include "../../src/common/errors.h"

#include <algorithm>
#include <map>
#include <random>
#include <set>
#include <string>

using namespace Vigil;

TEST(KeyRouterTest, ReplicaSetKeysAreUniqueWithoutLocation) {
    DocumentKeyRouter router(ClusterTopology::REPLICA_SET, DefaultZoneSet());
    std::set<std::string> ids;
    for (int64_t seq = 0; seq < 10000; ++seq) {
        DocumentKey key = router.BuildKey(seq);
        EXPECT_FALSE(key.has_location());
        EXPECT_EQ(key.k(), seq);
        ids.insert(key.id());
    }
    EXPECT_EQ(ids.size(), 10000u);
}

TEST(KeyRouterTest, ShardedKeysAreUniqueAndScattered) {
    DocumentKeyRouter router(ClusterTopology::SHARDED, DefaultZoneSet());
    std::set<std::string> ids;
    std::set<char> leading;
    for (int64_t seq = 0; seq < 10000; ++seq) {
        DocumentKey key = router.BuildKey(seq);
        EXPECT_FALSE(key.has_location());
        ids.insert(key.id());
        leading.insert(key.id()[0]);
    }
    EXPECT_EQ(ids.size(), 10000u);
    // Consecutive sequences do not share a prefix
    EXPECT_EQ(leading.size(), 16u);
    EXPECT_NE(router.BuildKey(1).id(), router.BuildKey(2).id());
}

TEST(KeyRouterTest, GeoshardedLocationIsDeterministic) {
    DocumentKeyRouter router(ClusterTopology::GEOSHARDED, DefaultZoneSet());
    DocumentKeyRouter other(ClusterTopology::GEOSHARDED, DefaultZoneSet());
    for (int64_t seq : {0, 1, 42, 999999}) {
        DocumentKey a = router.BuildKey(seq);
        DocumentKey b = router.BuildKey(seq);
        ASSERT_TRUE(a.has_location());
        EXPECT_EQ(a.location(), b.location());
        EXPECT_EQ(a.id(), b.id());
        // A second router, as in a later run, derives the same routing fields
        EXPECT_EQ(other.BuildKey(seq).location(), a.location());
        EXPECT_EQ(router.LocationFor(seq), a.location());
    }
}

TEST(KeyRouterTest, GeoshardedSpreadsAcrossZones) {
    const ZoneSet& zones = DefaultZoneSet();
    DocumentKeyRouter router(ClusterTopology::GEOSHARDED, zones);
    std::map<std::string, int> counts;
    const int samples = 20000;
    for (int64_t seq = 0; seq < samples; ++seq) {
        counts[router.BuildKey(seq).location()]++;
    }
    EXPECT_EQ(counts.size(), zones.size());
    for (const auto& [zone, count] : counts) {
        EXPECT_NE(std::find(zones.begin(), zones.end(), zone), zones.end());
        // Roughly uniform: 1000 expected per zone
        EXPECT_GT(count, 700) << zone;
        EXPECT_LT(count, 1300) << zone;
    }
}

TEST(KeyRouterTest, GeoshardedRequiresZones) {
    EXPECT_THROW(DocumentKeyRouter(ClusterTopology::GEOSHARDED, ZoneSet{}), ConfigurationError);
    EXPECT_NO_THROW(DocumentKeyRouter(ClusterTopology::SHARDED, ZoneSet{}));
}

TEST(KeyRouterTest, SequencesContinueFromKnownCount) {
    DocumentKeyRouter router(ClusterTopology::REPLICA_SET, DefaultZoneSet());
    std::mt19937_64 rng(7);
    EXPECT_EQ(router.RandomExistingSequence(rng), 0);

    router.SetKnownSequences(100);
    EXPECT_EQ(router.NextInsertSequence(), 100);
    EXPECT_EQ(router.NextInsertSequence(), 101);
    EXPECT_EQ(router.known_sequences(), 102);
    for (int i = 0; i < 1000; ++i) {
        int64_t seq = router.RandomExistingSequence(rng);
        EXPECT_GE(seq, 0);
        EXPECT_LT(seq, 102);
    }
}
