#include <gtest/gtest.h>
#include "gc_test_utils.hpp"
#include "utilities/errors.hpp"
#include "utilities/metrics.h"

using namespace chunkkeeper;
using namespace chunkkeeper_test;

class RecoveryManagerTest : public ::testing::Test {
protected:
    RecoveryManagerTest() : clock_(testEpoch()), node_(clock_) {
        MetricsRegistry::instance().reset();
    }

    // Orphan a chunk and sweep it so its row is soft-deleted.
    std::string sweptChunk(const std::string& content) {
        std::string h = node_.writeChunk(content);
        node_.ledger.incrementReference(h, commitRef("c-" + content));
        node_.ledger.decrementReference(h, commitRef("c-" + content));
        clock_.advance(8 * kOneDay);
        GcResult r = node_.service.collect(node_.options());
        EXPECT_EQ(r.chunksDeleted, 1u);
        return h;
    }

    ManualClock clock_;
    TestNode node_;
};

TEST_F(RecoveryManagerTest, RecoverWithBytesPresentIsFull) {
    std::string h = sweptChunk("recoverable");
    // Bytes came back from a replica before the recovery call.
    node_.store.fake().addChunk(bytesOf("recoverable"));

    EXPECT_EQ(node_.recovery.recover(h), RecoveryManager::RecoveryOutcome::Full);
    auto row = node_.ledger.getChunk(h);
    ASSERT_TRUE(row.has_value());
    EXPECT_FALSE(row->softDeleted());
    EXPECT_EQ(row->gcProtectedUntil.value_or(TimePoint{}), clock_.now() + node_.config.gc.gracePeriod);
    EXPECT_TRUE(node_.journal.lastEntry(h, AuditDecision::Recovered).has_value());

    // The restored row is not swept again straight away.
    GcResult r = node_.service.collect(node_.options());
    EXPECT_EQ(r.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(h));
}

TEST_F(RecoveryManagerTest, RecoverWithoutBytesIsMetadataOnly) {
    std::string h = sweptChunk("metadata only");
    EXPECT_EQ(node_.recovery.recover(h), RecoveryManager::RecoveryOutcome::MetadataOnly);
    EXPECT_FALSE(node_.ledger.getChunk(h)->softDeleted());
    auto entry = node_.journal.lastEntry(h, AuditDecision::Recovered);
    ASSERT_TRUE(entry.has_value());
    EXPECT_NE(entry->reason.find("re-upload"), std::string::npos);
}

TEST_F(RecoveryManagerTest, RecoverLiveChunkReportsNotDeleted) {
    std::string h = node_.writeChunk("alive");
    EXPECT_EQ(node_.recovery.recover(h), RecoveryManager::RecoveryOutcome::NotDeleted);
    EXPECT_EQ(node_.recovery.recover(std::string(64, 'e')), RecoveryManager::RecoveryOutcome::NotDeleted);
    EXPECT_EQ(recoveryOutcomeToString(RecoveryManager::RecoveryOutcome::MetadataOnly), "metadata-only");
}

TEST_F(RecoveryManagerTest, PurgeRemovesRowsPastRecoveryWindow) {
    std::string older = sweptChunk("purged first");
    clock_.advance(10 * kOneDay);
    std::string newer = sweptChunk("purged later");

    EXPECT_EQ(node_.recovery.purgeExpired(clock_.now()), 0u);
    clock_.advance(15 * kOneDay);
    EXPECT_EQ(node_.recovery.purgeExpired(clock_.now()), 1u);
    EXPECT_FALSE(node_.ledger.getChunk(older).has_value());
    EXPECT_TRUE(node_.ledger.getChunk(newer).has_value());
    EXPECT_TRUE(node_.journal.lastEntry(older, AuditDecision::Purged).has_value());
    EXPECT_EQ(node_.recovery.recover(older), RecoveryManager::RecoveryOutcome::NotDeleted);

    clock_.advance(20 * kOneDay);
    EXPECT_EQ(node_.recovery.purgeExpired(clock_.now(), 1), 1u);
    EXPECT_TRUE(node_.journal.verify().ok);
}

TEST_F(RecoveryManagerTest, HaltDropsEveryPendingDeletion) {
    for (const char* c : {"h1", "h2", "h3"})
        node_.writeChunk(c);
    EXPECT_EQ(node_.recovery.emergencyHalt("suspected ledger corruption"), 3u);
    EXPECT_TRUE(node_.recovery.isHalted());
    EXPECT_EQ(node_.recovery.haltReason(), "suspected ledger corruption");
    EXPECT_TRUE(node_.ledger.selectPendingDeletions().empty());
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("chunkkeeper_gc_halted"), 1.0);

    auto entries = node_.journal.entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.back().decision, AuditDecision::Halted);

    clock_.advance(30 * kOneDay);
    EXPECT_THROW(node_.service.collect(node_.options()), CoordinationError);
    // Even a collector that ignores the flag finds nothing eligible.
    EXPECT_TRUE(node_.ledger.selectExpiredOrphans(clock_.now(), 10).empty());
}

TEST_F(RecoveryManagerTest, ResumeStartsFreshGraceWindows) {
    std::string h = node_.writeChunk("waits again");
    node_.recovery.emergencyHalt("operator request");
    clock_.advance(30 * kOneDay);
    node_.recovery.resume();

    EXPECT_FALSE(node_.recovery.isHalted());
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("chunkkeeper_gc_halted"), 0.0);
    auto pending = node_.ledger.pendingFor(h);
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->deleteAfter, clock_.now() + node_.config.gc.gracePeriod);

    EXPECT_EQ(node_.service.collect(node_.options()).chunksDeleted, 0u);
    clock_.advance(8 * kOneDay);
    EXPECT_EQ(node_.service.collect(node_.options()).chunksDeleted, 1u);
}
