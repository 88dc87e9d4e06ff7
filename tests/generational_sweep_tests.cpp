#include <gtest/gtest.h>
#include "gc/generational_sweep.hpp"
#include "gc_test_utils.hpp"

using namespace chunkkeeper;
using namespace chunkkeeper_test;

namespace {

ChunkKeeperConfig shortGraceConfig() {
    ChunkKeeperConfig cfg = testConfig();
    cfg.gc.gracePeriod = std::chrono::hours(1);
    return cfg;
}

} // namespace

class GenerationalSweepTest : public ::testing::Test {
protected:
    GenerationalSweepTest() : clock_(testEpoch()), node_(clock_, shortGraceConfig()) {}

    std::string orphanNow(const std::string& content) {
        std::string h = node_.writeChunk(content);
        node_.ledger.incrementReference(h, commitRef("c-" + content));
        node_.ledger.decrementReference(h, commitRef("c-" + content));
        return h;
    }

    GcResult sweep(bool dryRun = false) {
        return node_.service.collect(node_.options("generational", dryRun));
    }

    ManualClock clock_;
    TestNode node_;
};

TEST_F(GenerationalSweepTest, NurseryIsNeverSwept) {
    TimePoint t0 = clock_.now();
    std::string old = orphanNow("old generation");
    std::string pinned = node_.writeChunk("old but pinned");
    node_.ledger.incrementReference(pinned, commitRef("pin"));

    clock_.set(t0 + 8 * kOneDay);
    std::string young = orphanNow("young generation");
    clock_.set(t0 + 10 * kOneDay - std::chrono::hours(2));
    std::string nursery = orphanNow("nursery");
    clock_.set(t0 + 10 * kOneDay);

    GcResult r = sweep();
    EXPECT_EQ(r.chunksDeleted, 2u);
    EXPECT_FALSE(node_.store.hasChunk(old));
    EXPECT_FALSE(node_.store.hasChunk(young));
    EXPECT_TRUE(node_.store.hasChunk(nursery));
    EXPECT_TRUE(node_.store.hasChunk(pinned));
    EXPECT_EQ(node_.ledger.getState(state_keys::kLastOldGenerationSweepAt).value_or(""),
              std::to_string(toEpochMillis(clock_.now())));

    auto entry = node_.journal.lastEntry(old, AuditDecision::Deleted);
    ASSERT_TRUE(entry.has_value());
    EXPECT_NE(entry->reason.find("old generation"), std::string::npos);
}

TEST_F(GenerationalSweepTest, OldGenerationWaitsForItsInterval) {
    TimePoint t0 = clock_.now();
    std::string pinned = node_.writeChunk("released later");
    node_.ledger.incrementReference(pinned, commitRef("pin"));
    clock_.set(t0 + 10 * kOneDay);
    sweep();

    node_.ledger.decrementReference(pinned, commitRef("pin"));
    clock_.advance(std::chrono::hours(2));
    GcResult skipped = sweep();
    EXPECT_EQ(skipped.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(pinned));

    clock_.advance(kOneDay);
    GcResult swept = sweep();
    EXPECT_EQ(swept.chunksDeleted, 1u);
    EXPECT_FALSE(node_.store.hasChunk(pinned));
}

TEST_F(GenerationalSweepTest, YoungIsSweptEveryPass) {
    std::string young = orphanNow("young again");
    clock_.advance(kOneDay + std::chrono::hours(2));
    node_.ledger.setState(state_keys::kLastOldGenerationSweepAt,
                          std::to_string(toEpochMillis(clock_.now() - std::chrono::hours(1))));

    GenerationalSweep finder(node_.ledger, node_.config.gc.nurseryAge, node_.config.gc.youngAge,
                             node_.config.gc.oldGenerationInterval);
    GcResult r = node_.service.collector().run(finder, node_.options("generational"));
    EXPECT_FALSE(finder.sweepingOld());
    EXPECT_EQ(r.chunksDeleted, 1u);
    EXPECT_FALSE(node_.store.hasChunk(young));
}

TEST_F(GenerationalSweepTest, DryRunDoesNotRecordOldSweep) {
    orphanNow("dry old");
    clock_.advance(10 * kOneDay);
    GcResult r = sweep(true);
    EXPECT_EQ(r.candidates.size(), 1u);
    EXPECT_FALSE(node_.ledger.getState(state_keys::kLastOldGenerationSweepAt).has_value());
}

TEST_F(GenerationalSweepTest, ClassifiesByAge) {
    GenerationalSweep finder(node_.ledger, kOneDay, 7 * kOneDay, kOneDay);
    TimePoint now = clock_.now();
    EXPECT_EQ(finder.classify(now - std::chrono::hours(23), now), Generation::Nursery);
    EXPECT_EQ(finder.classify(now - kOneDay, now), Generation::Young);
    EXPECT_EQ(finder.classify(now - 6 * kOneDay, now), Generation::Young);
    EXPECT_EQ(finder.classify(now - 7 * kOneDay, now), Generation::Old);
    EXPECT_EQ(generationToString(Generation::Old), "old");
}

TEST_F(GenerationalSweepTest, MalformedSweepStateFailsTheRun) {
    orphanNow("waiting");
    node_.ledger.setState(state_keys::kLastOldGenerationSweepAt, "not-a-timestamp");

    GcResult r = sweep();
    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_EQ(r.chunksDeleted, 0u);
    ASSERT_FALSE(r.errors.empty());
    EXPECT_NE(r.errors[0].message.find("malformed"), std::string::npos);
    EXPECT_EQ(node_.ledger.getRun(*r.runId)->status, RunStatus::Failed);
}
