#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "gc/refcount_sweep.hpp"
#include "gc_test_utils.hpp"
#include "utilities/errors.hpp"
#include "utilities/metrics.h"

#include <future>
#include <stdexcept>

using namespace chunkkeeper;
using namespace chunkkeeper_test;
using ::testing::_;
using ::testing::Throw;

namespace {

// Proposes a fixed list regardless of ledger state.
class FixedFinder : public CandidateFinder {
public:
    explicit FixedFinder(std::vector<Candidate> candidates) : candidates_(std::move(candidates)) {}
    std::string name() const override { return "fixed"; }
    std::vector<Candidate> findCandidates(const CollectionContext&, const std::string& afterHash,
                                          size_t) override {
        return afterHash.empty() ? candidates_ : std::vector<Candidate>{};
    }

private:
    std::vector<Candidate> candidates_;
};

// Fails outside the ChunkKeeper error hierarchy.
class BrokenFinder : public CandidateFinder {
public:
    std::string name() const override { return "broken"; }
    std::vector<Candidate> findCandidates(const CollectionContext&, const std::string&, size_t) override {
        throw std::runtime_error("index corrupted");
    }
};

} // namespace

class GarbageCollectorTest : public ::testing::Test {
protected:
    GarbageCollectorTest() : clock_(testEpoch()), node_(clock_) {
        MetricsRegistry::instance().reset();
    }

    // Write, reference and release a chunk so its grace starts now.
    std::string orphanNow(const std::string& content) {
        std::string h = node_.writeChunk(content);
        node_.ledger.incrementReference(h, commitRef("c-" + content));
        node_.ledger.decrementReference(h, commitRef("c-" + content));
        return h;
    }

    ManualClock clock_;
    TestNode node_;
};

TEST_F(GarbageCollectorTest, GracePeriodProtectsFreshOrphans) {
    std::string h = orphanNow("alpha");

    GcResult early = node_.service.collect(node_.options());
    EXPECT_TRUE(early.lockAcquired);
    EXPECT_EQ(early.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(h));

    clock_.advance(8 * kOneDay);
    GcResult late = node_.service.collect(node_.options());
    EXPECT_EQ(late.status, RunStatus::Completed);
    EXPECT_EQ(late.chunksDeleted, 1u);
    EXPECT_EQ(late.bytesReclaimed, 5u);
    EXPECT_FALSE(node_.store.hasChunk(h));

    auto row = node_.ledger.getChunk(h);
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->softDeleted());
    EXPECT_FALSE(node_.ledger.pendingFor(h).has_value());

    auto deleted = node_.journal.lastEntry(h, AuditDecision::Deleted);
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->runId, late.runId);
    EXPECT_EQ(deleted->priorSources, std::vector<std::string>{"commit:c-alpha"});
}

TEST_F(GarbageCollectorTest, ReferencedChunksAreNeverDeleted) {
    std::string kept = node_.writeChunk("kept");
    node_.ledger.incrementReference(kept, commitRef("c1"));
    clock_.advance(30 * kOneDay);

    GcResult r = node_.service.collect(node_.options());
    EXPECT_EQ(r.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(kept));
}

TEST_F(GarbageCollectorTest, ResurrectedChunkSurvives) {
    std::string h = orphanNow("phoenix");
    clock_.advance(3 * kOneDay);
    node_.ledger.incrementReference(h, commitRef("c-new"));
    clock_.advance(8 * kOneDay);

    GcResult r = node_.service.collect(node_.options());
    EXPECT_EQ(r.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(h));
    EXPECT_EQ(node_.ledger.getChunk(h)->refCount, 1);
}

TEST_F(GarbageCollectorTest, DryRunReportsWithoutMutating) {
    std::vector<std::string> hashes;
    for (const char* c : {"one", "three", "fiftyfive"})
        hashes.push_back(orphanNow(c));
    clock_.advance(8 * kOneDay);

    size_t journalBefore = node_.journal.entries().size();
    size_t pendingBefore = node_.ledger.selectPendingDeletions().size();

    GcResult dry = node_.service.collect(node_.options("refcount", true));
    EXPECT_TRUE(dry.dryRun);
    EXPECT_EQ(dry.chunksDeleted, 0u);
    EXPECT_EQ(dry.bytesReclaimed, 0u);
    EXPECT_EQ(dry.candidates.size(), 3u);
    EXPECT_EQ(dry.candidateBytes, 3u + 5u + 9u);
    for (const auto& h : hashes) {
        EXPECT_TRUE(node_.store.hasChunk(h));
        EXPECT_FALSE(node_.ledger.getChunk(h)->softDeleted());
    }
    EXPECT_EQ(node_.journal.entries().size(), journalBefore);
    EXPECT_EQ(node_.ledger.selectPendingDeletions().size(), pendingBefore);
    EXPECT_FALSE(node_.ledger.getState(state_keys::kLastRunAt).has_value());

    auto run = node_.ledger.getRun(*dry.runId);
    ASSERT_TRUE(run.has_value());
    EXPECT_TRUE(run->dryRun);

    GcResult live = node_.service.collect(node_.options());
    EXPECT_EQ(live.chunksDeleted, dry.candidates.size());
    EXPECT_EQ(live.bytesReclaimed, dry.candidateBytes);
}

TEST_F(GarbageCollectorTest, FailingDeleteDoesNotAbortBatch) {
    std::string a = orphanNow("first");
    std::string b = orphanNow("second");
    std::string c = orphanNow("third");
    clock_.advance(8 * kOneDay);

    // Other hashes fall through to the in-memory store.
    EXPECT_CALL(node_.store, deleteChunk(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(node_.store, deleteChunk(b))
        .WillRepeatedly(Throw(StorageError("disk on fire", false)));

    GcResult r = node_.service.collect(node_.options());
    EXPECT_EQ(r.status, RunStatus::Completed);
    EXPECT_EQ(r.chunksDeleted, 2u);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].hash, b);
    EXPECT_EQ(r.errors[0].kind, "storage");

    EXPECT_FALSE(node_.store.hasChunk(a));
    EXPECT_TRUE(node_.store.hasChunk(b));
    EXPECT_FALSE(node_.store.hasChunk(c));

    // The failed chunk keeps its row and stays eligible.
    EXPECT_FALSE(node_.ledger.getChunk(b)->softDeleted());
    EXPECT_TRUE(node_.ledger.pendingFor(b).has_value());
    EXPECT_TRUE(node_.journal.lastEntry(b, AuditDecision::Failed).has_value());
    EXPECT_EQ(node_.ledger.getRun(*r.runId)->errorCount, 1u);
}

TEST_F(GarbageCollectorTest, TransientDeleteFailuresAreRetried) {
    std::string h = orphanNow("flaky");
    clock_.advance(8 * kOneDay);

    EXPECT_CALL(node_.store, deleteChunk(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(node_.store, deleteChunk(h))
        .WillOnce(Throw(StorageError("busy", true)))
        .WillOnce(Throw(StorageError("busy", true)))
        .WillOnce([this](const std::string& hash) { node_.store.fake().deleteChunk(hash); });

    GcResult r = node_.service.collect(node_.options());
    EXPECT_EQ(r.chunksDeleted, 1u);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_FALSE(node_.store.hasChunk(h));
}

TEST_F(GarbageCollectorTest, StaleCandidateIsSkippedAfterRevalidation) {
    std::string h = node_.writeChunk("stale");
    node_.ledger.incrementReference(h, commitRef("c1"));
    FixedFinder finder({Candidate{h, 5, "stale snapshot"}});

    EXPECT_CALL(node_.store, deleteChunk(_)).Times(0);
    GcResult r = node_.service.collector().run(finder, node_.options());
    EXPECT_EQ(r.chunksDeleted, 0u);
    EXPECT_TRUE(node_.store.hasChunk(h));
    auto skipped = node_.journal.lastEntry(h, AuditDecision::Skipped);
    ASSERT_TRUE(skipped.has_value());
    EXPECT_NE(skipped->reason.find("ref_count"), std::string::npos);
}

TEST_F(GarbageCollectorTest, ListenersHearAboutDeletes) {
    std::string h = orphanNow("evict me");
    clock_.advance(8 * kOneDay);

    std::vector<std::pair<std::string, uint64_t>> heard;
    node_.service.collector().addDeletionListener(
        [&heard](const std::string& hash, uint64_t size) { heard.emplace_back(hash, size); });
    node_.service.collect(node_.options());

    ASSERT_EQ(heard.size(), 1u);
    EXPECT_EQ(heard[0].first, h);
    EXPECT_EQ(heard[0].second, 8u);
}

TEST_F(GarbageCollectorTest, BatchesCoverEveryCandidate) {
    for (int i = 0; i < 7; ++i)
        orphanNow("batch-" + std::to_string(i));
    clock_.advance(8 * kOneDay);

    RunOptions opts = node_.options();
    opts.batchSizeOverride = 2;
    GcResult r = node_.service.collect(opts);
    EXPECT_EQ(r.chunksDeleted, 7u);
    EXPECT_EQ(node_.store.fake().chunkCount(), 0u);
}

TEST_F(GarbageCollectorTest, GraceOverrideShortensWindow) {
    std::string h = orphanNow("urgent");
    clock_.advance(std::chrono::hours(2));

    RunOptions opts = node_.options();
    opts.graceOverride = Millis(std::chrono::hours(1));
    GcResult r = node_.service.collect(opts);
    EXPECT_EQ(r.chunksDeleted, 1u);
    EXPECT_FALSE(node_.store.hasChunk(h));
}

TEST_F(GarbageCollectorTest, RunMetricsAreRecorded) {
    orphanNow("metered");
    clock_.advance(8 * kOneDay);
    node_.service.collect(node_.options());

    auto& m = MetricsRegistry::instance();
    EXPECT_EQ(m.counterValue("chunkkeeper_gc_runs_total",
                             {{"strategy", "refcount"}, {"status", "completed"}}),
              1.0);
    EXPECT_EQ(m.counterValue("chunkkeeper_gc_chunks_deleted_total", {{"strategy", "refcount"}}), 1.0);
    EXPECT_EQ(m.counterValue("chunkkeeper_gc_bytes_reclaimed_total", {{"strategy", "refcount"}}), 7.0);
    EXPECT_NE(m.toPrometheus().find("chunkkeeper_gc_run_duration_seconds_count"), std::string::npos);
}

TEST_F(GarbageCollectorTest, UnknownStrategyIsRejected) {
    EXPECT_THROW(node_.service.collect(node_.options("compacting")), ValidationError);
}

TEST_F(GarbageCollectorTest, HaltBetweenBatchesStopsTheRun) {
    for (int i = 0; i < 6; ++i)
        orphanNow("halted-" + std::to_string(i));
    clock_.advance(8 * kOneDay);

    int renewals = 0;
    auto renew = [this, &renewals] {
        if (++renewals == 2)
            node_.recovery.emergencyHalt("operator stop");
        return true;
    };
    RunOptions opts = node_.options();
    opts.batchSizeOverride = 2;
    RefCountSweep finder(node_.ledger);
    GcResult r = node_.service.collector().run(finder, opts, renew);

    EXPECT_TRUE(r.halted);
    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_EQ(r.chunksDeleted, 2u);
    EXPECT_EQ(node_.store.fake().chunkCount(), 4u);
    EXPECT_EQ(node_.ledger.getRun(*r.runId)->status, RunStatus::Failed);
}

TEST_F(GarbageCollectorTest, RetryBackoffDoesNotHoldTheChunkLock) {
    ChunkKeeperConfig cfg = testConfig();
    cfg.gc.retryBackoff = std::chrono::seconds(1);
    TestNode slow(clock_, cfg);
    std::string h = slow.writeChunk("contended");
    slow.ledger.incrementReference(h, commitRef("c1"));
    slow.ledger.decrementReference(h, commitRef("c1"));
    clock_.advance(8 * kOneDay);

    std::promise<void> failed;
    EXPECT_CALL(slow.store, deleteChunk(h)).WillOnce([&failed](const std::string&) {
        failed.set_value();
        throw StorageError("busy", true);
    });

    auto running = std::async(std::launch::async, [&slow] {
        RefCountSweep finder(slow.ledger);
        return slow.service.collector().run(finder, slow.options());
    });
    failed.get_future().wait();

    auto start = std::chrono::steady_clock::now();
    slow.ledger.incrementReference(h, commitRef("c2"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

    GcResult r = running.get();
    EXPECT_EQ(r.chunksDeleted, 0u);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_TRUE(slow.store.hasChunk(h));
    EXPECT_TRUE(slow.journal.lastEntry(h, AuditDecision::Skipped).has_value());
}

TEST_F(GarbageCollectorTest, UnexpectedExceptionEndsRunFailed) {
    BrokenFinder finder;
    EXPECT_THROW(node_.service.collector().run(finder, node_.options()), std::runtime_error);

    auto runs = node_.ledger.listRuns(1);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].status, RunStatus::Failed);
    EXPECT_EQ(runs[0].errorCount, 1u);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("chunkkeeper_gc_runs_total",
                                                       {{"strategy", "broken"}, {"status", "failed"}}),
              1.0);
}
