#include "audit/recovery_manager.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace chunkkeeper {

std::string recoveryOutcomeToString(RecoveryManager::RecoveryOutcome outcome) {
    switch (outcome) {
    case RecoveryManager::RecoveryOutcome::Full: return "full";
    case RecoveryManager::RecoveryOutcome::MetadataOnly: return "metadata-only";
    case RecoveryManager::RecoveryOutcome::NotDeleted: return "not-deleted";
    }
    return "unknown";
}

RecoveryManager::RecoveryManager(ReferenceLedger& ledger, ObjectStore& store,
                                 DeletionJournal& journal, Millis recoveryWindow)
    : ledger_(ledger), store_(store), journal_(journal), recoveryWindow_(recoveryWindow) {}

RecoveryManager::RecoveryOutcome RecoveryManager::recover(const std::string& hash) {
    TimePoint now = ledger_.clock().now();
    ChunkTransaction txn(ledger_, hash);
    auto row = txn.chunk();
    if (!row || !row->softDeleted()) {
        Logger::getInstance().log(LogLevel::INFO, "[Recovery] chunk " + hash + " is not soft-deleted");
        return RecoveryOutcome::NotDeleted;
    }
    txn.restore(now + ledger_.gracePeriod());
    bool bytesPresent = store_.hasChunk(hash);
    RecoveryOutcome outcome = bytesPresent ? RecoveryOutcome::Full : RecoveryOutcome::MetadataOnly;
    journal_.record(AuditDecision::Recovered, hash, row->size,
                    bytesPresent ? "restored with bytes" : "restored metadata only; awaiting re-upload");
    txn.commit();

    Logger::getInstance().log(LogLevel::INFO, "[Recovery] recovered chunk " + hash + " (" +
                                                  recoveryOutcomeToString(outcome) + ")");
    return outcome;
}

size_t RecoveryManager::purgeExpired(TimePoint now, size_t batchSize) {
    TimePoint cutoff = now - recoveryWindow_;
    size_t purged = 0;
    for (;;) {
        auto rows = ledger_.softDeletedBefore(cutoff, batchSize);
        size_t removedThisBatch = 0;
        for (const auto& row : rows) {
            ChunkTransaction txn(ledger_, row.hash);
            auto current = txn.chunk();
            if (!current || !current->deletedAt || *current->deletedAt > cutoff)
                continue;
            if (!txn.purge())
                continue;
            journal_.record(AuditDecision::Purged, row.hash, row.size, "recovery window elapsed");
            txn.commit();
            ++removedThisBatch;
        }
        purged += removedThisBatch;
        if (rows.size() < batchSize || removedThisBatch == 0)
            break;
    }
    if (purged > 0) {
        Logger::getInstance().log(LogLevel::INFO, "[Recovery] purged " + std::to_string(purged) +
                                                      " soft-deleted rows");
        MetricsRegistry::instance().incrementCounter("chunkkeeper_gc_rows_purged_total",
                                                     static_cast<double>(purged));
    }
    return purged;
}

size_t RecoveryManager::emergencyHalt(const std::string& reason) {
    ledger_.setState(state_keys::kHalted, "true");
    ledger_.setState(state_keys::kHaltReason, reason);
    size_t dropped = ledger_.clearPendingDeletions();
    journal_.record(AuditDecision::Halted, "", 0, reason);
    MetricsRegistry::instance().setGauge("chunkkeeper_gc_halted", 1);
    Logger::getInstance().log(LogLevel::WARN, "[Recovery] emergency halt: " + reason + " (" +
                                                  std::to_string(dropped) +
                                                  " pending deletions dropped)");
    return dropped;
}

void RecoveryManager::resume() {
    ledger_.setState(state_keys::kHalted, "false");
    ledger_.setState(state_keys::kHaltReason, "");
    size_t reseeded = ledger_.reseedPendingDeletions(ledger_.clock().now());
    MetricsRegistry::instance().setGauge("chunkkeeper_gc_halted", 0);
    Logger::getInstance().log(LogLevel::INFO, "[Recovery] resumed; " + std::to_string(reseeded) +
                                                  " unreferenced chunks given a new grace window");
}

bool RecoveryManager::isHalted() const { return ledger_.collectionHalted(); }

std::string RecoveryManager::haltReason() const {
    return ledger_.getState(state_keys::kHaltReason).value_or("");
}

} // namespace chunkkeeper
