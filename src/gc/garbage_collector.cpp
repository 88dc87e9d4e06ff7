#include "gc/garbage_collector.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/retry.hpp"

#include <chrono>

namespace chunkkeeper {

GarbageCollector::GarbageCollector(ReferenceLedger &ledger, ObjectStore &store,
                                   DeletionJournal &journal, GcConfig config, std::string nodeId)
    : ledger_(ledger), store_(store), journal_(journal), config_(std::move(config)),
      nodeId_(std::move(nodeId)) {}

void GarbageCollector::addDeletionListener(DeletionListener listener) {
  std::lock_guard<std::mutex> lk(listenersMutex_);
  listeners_.push_back(std::move(listener));
}

GcResult GarbageCollector::run(CandidateFinder &finder, const RunOptions &options,
                               const std::function<bool()> &renewLease) {
  cancelRequested_ = false;
  auto started = std::chrono::steady_clock::now();

  GcResult result;
  result.dryRun = options.dryRun;
  result.strategy = finder.name();
  result.lockAcquired = true;

  StopReason stop = StopReason::None;
  CollectionContext ctx;
  ctx.now = ledger_.clock().now();
  ctx.dryRun = options.dryRun;
  ctx.graceOverride = options.graceOverride;
  ctx.batchSize = options.batchSizeOverride.value_or(config_.batchSize);
  if (ctx.batchSize == 0)
    ctx.batchSize = 1;
  ctx.keepGoing = [this, &stop, &renewLease] {
    if (stop == StopReason::None)
      stop = checkStop(renewLease);
    return stop == StopReason::None;
  };

  GcRunRecord record;
  record.strategy = finder.name();
  record.trigger = options.trigger;
  record.nodeId = nodeId_;
  record.startedAt = ctx.now;
  record.dryRun = options.dryRun;
  record.id = ledger_.beginRun(record);
  ctx.runId = record.id;
  result.runId = record.id;

  Logger::getInstance().log(LogLevel::INFO,
                            "[GC] run " + std::to_string(record.id) + " started: strategy=" +
                                finder.name() + " trigger=" + options.trigger +
                                " batch=" + std::to_string(ctx.batchSize) +
                                (ctx.dryRun ? " (dry run)" : ""));

  try {
    finder.prepare(ctx, result.errors);
    std::string after;
    while (ctx.keepGoing()) {
      auto batch = finder.findCandidates(ctx, after, ctx.batchSize);
      if (batch.empty())
        break;
      after = batch.back().hash;
      for (const auto &candidate : batch) {
        result.candidates.push_back(candidate);
        result.candidateBytes += candidate.size;
        if (!ctx.dryRun && deleteOne(candidate, ctx, result) == Outcome::Halted) {
          stop = StopReason::Halted;
          break;
        }
      }
      if (stop != StopReason::None || batch.size() < ctx.batchSize)
        break;
    }
    recordStop(stop, record.id, result);
    finder.complete(ctx, stop == StopReason::None);
  } catch (const ChunkKeeperError &e) {
    result.status = RunStatus::Failed;
    result.errors.push_back(RunError{"", "run", e.what()});
    Logger::getInstance().log(LogLevel::ERROR, "[GC] run " + std::to_string(record.id) +
                                                   " failed: " + e.what());
  } catch (const std::exception &e) {
    result.status = RunStatus::Failed;
    result.errors.push_back(RunError{"", "run", e.what()});
    Logger::getInstance().log(LogLevel::ERROR, "[GC] run " + std::to_string(record.id) +
                                                   " aborted: " + e.what());
    finishRun(record, result, finder, ctx, started);
    throw;
  }

  finishRun(record, result, finder, ctx, started);
  return result;
}

GarbageCollector::StopReason GarbageCollector::checkStop(const std::function<bool()> &renewLease) {
  if (cancelRequested_)
    return StopReason::Cancelled;
  if (renewLease && !renewLease())
    return StopReason::LeaseLost;
  if (ledger_.collectionHalted())
    return StopReason::Halted;
  return StopReason::None;
}

void GarbageCollector::recordStop(StopReason reason, int64_t runId, GcResult &result) {
  std::string run = "[GC] run " + std::to_string(runId);
  switch (reason) {
  case StopReason::None:
    return;
  case StopReason::Cancelled:
    result.cancelled = true;
    Logger::getInstance().log(LogLevel::INFO, run + " cancelled");
    return;
  case StopReason::Halted:
    result.halted = true;
    result.status = RunStatus::Failed;
    result.errors.push_back(RunError{"", "coordination", "collection halted mid-run"});
    Logger::getInstance().log(LogLevel::WARN, run + " stopped: collection halted");
    return;
  case StopReason::LeaseLost:
    result.status = RunStatus::Failed;
    result.errors.push_back(RunError{"", "coordination", "collection lease lost mid-run"});
    Logger::getInstance().log(LogLevel::WARN, run + " stopped: lease lost");
    return;
  }
}

void GarbageCollector::finishRun(GcRunRecord &record, GcResult &result,
                                 const CandidateFinder &finder, const CollectionContext &ctx,
                                 std::chrono::steady_clock::time_point started) {
  result.chunksScanned = finder.objectsScanned().value_or(result.candidates.size());

  record.finishedAt = ledger_.clock().now();
  record.status = result.status;
  record.chunksScanned = result.chunksScanned;
  record.chunksDeleted = result.chunksDeleted;
  record.bytesReclaimed = result.bytesReclaimed;
  record.errorCount = result.errors.size();
  ledger_.finishRun(record);

  auto &metrics = MetricsRegistry::instance();
  std::map<std::string, std::string> labels{{"strategy", finder.name()}};
  metrics.incrementCounter("chunkkeeper_gc_runs_total", 1,
                           {{"strategy", finder.name()}, {"status", runStatusToString(result.status)}});
  metrics.incrementCounter("chunkkeeper_gc_chunks_deleted_total",
                           static_cast<double>(result.chunksDeleted), labels);
  metrics.incrementCounter("chunkkeeper_gc_bytes_reclaimed_total",
                           static_cast<double>(result.bytesReclaimed), labels);
  metrics.incrementCounter("chunkkeeper_gc_errors_total", static_cast<double>(result.errors.size()),
                           labels);
  for (const auto &err : result.errors) {
    if (err.kind == "consistency")
      metrics.incrementCounter("chunkkeeper_consistency_errors_total");
  }
  metrics.observe("chunkkeeper_gc_run_duration_seconds",
                  std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count(),
                  labels);

  Logger::getInstance().log(
      LogLevel::INFO, "[GC] run " + std::to_string(record.id) + " " +
                          runStatusToString(result.status) + ": scanned=" +
                          std::to_string(result.chunksScanned) + " deleted=" +
                          std::to_string(result.chunksDeleted) + " reclaimed=" +
                          std::to_string(result.bytesReclaimed) + " errors=" +
                          std::to_string(result.errors.size()) +
                          (ctx.dryRun ? " would_reclaim=" + std::to_string(result.candidateBytes) : ""));
}

GarbageCollector::Verdict GarbageCollector::revalidate(ChunkTransaction &txn,
                                                       const CollectionContext &ctx,
                                                       std::string &why) {
  if (ledger_.collectionHalted()) {
    why = "collection halted";
    return Verdict::Halted;
  }
  auto row = txn.chunk();
  if (row && row->softDeleted()) {
    why = "already soft-deleted";
    return Verdict::Skip;
  }
  if (row && row->refCount > 0) {
    why = "resurrected: ref_count " + std::to_string(row->refCount);
    return Verdict::Skip;
  }
  if (txn.referenceCount() > 0) {
    why = "live references present";
    return Verdict::Skip;
  }
  auto pending = txn.pending();
  if (!pending) {
    why = "no pending deletion";
    return Verdict::Skip;
  }
  bool graceOver;
  if (ctx.graceOverride) {
    graceOver = pending->markedAt + *ctx.graceOverride <= ctx.now;
  } else {
    graceOver = pending->deleteAfter <= ctx.now &&
                !(row && row->gcProtectedUntil && *row->gcProtectedUntil > ctx.now);
  }
  if (!graceOver) {
    why = "grace window not over";
    return Verdict::Skip;
  }
  return Verdict::Delete;
}

GarbageCollector::Verdict GarbageCollector::deleteUnderLock(const Candidate &candidate,
                                                            const CollectionContext &ctx,
                                                            uint64_t &size) {
  ChunkTransaction txn(ledger_, candidate.hash);
  std::string why;
  Verdict verdict = revalidate(txn, ctx, why);
  if (verdict == Verdict::Halted)
    return verdict;
  if (verdict == Verdict::Skip) {
    journal_.record(AuditDecision::Skipped, candidate.hash, candidate.size, why, ctx.runId);
    txn.commit();
    Logger::getInstance().log(LogLevel::INFO, "[GC] skipped " + candidate.hash + ": " + why);
    return verdict;
  }
  if (auto row = txn.chunk(); row && row->size > 0)
    size = row->size;

  store_.deleteChunk(candidate.hash);
  txn.softDelete(ledger_.clock().now(), size);
  auto marked = journal_.lastEntry(candidate.hash, AuditDecision::Marked);
  journal_.record(AuditDecision::Deleted, candidate.hash, size, candidate.reason, ctx.runId,
                  marked ? marked->priorSources : std::vector<std::string>{});
  txn.commit();
  return Verdict::Delete;
}

GarbageCollector::Outcome GarbageCollector::deleteOne(const Candidate &candidate,
                                                      const CollectionContext &ctx,
                                                      GcResult &result) {
  uint64_t size = candidate.size;
  Verdict verdict = Verdict::Skip;
  try {
    // Each attempt opens and unwinds its own ChunkTransaction, so the backoff
    // sleeps with neither the chunk lock nor the write transaction held.
    verdict = retryWithBackoff("delete chunk " + candidate.hash,
                               [&] { return deleteUnderLock(candidate, ctx, size); },
                               config_.maxDeleteRetries, config_.retryBackoff);
  } catch (const StorageError &e) {
    recordFailure(candidate, ctx, result, "storage", e.what());
    return Outcome::Failed;
  } catch (const LockContention &e) {
    recordFailure(candidate, ctx, result, "lock-contention", e.what());
    return Outcome::Failed;
  } catch (const ConsistencyError &e) {
    recordFailure(candidate, ctx, result, "consistency", e.what());
    return Outcome::Failed;
  } catch (const ChunkKeeperError &e) {
    recordFailure(candidate, ctx, result, "ledger", e.what());
    return Outcome::Failed;
  }
  if (verdict == Verdict::Halted)
    return Outcome::Halted;
  if (verdict == Verdict::Skip)
    return Outcome::Skipped;

  ++result.chunksDeleted;
  result.bytesReclaimed += size;
  Logger::getInstance().log(LogLevel::DEBUG, "[GC] deleted " + candidate.hash + " (" +
                                                 std::to_string(size) + " bytes)");
  notifyListeners(candidate.hash, size);
  return Outcome::Deleted;
}

void GarbageCollector::recordFailure(const Candidate &candidate, const CollectionContext &ctx,
                                     GcResult &result, const std::string &kind,
                                     const std::string &message) {
  result.errors.push_back(RunError{candidate.hash, kind, message});
  Logger::getInstance().log(LogLevel::ERROR, "[GC] " + kind + " failure on " + candidate.hash +
                                                 ": " + message);
  try {
    journal_.record(AuditDecision::Failed, candidate.hash, candidate.size, kind + ": " + message,
                    ctx.runId);
  } catch (const ChunkKeeperError &e) {
    Logger::getInstance().log(LogLevel::ERROR, "[GC] could not journal failure on " +
                                                   candidate.hash + ": " + e.what());
  }
}

void GarbageCollector::notifyListeners(const std::string &hash, uint64_t size) {
  std::vector<DeletionListener> listeners;
  {
    std::lock_guard<std::mutex> lk(listenersMutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners) {
    try {
      listener(hash, size);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::WARN, "[GC] deletion listener failed for " + hash +
                                                    ": " + e.what());
    }
  }
}

} // namespace chunkkeeper
