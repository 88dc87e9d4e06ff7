#include "gc/mark_and_sweep.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace chunkkeeper {

namespace {

/// Walks live ledger rows in hash order alongside the store listing.
class LedgerCursor {
public:
  explicit LedgerCursor(const ReferenceLedger &ledger, size_t pageSize = 1000)
      : ledger_(ledger), pageSize_(pageSize) {}

  /// Row for @p hash, if any. Rows ordered before it are handed to @p skipped.
  std::optional<ChunkRecord> seek(const std::string &hash,
                                  const std::function<void(const ChunkRecord &)> &skipped) {
    while (fill()) {
      const ChunkRecord &row = page_[pos_];
      if (row.hash < hash) {
        skipped(row);
        ++pos_;
        continue;
      }
      if (row.hash == hash) {
        ++pos_;
        return page_[pos_ - 1];
      }
      return std::nullopt;
    }
    return std::nullopt;
  }

  void drain(const std::function<void(const ChunkRecord &)> &skipped) {
    while (fill()) {
      skipped(page_[pos_]);
      ++pos_;
    }
  }

private:
  bool fill() {
    if (pos_ < page_.size())
      return true;
    if (exhausted_)
      return false;
    page_ = ledger_.liveChunks(after_, pageSize_);
    pos_ = 0;
    if (page_.size() < pageSize_)
      exhausted_ = true;
    if (page_.empty())
      return false;
    after_ = page_.back().hash;
    return true;
  }

  const ReferenceLedger &ledger_;
  size_t pageSize_;
  std::vector<ChunkRecord> page_;
  size_t pos_ = 0;
  std::string after_;
  bool exhausted_ = false;
};

bool graceExpired(const PendingDeletion &p, const std::optional<ChunkRecord> &row,
                  const CollectionContext &ctx) {
  if (ctx.graceOverride)
    return p.markedAt + *ctx.graceOverride <= ctx.now;
  if (p.deleteAfter > ctx.now)
    return false;
  return !(row && row->gcProtectedUntil && *row->gcProtectedUntil > ctx.now);
}

} // namespace

void LedgerRootProvider::forEachRoot(TimePoint now,
                                     const std::function<void(const std::string &)> &visit) {
  ledger_.forEachReference([&](const ReferenceRecord &ref) {
    if (ref.source.kind == SourceKind::PendingUpload && ref.createdAt + pendingUploadTtl_ <= now)
      return;
    visit(ref.chunkHash);
  });
}

MarkAndSweep::MarkAndSweep(ReferenceLedger &ledger, ObjectStore &store, DeletionJournal &journal,
                           RootProvider &roots, Millis pendingUploadTtl, size_t scanPageSize)
    : ledger_(ledger), store_(store), journal_(journal), roots_(roots),
      pendingUploadTtl_(pendingUploadTtl), scanPageSize_(scanPageSize == 0 ? 1 : scanPageSize) {}

bool MarkAndSweep::expiredUploadsOnly(const std::string &hash, TimePoint now) const {
  auto refs = ledger_.referencesFor(hash);
  if (refs.empty())
    return false;
  return std::all_of(refs.begin(), refs.end(), [&](const ReferenceRecord &r) {
    return r.source.kind == SourceKind::PendingUpload && r.createdAt + pendingUploadTtl_ <= now;
  });
}

void MarkAndSweep::prepare(const CollectionContext &ctx, std::vector<RunError> &diagnostics) {
  candidates_.clear();
  stats_ = ScanStats{};

  std::unordered_set<std::string> reachable;
  roots_.forEachRoot(ctx.now, [&reachable](const std::string &h) { reachable.insert(h); });
  if (ctx.shouldStop()) {
    Logger::getInstance().log(LogLevel::WARN, "[MarkSweep] pass stopped after the root walk");
    return;
  }

  std::unordered_map<std::string, PendingDeletion> pending;
  for (auto &p : ledger_.selectPendingDeletions())
    pending.emplace(p.chunkHash, p);

  auto reportMissing = [&](const ChunkRecord &row) {
    ++stats_.missingBytes;
    std::string msg = row.refCount > 0
                          ? "referenced chunk is missing from the object store"
                          : "ledger row has no bytes in the object store";
    diagnostics.push_back(RunError{row.hash, "consistency", msg});
    Logger::getInstance().log(row.refCount > 0 ? LogLevel::ERROR : LogLevel::WARN,
                              "[MarkSweep] " + row.hash + ": " + msg);
  };

  bool interrupted = false;
  LedgerCursor cursor(ledger_);
  forEachChunk(store_, "", [&](const ObjectInfo &info) {
    ++stats_.storeChunks;
    auto row = cursor.seek(info.hash, reportMissing);
    auto pit = pending.find(info.hash);

    if (reachable.count(info.hash)) {
      ++stats_.reachable;
      if (row && row->refCount == 0) {
        std::string msg = "chunk is reachable from roots but the ledger counts no references";
        diagnostics.push_back(RunError{info.hash, "consistency", msg});
        Logger::getInstance().log(LogLevel::ERROR, "[MarkSweep] " + info.hash + ": " + msg);
      }
      if (pit != pending.end()) {
        ++stats_.cleared;
        if (!ctx.dryRun) {
          ChunkTransaction txn(ledger_, info.hash);
          txn.dropPending();
          txn.commit();
          Logger::getInstance().log(LogLevel::INFO, "[MarkSweep] " + info.hash +
                                                        " reachable again; pending deletion cleared");
        }
      }
      return;
    }

    ++stats_.unreachable;
    if (row && row->refCount > 0) {
      if (expiredUploadsOnly(info.hash, ctx.now)) {
        if (!ctx.dryRun) {
          for (const auto &ref : ledger_.referencesFor(info.hash))
            ledger_.decrementReference(info.hash, ref.source);
          Logger::getInstance().log(LogLevel::INFO, "[MarkSweep] expired pending uploads released " +
                                                        info.hash);
        }
        return;
      }
      std::string msg = "ledger counts " + std::to_string(row->refCount) +
                        " references but chunk is unreachable from roots";
      diagnostics.push_back(RunError{info.hash, "consistency", msg});
      Logger::getInstance().log(LogLevel::ERROR, "[MarkSweep] " + info.hash + ": " + msg);
      return;
    }

    if (pit == pending.end()) {
      ++stats_.newlyMarked;
      if (!ctx.dryRun) {
        ChunkTransaction txn(ledger_, info.hash);
        if (ledger_.collectionHalted())
          return;
        auto current = txn.chunk();
        if ((current && current->refCount > 0) || txn.referenceCount() > 0 || txn.pending())
          return;
        txn.markPending(ctx.now, ctx.now + ledger_.gracePeriod(), ctx.runId);
        journal_.record(AuditDecision::Marked, info.hash, info.size, "unreachable from roots",
                        ctx.runId);
        txn.commit();
      }
      return;
    }

    if (graceExpired(pit->second, row, ctx)) {
      candidates_.push_back(Candidate{info.hash, info.size, "unreachable past grace"});
    }
  }, scanPageSize_, [&] {
    interrupted = ctx.shouldStop();
    return !interrupted;
  });
  if (interrupted) {
    candidates_.clear();
    Logger::getInstance().log(LogLevel::WARN, "[MarkSweep] pass stopped after scanning " +
                                                  std::to_string(stats_.storeChunks) + " chunks");
    return;
  }
  cursor.drain(reportMissing);

  std::sort(candidates_.begin(), candidates_.end(),
            [](const Candidate &a, const Candidate &b) { return a.hash < b.hash; });

  Logger::getInstance().log(LogLevel::INFO,
                            "[MarkSweep] scanned " + std::to_string(stats_.storeChunks) +
                                " chunks: " + std::to_string(stats_.reachable) + " reachable, " +
                                std::to_string(stats_.unreachable) + " unreachable, " +
                                std::to_string(stats_.newlyMarked) + " newly marked, " +
                                std::to_string(candidates_.size()) + " eligible");
}

std::vector<Candidate> MarkAndSweep::findCandidates(const CollectionContext &ctx,
                                                    const std::string &afterHash,
                                                    size_t limit) {
  (void)ctx;
  auto it = afterHash.empty()
                ? candidates_.begin()
                : std::upper_bound(candidates_.begin(), candidates_.end(), afterHash,
                                   [](const std::string &h, const Candidate &c) { return h < c.hash; });
  std::vector<Candidate> out;
  for (; it != candidates_.end() && out.size() < std::max<size_t>(limit, 1); ++it)
    out.push_back(*it);
  return out;
}

} // namespace chunkkeeper
