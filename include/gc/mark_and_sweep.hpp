#ifndef CHUNKKEEPER_MARK_AND_SWEEP_HPP
#define CHUNKKEEPER_MARK_AND_SWEEP_HPP

#include "audit/deletion_journal.hpp"
#include "gc/candidate_finder.hpp"
#include "ledger/reference_ledger.hpp"
#include "store/object_store.hpp"

#include <functional>

namespace chunkkeeper {

/**
 * @brief Source of live roots for the reachability walk.
 *
 * Implementations visit every chunk hash that must survive. Visiting a hash
 * more than once is allowed.
 */
class RootProvider {
public:
  virtual ~RootProvider() = default;
  virtual void forEachRoot(TimePoint now,
                           const std::function<void(const std::string &)> &visit) = 0;
};

/**
 * @brief Roots taken from the ledger's live references.
 *
 * Pending-upload references older than @p pendingUploadTtl are not roots.
 */
class LedgerRootProvider : public RootProvider {
public:
  LedgerRootProvider(ReferenceLedger &ledger, Millis pendingUploadTtl)
      : ledger_(ledger), pendingUploadTtl_(pendingUploadTtl) {}

  void forEachRoot(TimePoint now,
                   const std::function<void(const std::string &)> &visit) override;

private:
  ReferenceLedger &ledger_;
  Millis pendingUploadTtl_;
};

/**
 * @brief Reachability strategy.
 *
 * prepare() walks every root, streams the whole object store and flags what
 * is unreachable. An unreachable chunk seen for the first time is only
 * marked (PendingDeletion plus journal entry); it becomes a candidate on a
 * later pass once that grace has run out. Reachable chunks lose any
 * PendingDeletion they hold; one the ledger counts at zero references is
 * also reported. Unreachable chunks the ledger still counts as referenced
 * are reported, never proposed.
 */
class MarkAndSweep : public CandidateFinder {
public:
  /// @param scanPageSize Store listing page size; the pass can stop between pages.
  MarkAndSweep(ReferenceLedger &ledger, ObjectStore &store, DeletionJournal &journal,
               RootProvider &roots, Millis pendingUploadTtl, size_t scanPageSize = 1000);

  std::string name() const override { return "mark-sweep"; }

  void prepare(const CollectionContext &ctx, std::vector<RunError> &diagnostics) override;
  std::vector<Candidate> findCandidates(const CollectionContext &ctx,
                                        const std::string &afterHash,
                                        size_t limit) override;
  std::optional<uint64_t> objectsScanned() const override { return stats_.storeChunks; }

  struct ScanStats {
    size_t storeChunks = 0;
    size_t reachable = 0;
    size_t unreachable = 0;
    size_t newlyMarked = 0;
    size_t cleared = 0;
    size_t missingBytes = 0;
  };
  const ScanStats &lastScan() const { return stats_; }

private:
  bool expiredUploadsOnly(const std::string &hash, TimePoint now) const;

  ReferenceLedger &ledger_;
  ObjectStore &store_;
  DeletionJournal &journal_;
  RootProvider &roots_;
  Millis pendingUploadTtl_;
  size_t scanPageSize_;
  std::vector<Candidate> candidates_;
  ScanStats stats_;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_MARK_AND_SWEEP_HPP
