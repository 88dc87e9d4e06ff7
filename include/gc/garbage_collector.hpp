#ifndef CHUNKKEEPER_GARBAGE_COLLECTOR_HPP
#define CHUNKKEEPER_GARBAGE_COLLECTOR_HPP

#include "audit/deletion_journal.hpp"
#include "gc/candidate_finder.hpp"
#include "ledger/reference_ledger.hpp"
#include "store/object_store.hpp"
#include "utilities/config.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

/// Caller-supplied knobs for one pass.
struct RunOptions {
  bool dryRun{false};
  std::optional<Millis> graceOverride;
  std::optional<size_t> batchSizeOverride;
  /// Strategy name; the configured default when unset.
  std::optional<std::string> strategy;
  /// "interval", "pressure", "manual", "bulk:<kind>"
  std::string trigger{"manual"};
};

struct GcResult {
  uint64_t chunksScanned{0};
  uint64_t chunksDeleted{0};
  uint64_t bytesReclaimed{0};
  /// Sum of candidate sizes. In a dry run this is what a live run would free.
  uint64_t candidateBytes{0};
  std::vector<RunError> errors;
  std::vector<Candidate> candidates;
  std::optional<int64_t> runId;
  bool lockAcquired{false};
  bool dryRun{false};
  bool cancelled{false};
  /// Collection stopped because of an emergency halt.
  bool halted{false};
  /// Lease taken but no pass run: the interval slot was already served.
  bool skipped{false};
  std::string strategy;
  RunStatus status{RunStatus::Completed};
};

/// Invoked after a physical delete has committed (cache eviction).
using DeletionListener = std::function<void(const std::string &hash, uint64_t size)>;

/**
 * @brief The safety pipeline every strategy runs through.
 *
 * For each candidate in a live pass: open a ChunkTransaction, re-validate
 * (not halted, ref_count 0, no references, not soft-deleted, grace over),
 * delete the bytes, soft-delete the row, journal, commit, then notify
 * listeners. A transient store failure rolls the attempt back and retries it
 * from re-validation after a backoff, so no lock is held while waiting. A
 * failing chunk is recorded and stays eligible; the batch carries on.
 *
 * Between batches, and whenever a strategy polls CollectionContext::keepGoing,
 * the pass stops if it was cancelled, collection was halted or the lease
 * could not be renewed.
 */
class GarbageCollector {
public:
  GarbageCollector(ReferenceLedger &ledger, ObjectStore &store, DeletionJournal &journal,
                   GcConfig config, std::string nodeId);

  /**
   * @brief Run one pass with @p finder.
   * @param renewLease Called at every stop check; returning false stops the
   *        pass (lease lost).
   * @throw std::exception subclasses outside ChunkKeeperError propagate
   *        after the run has been recorded as failed.
   */
  GcResult run(CandidateFinder &finder, const RunOptions &options,
               const std::function<bool()> &renewLease = {});

  void addDeletionListener(DeletionListener listener);

  /// Ask a running pass to stop at the next batch boundary.
  void cancel() { cancelRequested_ = true; }
  bool cancelRequested() const { return cancelRequested_; }

  const GcConfig &config() const { return config_; }

private:
  enum class Verdict { Delete, Skip, Halted };
  enum class Outcome { Deleted, Skipped, Failed, Halted };
  enum class StopReason { None, Cancelled, Halted, LeaseLost };

  StopReason checkStop(const std::function<bool()> &renewLease);
  void recordStop(StopReason reason, int64_t runId, GcResult &result);
  void finishRun(GcRunRecord &record, GcResult &result, const CandidateFinder &finder,
                 const CollectionContext &ctx, std::chrono::steady_clock::time_point started);

  Outcome deleteOne(const Candidate &candidate, const CollectionContext &ctx, GcResult &result);
  Verdict deleteUnderLock(const Candidate &candidate, const CollectionContext &ctx,
                          uint64_t &size);
  Verdict revalidate(ChunkTransaction &txn, const CollectionContext &ctx, std::string &why);
  void notifyListeners(const std::string &hash, uint64_t size);
  void recordFailure(const Candidate &candidate, const CollectionContext &ctx, GcResult &result,
                     const std::string &kind, const std::string &message);

  ReferenceLedger &ledger_;
  ObjectStore &store_;
  DeletionJournal &journal_;
  GcConfig config_;
  std::string nodeId_;
  std::atomic<bool> cancelRequested_{false};
  std::mutex listenersMutex_;
  std::vector<DeletionListener> listeners_;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_GARBAGE_COLLECTOR_HPP
