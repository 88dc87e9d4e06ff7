#ifndef CHUNKKEEPER_COLLECTION_SERVICE_HPP
#define CHUNKKEEPER_COLLECTION_SERVICE_HPP

#include "audit/deletion_journal.hpp"
#include "audit/recovery_manager.hpp"
#include "cluster/LeaseLock.h"
#include "gc/garbage_collector.hpp"
#include "gc/mark_and_sweep.hpp"
#include "ledger/reference_ledger.hpp"
#include "store/object_store.hpp"
#include "utilities/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

struct StatusReport {
  std::optional<TimePoint> lastRunAt;
  std::optional<TimePoint> lastSuccessAt;
  std::optional<TimePoint> nextScheduledAt;
  uint64_t orphanedCount{0};
  uint64_t orphanedBytes{0};
  uint64_t reclaimableCount{0};
  uint64_t reclaimableBytes{0};
  uint64_t totalBytes{0};
  std::optional<std::string> lockHolder;
  bool halted{false};
  std::string haltReason;
};

struct Alert {
  std::string name;
  std::string message;
};

/**
 * @brief Entry point for collection passes and their bookkeeping.
 *
 * collect() takes the cluster lease, builds the requested strategy, runs it
 * through the GarbageCollector and records scheduler state while the lease
 * is still held. A node that loses the lease race gets an empty result. An
 * interval run whose slot another holder already served is skipped.
 */
class CollectionService {
public:
  /**
   * @param roots Root provider for mark-and-sweep. When null the ledger's
   *              references are used.
   */
  CollectionService(ChunkKeeperConfig config, ReferenceLedger &ledger, ObjectStore &store,
                    DeletionJournal &journal, LeaseLock &lease, RecoveryManager &recovery,
                    RootProvider *roots = nullptr);

  /**
   * @brief Run one pass.
   * @throw CoordinationError when collection is halted.
   * @throw ValidationError for an unknown strategy.
   */
  GcResult collect(RunOptions options);

  StatusReport status() const;
  std::vector<GcRunRecord> history(size_t limit) const;
  std::vector<Alert> checkAlerts(TimePoint now) const;

  /// Update the orphan gauges from the ledger.
  void refreshGauges() const;

  std::unique_ptr<CandidateFinder> makeFinder(const std::string &strategy);

  GarbageCollector &collector() { return gc_; }
  const ChunkKeeperConfig &config() const { return config_; }
  /// Lease holder identity of this instance.
  const std::string &holderId() const { return holderId_; }

private:
  void filterGraceOverride(RunOptions &options) const;

  ChunkKeeperConfig config_;
  std::string holderId_;
  ReferenceLedger &ledger_;
  ObjectStore &store_;
  DeletionJournal &journal_;
  LeaseLock &lease_;
  RecoveryManager &recovery_;
  std::unique_ptr<LedgerRootProvider> defaultRoots_;
  RootProvider *roots_;
  GarbageCollector gc_;
  TimePoint startedAt_;
};

std::string formatTime(TimePoint t);
/// "1.50 GB" style rendering.
std::string formatSize(uint64_t bytes);

} // namespace chunkkeeper

#endif // CHUNKKEEPER_COLLECTION_SERVICE_HPP
