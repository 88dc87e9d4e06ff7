#ifndef CHUNKKEEPER_REFERENCE_LEDGER_HPP
#define CHUNKKEEPER_REFERENCE_LEDGER_HPP

#include "ledger/ledger_types.hpp"
#include "ledger/sqlite_db.hpp"
#include "utilities/clock.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

class DeletionJournal;

/**
 * @brief Fixed set of mutexes keyed by chunk hash.
 *
 * A hash maps to the stripe named by its first two hex digits, so acquiring
 * stripes in ascending index order is acquiring them in ascending hash
 * order. Multi-chunk callers always go through lock(std::vector) which
 * enforces that order.
 */
class ChunkLockTable {
public:
  static constexpr size_t kStripes = 256;

  class Guard {
  public:
    Guard() = default;
    Guard(Guard &&) = default;
    Guard &operator=(Guard &&) = default;

  private:
    friend class ChunkLockTable;
    std::vector<std::unique_lock<std::mutex>> locks_;
  };

  ChunkLockTable() : stripes_(kStripes) {}

  Guard lock(const std::string &hash);
  Guard lock(const std::vector<std::string> &hashes);

  static size_t stripeFor(const std::string &hash);

private:
  std::vector<std::mutex> stripes_;
};

class ReferenceLedger;

/**
 * @brief Per-chunk lock plus one BEGIN IMMEDIATE transaction.
 *
 * Everything the collector does to one chunk between re-validation and the
 * soft delete happens inside a single ChunkTransaction, so a concurrent
 * incrementReference() on the same hash either completes before the
 * re-validation or starts after the commit. Rolls back on destruction unless
 * commit() was called.
 */
class ChunkTransaction {
public:
  ChunkTransaction(ReferenceLedger &ledger, const std::string &hash);

  ChunkTransaction(const ChunkTransaction &) = delete;
  ChunkTransaction &operator=(const ChunkTransaction &) = delete;

  const std::string &hash() const { return hash_; }

  std::optional<ChunkRecord> chunk();
  size_t referenceCount();
  std::optional<PendingDeletion> pending();

  /// Mark the row deleted, creating it when the store held bytes the ledger
  /// never saw. Drops any PendingDeletion.
  void softDelete(TimePoint now, uint64_t size);
  /// Insert or refresh the PendingDeletion and start the grace window.
  void markPending(TimePoint now, TimePoint deleteAfter, std::optional<int64_t> runId);
  void dropPending();
  /// Clear a soft delete and protect the row until @p protectUntil.
  bool restore(TimePoint protectUntil);
  /// Remove a soft-deleted row for good.
  bool purge();

  void commit();

private:
  ReferenceLedger &ledger_;
  std::string hash_;
  ChunkLockTable::Guard chunkLock_;
  SqliteTransaction txn_;
};

/// One reference change in a batch.
struct ReferenceChange {
  std::string hash;
  ReferenceSource source;
};

/**
 * @brief Durable map from chunk hash to reference count and live references.
 *
 * Backed by sqlite. Every mutation takes the chunk lock(s) first and then one
 * BEGIN IMMEDIATE transaction; a Reference row and the ref_count change it
 * implies always commit together. Several nodes may open the same database
 * file; sqlite's write lock serialises them.
 */
class ReferenceLedger {
public:
  /**
   * @param db          Shared connection; the schema is created if missing.
   * @param clock       Time source for grace windows and timestamps.
   * @param gracePeriod Window between ref_count reaching zero and eligibility.
   */
  ReferenceLedger(std::shared_ptr<SqliteDatabase> db, const Clock &clock,
                  Millis gracePeriod);

  ReferenceLedger(const ReferenceLedger &) = delete;
  ReferenceLedger &operator=(const ReferenceLedger &) = delete;

  /// Journal receiving marked/resurrected entries. May be null.
  void attachJournal(DeletionJournal *journal) { journal_ = journal; }

  /**
   * @brief Record a freshly written chunk.
   *
   * A new row starts with ref_count 0 inside a grace window so a chunk that
   * is written but never referenced is eventually collected.
   * @return true if the row was created.
   * @throw ValidationError for a malformed hash.
   */
  bool registerChunk(const std::string &hash, uint64_t size,
                     uint64_t compressedSize = 0,
                     StorageTier tier = StorageTier::Hot);

  /**
   * @brief Add a reference from @p source.
   *
   * Re-adding an existing (hash, kind, id) changes nothing.
   * @return ref_count after the call.
   */
  int64_t incrementReference(const std::string &hash, const ReferenceSource &source);

  /**
   * @brief Remove the reference from @p source if present.
   *
   * ref_count never drops below zero. Reaching zero starts the grace window.
   * @return ref_count after the call.
   */
  int64_t decrementReference(const std::string &hash, const ReferenceSource &source);

  /// Batch forms. One transaction, chunk locks in ascending hash order.
  void incrementReferences(const std::vector<ReferenceChange> &changes);
  void decrementReferences(const std::vector<ReferenceChange> &changes);

  /**
   * @brief Drop every reference held by one source (branch delete, prune).
   * @return Hashes whose reference was removed.
   */
  std::vector<std::string> removeSource(SourceKind kind, const std::string &sourceId);

  std::optional<ChunkRecord> getChunk(const std::string &hash) const;
  std::vector<ReferenceRecord> referencesFor(const std::string &hash) const;
  std::vector<ReferenceRecord> referencesFrom(SourceKind kind, const std::string &sourceId) const;

  /// Unreferenced chunks whose grace has expired at @p now, ascending hash.
  std::vector<ChunkRecord> selectExpiredOrphans(TimePoint now, size_t limit) const;
  std::vector<ChunkRecord> selectOrphans(const OrphanQuery &query) const;

  std::vector<PendingDeletion> selectPendingDeletions(size_t limit = 0) const;
  std::optional<PendingDeletion> pendingFor(const std::string &hash) const;

  OrphanSummary orphanSummary(TimePoint now) const;

  /// Visit every live reference. Used as the default root set.
  void forEachReference(const std::function<void(const ReferenceRecord &)> &fn) const;
  std::vector<ReferenceRecord> allReferences() const;

  /// Live (not soft-deleted) rows after @p afterHash, ascending hash.
  std::vector<ChunkRecord> liveChunks(const std::string &afterHash, size_t limit) const;
  /// Soft-deleted rows whose deleted_at is at or before @p cutoff.
  std::vector<ChunkRecord> softDeletedBefore(TimePoint cutoff, size_t limit) const;

  /// @throw NotFoundError if the row is absent.
  void setTier(const std::string &hash, StorageTier tier);
  /// Update last_accessed_at. Absent rows are ignored.
  void touch(const std::string &hash);

  /// Remove every PendingDeletion. @return rows removed.
  size_t clearPendingDeletions();
  /// Give every unreferenced live row without a PendingDeletion a fresh window.
  size_t reseedPendingDeletions(TimePoint now);

  int64_t beginRun(const GcRunRecord &run);
  void finishRun(const GcRunRecord &run);
  std::optional<GcRunRecord> getRun(int64_t id) const;
  /// Newest first.
  std::vector<GcRunRecord> listRuns(size_t limit) const;

  std::optional<std::string> getState(const std::string &key) const;
  void setState(const std::string &key, const std::string &value);
  /// Epoch-millisecond state value. @throw LedgerError if it does not parse.
  std::optional<TimePoint> getStateTime(const std::string &key) const;
  void setStateTime(const std::string &key, TimePoint t);
  /// Halt flag set by RecoveryManager::emergencyHalt().
  bool collectionHalted() const;

  Millis gracePeriod() const { return gracePeriod_; }
  const Clock &clock() const { return clock_; }
  SqliteDatabase &database() { return *db_; }
  std::shared_ptr<SqliteDatabase> sharedDatabase() const { return db_; }

private:
  friend class ChunkTransaction;

  void ensureSchema();
  std::optional<ChunkRecord> selectChunk(const std::string &hash) const;
  int64_t refCountOf(const std::string &hash) const;
  int64_t applyIncrement(const std::string &hash, const ReferenceSource &source, TimePoint now);
  int64_t applyDecrement(const std::string &hash, const ReferenceSource &source, TimePoint now);
  void startGrace(const std::string &hash, TimePoint now, std::optional<int64_t> runId);

  std::shared_ptr<SqliteDatabase> db_;
  const Clock &clock_;
  Millis gracePeriod_;
  mutable ChunkLockTable locks_;
  DeletionJournal *journal_{nullptr};
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_REFERENCE_LEDGER_HPP
