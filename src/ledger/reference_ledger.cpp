#include "ledger/reference_ledger.hpp"
#include "audit/deletion_journal.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <charconv>
#include <set>

namespace chunkkeeper {

namespace {

const char *kChunkColumns =
    "hash, size, compressed_size, ref_count, storage_tier, created_at,"
    " last_accessed_at, deleted_at, gc_protected_until";

ChunkRecord readChunk(const Statement &st, int offset = 0) {
  ChunkRecord c;
  c.hash = st.columnText(offset + 0);
  c.size = static_cast<uint64_t>(st.columnInt64(offset + 1));
  c.compressedSize = static_cast<uint64_t>(st.columnInt64(offset + 2));
  c.refCount = st.columnInt64(offset + 3);
  c.tier = tierFromString(st.columnText(offset + 4));
  c.createdAt = fromEpochMillis(st.columnInt64(offset + 5));
  c.lastAccessedAt = fromEpochMillis(st.columnInt64(offset + 6));
  if (auto v = st.columnOptionalInt64(offset + 7))
    c.deletedAt = fromEpochMillis(*v);
  if (auto v = st.columnOptionalInt64(offset + 8))
    c.gcProtectedUntil = fromEpochMillis(*v);
  return c;
}

ReferenceRecord readReference(const Statement &st) {
  ReferenceRecord r;
  r.chunkHash = st.columnText(0);
  r.source.kind = sourceKindFromString(st.columnText(1));
  r.source.id = st.columnText(2);
  r.source.repositoryId = st.columnText(3);
  r.createdAt = fromEpochMillis(st.columnInt64(4));
  return r;
}

PendingDeletion readPending(const Statement &st) {
  PendingDeletion p;
  p.chunkHash = st.columnText(0);
  p.markedAt = fromEpochMillis(st.columnInt64(1));
  p.deleteAfter = fromEpochMillis(st.columnInt64(2));
  p.runId = st.columnOptionalInt64(3);
  return p;
}

const char *kRunColumns =
    "id, strategy, trigger_kind, node_id, started_at, finished_at, status,"
    " chunks_scanned, chunks_deleted, bytes_reclaimed, error_count, dry_run";

GcRunRecord readRun(const Statement &st) {
  GcRunRecord r;
  r.id = st.columnInt64(0);
  r.strategy = st.columnText(1);
  r.trigger = st.columnText(2);
  r.nodeId = st.columnText(3);
  r.startedAt = fromEpochMillis(st.columnInt64(4));
  if (auto v = st.columnOptionalInt64(5))
    r.finishedAt = fromEpochMillis(*v);
  r.status = runStatusFromString(st.columnText(6));
  r.chunksScanned = static_cast<uint64_t>(st.columnInt64(7));
  r.chunksDeleted = static_cast<uint64_t>(st.columnInt64(8));
  r.bytesReclaimed = static_cast<uint64_t>(st.columnInt64(9));
  r.errorCount = static_cast<uint64_t>(st.columnInt64(10));
  r.dryRun = st.columnInt64(11) != 0;
  return r;
}

std::vector<std::string> sortedHashes(const std::vector<ReferenceChange> &changes) {
  std::vector<std::string> hashes;
  hashes.reserve(changes.size());
  for (const auto &c : changes)
    hashes.push_back(c.hash);
  return hashes;
}

std::vector<ReferenceChange> sortedChanges(std::vector<ReferenceChange> changes) {
  std::stable_sort(changes.begin(), changes.end(),
                   [](const ReferenceChange &a, const ReferenceChange &b) {
                     return a.hash < b.hash;
                   });
  return changes;
}

} // namespace

std::string sourceKindToString(SourceKind kind) {
  switch (kind) {
  case SourceKind::Commit:
    return "commit";
  case SourceKind::StagingEntry:
    return "staging-entry";
  case SourceKind::Stash:
    return "stash";
  case SourceKind::Tag:
    return "tag";
  case SourceKind::PendingUpload:
    return "pending-upload";
  case SourceKind::CacheEntry:
    return "cache-entry";
  }
  return "unknown";
}

SourceKind sourceKindFromString(const std::string &name) {
  if (name == "commit")
    return SourceKind::Commit;
  if (name == "staging-entry")
    return SourceKind::StagingEntry;
  if (name == "stash")
    return SourceKind::Stash;
  if (name == "tag")
    return SourceKind::Tag;
  if (name == "pending-upload")
    return SourceKind::PendingUpload;
  if (name == "cache-entry")
    return SourceKind::CacheEntry;
  throw ValidationError("unknown reference source kind: " + name);
}

std::string runStatusToString(RunStatus status) {
  switch (status) {
  case RunStatus::Running:
    return "running";
  case RunStatus::Completed:
    return "completed";
  case RunStatus::Failed:
    return "failed";
  }
  return "unknown";
}

RunStatus runStatusFromString(const std::string &name) {
  if (name == "running")
    return RunStatus::Running;
  if (name == "completed")
    return RunStatus::Completed;
  if (name == "failed")
    return RunStatus::Failed;
  throw ValidationError("unknown run status: " + name);
}

// ---------------------------------------------------------------------------
// ChunkLockTable

size_t ChunkLockTable::stripeFor(const std::string &hash) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    return -1;
  };
  if (hash.size() >= 2) {
    int hi = nibble(hash[0]);
    int lo = nibble(hash[1]);
    if (hi >= 0 && lo >= 0)
      return static_cast<size_t>(hi * 16 + lo);
  }
  return std::hash<std::string>{}(hash) % kStripes;
}

ChunkLockTable::Guard ChunkLockTable::lock(const std::string &hash) {
  Guard g;
  g.locks_.emplace_back(stripes_[stripeFor(hash)]);
  return g;
}

ChunkLockTable::Guard ChunkLockTable::lock(const std::vector<std::string> &hashes) {
  std::set<size_t> indices;
  for (const auto &h : hashes)
    indices.insert(stripeFor(h));
  Guard g;
  g.locks_.reserve(indices.size());
  for (size_t idx : indices)
    g.locks_.emplace_back(stripes_[idx]);
  return g;
}

// ---------------------------------------------------------------------------
// ChunkTransaction

ChunkTransaction::ChunkTransaction(ReferenceLedger &ledger, const std::string &hash)
    : ledger_(ledger), hash_(hash), chunkLock_(ledger.locks_.lock(hash)),
      txn_(*ledger.db_) {}

std::optional<ChunkRecord> ChunkTransaction::chunk() { return ledger_.selectChunk(hash_); }

size_t ChunkTransaction::referenceCount() {
  Statement st(*ledger_.db_, "SELECT COUNT(*) FROM chunk_refs WHERE chunk_hash = ?");
  st.bind(1, hash_);
  st.step();
  return static_cast<size_t>(st.columnInt64(0));
}

std::optional<PendingDeletion> ChunkTransaction::pending() { return ledger_.pendingFor(hash_); }

void ChunkTransaction::softDelete(TimePoint now, uint64_t size) {
  int64_t ts = toEpochMillis(now);
  Statement st(*ledger_.db_,
               "INSERT INTO chunks (hash, size, compressed_size, ref_count, storage_tier,"
               " created_at, last_accessed_at, deleted_at, gc_protected_until)"
               " VALUES (?, ?, 0, 0, 'hot', ?, ?, ?, NULL)"
               " ON CONFLICT(hash) DO UPDATE SET deleted_at = excluded.deleted_at,"
               " gc_protected_until = NULL");
  st.bind(1, hash_).bind(2, static_cast<int64_t>(size)).bind(3, ts).bind(4, ts).bind(5, ts);
  st.exec();
  dropPending();
}

void ChunkTransaction::markPending(TimePoint now, TimePoint deleteAfter,
                                   std::optional<int64_t> runId) {
  Statement st(*ledger_.db_,
               "INSERT INTO pending_deletions (chunk_hash, marked_at, delete_after, run_id)"
               " VALUES (?, ?, ?, ?) ON CONFLICT(chunk_hash) DO UPDATE SET"
               " marked_at = excluded.marked_at, delete_after = excluded.delete_after,"
               " run_id = excluded.run_id");
  st.bind(1, hash_).bind(2, toEpochMillis(now)).bind(3, toEpochMillis(deleteAfter)).bind(4, runId);
  st.exec();
  Statement protect(*ledger_.db_,
                    "UPDATE chunks SET gc_protected_until = ? WHERE hash = ? AND ref_count = 0");
  protect.bind(1, toEpochMillis(deleteAfter)).bind(2, hash_);
  protect.exec();
}

void ChunkTransaction::dropPending() {
  Statement st(*ledger_.db_, "DELETE FROM pending_deletions WHERE chunk_hash = ?");
  st.bind(1, hash_);
  st.exec();
}

bool ChunkTransaction::restore(TimePoint protectUntil) {
  Statement st(*ledger_.db_, "UPDATE chunks SET deleted_at = NULL, gc_protected_until = ?"
                             " WHERE hash = ? AND deleted_at IS NOT NULL");
  st.bind(1, toEpochMillis(protectUntil)).bind(2, hash_);
  st.exec();
  if (ledger_.db_->changes() == 0)
    return false;
  auto row = chunk();
  if (row && row->refCount == 0) {
    markPending(ledger_.clock_.now(), protectUntil, std::nullopt);
  }
  return true;
}

bool ChunkTransaction::purge() {
  Statement st(*ledger_.db_, "DELETE FROM chunks WHERE hash = ? AND deleted_at IS NOT NULL");
  st.bind(1, hash_);
  st.exec();
  bool removed = ledger_.db_->changes() > 0;
  if (removed)
    dropPending();
  return removed;
}

void ChunkTransaction::commit() { txn_.commit(); }

// ---------------------------------------------------------------------------
// ReferenceLedger

ReferenceLedger::ReferenceLedger(std::shared_ptr<SqliteDatabase> db, const Clock &clock,
                                 Millis gracePeriod)
    : db_(std::move(db)), clock_(clock), gracePeriod_(gracePeriod) {
  if (!db_)
    throw LedgerError("ledger requires a database connection", 0);
  ensureSchema();
}

void ReferenceLedger::ensureSchema() {
  db_->exec("CREATE TABLE IF NOT EXISTS chunks ("
            " hash TEXT PRIMARY KEY,"
            " size INTEGER NOT NULL DEFAULT 0,"
            " compressed_size INTEGER NOT NULL DEFAULT 0,"
            " ref_count INTEGER NOT NULL DEFAULT 0 CHECK (ref_count >= 0),"
            " storage_tier TEXT NOT NULL DEFAULT 'hot',"
            " created_at INTEGER NOT NULL,"
            " last_accessed_at INTEGER NOT NULL,"
            " deleted_at INTEGER,"
            " gc_protected_until INTEGER);"
            "CREATE INDEX IF NOT EXISTS idx_chunks_orphans ON chunks(ref_count, deleted_at);"
            "CREATE INDEX IF NOT EXISTS idx_chunks_created ON chunks(created_at);"
            "CREATE TABLE IF NOT EXISTS chunk_refs ("
            " chunk_hash TEXT NOT NULL,"
            " source_kind TEXT NOT NULL,"
            " source_id TEXT NOT NULL,"
            " repository_id TEXT NOT NULL DEFAULT '',"
            " created_at INTEGER NOT NULL,"
            " PRIMARY KEY (chunk_hash, source_kind, source_id));"
            "CREATE INDEX IF NOT EXISTS idx_chunk_refs_source ON chunk_refs(source_kind, source_id);"
            "CREATE TABLE IF NOT EXISTS pending_deletions ("
            " chunk_hash TEXT PRIMARY KEY,"
            " marked_at INTEGER NOT NULL,"
            " delete_after INTEGER NOT NULL,"
            " run_id INTEGER);"
            "CREATE TABLE IF NOT EXISTS gc_runs ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " strategy TEXT NOT NULL,"
            " trigger_kind TEXT NOT NULL,"
            " node_id TEXT NOT NULL DEFAULT '',"
            " started_at INTEGER NOT NULL,"
            " finished_at INTEGER,"
            " status TEXT NOT NULL CHECK (status IN ('running', 'completed', 'failed')),"
            " chunks_scanned INTEGER NOT NULL DEFAULT 0,"
            " chunks_deleted INTEGER NOT NULL DEFAULT 0,"
            " bytes_reclaimed INTEGER NOT NULL DEFAULT 0,"
            " error_count INTEGER NOT NULL DEFAULT 0,"
            " dry_run INTEGER NOT NULL DEFAULT 0);"
            "CREATE TABLE IF NOT EXISTS scheduler_state ("
            " key TEXT PRIMARY KEY,"
            " value TEXT NOT NULL,"
            " updated_at INTEGER NOT NULL);");
}

std::optional<ChunkRecord> ReferenceLedger::selectChunk(const std::string &hash) const {
  auto lk = db_->lock();
  Statement st(*db_, std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE hash = ?");
  st.bind(1, hash);
  if (!st.step())
    return std::nullopt;
  return readChunk(st);
}

int64_t ReferenceLedger::refCountOf(const std::string &hash) const {
  Statement st(*db_, "SELECT ref_count FROM chunks WHERE hash = ?");
  st.bind(1, hash);
  return st.step() ? st.columnInt64(0) : 0;
}

bool ReferenceLedger::registerChunk(const std::string &hash, uint64_t size,
                                    uint64_t compressedSize, StorageTier tier) {
  if (!utils::isValidHash(hash))
    throw ValidationError("malformed chunk hash: '" + hash + "'");

  TimePoint now = clock_.now();
  int64_t ts = toEpochMillis(now);
  auto guard = locks_.lock(hash);
  SqliteTransaction txn(*db_);

  auto existing = selectChunk(hash);
  if (!existing) {
    Statement ins(*db_, "INSERT INTO chunks (hash, size, compressed_size, ref_count,"
                        " storage_tier, created_at, last_accessed_at, deleted_at,"
                        " gc_protected_until) VALUES (?, ?, ?, 0, ?, ?, ?, NULL, ?)");
    ins.bind(1, hash)
        .bind(2, static_cast<int64_t>(size))
        .bind(3, static_cast<int64_t>(compressedSize))
        .bind(4, tierToString(tier))
        .bind(5, ts)
        .bind(6, ts)
        .bind(7, toEpochMillis(now + gracePeriod_));
    ins.exec();
    startGrace(hash, now, std::nullopt);
    txn.commit();
    Logger::getInstance().log(LogLevel::DEBUG, "[Ledger] registered chunk " + hash + " (" +
                                                   std::to_string(size) + " bytes)");
    return true;
  }

  if (existing->size == 0 && size != 0) {
    Statement upd(*db_, "UPDATE chunks SET size = ?, compressed_size = ? WHERE hash = ?");
    upd.bind(1, static_cast<int64_t>(size)).bind(2, static_cast<int64_t>(compressedSize)).bind(3, hash);
    upd.exec();
  }
  if (existing->softDeleted()) {
    // Bytes were written again after a sweep.
    Statement upd(*db_, "UPDATE chunks SET deleted_at = NULL, last_accessed_at = ? WHERE hash = ?");
    upd.bind(1, ts).bind(2, hash);
    upd.exec();
    if (existing->refCount == 0)
      startGrace(hash, now, std::nullopt);
    Logger::getInstance().log(LogLevel::INFO,
                              "[Ledger] soft-deleted chunk " + hash + " re-written");
  }
  txn.commit();
  return false;
}

void ReferenceLedger::startGrace(const std::string &hash, TimePoint now,
                                 std::optional<int64_t> runId) {
  TimePoint until = now + gracePeriod_;
  Statement protect(*db_, "UPDATE chunks SET gc_protected_until = ? WHERE hash = ?");
  protect.bind(1, toEpochMillis(until)).bind(2, hash);
  protect.exec();
  Statement pend(*db_,
                 "INSERT INTO pending_deletions (chunk_hash, marked_at, delete_after, run_id)"
                 " VALUES (?, ?, ?, ?) ON CONFLICT(chunk_hash) DO UPDATE SET"
                 " marked_at = excluded.marked_at, delete_after = excluded.delete_after,"
                 " run_id = excluded.run_id");
  pend.bind(1, hash).bind(2, toEpochMillis(now)).bind(3, toEpochMillis(until)).bind(4, runId);
  pend.exec();
}

int64_t ReferenceLedger::applyIncrement(const std::string &hash, const ReferenceSource &source,
                                        TimePoint now) {
  int64_t ts = toEpochMillis(now);
  Statement ref(*db_, "INSERT OR IGNORE INTO chunk_refs (chunk_hash, source_kind, source_id,"
                      " repository_id, created_at) VALUES (?, ?, ?, ?, ?)");
  ref.bind(1, hash)
      .bind(2, sourceKindToString(source.kind))
      .bind(3, source.id)
      .bind(4, source.repositoryId)
      .bind(5, ts);
  ref.exec();
  if (db_->changes() == 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "[Ledger] duplicate reference " +
                                                   source.toString() + " -> " + hash);
    return refCountOf(hash);
  }

  auto prior = selectChunk(hash);
  auto pendingRow = pendingFor(hash);

  Statement up(*db_, "INSERT INTO chunks (hash, size, compressed_size, ref_count, storage_tier,"
                     " created_at, last_accessed_at, deleted_at, gc_protected_until)"
                     " VALUES (?, 0, 0, 1, 'hot', ?, ?, NULL, NULL)"
                     " ON CONFLICT(hash) DO UPDATE SET ref_count = ref_count + 1,"
                     " deleted_at = NULL, gc_protected_until = NULL,"
                     " last_accessed_at = excluded.last_accessed_at");
  up.bind(1, hash).bind(2, ts).bind(3, ts);
  up.exec();

  Statement drop(*db_, "DELETE FROM pending_deletions WHERE chunk_hash = ?");
  drop.bind(1, hash);
  drop.exec();

  if (prior && prior->softDeleted()) {
    Logger::getInstance().log(LogLevel::ERROR, "[Ledger] reference " + source.toString() +
                                                   " added to soft-deleted chunk " + hash +
                                                   "; bytes must be re-uploaded");
    MetricsRegistry::instance().incrementCounter("chunkkeeper_consistency_errors_total");
  }
  if (pendingRow) {
    Logger::getInstance().log(LogLevel::INFO, "[Ledger] chunk " + hash +
                                                  " resurrected by " + source.toString());
    if (journal_) {
      journal_->record(AuditDecision::Resurrected, hash, prior ? prior->size : 0,
                       "reference added during grace window", pendingRow->runId,
                       {source.toString()});
    }
  }
  return refCountOf(hash);
}

int64_t ReferenceLedger::applyDecrement(const std::string &hash, const ReferenceSource &source,
                                        TimePoint now) {
  Statement del(*db_, "DELETE FROM chunk_refs WHERE chunk_hash = ? AND source_kind = ?"
                      " AND source_id = ?");
  del.bind(1, hash).bind(2, sourceKindToString(source.kind)).bind(3, source.id);
  del.exec();
  if (db_->changes() == 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "[Ledger] no reference " + source.toString() +
                                                   " -> " + hash + " to remove");
    return refCountOf(hash);
  }

  Statement dec(*db_, "UPDATE chunks SET ref_count = MAX(ref_count - 1, 0),"
                      " last_accessed_at = ? WHERE hash = ?");
  dec.bind(1, toEpochMillis(now)).bind(2, hash);
  dec.exec();
  if (db_->changes() == 0) {
    Logger::getInstance().log(LogLevel::WARN, "[Ledger] reference " + source.toString() +
                                                  " pointed at unknown chunk " + hash);
    return 0;
  }

  int64_t count = refCountOf(hash);
  if (count == 0) {
    startGrace(hash, now, std::nullopt);
    if (journal_) {
      auto row = selectChunk(hash);
      journal_->record(AuditDecision::Marked, hash, row ? row->size : 0,
                       "last reference removed", std::nullopt, {source.toString()});
    }
  }
  return count;
}

int64_t ReferenceLedger::incrementReference(const std::string &hash,
                                            const ReferenceSource &source) {
  if (!utils::isValidHash(hash))
    throw ValidationError("malformed chunk hash: '" + hash + "'");
  auto guard = locks_.lock(hash);
  SqliteTransaction txn(*db_);
  int64_t count = applyIncrement(hash, source, clock_.now());
  txn.commit();
  return count;
}

int64_t ReferenceLedger::decrementReference(const std::string &hash,
                                            const ReferenceSource &source) {
  auto guard = locks_.lock(hash);
  SqliteTransaction txn(*db_);
  int64_t count = applyDecrement(hash, source, clock_.now());
  txn.commit();
  return count;
}

void ReferenceLedger::incrementReferences(const std::vector<ReferenceChange> &changes) {
  if (changes.empty())
    return;
  for (const auto &c : changes) {
    if (!utils::isValidHash(c.hash))
      throw ValidationError("malformed chunk hash: '" + c.hash + "'");
  }
  auto ordered = sortedChanges(changes);
  auto guard = locks_.lock(sortedHashes(ordered));
  SqliteTransaction txn(*db_);
  TimePoint now = clock_.now();
  for (const auto &c : ordered)
    applyIncrement(c.hash, c.source, now);
  txn.commit();
}

void ReferenceLedger::decrementReferences(const std::vector<ReferenceChange> &changes) {
  if (changes.empty())
    return;
  auto ordered = sortedChanges(changes);
  auto guard = locks_.lock(sortedHashes(ordered));
  SqliteTransaction txn(*db_);
  TimePoint now = clock_.now();
  for (const auto &c : ordered)
    applyDecrement(c.hash, c.source, now);
  txn.commit();
}

std::vector<std::string> ReferenceLedger::removeSource(SourceKind kind,
                                                       const std::string &sourceId) {
  auto refs = referencesFrom(kind, sourceId);
  std::vector<ReferenceChange> changes;
  std::vector<std::string> hashes;
  for (const auto &r : refs) {
    changes.push_back(ReferenceChange{r.chunkHash, r.source});
    hashes.push_back(r.chunkHash);
  }
  decrementReferences(changes);
  Logger::getInstance().log(LogLevel::INFO, "[Ledger] removed " + std::to_string(hashes.size()) +
                                                " references held by " +
                                                sourceKindToString(kind) + ":" + sourceId);
  return hashes;
}

std::optional<ChunkRecord> ReferenceLedger::getChunk(const std::string &hash) const {
  return selectChunk(hash);
}

std::vector<ReferenceRecord> ReferenceLedger::referencesFor(const std::string &hash) const {
  auto lk = db_->lock();
  Statement st(*db_, "SELECT chunk_hash, source_kind, source_id, repository_id, created_at"
                     " FROM chunk_refs WHERE chunk_hash = ? ORDER BY source_kind, source_id");
  st.bind(1, hash);
  std::vector<ReferenceRecord> out;
  while (st.step())
    out.push_back(readReference(st));
  return out;
}

std::vector<ReferenceRecord> ReferenceLedger::referencesFrom(SourceKind kind,
                                                             const std::string &sourceId) const {
  auto lk = db_->lock();
  Statement st(*db_, "SELECT chunk_hash, source_kind, source_id, repository_id, created_at"
                     " FROM chunk_refs WHERE source_kind = ? AND source_id = ?"
                     " ORDER BY chunk_hash");
  st.bind(1, sourceKindToString(kind)).bind(2, sourceId);
  std::vector<ReferenceRecord> out;
  while (st.step())
    out.push_back(readReference(st));
  return out;
}

std::vector<ChunkRecord> ReferenceLedger::selectExpiredOrphans(TimePoint now,
                                                               size_t limit) const {
  OrphanQuery q;
  q.now = now;
  q.limit = limit;
  return selectOrphans(q);
}

std::vector<ChunkRecord> ReferenceLedger::selectOrphans(const OrphanQuery &query) const {
  std::string sql = "SELECT c.hash, c.size, c.compressed_size, c.ref_count, c.storage_tier,"
                    " c.created_at, c.last_accessed_at, c.deleted_at, c.gc_protected_until"
                    " FROM chunks c JOIN pending_deletions p ON p.chunk_hash = c.hash"
                    " WHERE c.ref_count = 0 AND c.deleted_at IS NULL AND c.hash > ?"
                    " AND NOT EXISTS (SELECT 1 FROM chunk_refs r WHERE r.chunk_hash = c.hash)";
  if (query.graceOverride) {
    sql += " AND p.marked_at + ? <= ?";
  } else {
    sql += " AND p.delete_after <= ?"
           " AND (c.gc_protected_until IS NULL OR c.gc_protected_until <= ?)";
  }
  if (query.createdAfter)
    sql += " AND c.created_at > ?";
  if (query.createdAtOrBefore)
    sql += " AND c.created_at <= ?";
  sql += " ORDER BY c.hash LIMIT ?";

  auto lk = db_->lock();
  Statement st(*db_, sql);
  int idx = 1;
  int64_t now = toEpochMillis(query.now);
  st.bind(idx++, query.afterHash);
  if (query.graceOverride) {
    st.bind(idx++, static_cast<int64_t>(query.graceOverride->count()));
    st.bind(idx++, now);
  } else {
    st.bind(idx++, now);
    st.bind(idx++, now);
  }
  if (query.createdAfter)
    st.bind(idx++, toEpochMillis(*query.createdAfter));
  if (query.createdAtOrBefore)
    st.bind(idx++, toEpochMillis(*query.createdAtOrBefore));
  st.bind(idx++, static_cast<int64_t>(query.limit == 0 ? 1 : query.limit));

  std::vector<ChunkRecord> out;
  while (st.step())
    out.push_back(readChunk(st));
  return out;
}

std::vector<PendingDeletion> ReferenceLedger::selectPendingDeletions(size_t limit) const {
  auto lk = db_->lock();
  std::string sql = "SELECT chunk_hash, marked_at, delete_after, run_id FROM pending_deletions"
                    " ORDER BY chunk_hash";
  if (limit > 0)
    sql += " LIMIT " + std::to_string(limit);
  Statement st(*db_, sql);
  std::vector<PendingDeletion> out;
  while (st.step())
    out.push_back(readPending(st));
  return out;
}

std::optional<PendingDeletion> ReferenceLedger::pendingFor(const std::string &hash) const {
  auto lk = db_->lock();
  Statement st(*db_, "SELECT chunk_hash, marked_at, delete_after, run_id FROM pending_deletions"
                     " WHERE chunk_hash = ?");
  st.bind(1, hash);
  if (!st.step())
    return std::nullopt;
  return readPending(st);
}

OrphanSummary ReferenceLedger::orphanSummary(TimePoint now) const {
  auto lk = db_->lock();
  OrphanSummary s;
  {
    Statement st(*db_, "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM chunks"
                       " WHERE ref_count = 0 AND deleted_at IS NULL");
    st.step();
    s.orphanedCount = static_cast<uint64_t>(st.columnInt64(0));
    s.orphanedBytes = static_cast<uint64_t>(st.columnInt64(1));
  }
  {
    Statement st(*db_, "SELECT COUNT(*), COALESCE(SUM(c.size), 0) FROM chunks c"
                       " JOIN pending_deletions p ON p.chunk_hash = c.hash"
                       " WHERE c.ref_count = 0 AND c.deleted_at IS NULL AND p.delete_after <= ?"
                       " AND (c.gc_protected_until IS NULL OR c.gc_protected_until <= ?)");
    int64_t ts = toEpochMillis(now);
    st.bind(1, ts).bind(2, ts);
    st.step();
    s.reclaimableCount = static_cast<uint64_t>(st.columnInt64(0));
    s.reclaimableBytes = static_cast<uint64_t>(st.columnInt64(1));
  }
  {
    Statement st(*db_, "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM chunks"
                       " WHERE deleted_at IS NULL");
    st.step();
    s.totalCount = static_cast<uint64_t>(st.columnInt64(0));
    s.totalBytes = static_cast<uint64_t>(st.columnInt64(1));
  }
  return s;
}

void ReferenceLedger::forEachReference(
    const std::function<void(const ReferenceRecord &)> &fn) const {
  auto lk = db_->lock();
  Statement st(*db_, "SELECT chunk_hash, source_kind, source_id, repository_id, created_at"
                     " FROM chunk_refs ORDER BY chunk_hash");
  while (st.step())
    fn(readReference(st));
}

std::vector<ReferenceRecord> ReferenceLedger::allReferences() const {
  std::vector<ReferenceRecord> out;
  forEachReference([&out](const ReferenceRecord &r) { out.push_back(r); });
  return out;
}

std::vector<ChunkRecord> ReferenceLedger::liveChunks(const std::string &afterHash,
                                                     size_t limit) const {
  auto lk = db_->lock();
  Statement st(*db_, std::string("SELECT ") + kChunkColumns +
                         " FROM chunks WHERE deleted_at IS NULL AND hash > ?"
                         " ORDER BY hash LIMIT ?");
  st.bind(1, afterHash).bind(2, static_cast<int64_t>(limit == 0 ? 1 : limit));
  std::vector<ChunkRecord> out;
  while (st.step())
    out.push_back(readChunk(st));
  return out;
}

std::vector<ChunkRecord> ReferenceLedger::softDeletedBefore(TimePoint cutoff,
                                                            size_t limit) const {
  auto lk = db_->lock();
  Statement st(*db_, std::string("SELECT ") + kChunkColumns +
                         " FROM chunks WHERE deleted_at IS NOT NULL AND deleted_at <= ?"
                         " ORDER BY deleted_at, hash LIMIT ?");
  st.bind(1, toEpochMillis(cutoff)).bind(2, static_cast<int64_t>(limit == 0 ? 1 : limit));
  std::vector<ChunkRecord> out;
  while (st.step())
    out.push_back(readChunk(st));
  return out;
}

void ReferenceLedger::setTier(const std::string &hash, StorageTier tier) {
  auto guard = locks_.lock(hash);
  SqliteTransaction txn(*db_);
  Statement st(*db_, "UPDATE chunks SET storage_tier = ? WHERE hash = ?");
  st.bind(1, tierToString(tier)).bind(2, hash);
  st.exec();
  if (db_->changes() == 0)
    throw NotFoundError(hash);
  txn.commit();
}

void ReferenceLedger::touch(const std::string &hash) {
  auto lk = db_->lock();
  Statement st(*db_, "UPDATE chunks SET last_accessed_at = ? WHERE hash = ?");
  st.bind(1, toEpochMillis(clock_.now())).bind(2, hash);
  st.exec();
}

size_t ReferenceLedger::clearPendingDeletions() {
  SqliteTransaction txn(*db_);
  db_->exec("DELETE FROM pending_deletions");
  size_t removed = static_cast<size_t>(db_->changes());
  db_->exec("UPDATE chunks SET gc_protected_until = NULL WHERE ref_count = 0"
            " AND deleted_at IS NULL");
  txn.commit();
  return removed;
}

size_t ReferenceLedger::reseedPendingDeletions(TimePoint now) {
  int64_t ts = toEpochMillis(now);
  int64_t until = toEpochMillis(now + gracePeriod_);
  SqliteTransaction txn(*db_);
  Statement ins(*db_, "INSERT INTO pending_deletions (chunk_hash, marked_at, delete_after, run_id)"
                      " SELECT hash, ?, ?, NULL FROM chunks c WHERE c.ref_count = 0"
                      " AND c.deleted_at IS NULL AND NOT EXISTS"
                      " (SELECT 1 FROM pending_deletions p WHERE p.chunk_hash = c.hash)");
  ins.bind(1, ts).bind(2, until);
  ins.exec();
  size_t added = static_cast<size_t>(db_->changes());
  Statement protect(*db_, "UPDATE chunks SET gc_protected_until = ? WHERE ref_count = 0"
                          " AND deleted_at IS NULL AND gc_protected_until IS NULL");
  protect.bind(1, until);
  protect.exec();
  txn.commit();
  return added;
}

int64_t ReferenceLedger::beginRun(const GcRunRecord &run) {
  auto lk = db_->lock();
  Statement st(*db_, "INSERT INTO gc_runs (strategy, trigger_kind, node_id, started_at, status,"
                     " dry_run) VALUES (?, ?, ?, ?, ?, ?)");
  st.bind(1, run.strategy)
      .bind(2, run.trigger)
      .bind(3, run.nodeId)
      .bind(4, toEpochMillis(run.startedAt))
      .bind(5, runStatusToString(RunStatus::Running))
      .bind(6, static_cast<int64_t>(run.dryRun ? 1 : 0));
  st.exec();
  return db_->lastInsertRowId();
}

void ReferenceLedger::finishRun(const GcRunRecord &run) {
  auto lk = db_->lock();
  Statement st(*db_, "UPDATE gc_runs SET finished_at = ?, status = ?, chunks_scanned = ?,"
                     " chunks_deleted = ?, bytes_reclaimed = ?, error_count = ? WHERE id = ?");
  st.bind(1, run.finishedAt ? std::optional<int64_t>(toEpochMillis(*run.finishedAt))
                            : std::optional<int64_t>())
      .bind(2, runStatusToString(run.status))
      .bind(3, static_cast<int64_t>(run.chunksScanned))
      .bind(4, static_cast<int64_t>(run.chunksDeleted))
      .bind(5, static_cast<int64_t>(run.bytesReclaimed))
      .bind(6, static_cast<int64_t>(run.errorCount))
      .bind(7, run.id);
  st.exec();
  if (db_->changes() == 0)
    throw LedgerError("no gc run with id " + std::to_string(run.id), 0);
}

std::optional<GcRunRecord> ReferenceLedger::getRun(int64_t id) const {
  auto lk = db_->lock();
  Statement st(*db_, std::string("SELECT ") + kRunColumns + " FROM gc_runs WHERE id = ?");
  st.bind(1, id);
  if (!st.step())
    return std::nullopt;
  return readRun(st);
}

std::vector<GcRunRecord> ReferenceLedger::listRuns(size_t limit) const {
  auto lk = db_->lock();
  Statement st(*db_, std::string("SELECT ") + kRunColumns +
                         " FROM gc_runs ORDER BY id DESC LIMIT ?");
  st.bind(1, static_cast<int64_t>(limit == 0 ? 1 : limit));
  std::vector<GcRunRecord> out;
  while (st.step())
    out.push_back(readRun(st));
  return out;
}

std::optional<std::string> ReferenceLedger::getState(const std::string &key) const {
  auto lk = db_->lock();
  Statement st(*db_, "SELECT value FROM scheduler_state WHERE key = ?");
  st.bind(1, key);
  if (!st.step())
    return std::nullopt;
  return st.columnText(0);
}

void ReferenceLedger::setState(const std::string &key, const std::string &value) {
  auto lk = db_->lock();
  Statement st(*db_, "INSERT INTO scheduler_state (key, value, updated_at) VALUES (?, ?, ?)"
                     " ON CONFLICT(key) DO UPDATE SET value = excluded.value,"
                     " updated_at = excluded.updated_at");
  st.bind(1, key).bind(2, value).bind(3, toEpochMillis(clock_.now()));
  st.exec();
}

std::optional<TimePoint> ReferenceLedger::getStateTime(const std::string &key) const {
  auto v = getState(key);
  if (!v || v->empty())
    return std::nullopt;
  int64_t millis = 0;
  const char *end = v->data() + v->size();
  auto [ptr, ec] = std::from_chars(v->data(), end, millis);
  if (ec != std::errc() || ptr != end)
    throw LedgerError("malformed timestamp in scheduler state " + key + ": '" + *v + "'", 0);
  return fromEpochMillis(millis);
}

void ReferenceLedger::setStateTime(const std::string &key, TimePoint t) {
  setState(key, std::to_string(toEpochMillis(t)));
}

bool ReferenceLedger::collectionHalted() const {
  auto v = getState(state_keys::kHalted);
  return v && *v == "true";
}

} // namespace chunkkeeper
