#include "audit/deletion_journal.hpp"
#include "ledger/sqlite_db.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <sstream>

namespace chunkkeeper {

namespace {

const char *kColumns =
    "seq, ts, run_id, chunk_hash, size, prior_sources, decision, reason, prev_digest, digest";

std::string joinSources(const std::vector<std::string> &sources) {
    std::string out;
    for (size_t i = 0; i < sources.size(); ++i) {
        if (i)
            out += ',';
        out += sources[i];
    }
    return out;
}

std::vector<std::string> splitSources(const std::string &text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

AuditEntry readEntry(const Statement &st) {
    AuditEntry e;
    e.sequence = st.columnInt64(0);
    e.timestamp = fromEpochMillis(st.columnInt64(1));
    e.runId = st.columnOptionalInt64(2);
    e.chunkHash = st.columnText(3);
    e.size = static_cast<uint64_t>(st.columnInt64(4));
    e.priorSources = splitSources(st.columnText(5));
    e.decision = auditDecisionFromString(st.columnText(6));
    e.reason = st.columnText(7);
    e.prevDigest = st.columnText(8);
    e.digest = st.columnText(9);
    return e;
}

} // namespace

std::string auditDecisionToString(AuditDecision decision) {
    switch (decision) {
    case AuditDecision::Marked: return "marked";
    case AuditDecision::Deleted: return "deleted";
    case AuditDecision::Resurrected: return "resurrected";
    case AuditDecision::Skipped: return "skipped";
    case AuditDecision::Failed: return "failed";
    case AuditDecision::Recovered: return "recovered";
    case AuditDecision::Purged: return "purged";
    case AuditDecision::Halted: return "halted";
    }
    return "unknown";
}

AuditDecision auditDecisionFromString(const std::string &name) {
    static const AuditDecision all[] = {
        AuditDecision::Marked,  AuditDecision::Deleted,   AuditDecision::Resurrected,
        AuditDecision::Skipped, AuditDecision::Failed,    AuditDecision::Recovered,
        AuditDecision::Purged,  AuditDecision::Halted};
    for (auto d : all) {
        if (auditDecisionToString(d) == name)
            return d;
    }
    throw ValidationError("unknown audit decision: " + name);
}

DeletionJournal::DeletionJournal(std::shared_ptr<SqliteDatabase> db, const Clock &clock)
    : db_(std::move(db)), clock_(clock) {
    ensureSchema();
}

void DeletionJournal::ensureSchema() {
    db_->exec("CREATE TABLE IF NOT EXISTS gc_audit ("
              " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
              " ts INTEGER NOT NULL,"
              " run_id INTEGER,"
              " chunk_hash TEXT NOT NULL,"
              " size INTEGER NOT NULL DEFAULT 0,"
              " prior_sources TEXT NOT NULL DEFAULT '',"
              " decision TEXT NOT NULL,"
              " reason TEXT NOT NULL DEFAULT '',"
              " prev_digest TEXT NOT NULL,"
              " digest TEXT NOT NULL);"
              "CREATE INDEX IF NOT EXISTS idx_gc_audit_chunk ON gc_audit(chunk_hash);"
              "CREATE INDEX IF NOT EXISTS idx_gc_audit_run ON gc_audit(run_id);"
              // The journal is append-only.
              "CREATE TRIGGER IF NOT EXISTS gc_audit_no_update BEFORE UPDATE ON gc_audit"
              " BEGIN SELECT RAISE(ABORT, 'gc_audit is append-only'); END;");
}

std::string DeletionJournal::computeDigest(const Entry &entry) {
    utils::ContentHasher h(utils::HashAlgorithm::SHA256);
    std::ostringstream oss;
    oss << entry.prevDigest << '|' << toEpochMillis(entry.timestamp) << '|'
        << (entry.runId ? std::to_string(*entry.runId) : std::string()) << '|'
        << entry.chunkHash << '|' << entry.size << '|' << joinSources(entry.priorSources)
        << '|' << auditDecisionToString(entry.decision) << '|' << entry.reason;
    h.update(oss.str());
    return h.finalizeHex();
}

AuditEntry DeletionJournal::append(Entry entry) {
    auto lk = db_->lock();
    if (db_->inTransaction())
        return appendLocked(std::move(entry));
    SqliteTransaction txn(*db_);
    Entry stored = appendLocked(std::move(entry));
    txn.commit();
    return stored;
}

AuditEntry DeletionJournal::appendLocked(Entry entry) {
    {
        Statement last(*db_, "SELECT digest FROM gc_audit ORDER BY seq DESC LIMIT 1");
        entry.prevDigest = last.step() ? last.columnText(0) : std::string();
    }
    entry.timestamp = clock_.now();
    entry.digest = computeDigest(entry);

    Statement ins(*db_, "INSERT INTO gc_audit (ts, run_id, chunk_hash, size, prior_sources,"
                        " decision, reason, prev_digest, digest) VALUES (?,?,?,?,?,?,?,?,?)");
    ins.bind(1, toEpochMillis(entry.timestamp))
        .bind(2, entry.runId)
        .bind(3, entry.chunkHash)
        .bind(4, static_cast<int64_t>(entry.size))
        .bind(5, joinSources(entry.priorSources))
        .bind(6, auditDecisionToString(entry.decision))
        .bind(7, entry.reason)
        .bind(8, entry.prevDigest)
        .bind(9, entry.digest);
    ins.exec();
    entry.sequence = db_->lastInsertRowId();

    Logger::getInstance().log(LogLevel::DEBUG, "[Journal] " + auditDecisionToString(entry.decision) +
                                                   " " + entry.chunkHash + " (" + entry.reason + ")");
    return entry;
}

AuditEntry DeletionJournal::record(AuditDecision decision, const std::string &chunkHash,
                                   uint64_t size, const std::string &reason,
                                   std::optional<int64_t> runId,
                                   std::vector<std::string> priorSources) {
    Entry e;
    e.decision = decision;
    e.chunkHash = chunkHash;
    e.size = size;
    e.reason = reason;
    e.runId = runId;
    e.priorSources = std::move(priorSources);
    return append(std::move(e));
}

std::vector<AuditEntry> DeletionJournal::entries(std::optional<int64_t> runId) const {
    auto lk = db_->lock();
    std::string sql = std::string("SELECT ") + kColumns + " FROM gc_audit";
    if (runId)
        sql += " WHERE run_id = ?";
    sql += " ORDER BY seq";
    Statement st(*db_, sql);
    if (runId)
        st.bind(1, *runId);
    std::vector<Entry> out;
    while (st.step())
        out.push_back(readEntry(st));
    return out;
}

std::vector<AuditEntry> DeletionJournal::entriesFor(const std::string &chunkHash) const {
    auto lk = db_->lock();
    Statement st(*db_, std::string("SELECT ") + kColumns +
                           " FROM gc_audit WHERE chunk_hash = ? ORDER BY seq");
    st.bind(1, chunkHash);
    std::vector<Entry> out;
    while (st.step())
        out.push_back(readEntry(st));
    return out;
}

std::optional<AuditEntry> DeletionJournal::lastEntry(const std::string &chunkHash,
                                                     AuditDecision decision) const {
    auto lk = db_->lock();
    Statement st(*db_, std::string("SELECT ") + kColumns +
                           " FROM gc_audit WHERE chunk_hash = ? AND decision = ?"
                           " ORDER BY seq DESC LIMIT 1");
    st.bind(1, chunkHash).bind(2, auditDecisionToString(decision));
    if (!st.step())
        return std::nullopt;
    return readEntry(st);
}

DeletionJournal::VerifyResult DeletionJournal::verify() const {
    auto lk = db_->lock();
    Statement st(*db_, std::string("SELECT ") + kColumns + " FROM gc_audit ORDER BY seq");
    VerifyResult result;
    std::string prev;
    while (st.step()) {
        Entry e = readEntry(st);
        ++result.checked;
        if (e.prevDigest != prev || computeDigest(e) != e.digest) {
            result.ok = false;
            result.brokenAt = e.sequence;
            Logger::getInstance().log(LogLevel::ERROR, "[Journal] chain broken at sequence " +
                                                           std::to_string(e.sequence));
            return result;
        }
        prev = e.digest;
    }
    return result;
}

} // namespace chunkkeeper
