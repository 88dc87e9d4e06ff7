#ifndef CHUNKKEEPER_DELETION_JOURNAL_HPP
#define CHUNKKEEPER_DELETION_JOURNAL_HPP

#include "utilities/clock.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

class SqliteDatabase;

/// Outcome recorded for a chunk.
enum class AuditDecision { Marked, Deleted, Resurrected, Skipped, Failed, Recovered, Purged, Halted };

std::string auditDecisionToString(AuditDecision decision);
AuditDecision auditDecisionFromString(const std::string &name);

/**
 * @brief Append-only record of every reclamation decision.
 *
 * Entries live in the `gc_audit` table of the ledger database. Each entry's
 * digest is SHA-256 over the previous entry's digest and this entry's fields,
 * so rewriting or removing any row breaks verify().
 */
class DeletionJournal {
public:
    struct Entry {
        int64_t sequence = 0;             ///< Assigned on append
        TimePoint timestamp{};            ///< Assigned on append
        std::optional<int64_t> runId;     ///< Owning GcRun, if any
        std::string chunkHash;
        uint64_t size = 0;
        std::vector<std::string> priorSources; ///< "kind:id" of removed references
        AuditDecision decision = AuditDecision::Marked;
        std::string reason;
        std::string prevDigest;
        std::string digest;
    };

    struct VerifyResult {
        bool ok = true;
        size_t checked = 0;
        std::optional<int64_t> brokenAt; ///< First sequence whose digest does not match
    };

    DeletionJournal(std::shared_ptr<SqliteDatabase> db, const Clock &clock);

    DeletionJournal(const DeletionJournal&) = delete;
    DeletionJournal& operator=(const DeletionJournal&) = delete;

    /**
     * @brief Append an entry and return it with sequence and digests filled in.
     *
     * Joins the caller's open transaction if there is one, so a decision and
     * the ledger change it describes commit together.
     */
    Entry append(Entry entry);

    /** Convenience wrapper around append(). */
    Entry record(AuditDecision decision, const std::string &chunkHash, uint64_t size,
                 const std::string &reason, std::optional<int64_t> runId = std::nullopt,
                 std::vector<std::string> priorSources = {});

    /** Entries in sequence order, optionally restricted to one run. */
    std::vector<Entry> entries(std::optional<int64_t> runId = std::nullopt) const;

    /** Entries for one chunk in sequence order. */
    std::vector<Entry> entriesFor(const std::string &chunkHash) const;

    /** Most recent entry for @p chunkHash with @p decision. */
    std::optional<Entry> lastEntry(const std::string &chunkHash, AuditDecision decision) const;

    /** Recompute the chain from the first entry. */
    VerifyResult verify() const;

    /** Digest of @p entry chained onto entry.prevDigest. */
    static std::string computeDigest(const Entry &entry);

private:
    void ensureSchema();
    Entry appendLocked(Entry entry);

    std::shared_ptr<SqliteDatabase> db_;
    const Clock &clock_;
};

using AuditEntry = DeletionJournal::Entry;

} // namespace chunkkeeper

#endif // CHUNKKEEPER_DELETION_JOURNAL_HPP
