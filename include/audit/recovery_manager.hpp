#ifndef CHUNKKEEPER_RECOVERY_MANAGER_HPP
#define CHUNKKEEPER_RECOVERY_MANAGER_HPP

#include "audit/deletion_journal.hpp"
#include "ledger/reference_ledger.hpp"
#include "store/object_store.hpp"

#include <string>

namespace chunkkeeper {

/**
 * @brief Undo, purge and halt operations on top of the soft-delete lifecycle.
 */
class RecoveryManager {
public:
    enum class RecoveryOutcome {
        Full,         ///< Row restored and bytes still present
        MetadataOnly, ///< Row restored, bytes must be re-uploaded
        NotDeleted    ///< Nothing to recover
    };

    RecoveryManager(ReferenceLedger& ledger, ObjectStore& store, DeletionJournal& journal,
                    Millis recoveryWindow);

    /**
     * @brief Restore a soft-deleted chunk row.
     *
     * The row is protected for a fresh grace period so the next pass does
     * not immediately sweep it again.
     */
    RecoveryOutcome recover(const std::string& hash);

    /** Remove soft-deleted rows older than the recovery window. @return rows purged. */
    size_t purgeExpired(TimePoint now, size_t batchSize = 500);

    /**
     * @brief Stop all reclamation.
     *
     * Persists the halted flag and drops every PendingDeletion so nothing is
     * eligible even if a stale process ignores the flag.
     * @return PendingDeletion rows removed.
     */
    size_t emergencyHalt(const std::string& reason);

    /** Clear the halted flag and restart grace windows for unreferenced rows. */
    void resume();

    bool isHalted() const;
    std::string haltReason() const;

private:
    ReferenceLedger& ledger_;
    ObjectStore& store_;
    DeletionJournal& journal_;
    Millis recoveryWindow_;
};

std::string recoveryOutcomeToString(RecoveryManager::RecoveryOutcome outcome);

} // namespace chunkkeeper

#endif // CHUNKKEEPER_RECOVERY_MANAGER_HPP
