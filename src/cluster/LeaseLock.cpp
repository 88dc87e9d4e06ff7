#include "cluster/LeaseLock.h"
#include "ledger/sqlite_db.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <unistd.h>

namespace chunkkeeper {

std::string makeLeaseHolderId(const std::string &nodeId) {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0)
        host[0] = '\0';
    std::string hostName = host[0] ? host : "unknown-host";
    return nodeId + "@" + hostName + ":" + std::to_string(getpid()) + "#" + utils::randomHex(8);
}

SqliteLeaseLock::SqliteLeaseLock(std::shared_ptr<SqliteDatabase> db, const Clock &clock)
    : db_(std::move(db)), clock_(clock) {
    db_->exec("CREATE TABLE IF NOT EXISTS gc_leases ("
              " lease_key TEXT PRIMARY KEY,"
              " holder TEXT NOT NULL,"
              " acquired_at INTEGER NOT NULL,"
              " expires_at INTEGER NOT NULL)");
}

bool SqliteLeaseLock::tryAcquire(const std::string &key, const std::string &holder, Millis ttl) {
    int64_t now = toEpochMillis(clock_.now());
    int64_t expires = toEpochMillis(clock_.now() + ttl);
    try {
        SqliteTransaction txn(*db_);
        int64_t acquiredAt = now;
        {
            Statement st(*db_, "SELECT holder, acquired_at, expires_at FROM gc_leases WHERE lease_key = ?");
            st.bind(1, key);
            if (st.step()) {
                std::string current = st.columnText(0);
                int64_t currentExpiry = st.columnInt64(2);
                if (current != holder && currentExpiry > now) {
                    return false;
                }
                if (current == holder) {
                    acquiredAt = st.columnInt64(1);
                } else {
                    Logger::getInstance().log(LogLevel::WARN, "[Lease] superseding expired lease on " + key +
                                                                  " held by " + current);
                }
            }
        }
        Statement up(*db_, "INSERT INTO gc_leases (lease_key, holder, acquired_at, expires_at)"
                           " VALUES (?, ?, ?, ?) ON CONFLICT(lease_key) DO UPDATE SET"
                           " holder = excluded.holder, acquired_at = excluded.acquired_at,"
                           " expires_at = excluded.expires_at");
        up.bind(1, key).bind(2, holder).bind(3, acquiredAt).bind(4, expires);
        up.exec();
        txn.commit();
        return true;
    } catch (const LockContention &e) {
        Logger::getInstance().log(LogLevel::INFO, "[Lease] " + key + " contended: " + e.what());
        return false;
    }
}

bool SqliteLeaseLock::renew(const std::string &key, const std::string &holder, Millis ttl) {
    auto lk = db_->lock();
    Statement st(*db_, "UPDATE gc_leases SET expires_at = ? WHERE lease_key = ? AND holder = ?"
                       " AND expires_at > ?");
    st.bind(1, toEpochMillis(clock_.now() + ttl)).bind(2, key).bind(3, holder)
        .bind(4, toEpochMillis(clock_.now()));
    st.exec();
    return db_->changes() > 0;
}

bool SqliteLeaseLock::release(const std::string &key, const std::string &holder) {
    auto lk = db_->lock();
    Statement st(*db_, "DELETE FROM gc_leases WHERE lease_key = ? AND holder = ?");
    st.bind(1, key).bind(2, holder);
    st.exec();
    return db_->changes() > 0;
}

std::optional<LeaseInfo> SqliteLeaseLock::currentHolder(const std::string &key) {
    auto lk = db_->lock();
    Statement st(*db_, "SELECT lease_key, holder, acquired_at, expires_at FROM gc_leases"
                       " WHERE lease_key = ? AND expires_at > ?");
    st.bind(1, key).bind(2, toEpochMillis(clock_.now()));
    if (!st.step())
        return std::nullopt;
    LeaseInfo info;
    info.key = st.columnText(0);
    info.holder = st.columnText(1);
    info.acquiredAt = fromEpochMillis(st.columnInt64(2));
    info.expiresAt = fromEpochMillis(st.columnInt64(3));
    return info;
}

LeaseGuard::LeaseGuard(LeaseLock &lock, std::string key, std::string holder, Millis ttl)
    : lock_(lock), key_(std::move(key)), holder_(std::move(holder)), ttl_(ttl) {
    held_ = lock_.tryAcquire(key_, holder_, ttl_);
}

LeaseGuard::~LeaseGuard() {
    if (!held_)
        return;
    try {
        release();
    } catch (const ChunkKeeperError &e) {
        // The lease expires on its own.
        Logger::getInstance().log(LogLevel::ERROR, "[Lease] failed to release " + key_ + ": " + e.what());
    }
}

bool LeaseGuard::renew() {
    if (!held_)
        return false;
    held_ = lock_.renew(key_, holder_, ttl_);
    if (!held_) {
        Logger::getInstance().log(LogLevel::WARN, "[Lease] lost lease " + key_ + " held by " + holder_);
    }
    return held_;
}

void LeaseGuard::release() {
    if (!held_)
        return;
    held_ = false;
    lock_.release(key_, holder_);
}

} // namespace chunkkeeper
