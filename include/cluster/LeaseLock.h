#pragma once
#include "utilities/clock.hpp"

#include <memory>
#include <optional>
#include <string>

/**
 * @file LeaseLock.h
 * @brief Cluster-wide leased mutual exclusion for collection passes.
 */

namespace chunkkeeper {

class SqliteDatabase;

struct LeaseInfo {
    std::string key;
    std::string holder;
    TimePoint acquiredAt{};
    TimePoint expiresAt{};
};

/**
 * @brief Holder identity for one process-local owner of a lease.
 *
 * "<nodeId>@<host>:<pid>#<token>". The random token differs for every call,
 * so two services sharing a node id never pass for the same holder.
 */
std::string makeLeaseHolderId(const std::string &nodeId);

/**
 * @brief Named lease with an expiry.
 *
 * A lease whose expiry has passed is free for anyone to take, so a stalled
 * holder is superseded once its TTL runs out.
 */
class LeaseLock {
public:
    virtual ~LeaseLock() = default;

    /**
     * Take @p key for @p holder. Re-acquiring an owned lease extends it, so
     * @p holder must be unique to its owner (see makeLeaseHolderId()).
     */
    virtual bool tryAcquire(const std::string &key, const std::string &holder, Millis ttl) = 0;

    /** Extend a lease still owned by @p holder. False if it was lost. */
    virtual bool renew(const std::string &key, const std::string &holder, Millis ttl) = 0;

    /** Release only if @p holder still owns the lease. */
    virtual bool release(const std::string &key, const std::string &holder) = 0;

    /** Current unexpired lease on @p key. */
    virtual std::optional<LeaseInfo> currentHolder(const std::string &key) = 0;
};

/**
 * @brief LeaseLock stored in the `gc_leases` table of the ledger database.
 *
 * Every node that opens the same database file competes for the same rows.
 */
class SqliteLeaseLock : public LeaseLock {
public:
    SqliteLeaseLock(std::shared_ptr<SqliteDatabase> db, const Clock &clock);

    bool tryAcquire(const std::string &key, const std::string &holder, Millis ttl) override;
    bool renew(const std::string &key, const std::string &holder, Millis ttl) override;
    bool release(const std::string &key, const std::string &holder) override;
    std::optional<LeaseInfo> currentHolder(const std::string &key) override;

private:
    std::shared_ptr<SqliteDatabase> db_;
    const Clock &clock_;
};

/**
 * @brief Scoped lease. Releases on destruction if still held.
 */
class LeaseGuard {
public:
    LeaseGuard(LeaseLock &lock, std::string key, std::string holder, Millis ttl);
    ~LeaseGuard();

    LeaseGuard(const LeaseGuard &) = delete;
    LeaseGuard &operator=(const LeaseGuard &) = delete;

    bool acquired() const { return held_; }
    /** Extend the lease. Marks the guard as not held when the lease was lost. */
    bool renew();
    void release();

    const std::string &holder() const { return holder_; }

private:
    LeaseLock &lock_;
    std::string key_;
    std::string holder_;
    Millis ttl_;
    bool held_{false};
};

} // namespace chunkkeeper
