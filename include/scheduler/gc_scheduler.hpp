#pragma once
#include "audit/recovery_manager.hpp"
#include "service/collection_service.hpp"
#include "store/object_store.hpp"
#include "utilities/clock.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace chunkkeeper {

/**
 * @brief Decides when collection passes run.
 *
 * Triggers, in priority order: an administrative request, a bulk-operation
 * follow-up, storage pressure and the fixed interval. While halted no pass
 * runs and administrative requests are refused.
 */
class GcScheduler {
public:
    /**
     * @param tick Interval between trigger evaluations when running in the background.
     */
    GcScheduler(CollectionService& service, RecoveryManager& recovery, ObjectStore& store,
                const Clock& clock, std::chrono::seconds tick = std::chrono::seconds(30));
    ~GcScheduler();

    /** Start the background scheduling thread. */
    void start();
    /** Stop the background scheduling thread. Interrupts a running pass at its next batch. */
    void stop();
    bool running() const { return running_; }

    /**
     * @brief Evaluate triggers once and run at most one pass.
     * @return The pass result, or nothing if no trigger fired.
     */
    std::optional<GcResult> tick();

    /**
     * @brief Queue an administrative pass.
     * @return false when collection is halted.
     */
    bool requestCollection(RunOptions options);

    /**
     * @brief Schedule a follow-up pass after a bulk operation such as a
     *        branch delete or history rewrite.
     */
    void notifyBulkOperation(const std::string& kind, size_t orphanEstimate);

    /** True when free space is below the configured floor. */
    bool underPressure() const;

private:
    void threadFunc();
    RunOptions scheduledOptions(const std::string& trigger) const;

    CollectionService& service_;
    RecoveryManager& recovery_;
    ObjectStore& store_;
    const Clock& clock_;
    std::chrono::seconds tick_;

    std::mutex queueMutex_;
    std::deque<RunOptions> manual_;
    std::optional<std::string> bulkKind_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace chunkkeeper
