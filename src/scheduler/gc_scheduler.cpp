#include "scheduler/gc_scheduler.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace chunkkeeper {

GcScheduler::GcScheduler(CollectionService& service, RecoveryManager& recovery, ObjectStore& store,
                         const Clock& clock, std::chrono::seconds tick)
    : service_(service), recovery_(recovery), store_(store), clock_(clock), tick_(tick) {}

GcScheduler::~GcScheduler() { stop(); }

void GcScheduler::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&GcScheduler::threadFunc, this);
    Logger::getInstance().log(LogLevel::INFO, "[Scheduler] started; tick " +
                                                  std::to_string(tick_.count()) + "s");
}

void GcScheduler::stop() {
    if (!running_) return;
    running_ = false;
    service_.collector().cancel();
    if (worker_.joinable()) worker_.join();
    Logger::getInstance().log(LogLevel::INFO, "[Scheduler] stopped");
}

void GcScheduler::threadFunc() {
    while (running_) {
        try {
            tick();
        } catch (const ChunkKeeperError& e) {
            Logger::getInstance().log(LogLevel::ERROR, std::string("[Scheduler] pass failed: ") + e.what());
        } catch (const std::exception& e) {
            Logger::getInstance().log(LogLevel::ERROR, std::string("[Scheduler] pass aborted: ") + e.what());
        }
        for (std::chrono::seconds s{0}; s < tick_ && running_; s += std::chrono::seconds(1)) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

bool GcScheduler::requestCollection(RunOptions options) {
    if (recovery_.isHalted()) {
        Logger::getInstance().log(LogLevel::WARN, "[Scheduler] administrative request refused: halted (" +
                                                      recovery_.haltReason() + ")");
        return false;
    }
    options.trigger = "manual";
    std::lock_guard<std::mutex> lk(queueMutex_);
    manual_.push_back(std::move(options));
    return true;
}

void GcScheduler::notifyBulkOperation(const std::string& kind, size_t orphanEstimate) {
    std::lock_guard<std::mutex> lk(queueMutex_);
    bulkKind_ = kind;
    Logger::getInstance().log(LogLevel::INFO, "[Scheduler] bulk operation '" + kind + "' left ~" +
                                                  std::to_string(orphanEstimate) +
                                                  " orphans; follow-up pass scheduled");
}

bool GcScheduler::underPressure() const {
    StoreUsage usage = store_.usage();
    MetricsRegistry::instance().setGauge("chunkkeeper_store_free_percent", usage.freePercent());
    return usage.freePercent() < service_.config().gc.minFreeSpacePercent;
}

RunOptions GcScheduler::scheduledOptions(const std::string& trigger) const {
    RunOptions opts;
    opts.trigger = trigger;
    opts.dryRun = service_.config().gc.dryRun;
    return opts;
}

std::optional<GcResult> GcScheduler::tick() {
    const GcConfig& cfg = service_.config().gc;
    TimePoint now = clock_.now();

    if (recovery_.isHalted()) {
        std::lock_guard<std::mutex> lk(queueMutex_);
        manual_.clear();
        bulkKind_.reset();
        return std::nullopt;
    }

    std::optional<RunOptions> opts;
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        if (!manual_.empty()) {
            opts = std::move(manual_.front());
            manual_.pop_front();
        } else if (bulkKind_) {
            opts = scheduledOptions("bulk:" + *bulkKind_);
            bulkKind_.reset();
        }
    }

    if (!opts && underPressure()) {
        opts = scheduledOptions("pressure");
        opts->batchSizeOverride = cfg.batchSize * cfg.pressureBatchMultiplier;
        if (cfg.allowPressureGraceOverride && cfg.pressureGracePeriod)
            opts->graceOverride = cfg.pressureGracePeriod;
        Logger::getInstance().log(LogLevel::WARN, "[Scheduler] storage pressure; running enlarged pass");
    }

    if (!opts) {
        // Advisory only; collect() checks the slot again under the lease.
        auto next = service_.status().nextScheduledAt;
        if (next && *next > now)
            return std::nullopt;
        opts = scheduledOptions("interval");
    }

    GcResult result = service_.collect(*opts);
    if (result.skipped)
        return std::nullopt;
    if (result.lockAcquired && result.status == RunStatus::Completed && !result.dryRun) {
        recovery_.purgeExpired(clock_.now());
    }
    return result;
}

} // namespace chunkkeeper
