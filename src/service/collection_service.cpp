#include "service/collection_service.hpp"
#include "gc/generational_sweep.hpp"
#include "gc/refcount_sweep.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <cstdio>
#include <ctime>

namespace chunkkeeper {

std::string formatTime(TimePoint t) {
  std::time_t tt = SystemClock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string formatSize(uint64_t bytes) {
  constexpr uint64_t KB = 1024;
  constexpr uint64_t MB = KB * 1024;
  constexpr uint64_t GB = MB * 1024;
  char buf[64];
  if (bytes >= GB)
    std::snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(bytes) / GB);
  else if (bytes >= MB)
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / MB);
  else if (bytes >= KB)
    std::snprintf(buf, sizeof(buf), "%.2f KB", static_cast<double>(bytes) / KB);
  else
    std::snprintf(buf, sizeof(buf), "%llu bytes", static_cast<unsigned long long>(bytes));
  return buf;
}

CollectionService::CollectionService(ChunkKeeperConfig config, ReferenceLedger &ledger,
                                     ObjectStore &store, DeletionJournal &journal,
                                     LeaseLock &lease, RecoveryManager &recovery,
                                     RootProvider *roots)
    : config_(std::move(config)), holderId_(makeLeaseHolderId(config_.nodeId)), ledger_(ledger),
      store_(store), journal_(journal),
      lease_(lease), recovery_(recovery), roots_(roots),
      gc_(ledger, store, journal, config_.gc, config_.nodeId),
      startedAt_(ledger.clock().now()) {
  if (!roots_) {
    defaultRoots_ = std::make_unique<LedgerRootProvider>(ledger_, config_.gc.pendingUploadTtl);
    roots_ = defaultRoots_.get();
  }
}

std::unique_ptr<CandidateFinder> CollectionService::makeFinder(const std::string &strategy) {
  if (strategy == "refcount")
    return std::make_unique<RefCountSweep>(ledger_);
  if (strategy == "mark-sweep")
    return std::make_unique<MarkAndSweep>(ledger_, store_, journal_, *roots_,
                                          config_.gc.pendingUploadTtl);
  if (strategy == "generational")
    return std::make_unique<GenerationalSweep>(ledger_, config_.gc.nurseryAge, config_.gc.youngAge,
                                               config_.gc.oldGenerationInterval);
  throw ValidationError("unknown collection strategy: " + strategy);
}

void CollectionService::filterGraceOverride(RunOptions &options) const {
  if (!options.graceOverride)
    return;
  if (options.trigger == "manual")
    return;
  if (options.trigger == "pressure") {
    if (config_.gc.allowPressureGraceOverride)
      return;
    Logger::getInstance().log(LogLevel::WARN,
                              "[Collector] pressure grace override ignored; not enabled");
  } else {
    Logger::getInstance().log(LogLevel::WARN, "[Collector] grace override ignored for " +
                                                  options.trigger + " run");
  }
  options.graceOverride.reset();
}

GcResult CollectionService::collect(RunOptions options) {
  if (recovery_.isHalted()) {
    std::string reason = recovery_.haltReason();
    Logger::getInstance().log(LogLevel::WARN, "[Collector] refusing " + options.trigger +
                                                  " collection: halted (" + reason + ")");
    throw CoordinationError("collection is halted: " + reason);
  }

  filterGraceOverride(options);
  std::string strategy = options.strategy.value_or(config_.gc.strategy);
  auto finder = makeFinder(strategy);

  LeaseGuard guard(lease_, config_.coordinator.leaseKey, holderId_,
                   config_.coordinator.leaseTtl);
  if (!guard.acquired()) {
    auto holder = lease_.currentHolder(config_.coordinator.leaseKey);
    Logger::getInstance().log(LogLevel::INFO, "[Collector] collection lock held by " +
                                                  (holder ? holder->holder : std::string("another node")) +
                                                  "; skipping " + options.trigger + " run");
    MetricsRegistry::instance().incrementCounter("chunkkeeper_gc_lock_denied_total");
    GcResult empty;
    empty.lockAcquired = false;
    empty.dryRun = options.dryRun;
    empty.strategy = strategy;
    return empty;
  }

  if (options.trigger == "interval") {
    auto next = ledger_.getStateTime(state_keys::kNextScheduledAt);
    if (next && *next > ledger_.clock().now()) {
      Logger::getInstance().log(LogLevel::INFO, "[Collector] interval slot already served; next run at " +
                                                    formatTime(*next));
      GcResult skipped;
      skipped.lockAcquired = true;
      skipped.skipped = true;
      skipped.dryRun = options.dryRun;
      skipped.strategy = strategy;
      return skipped;
    }
  }

  GcResult result = gc_.run(*finder, options, [&guard] { return guard.renew(); });

  if (!options.dryRun && guard.acquired()) {
    TimePoint now = ledger_.clock().now();
    ledger_.setStateTime(state_keys::kLastRunAt, now);
    if (result.status == RunStatus::Completed)
      ledger_.setStateTime(state_keys::kLastSuccessAt, now);
    ledger_.setStateTime(state_keys::kNextScheduledAt, now + config_.gc.runInterval);
  }
  refreshGauges();
  return result;
}

StatusReport CollectionService::status() const {
  StatusReport s;
  s.lastRunAt = ledger_.getStateTime(state_keys::kLastRunAt);
  s.lastSuccessAt = ledger_.getStateTime(state_keys::kLastSuccessAt);
  s.nextScheduledAt = ledger_.getStateTime(state_keys::kNextScheduledAt);
  OrphanSummary summary = ledger_.orphanSummary(ledger_.clock().now());
  s.orphanedCount = summary.orphanedCount;
  s.orphanedBytes = summary.orphanedBytes;
  s.reclaimableCount = summary.reclaimableCount;
  s.reclaimableBytes = summary.reclaimableBytes;
  s.totalBytes = summary.totalBytes;
  if (auto holder = lease_.currentHolder(config_.coordinator.leaseKey))
    s.lockHolder = holder->holder;
  s.halted = recovery_.isHalted();
  s.haltReason = recovery_.haltReason();
  return s;
}

std::vector<GcRunRecord> CollectionService::history(size_t limit) const {
  return ledger_.listRuns(limit);
}

std::vector<Alert> CollectionService::checkAlerts(TimePoint now) const {
  std::vector<Alert> alerts;

  auto window = std::chrono::duration_cast<Millis>(config_.gc.runInterval *
                                                   config_.alerts.missedRunFactor);
  TimePoint reference = ledger_.getStateTime(state_keys::kLastSuccessAt).value_or(startedAt_);
  if (!recovery_.isHalted() && now - reference > window) {
    alerts.push_back(Alert{"gc-missed-runs",
                           "no successful collection since " + formatTime(reference)});
  }

  OrphanSummary summary = ledger_.orphanSummary(now);
  if (summary.totalBytes > 0) {
    double fraction =
        static_cast<double>(summary.reclaimableBytes) / static_cast<double>(summary.totalBytes);
    if (fraction > config_.alerts.reclaimableFraction) {
      alerts.push_back(Alert{"gc-reclaimable-high",
                             std::to_string(static_cast<int>(fraction * 100)) +
                                 "% of tracked bytes are reclaimable (" +
                                 formatSize(summary.reclaimableBytes) + ")"});
    }
  }

  for (const auto &a : alerts)
    Logger::getInstance().log(LogLevel::WARN, "[Alerts] " + a.name + ": " + a.message);
  MetricsRegistry::instance().setGauge("chunkkeeper_gc_alerts_active",
                                       static_cast<double>(alerts.size()));
  return alerts;
}

void CollectionService::refreshGauges() const {
  OrphanSummary summary = ledger_.orphanSummary(ledger_.clock().now());
  auto &metrics = MetricsRegistry::instance();
  metrics.setGauge("chunkkeeper_orphaned_chunks", static_cast<double>(summary.orphanedCount));
  metrics.setGauge("chunkkeeper_reclaimable_bytes", static_cast<double>(summary.reclaimableBytes));
}

} // namespace chunkkeeper
