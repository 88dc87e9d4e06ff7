#include "service/runtime.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace chunkkeeper;

static void usage() {
  std::cout << "Usage: chunkkeeper_ctl <command> [args]\n"
            << "  collect [--dry-run] [--strategy refcount|mark-sweep|generational]\n"
            << "          [--batch n] [--grace-hours h]\n"
            << "  status\n"
            << "  history [n]\n"
            << "  halt <reason>\n"
            << "  resume\n"
            << "  purge\n"
            << "  recover <hash>\n"
            << "  verify-journal\n"
            << "  metrics\n";
}

static std::string timeOrNever(const std::optional<TimePoint> &t) {
  return t ? formatTime(*t) : std::string("never");
}

static int collect_command(Runtime &rt, const std::vector<std::string> &args) {
  RunOptions opts;
  opts.trigger = "manual";
  opts.dryRun = rt.config.gc.dryRun;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--dry-run") {
      opts.dryRun = true;
    } else if (arg == "--strategy" && i + 1 < args.size()) {
      opts.strategy = args[++i];
    } else if (arg == "--batch" && i + 1 < args.size()) {
      opts.batchSizeOverride = std::stoul(args[++i]);
    } else if (arg == "--grace-hours" && i + 1 < args.size()) {
      opts.graceOverride = std::chrono::hours(std::stol(args[++i]));
    } else {
      std::cout << "Unknown collect option: " << arg << std::endl;
      return 1;
    }
  }

  GcResult r = rt.service.collect(opts);
  if (!r.lockAcquired) {
    std::cout << "Another node is collecting; nothing done." << std::endl;
    return 0;
  }
  if (r.dryRun)
    std::cout << "Dry run - no changes made" << std::endl;
  std::cout << "Run " << (r.runId ? std::to_string(*r.runId) : "-") << " (" << r.strategy
            << "): " << runStatusToString(r.status) << std::endl;
  std::cout << "  Candidates:      " << r.candidates.size() << " ("
            << formatSize(r.candidateBytes) << ")" << std::endl;
  std::cout << "  Chunks scanned:  " << r.chunksScanned << std::endl;
  std::cout << "  Chunks deleted:  " << r.chunksDeleted << std::endl;
  std::cout << "  Space freed:     " << formatSize(r.bytesReclaimed) << std::endl;
  for (const auto &c : r.candidates) {
    if (r.dryRun)
      std::cout << "  would delete " << c.hash << " " << c.size << " (" << c.reason << ")"
                << std::endl;
  }
  for (const auto &e : r.errors) {
    std::cout << "  error [" << e.kind << "] " << (e.hash.empty() ? "-" : e.hash) << ": "
              << e.message << std::endl;
  }
  return r.status == RunStatus::Completed ? 0 : 2;
}

static int status_command(Runtime &rt) {
  StatusReport s = rt.service.status();
  std::cout << "Last run:          " << timeOrNever(s.lastRunAt) << std::endl;
  std::cout << "Last success:      " << timeOrNever(s.lastSuccessAt) << std::endl;
  std::cout << "Next scheduled:    " << timeOrNever(s.nextScheduledAt) << std::endl;
  std::cout << "Orphaned chunks:   " << s.orphanedCount << " (" << formatSize(s.orphanedBytes)
            << ")" << std::endl;
  std::cout << "Reclaimable:       " << s.reclaimableCount << " ("
            << formatSize(s.reclaimableBytes) << ")" << std::endl;
  std::cout << "Lock holder:       " << s.lockHolder.value_or("none") << std::endl;
  std::cout << "Halted:            " << (s.halted ? "yes (" + s.haltReason + ")" : "no")
            << std::endl;
  for (const auto &a : rt.service.checkAlerts(rt.clock.now()))
    std::cout << "ALERT " << a.name << ": " << a.message << std::endl;
  return 0;
}

static int history_command(Runtime &rt, size_t limit) {
  std::cout << "Id\tStrategy\tTrigger\tStatus\tStarted\tScanned\tDeleted\tBytes\tErrors\tNode"
            << std::endl;
  for (const auto &run : rt.service.history(limit)) {
    std::cout << run.id << '\t' << run.strategy << (run.dryRun ? " (dry)" : "") << '\t'
              << run.trigger << '\t' << runStatusToString(run.status) << '\t'
              << formatTime(run.startedAt) << '\t' << run.chunksScanned << '\t'
              << run.chunksDeleted << '\t' << run.bytesReclaimed << '\t' << run.errorCount
              << '\t' << run.nodeId << std::endl;
  }
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  ChunkKeeperConfig config;
  try {
    config = loadConfig(defaultConfigPath());
    initLogging(config, "ctl");
  } catch (const std::exception &e) {
    std::cerr << "FATAL: configuration failed: " << e.what() << std::endl;
    return 1;
  }

  try {
    RealClock clock;
    Runtime rt(config, clock);

    if (cmd == "collect") {
      return collect_command(rt, args);
    } else if (cmd == "status") {
      return status_command(rt);
    } else if (cmd == "history") {
      size_t limit = args.empty() ? 20 : std::stoul(args[0]);
      return history_command(rt, limit);
    } else if (cmd == "halt" && !args.empty()) {
      std::string reason;
      for (const auto &a : args)
        reason += (reason.empty() ? "" : " ") + a;
      size_t dropped = rt.recovery.emergencyHalt(reason);
      std::cout << "Collection halted. " << dropped << " pending deletions dropped." << std::endl;
      return 0;
    } else if (cmd == "resume") {
      rt.recovery.resume();
      std::cout << "Collection resumed." << std::endl;
      return 0;
    } else if (cmd == "purge") {
      size_t purged = rt.recovery.purgeExpired(clock.now());
      std::cout << "Purged " << purged << " soft-deleted rows." << std::endl;
      return 0;
    } else if (cmd == "recover" && !args.empty()) {
      auto outcome = rt.recovery.recover(args[0]);
      std::cout << "Recover " << args[0] << ": " << recoveryOutcomeToString(outcome) << std::endl;
      return outcome == RecoveryManager::RecoveryOutcome::NotDeleted ? 1 : 0;
    } else if (cmd == "verify-journal") {
      auto v = rt.journal.verify();
      if (v.ok) {
        std::cout << "Journal OK (" << v.checked << " entries)" << std::endl;
        return 0;
      }
      std::cout << "Journal chain BROKEN at sequence " << *v.brokenAt << std::endl;
      return 1;
    } else if (cmd == "metrics") {
      rt.service.refreshGauges();
      std::cout << MetricsRegistry::instance().toPrometheus();
      return 0;
    }
  } catch (const CoordinationError &e) {
    std::cout << "Refused: " << e.what() << std::endl;
    return 1;
  } catch (const ChunkKeeperError &e) {
    Logger::getInstance().log(LogLevel::ERROR, std::string("[ctl] ") + cmd + " failed: " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::logic_error &e) {
    std::cerr << "Invalid argument: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Unknown command" << std::endl;
  usage();
  return 1;
}
