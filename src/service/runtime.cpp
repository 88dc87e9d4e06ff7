#include "service/runtime.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

namespace chunkkeeper {

void initLogging(const ChunkKeeperConfig &config, const std::string &component) {
  std::string file = config.logFile;
  if (file.empty())
    file = Logger::CONSOLE_ONLY_OUTPUT;
  if (file != Logger::CONSOLE_ONLY_OUTPUT)
    ensureParentDirectory(file, "log");
  Logger::init(file, Logger::levelFromString(config.logLevel));
  Logger::getInstance().log(LogLevel::INFO, "[" + component + "] node " + config.nodeId +
                                                " using var dir " + config.varDir);
}

namespace {

std::shared_ptr<SqliteDatabase> openLedgerDatabase(const std::string &path) {
  ensureParentDirectory(path, "ledger");
  return std::make_shared<SqliteDatabase>(path);
}

} // namespace

Runtime::Runtime(const ChunkKeeperConfig &cfg, const Clock &clk)
    : config(cfg), clock(clk), db(openLedgerDatabase(cfg.ledgerPath)),
      store(cfg.objectsDir, cfg.hashAlgorithm), journal(db, clk),
      ledger(db, clk, cfg.gc.gracePeriod), lease(db, clk),
      recovery(ledger, store, journal, cfg.gc.recoveryWindow),
      service(cfg, ledger, store, journal, lease, recovery) {
  ledger.attachJournal(&journal);
}

} // namespace chunkkeeper
