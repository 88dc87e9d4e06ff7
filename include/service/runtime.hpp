#ifndef CHUNKKEEPER_RUNTIME_HPP
#define CHUNKKEEPER_RUNTIME_HPP

#include "audit/deletion_journal.hpp"
#include "audit/recovery_manager.hpp"
#include "cluster/LeaseLock.h"
#include "ledger/reference_ledger.hpp"
#include "ledger/sqlite_db.hpp"
#include "service/collection_service.hpp"
#include "store/filesystem_object_store.hpp"
#include "utilities/clock.hpp"
#include "utilities/config.hpp"

#include <memory>
#include <string>

namespace chunkkeeper {

/**
 * @brief Initialise the process logger from @p config.
 *
 * Creates the log directory when needed. @p component tags the startup line.
 */
void initLogging(const ChunkKeeperConfig &config, const std::string &component);

/**
 * @brief Everything a node needs, wired in dependency order.
 *
 * Members are declared in construction order; destruction tears the
 * service down before the ledger and database it points into.
 */
struct Runtime {
  Runtime(const ChunkKeeperConfig &cfg, const Clock &clk);

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  ChunkKeeperConfig config;
  const Clock &clock;
  std::shared_ptr<SqliteDatabase> db;
  FilesystemObjectStore store;
  DeletionJournal journal;
  ReferenceLedger ledger;
  SqliteLeaseLock lease;
  RecoveryManager recovery;
  CollectionService service;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_RUNTIME_HPP
