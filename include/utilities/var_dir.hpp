#pragma once

#include <string>

namespace chunkkeeper {

/// On-disk layout of a node's state directory.
///
///   <root>/objects/       filesystem object store (fan-out dirs, tmp/)
///   <root>/ledger.db      SQLite reference ledger, journal and leases
///   <root>/logs/          rotating log files
struct VarLayout {
  std::string root;
  std::string objectsDir;
  std::string ledgerPath;
  std::string logsDir;
  std::string logFile;
};

/// Root used when nothing else is configured: $CHUNKKEEPER_VAR_DIR, then
/// /var/lib/chunkkeeper when it exists, then ./var/chunkkeeper.
std::string defaultVarDir();

void setVarDir(const std::string &dir);
const std::string &getVarDir();

VarLayout varLayout(const std::string &root);
inline VarLayout currentVarLayout() { return varLayout(getVarDir()); }

/// Creates `dir` and any missing parents. Throws StorageError naming `what`.
void ensureDirectory(const std::string &dir, const std::string &what);
/// Creates the directory that will hold `file`, if it has one.
void ensureParentDirectory(const std::string &file, const std::string &what);

} // namespace chunkkeeper
