#include "utilities/var_dir.hpp"
#include "utilities/errors.hpp"

#include <cstdlib>
#include <filesystem>

namespace chunkkeeper {

namespace fs = std::filesystem;

namespace {

constexpr const char *kSystemVarDir = "/var/lib/chunkkeeper";
constexpr const char *kLocalVarDir = "var/chunkkeeper";

std::string &varDirSlot() {
  static std::string dir = defaultVarDir();
  return dir;
}

} // namespace

std::string defaultVarDir() {
  const char *env = std::getenv("CHUNKKEEPER_VAR_DIR");
  if (env && env[0] != '\0')
    return env;
  std::error_code ec;
  if (fs::is_directory(kSystemVarDir, ec))
    return kSystemVarDir;
  return kLocalVarDir;
}

void setVarDir(const std::string &dir) { varDirSlot() = dir; }

const std::string &getVarDir() { return varDirSlot(); }

VarLayout varLayout(const std::string &root) {
  fs::path base(root);
  VarLayout layout;
  layout.root = root;
  layout.objectsDir = (base / "objects").string();
  layout.ledgerPath = (base / "ledger.db").string();
  layout.logsDir = (base / "logs").string();
  layout.logFile = (base / "logs" / "chunkkeeper.log").string();
  return layout;
}

void ensureDirectory(const std::string &dir, const std::string &what) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw StorageError("cannot create " + what + " directory " + dir + ": " + ec.message(),
                       false);
}

void ensureParentDirectory(const std::string &file, const std::string &what) {
  fs::path parent = fs::path(file).parent_path();
  if (!parent.empty())
    ensureDirectory(parent.string(), what);
}

} // namespace chunkkeeper
