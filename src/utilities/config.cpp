#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace chunkkeeper {

Duration parseDuration(const std::string &text) {
  size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
    ++pos;
  if (pos == 0) {
    throw std::invalid_argument("invalid duration: '" + text + "'");
  }
  long long value = std::stoll(text.substr(0, pos));
  std::string unit = text.substr(pos);
  if (unit.empty() || unit == "s")
    return std::chrono::seconds(value);
  if (unit == "ms")
    return Duration(value);
  if (unit == "m")
    return std::chrono::minutes(value);
  if (unit == "h")
    return std::chrono::hours(value);
  if (unit == "d")
    return std::chrono::hours(24 * value);
  throw std::invalid_argument("invalid duration unit in '" + text + "'");
}

static void readDuration(const YAML::Node &node, const char *key, Duration &out) {
  if (node[key])
    out = parseDuration(node[key].as<std::string>());
}

ChunkKeeperConfig configFromYaml(const YAML::Node &root) {
  ChunkKeeperConfig cfg;
  if (auto node = root["node"]) {
    if (node["id"])
      cfg.nodeId = node["id"].as<std::string>();
  }
  if (auto storage = root["storage"]) {
    if (storage["var_dir"])
      cfg.varDir = storage["var_dir"].as<std::string>();
    if (storage["objects_dir"])
      cfg.objectsDir = storage["objects_dir"].as<std::string>();
    if (storage["hash_algorithm"])
      cfg.hashAlgorithm =
          utils::hashAlgorithmFromString(storage["hash_algorithm"].as<std::string>());
  }
  if (auto ledger = root["ledger"]) {
    if (ledger["path"])
      cfg.ledgerPath = ledger["path"].as<std::string>();
  }
  if (auto gc = root["gc"]) {
    readDuration(gc, "grace_period", cfg.gc.gracePeriod);
    readDuration(gc, "run_interval", cfg.gc.runInterval);
    readDuration(gc, "recovery_window", cfg.gc.recoveryWindow);
    readDuration(gc, "pending_upload_ttl", cfg.gc.pendingUploadTtl);
    readDuration(gc, "nursery_age", cfg.gc.nurseryAge);
    readDuration(gc, "young_age", cfg.gc.youngAge);
    readDuration(gc, "old_generation_interval", cfg.gc.oldGenerationInterval);
    readDuration(gc, "retry_backoff", cfg.gc.retryBackoff);
    if (gc["batch_size"])
      cfg.gc.batchSize = gc["batch_size"].as<size_t>();
    if (gc["dry_run"])
      cfg.gc.dryRun = gc["dry_run"].as<bool>();
    if (gc["min_free_space_percent"])
      cfg.gc.minFreeSpacePercent = gc["min_free_space_percent"].as<double>();
    if (gc["pressure_batch_multiplier"])
      cfg.gc.pressureBatchMultiplier = gc["pressure_batch_multiplier"].as<size_t>();
    if (gc["pressure_grace_period"])
      cfg.gc.pressureGracePeriod =
          parseDuration(gc["pressure_grace_period"].as<std::string>());
    if (gc["allow_pressure_grace_override"])
      cfg.gc.allowPressureGraceOverride =
          gc["allow_pressure_grace_override"].as<bool>();
    if (gc["strategy"])
      cfg.gc.strategy = gc["strategy"].as<std::string>();
    if (gc["max_delete_retries"])
      cfg.gc.maxDeleteRetries = gc["max_delete_retries"].as<int>();
  }
  if (auto coord = root["coordinator"]) {
    if (coord["lease_key"])
      cfg.coordinator.leaseKey = coord["lease_key"].as<std::string>();
    readDuration(coord, "lease_ttl", cfg.coordinator.leaseTtl);
  }
  if (auto alerts = root["alerts"]) {
    if (alerts["reclaimable_fraction"])
      cfg.alerts.reclaimableFraction = alerts["reclaimable_fraction"].as<double>();
    if (alerts["missed_run_factor"])
      cfg.alerts.missedRunFactor = alerts["missed_run_factor"].as<double>();
  }
  if (auto logging = root["logging"]) {
    if (logging["file"])
      cfg.logFile = logging["file"].as<std::string>();
    if (logging["level"])
      cfg.logLevel = logging["level"].as<std::string>();
  }
  return cfg;
}

ChunkKeeperConfig loadConfig(const std::string &path) {
  ChunkKeeperConfig cfg;
  if (std::filesystem::exists(path)) {
    // Parse errors propagate to the caller.
    cfg = configFromYaml(YAML::LoadFile(path));
  }

  if (const char *env = std::getenv("CHUNKKEEPER_VAR_DIR"))
    cfg.varDir = env;
  if (const char *env = std::getenv("CHUNKKEEPER_NODE_ID"))
    cfg.nodeId = env;
  if (const char *env = std::getenv("CHUNKKEEPER_DRY_RUN"))
    cfg.gc.dryRun = std::string(env) == "1" || std::string(env) == "true";

  if (!cfg.varDir.empty())
    setVarDir(cfg.varDir);
  else
    cfg.varDir = getVarDir();
  VarLayout layout = varLayout(cfg.varDir);
  if (cfg.objectsDir.empty())
    cfg.objectsDir = layout.objectsDir;
  if (cfg.ledgerPath.empty())
    cfg.ledgerPath = layout.ledgerPath;
  if (cfg.logFile.empty())
    cfg.logFile = layout.logFile;
  return cfg;
}

std::string defaultConfigPath() {
  const char *cfg = std::getenv("CHUNKKEEPER_CONFIG");
  return cfg ? std::string(cfg) : std::string("chunkkeeper_config.yaml");
}

} // namespace chunkkeeper
