#ifndef CHUNKKEEPER_CONFIG_HPP
#define CHUNKKEEPER_CONFIG_HPP

#include "utilities/digest.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace chunkkeeper {

using Duration = std::chrono::milliseconds;

inline constexpr Duration kHour = std::chrono::hours(1);
inline constexpr Duration kDay = std::chrono::hours(24);

/// Collection tuning. Defaults match a production deployment.
struct GcConfig {
  Duration gracePeriod{7 * kDay};
  Duration runInterval{kHour};
  size_t batchSize{500};
  bool dryRun{false};
  double minFreeSpacePercent{10.0};
  size_t pressureBatchMultiplier{4};
  /// Shorter grace for pressure-triggered runs. Ignored unless
  /// allowPressureGraceOverride is set.
  std::optional<Duration> pressureGracePeriod;
  bool allowPressureGraceOverride{false};
  Duration recoveryWindow{30 * kDay};
  Duration pendingUploadTtl{24 * kHour};
  Duration nurseryAge{kDay};
  Duration youngAge{7 * kDay};
  Duration oldGenerationInterval{kDay};
  std::string strategy{"refcount"};
  int maxDeleteRetries{3};
  Duration retryBackoff{100};
};

struct CoordinatorConfig {
  std::string leaseKey{"chunkkeeper/gc"};
  Duration leaseTtl{std::chrono::minutes(10)};
};

struct AlertConfig {
  /// Alert when reclaimable bytes exceed this fraction of tracked bytes.
  double reclaimableFraction{0.25};
  /// Alert when no run succeeded within missedRunFactor * runInterval.
  double missedRunFactor{2.0};
};

struct ChunkKeeperConfig {
  std::string nodeId{"node-1"};
  std::string varDir;
  std::string objectsDir;
  std::string ledgerPath;
  utils::HashAlgorithm hashAlgorithm{utils::HashAlgorithm::BLAKE3};
  std::string logFile;
  std::string logLevel{"info"};
  GcConfig gc;
  CoordinatorConfig coordinator;
  AlertConfig alerts;
};

/**
 * @brief Parse a duration such as "7d", "12h", "30m", "45s" or "250ms".
 *
 * A bare number is taken as seconds.
 * @throw std::invalid_argument on malformed input.
 */
Duration parseDuration(const std::string &text);

/// Build a configuration from an already parsed YAML document.
ChunkKeeperConfig configFromYaml(const YAML::Node &root);

/**
 * @brief Load configuration from @p path and apply environment overrides.
 *
 * A missing file yields the defaults. Unset path fields are filled in from
 * the var directory. Overrides: CHUNKKEEPER_VAR_DIR, CHUNKKEEPER_NODE_ID,
 * CHUNKKEEPER_DRY_RUN.
 */
ChunkKeeperConfig loadConfig(const std::string &path);

/// Resolve the config path from CHUNKKEEPER_CONFIG or the default file name.
std::string defaultConfigPath();

} // namespace chunkkeeper

#endif // CHUNKKEEPER_CONFIG_HPP
