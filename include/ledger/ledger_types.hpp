#pragma once

#include "store/object_store.hpp"
#include "utilities/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

/// Kind of entity holding a reference to a chunk.
enum class SourceKind { Commit, StagingEntry, Stash, Tag, PendingUpload, CacheEntry };

std::string sourceKindToString(SourceKind kind);
/// @throws ValidationError on an unknown name.
SourceKind sourceKindFromString(const std::string &name);

struct ReferenceSource {
  SourceKind kind{SourceKind::Commit};
  std::string id;
  std::string repositoryId;

  std::string toString() const { return sourceKindToString(kind) + ":" + id; }
};

struct ChunkRecord {
  std::string hash;
  uint64_t size{0};
  uint64_t compressedSize{0};
  int64_t refCount{0};
  StorageTier tier{StorageTier::Hot};
  TimePoint createdAt{};
  TimePoint lastAccessedAt{};
  std::optional<TimePoint> deletedAt;
  std::optional<TimePoint> gcProtectedUntil;

  bool softDeleted() const { return deletedAt.has_value(); }
};

struct ReferenceRecord {
  std::string chunkHash;
  ReferenceSource source;
  TimePoint createdAt{};
};

struct PendingDeletion {
  std::string chunkHash;
  TimePoint markedAt{};
  TimePoint deleteAfter{};
  std::optional<int64_t> runId;
};

enum class RunStatus { Running, Completed, Failed };

std::string runStatusToString(RunStatus status);
RunStatus runStatusFromString(const std::string &name);

struct GcRunRecord {
  int64_t id{0};
  std::string strategy;
  std::string trigger;
  std::string nodeId;
  TimePoint startedAt{};
  std::optional<TimePoint> finishedAt;
  RunStatus status{RunStatus::Running};
  uint64_t chunksScanned{0};
  uint64_t chunksDeleted{0};
  uint64_t bytesReclaimed{0};
  uint64_t errorCount{0};
  bool dryRun{false};
};

/// Unreferenced, not yet deleted chunks.
struct OrphanSummary {
  uint64_t orphanedCount{0};
  uint64_t orphanedBytes{0};
  /// Subset whose grace window has already ended.
  uint64_t reclaimableCount{0};
  uint64_t reclaimableBytes{0};
  /// All live (not soft-deleted) chunks.
  uint64_t totalCount{0};
  uint64_t totalBytes{0};
};

/**
 * @brief Filter for orphan selection.
 *
 * A chunk qualifies when ref_count is 0, it is not soft-deleted and it has a
 * PendingDeletion whose grace has ended. With @c graceOverride the grace is
 * measured from marked_at instead of the recorded delete_after.
 */
struct OrphanQuery {
  TimePoint now{};
  std::optional<Millis> graceOverride;
  /// Only chunks created strictly after this instant.
  std::optional<TimePoint> createdAfter;
  /// Only chunks created at or before this instant.
  std::optional<TimePoint> createdAtOrBefore;
  /// Keyset pagination: only hashes greater than this.
  std::string afterHash;
  size_t limit{500};
};

/// Keys of the persisted scheduler_state record.
namespace state_keys {
inline constexpr const char *kLastRunAt = "last_run_at";
inline constexpr const char *kLastSuccessAt = "last_success_at";
inline constexpr const char *kNextScheduledAt = "next_scheduled_at";
inline constexpr const char *kLastOldGenerationSweepAt = "last_old_generation_sweep_at";
inline constexpr const char *kHalted = "halted";
inline constexpr const char *kHaltReason = "halt_reason";
} // namespace state_keys

} // namespace chunkkeeper
