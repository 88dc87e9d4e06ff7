#ifndef CHUNKKEEPER_CANDIDATE_FINDER_HPP
#define CHUNKKEEPER_CANDIDATE_FINDER_HPP

#include "utilities/clock.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chunkkeeper {

/// A chunk a strategy proposes for deletion.
struct Candidate {
  std::string hash;
  uint64_t size{0};
  std::string reason;
};

/// Per-chunk problem recorded in a run result. Never fails the run.
struct RunError {
  std::string hash;
  /// "storage", "consistency", "lock-contention", "ledger", "coordination"
  std::string kind;
  std::string message;
};

/// Parameters shared by every step of one collection pass.
struct CollectionContext {
  TimePoint now{};
  bool dryRun{false};
  /// Grace measured from marked_at instead of the recorded window.
  std::optional<Millis> graceOverride;
  std::optional<int64_t> runId;
  size_t batchSize{500};
  /// Polled between units of long work such as store pages. False means the
  /// pass must stop: it was cancelled or halted, or the lease was lost.
  std::function<bool()> keepGoing;

  bool shouldStop() const { return keepGoing && !keepGoing(); }
};

/**
 * @brief Strategy that proposes deletion candidates.
 *
 * Strategies only propose. Every candidate is re-validated under its chunk
 * lock by the GarbageCollector before anything is removed, so a strategy may
 * work from a snapshot that is already stale.
 */
class CandidateFinder {
public:
  virtual ~CandidateFinder() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Called once before the first findCandidates().
   *
   * Problems found while scanning are appended to @p diagnostics. Long
   * scans poll ctx.shouldStop() and return early when it is true.
   */
  virtual void prepare(const CollectionContext &ctx, std::vector<RunError> &diagnostics) {
    (void)ctx;
    (void)diagnostics;
  }

  /**
   * @brief Next page of candidates in ascending hash order.
   * @param afterHash Last hash of the previous page, empty for the first.
   * @return Empty when exhausted.
   */
  virtual std::vector<Candidate> findCandidates(const CollectionContext &ctx,
                                                const std::string &afterHash,
                                                size_t limit) = 0;

  /// Objects examined by prepare() when the strategy scans the store itself.
  virtual std::optional<uint64_t> objectsScanned() const { return std::nullopt; }

  /// Called after the last page. @p completed is false for aborted passes.
  virtual void complete(const CollectionContext &ctx, bool completed) {
    (void)ctx;
    (void)completed;
  }
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_CANDIDATE_FINDER_HPP
