#ifndef CHUNKKEEPER_GENERATIONAL_SWEEP_HPP
#define CHUNKKEEPER_GENERATIONAL_SWEEP_HPP

#include "gc/candidate_finder.hpp"
#include "ledger/reference_ledger.hpp"

namespace chunkkeeper {

enum class Generation { Nursery, Young, Old };

std::string generationToString(Generation gen);

/**
 * @brief Age-partitioned reference-count sweep.
 *
 * Nursery chunks (younger than nurseryAge) are never proposed. Young chunks
 * (up to youngAge) are swept every pass. Old chunks are included only when
 * the last old-generation sweep recorded in scheduler_state is at least
 * oldGenerationInterval ago.
 */
class GenerationalSweep : public CandidateFinder {
public:
  GenerationalSweep(ReferenceLedger &ledger, Millis nurseryAge, Millis youngAge,
                    Millis oldGenerationInterval);

  std::string name() const override { return "generational"; }

  void prepare(const CollectionContext &ctx, std::vector<RunError> &diagnostics) override;
  std::vector<Candidate> findCandidates(const CollectionContext &ctx,
                                        const std::string &afterHash,
                                        size_t limit) override;
  void complete(const CollectionContext &ctx, bool completed) override;

  Generation classify(TimePoint createdAt, TimePoint now) const;
  bool sweepingOld() const { return includeOld_; }

private:
  ReferenceLedger &ledger_;
  Millis nurseryAge_;
  Millis youngAge_;
  Millis oldInterval_;
  bool includeOld_{false};
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_GENERATIONAL_SWEEP_HPP
