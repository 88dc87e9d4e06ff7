#ifndef CHUNKKEEPER_REFCOUNT_SWEEP_HPP
#define CHUNKKEEPER_REFCOUNT_SWEEP_HPP

#include "gc/candidate_finder.hpp"
#include "ledger/reference_ledger.hpp"

namespace chunkkeeper {

/**
 * @brief Default strategy: chunks with ref_count 0 whose grace has expired.
 *
 * Reads only the ledger. Pages are keyset-paginated by hash so a pass over a
 * large ledger never materialises the full orphan set.
 */
class RefCountSweep : public CandidateFinder {
public:
  explicit RefCountSweep(ReferenceLedger &ledger) : ledger_(ledger) {}

  std::string name() const override { return "refcount"; }

  std::vector<Candidate> findCandidates(const CollectionContext &ctx,
                                        const std::string &afterHash,
                                        size_t limit) override;

private:
  ReferenceLedger &ledger_;
};

} // namespace chunkkeeper

#endif // CHUNKKEEPER_REFCOUNT_SWEEP_HPP
