#include "gc/refcount_sweep.hpp"

namespace chunkkeeper {

std::vector<Candidate> RefCountSweep::findCandidates(const CollectionContext &ctx,
                                                     const std::string &afterHash,
                                                     size_t limit) {
  OrphanQuery q;
  q.now = ctx.now;
  q.graceOverride = ctx.graceOverride;
  q.afterHash = afterHash;
  q.limit = limit;

  std::vector<Candidate> out;
  for (const auto &row : ledger_.selectOrphans(q)) {
    out.push_back(Candidate{row.hash, row.size, "unreferenced past grace"});
  }
  return out;
}

} // namespace chunkkeeper
