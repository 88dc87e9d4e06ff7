#include "gc/generational_sweep.hpp"
#include "utilities/logger.h"

namespace chunkkeeper {

std::string generationToString(Generation gen) {
  switch (gen) {
  case Generation::Nursery:
    return "nursery";
  case Generation::Young:
    return "young";
  case Generation::Old:
    return "old";
  }
  return "unknown";
}

GenerationalSweep::GenerationalSweep(ReferenceLedger &ledger, Millis nurseryAge, Millis youngAge,
                                     Millis oldGenerationInterval)
    : ledger_(ledger), nurseryAge_(nurseryAge), youngAge_(youngAge),
      oldInterval_(oldGenerationInterval) {}

Generation GenerationalSweep::classify(TimePoint createdAt, TimePoint now) const {
  auto age = now - createdAt;
  if (age < nurseryAge_)
    return Generation::Nursery;
  if (age < youngAge_)
    return Generation::Young;
  return Generation::Old;
}

void GenerationalSweep::prepare(const CollectionContext &ctx, std::vector<RunError> &diagnostics) {
  (void)diagnostics;
  auto last = ledger_.getStateTime(state_keys::kLastOldGenerationSweepAt);
  includeOld_ = !last || ctx.now - *last >= oldInterval_;
  Logger::getInstance().log(LogLevel::INFO, std::string("[Generational] old generation ") +
                                                (includeOld_ ? "included" : "skipped") +
                                                " this pass");
}

std::vector<Candidate> GenerationalSweep::findCandidates(const CollectionContext &ctx,
                                                         const std::string &afterHash,
                                                         size_t limit) {
  OrphanQuery q;
  q.now = ctx.now;
  q.graceOverride = ctx.graceOverride;
  q.afterHash = afterHash;
  q.limit = limit;
  q.createdAtOrBefore = ctx.now - nurseryAge_;
  if (!includeOld_)
    q.createdAfter = ctx.now - youngAge_;

  std::vector<Candidate> out;
  for (const auto &row : ledger_.selectOrphans(q)) {
    out.push_back(Candidate{row.hash, row.size,
                            generationToString(classify(row.createdAt, ctx.now)) +
                                " generation, unreferenced past grace"});
  }
  return out;
}

void GenerationalSweep::complete(const CollectionContext &ctx, bool completed) {
  if (!includeOld_ || !completed || ctx.dryRun)
    return;
  ledger_.setStateTime(state_keys::kLastOldGenerationSweepAt, ctx.now);
}

} // namespace chunkkeeper
