// Repository: Dossier-render
// Component: Timeline Builder
// Purpose: Profile Record -> ordered Block list + deterministic seed.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_TIMELINE_BUILDER_HPP_
#define DOSSIER_TIMELINE_TIMELINE_BUILDER_HPP_

#include <cstdint>
#include <vector>

#include "dossier/profile/ProfileRecord.hpp"
#include "dossier/timeline/BlockTypes.hpp"
#include "dossier/timeline/VariantConfig.hpp"

namespace dossier::timeline {

struct Schedule {
  std::vector<Block> blocks;
  int64_t seed = 1;
};

// One builder for every variant. The variant only selects which block set
// is composed and how it is post-processed (empty-line handling, hold
// model); scheduling is shared.
//
// Build() is a pure function of the profile: the same record always yields
// the same blocks, lines, holds and seed.
class TimelineBuilder {
 public:
  explicit TimelineBuilder(VariantConfig config);

  Schedule Build(const profile::ProfileRecord& record) const;

  const VariantConfig& config() const { return config_; }

 private:
  VariantConfig config_;
};

// Composers for each variant's block set, in presentation order. Holds are
// authored where the variant has them; empty lines are left in place.
void ComposeClassicBlocks(const profile::ProfileRecord& record, std::vector<Block>* out);
void ComposeExtendedBlocks(const profile::ProfileRecord& record, std::vector<Block>* out);
void ComposeDossierBlocks(const profile::ProfileRecord& record, std::vector<Block>* out);
void ComposeReelBlocks(const profile::ProfileRecord& record, std::vector<Block>* out);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_TIMELINE_BUILDER_HPP_
