// Repository: Dossier-render
// Component: Timeline Builder
// Purpose: Compose, normalize and time the block list for one variant.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/TimelineBuilder.hpp"

#include <algorithm>
#include <utility>

#include "dossier/timeline/ScaredTiming.hpp"
#include "dossier/timeline/SeededRng.hpp"
#include "dossier/util/Logger.hpp"

namespace dossier::timeline {

TimelineBuilder::TimelineBuilder(VariantConfig config) : config_(std::move(config)) {}

Schedule TimelineBuilder::Build(const profile::ProfileRecord& record) const {
  Schedule schedule;
  schedule.seed = SeedFromVisitorId(record.fingerprint.visitor_id);

  switch (config_.variant) {
    case Variant::kClassic:
      ComposeClassicBlocks(record, &schedule.blocks);
      break;
    case Variant::kExtended:
      ComposeExtendedBlocks(record, &schedule.blocks);
      break;
    case Variant::kDossier:
      ComposeDossierBlocks(record, &schedule.blocks);
      break;
    case Variant::kReel:
      ComposeReelBlocks(record, &schedule.blocks);
      break;
  }

  if (config_.drop_empty_lines) {
    for (auto& block : schedule.blocks) {
      auto& lines = block.lines;
      lines.erase(std::remove_if(lines.begin(), lines.end(),
                                 [](const std::string& l) { return l.empty(); }),
                  lines.end());
    }
  }

  // Jitter draws happen in block order, one per block, so the holds are a
  // pure function of (seed, block count, line counts, importances).
  SeededRng rng(schedule.seed);
  const size_t total = schedule.blocks.size();
  for (size_t i = 0; i < total; ++i) {
    Block& block = schedule.blocks[i];
    if (config_.scared_timing) {
      const double scared =
          ScaredHoldSeconds(i, total, block.lines.size(), block.importance, rng);
      block.computed_hold_sec = block.hold_sec ? *block.hold_sec : scared;
    } else {
      block.computed_hold_sec = block.hold_sec.value_or(0.0);
    }
  }

  util::Logger::Debug("[TimelineBuilder] variant=" + std::string(VariantToString(config_.variant)) +
                      " blocks=" + std::to_string(total) +
                      " seed=" + std::to_string(schedule.seed));
  return schedule;
}

}  // namespace dossier::timeline
