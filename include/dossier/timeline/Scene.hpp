// Repository: Dossier-render
// Component: Scene Kinds
// Purpose: Tagged variant of full-frame scenes and the profile-derived
//          constants each one paints.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_SCENE_HPP_
#define DOSSIER_TIMELINE_SCENE_HPP_

#include <string>
#include <variant>
#include <vector>

namespace dossier::timeline {

// Network fades in from the void; centered title and classification line.
struct EmergenceScene {
  std::string title = "SUBJECT DOSSIER";
  std::string subtitle = "CLASSIFICATION: ADVERTISING COMMODITY";
};

struct IdentityRow {
  std::string label;  // upper-cased category
  std::string value;
};

// Network on the left, inference panel on the right (max 14 rows).
struct IdentityScene {
  std::vector<IdentityRow> rows;
};

struct EntropyBar {
  std::string label;
  double bits = 0.0;
};

// Radial bars, one per present contribution (max 10), around a counting
// "N.N BITS" readout.
struct EntropyConstellationScene {
  double total_bits = 0.0;
  double max_bits = 1.0;
  std::vector<EntropyBar> bars;
  double uniqueness_percent = 0.0;
  std::string uniqueness_description;
};

struct ValuationFactor {
  std::string label;
  std::string effect;
};

// CPM counts up in the center; up to six pricing factors orbit it.
struct ValuationScene {
  double cpm = 0.0;
  std::vector<ValuationFactor> factors;
};

// Raw collected strings cascading down as columns.
struct DataRainScene {
  std::vector<std::string> columns;
  int signal_count = 0;
};

// Network collapses to center; closing message.
struct OutroScene {
  std::string headline = "YOU ARE THE PRODUCT";
  std::string footer = "Collected in seconds. No permissions asked.";
};

using Scene = std::variant<EmergenceScene, IdentityScene, EntropyConstellationScene,
                           ValuationScene, DataRainScene, OutroScene>;

enum class SceneKind {
  kEmergence = 0,
  kIdentity,
  kEntropyConstellation,
  kValuation,
  kDataRain,
  kOutro,
};

SceneKind KindOf(const Scene& scene);
const char* SceneKindToString(SceneKind kind);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_SCENE_HPP_
