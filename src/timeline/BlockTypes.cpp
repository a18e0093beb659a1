// Repository: Dossier-render
// Component: Block Types
// Purpose: String helpers for block and scene tags.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/BlockTypes.hpp"

#include <type_traits>

namespace dossier::timeline {

const char* ImportanceToString(Importance importance) {
  switch (importance) {
    case Importance::kNormal:
      return "normal";
    case Importance::kFlash:
      return "flash";
    case Importance::kLinger:
      return "linger";
  }
  return "unknown";
}

SceneKind KindOf(const Scene& scene) {
  return std::visit(
      [](const auto& s) -> SceneKind {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, EmergenceScene>) {
          return SceneKind::kEmergence;
        } else if constexpr (std::is_same_v<T, IdentityScene>) {
          return SceneKind::kIdentity;
        } else if constexpr (std::is_same_v<T, EntropyConstellationScene>) {
          return SceneKind::kEntropyConstellation;
        } else if constexpr (std::is_same_v<T, ValuationScene>) {
          return SceneKind::kValuation;
        } else if constexpr (std::is_same_v<T, DataRainScene>) {
          return SceneKind::kDataRain;
        } else {
          return SceneKind::kOutro;
        }
      },
      scene);
}

const char* SceneKindToString(SceneKind kind) {
  switch (kind) {
    case SceneKind::kEmergence:
      return "emergence";
    case SceneKind::kIdentity:
      return "identity";
    case SceneKind::kEntropyConstellation:
      return "entropy_constellation";
    case SceneKind::kValuation:
      return "valuation";
    case SceneKind::kDataRain:
      return "data_rain";
    case SceneKind::kOutro:
      return "outro";
  }
  return "unknown";
}

}  // namespace dossier::timeline
