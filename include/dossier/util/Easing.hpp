// Repository: Dossier-render
// Component: Easing
// Purpose: Clamp / lerp / easing curves shared by the timeline and painters.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_UTIL_EASING_HPP_
#define DOSSIER_UTIL_EASING_HPP_

namespace dossier::util {

inline double Clamp(double v, double lo, double hi) {
  return v < lo ? lo : (v > hi ? hi : v);
}

inline double Clamp01(double v) { return Clamp(v, 0.0, 1.0); }

inline double Lerp(double a, double b, double t) { return a + (b - a) * Clamp01(t); }

// 1 - (1 - t)^3
inline double EaseOut(double t) {
  const double u = 1.0 - Clamp01(t);
  return 1.0 - u * u * u;
}

// Cubic in/out.
inline double EaseInOut(double t) {
  t = Clamp01(t);
  if (t < 0.5) return 4.0 * t * t * t;
  const double u = -2.0 * t + 2.0;
  return 1.0 - u * u * u / 2.0;
}

}  // namespace dossier::util

#endif  // DOSSIER_UTIL_EASING_HPP_
