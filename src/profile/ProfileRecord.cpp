// Repository: Dossier-render
// Component: Profile Record
// Purpose: Immutable, typed view of the subject profile consumed by the renderer.
// Copyright (c) 2025 Dossier

#include "dossier/profile/ProfileRecord.hpp"

#include <cmath>

#include "dossier/util/TextFormat.hpp"

namespace dossier::profile {

std::vector<EntropyContribution> EntropyReport::Present() const {
  std::vector<EntropyContribution> out;
  for (const auto& c : contributions) {
    if (c.present) out.push_back(c);
  }
  return out;
}

std::string ProfileRecord::DisplayVisitorId() const {
  return fingerprint.visitor_id.empty() ? std::string("00000000") : fingerprint.visitor_id;
}

Uniqueness DeriveUniqueness(double total_bits) {
  Uniqueness u;
  if (total_bits >= 33) {
    u.percent = 99.99;
  } else if (total_bits >= 25) {
    u.percent = 99.9;
  } else if (total_bits >= 20) {
    u.percent = 99.5;
  } else if (total_bits >= 18) {
    u.percent = 99.0;
  } else if (total_bits >= 15) {
    u.percent = 95.0;
  } else if (total_bits >= 10) {
    u.percent = 80.0;
  } else {
    u.percent = 50.0;
  }

  const double combinations = std::pow(2.0, total_bits);
  if (combinations > 1e9) {
    u.population_size = util::FormatFixed(combinations / 1e9, 1) + " billion";
  } else if (combinations > 1e6) {
    u.population_size = util::FormatFixed(combinations / 1e6, 1) + " million";
  } else if (combinations > 1e3) {
    u.population_size = util::FormatFixed(combinations / 1e3, 0) + " thousand";
  } else {
    u.population_size = util::FormatFixed(combinations, 0);
  }

  if (total_bits >= 18) {
    u.description = "Your fingerprint is likely unique among " + u.population_size +
                    " browsers. You can be tracked without cookies.";
  } else {
    u.description =
        "Your fingerprint has moderate uniqueness. Combined with other signals, "
        "you may still be identifiable.";
  }
  return u;
}

double DeriveAnnualValue(double cpm) {
  return util::RoundHalfUp(cpm * 30.0 * 100.0) / 100.0;
}

}  // namespace dossier::profile
