// Repository: Dossier-render
// Component: Profile Loader
// Purpose: Parse and validate a Profile Record JSON document.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_PROFILE_PROFILE_LOADER_HPP_
#define DOSSIER_PROFILE_PROFILE_LOADER_HPP_

#include <string>

#include "dossier/RenderError.hpp"
#include "dossier/profile/ProfileRecord.hpp"

namespace dossier::profile {

// Required groups: fingerprint.basic, profile.device.parsed (os, browser),
// profile.location (country, market), profile.income (bracket, estimate),
// entropy (totalBits, contributions[]), pricing.cpm.
// Anything else is optional and simply left empty when absent.
//
// Both entry points return kInputError with a dotted field path in `detail`
// on the first violation; `out` is only written on success.
RenderResult ParseProfileRecord(const std::string& json_text, ProfileRecord* out);
RenderResult LoadProfileRecord(const std::string& path, ProfileRecord* out);

}  // namespace dossier::profile

#endif  // DOSSIER_PROFILE_PROFILE_LOADER_HPP_
