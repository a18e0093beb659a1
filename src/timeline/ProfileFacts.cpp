// Repository: Dossier-render
// Component: Profile Facts
// Purpose: Derived observations the monologue conditions on.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/ProfileFacts.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace dossier::timeline {

namespace {

std::string FirstGroup(const std::string& text, const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(text, match, pattern) && match.size() > 1) {
    return match[1].str();
  }
  return "";
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int64_t y, int64_t m, int64_t d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

bool ReadDigits(const std::string& s, size_t* pos, size_t count, int* out) {
  if (*pos + count > s.size()) return false;
  int v = 0;
  for (size_t i = 0; i < count; ++i) {
    const char c = s[*pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  *pos += count;
  *out = v;
  return true;
}

bool Expect(const std::string& s, size_t* pos, char c) {
  if (*pos >= s.size() || s[*pos] != c) return false;
  ++*pos;
  return true;
}

}  // namespace

std::optional<int64_t> ParseIsoTimestampMinutes(const std::string& iso) {
  size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0;
  if (!ReadDigits(iso, &pos, 4, &year) || !Expect(iso, &pos, '-') ||
      !ReadDigits(iso, &pos, 2, &month) || !Expect(iso, &pos, '-') ||
      !ReadDigits(iso, &pos, 2, &day)) {
    return std::nullopt;
  }
  if (pos >= iso.size() || (iso[pos] != 'T' && iso[pos] != ' ')) return std::nullopt;
  ++pos;
  if (!ReadDigits(iso, &pos, 2, &hour) || !Expect(iso, &pos, ':') ||
      !ReadDigits(iso, &pos, 2, &minute)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59) {
    return std::nullopt;
  }

  // Seconds and fractions do not affect the minute.
  if (pos < iso.size() && iso[pos] == ':') {
    ++pos;
    while (pos < iso.size() &&
           (std::isdigit(static_cast<unsigned char>(iso[pos])) || iso[pos] == '.')) {
      ++pos;
    }
  }

  int64_t zone_minutes = 0;
  if (pos < iso.size()) {
    const char z = iso[pos];
    if (z == 'Z' || z == 'z') {
      ++pos;
    } else if (z == '+' || z == '-') {
      ++pos;
      int zh = 0, zm = 0;
      if (!ReadDigits(iso, &pos, 2, &zh)) return std::nullopt;
      Expect(iso, &pos, ':');
      if (!ReadDigits(iso, &pos, 2, &zm)) return std::nullopt;
      zone_minutes = (z == '+' ? 1 : -1) * (zh * 60 + zm);
    } else {
      return std::nullopt;
    }
  }
  if (pos != iso.size()) return std::nullopt;

  const int64_t days = DaysFromCivil(year, month, day);
  return days * 1440 + hour * 60 + minute - zone_minutes;
}

std::vector<std::string> FilterFonts(const std::vector<std::string>& installed,
                                     const std::vector<std::string>& known) {
  std::vector<std::string> out;
  for (const auto& f : installed) {
    if (std::find(known.begin(), known.end(), f) != known.end()) out.push_back(f);
  }
  return out;
}

ProfileFacts DeriveProfileFacts(const profile::ProfileRecord& record) {
  static const std::regex kAppleChip("Apple (M\\d+\\s*\\w*)", std::regex::icase);
  static const std::regex kNvidia("((?:RTX|GTX)\\s*\\d+\\s*\\w*)", std::regex::icase);
  static const std::regex kRecentNvidia("RTX\\s*(30|40|50)", std::regex::icase);
  static const std::regex kAmd("(Radeon\\s*(?:RX)?\\s*\\d+\\s*\\w*)", std::regex::icase);

  const auto& d = record.fingerprint.basic;
  const auto& parsed = record.profile.device.parsed;
  const std::string& gpu = record.fingerprint.gpu_renderer;

  ProfileFacts f;
  f.apple_chip = FirstGroup(gpu, kAppleChip);
  f.nvidia_gpu = FirstGroup(gpu, kNvidia);
  f.amd_gpu = FirstGroup(gpu, kAmd);
  f.nvidia_recent = !f.nvidia_gpu.empty() && std::regex_search(f.nvidia_gpu, kRecentNvidia);

  f.is_mobile = parsed.mobile;
  f.is_apple = parsed.os == "macOS" || parsed.os == "iOS";
  f.is_windows = parsed.os == "Windows";
  f.is_linux = parsed.os == "Linux";
  f.is_chromeos = d.platform.find("CrOS") != std::string::npos;
  f.is_premium = record.profile.device.device_tier == "Premium";

  f.high_memory = d.device_memory_gb.value_or(0.0) >= 8.0;
  f.high_cores = d.hardware_concurrency.value_or(0.0) >= 8.0;
  f.retina = d.device_pixel_ratio.value_or(1.0) >= 2.0;
  f.wide_color = d.color_depth.value_or(0.0) >= 30.0;
  if (record.fingerprint.media_devices) {
    f.has_webcam = record.fingerprint.media_devices->video_input > 0;
    f.has_mic = record.fingerprint.media_devices->audio_input > 0;
  }
  f.do_not_track = d.do_not_track == "1";
  f.cookies_enabled = d.cookie_enabled.value_or(true);

  f.is_brave = d.user_agent.find("Brave") != std::string::npos;
  f.is_firefox = parsed.browser == "Firefox";
  f.is_safari = parsed.browser == "Safari";
  f.is_chrome = parsed.browser == "Chrome" && !f.is_brave;

  if (!record.fingerprint.collected_at.empty() && d.timezone_offset_min) {
    if (auto utc = ParseIsoTimestampMinutes(record.fingerprint.collected_at)) {
      const int64_t local = *utc - static_cast<int64_t>(std::llround(*d.timezone_offset_min));
      int64_t of_day = local % 1440;
      if (of_day < 0) of_day += 1440;
      f.local_time = LocalClock{static_cast<int>(of_day / 60), static_cast<int>(of_day % 60)};
    }
  }
  return f;
}

}  // namespace dossier::timeline
