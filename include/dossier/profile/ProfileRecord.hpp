// Repository: Dossier-render
// Component: Profile Record
// Purpose: Immutable, typed view of the subject profile consumed by the renderer.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_PROFILE_PROFILE_RECORD_HPP_
#define DOSSIER_PROFILE_PROFILE_RECORD_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dossier::profile {

// =============================================================================
// Fingerprint (collected facts)
// =============================================================================

// fingerprint.basic. Every field is optional in the source document; an
// absent numeric field stays std::nullopt so the monologue can tell "0" from
// "not reported".
struct DeviceFacts {
  std::string user_agent;
  std::string platform;
  std::string language;
  std::string timezone;
  std::optional<double> timezone_offset_min;
  std::optional<double> hardware_concurrency;
  std::optional<double> device_memory_gb;
  std::optional<double> screen_width;
  std::optional<double> screen_height;
  std::optional<double> device_pixel_ratio;
  std::optional<double> color_depth;
  std::optional<double> max_touch_points;
  std::string do_not_track;             // "1" when enabled
  std::optional<bool> cookie_enabled;
  std::string connection_type;          // "4g", "3g", ...
  std::optional<double> connection_downlink_mbps;
  bool connection_save_data = false;
};

struct BatteryState {
  double level = 0.0;  // 0..1
  bool charging = false;
  std::optional<double> charging_time_sec;
};

struct MediaDeviceCounts {
  int audio_input = 0;
  int video_input = 0;
  int audio_output = 0;
};

struct Fingerprint {
  DeviceFacts basic;
  std::string visitor_id;
  std::string gpu_renderer;
  std::string gpu_vendor;
  std::string canvas_hash;
  std::string audio_hash;
  std::vector<std::string> fonts;
  std::optional<BatteryState> battery;
  std::optional<MediaDeviceCounts> media_devices;
  // collectedAt, falling back to generatedAt. ISO-8601, may be empty.
  std::string collected_at;
};

// =============================================================================
// Inferred profile (precomputed by the external collector)
// =============================================================================

struct ParsedDevice {
  std::string os;
  std::string os_version;
  std::string browser;
  std::string browser_version;
  bool mobile = false;
};

struct DeviceProfile {
  ParsedDevice parsed;
  std::string device_tier;   // "Premium", "Mid-range", "Budget", "Low"
  std::string device_type;
  std::string device_guess;
};

struct LocationProfile {
  std::string country;
  std::string market;
  std::string region;
};

struct IncomeProfile {
  std::string bracket;
  std::string estimate;
};

struct TechLiteracy {
  int score = 50;
  std::string level;
};

struct ProfessionGuess {
  std::string label;
  double confidence = 0.0;  // 0..1
};

struct ProfessionProfile {
  std::string primary;
  std::vector<ProfessionGuess> all;
};

struct Inference {
  std::string category;
  std::string inference;
};

struct InferredProfile {
  DeviceProfile device;
  LocationProfile location;
  IncomeProfile income;
  TechLiteracy tech_literacy;
  ProfessionProfile profession;
  std::vector<Inference> inferences;
};

// =============================================================================
// Entropy / uniqueness / pricing
// =============================================================================

struct EntropyContribution {
  std::string signal;
  std::string label;
  double bits = 0.0;
  bool present = false;
};

struct EntropyReport {
  double total_bits = 0.0;
  std::vector<EntropyContribution> contributions;

  std::vector<EntropyContribution> Present() const;
};

struct Uniqueness {
  double percent = 0.0;
  std::string population_size;
  std::string description;
};

struct PricingFactor {
  std::string label;
  std::string value;
  std::string effect;
};

struct Pricing {
  double cpm = 0.0;
  double annual_value = 0.0;
  std::vector<PricingFactor> factors;
};

// =============================================================================
// Extension data (optional group)
// =============================================================================

struct CookieCategoryCounts {
  int advertising = 0;
  int analytics = 0;
  int social = 0;
  int data_brokers = 0;
  int fingerprinting = 0;
  int consent_management = 0;
  int unknown = 0;
};

struct CookieLifetimes {
  int session = 0;
  int short_lived = 0;
  int persistent = 0;
  int zombie = 0;
};

struct TrackerDomain {
  std::string domain;
  int count = 0;
  std::string category;  // "advertising", "social", "data_brokers", ...
};

struct CookieReport {
  int total = 0;
  int tracker_count = 0;
  std::optional<double> tracker_percentage;
  CookieCategoryCounts by_category;
  CookieLifetimes lifetimes;
  std::vector<TrackerDomain> top_trackers;
};

struct BrowsingPatterns {
  std::string peak_hour;
  std::string estimated_sleep;
  bool weekend_warrior = false;
  bool workaholic = false;
};

// Browsing history as the extension reports it. Part of the input model
// only: no block or scene reads it.
struct HistorySummary {
  int total_items = 0;
  int unique_domains = 0;
  std::vector<std::string> interests;
  std::optional<BrowsingPatterns> patterns;
};

struct ExtensionData {
  std::optional<CookieReport> cookies;
  std::optional<HistorySummary> history;
  std::optional<int> bookmark_count;  // input model only, like history
};

// =============================================================================
// Profile Record
// =============================================================================

struct ProfileRecord {
  std::string generated_at;
  Fingerprint fingerprint;
  InferredProfile profile;
  EntropyReport entropy;
  Uniqueness uniqueness;
  Pricing pricing;
  ExtensionData extension;

  // Visitor ID as displayed; "00000000" when the collector supplied none.
  std::string DisplayVisitorId() const;
};

// Uniqueness tiers by total entropy bits (EFF Panopticlick thresholds).
Uniqueness DeriveUniqueness(double total_bits);

// Default annual value when the record carries none: ~30k impressions/year.
double DeriveAnnualValue(double cpm);

}  // namespace dossier::profile

#endif  // DOSSIER_PROFILE_PROFILE_RECORD_HPP_
