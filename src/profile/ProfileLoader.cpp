// Repository: Dossier-render
// Component: Profile Loader
// Purpose: Parse and validate a Profile Record JSON document.
// Copyright (c) 2025 Dossier

#include "dossier/profile/ProfileLoader.hpp"

#include <cmath>
#include <limits>

#include <nlohmann/json.hpp>

#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::profile {

namespace {

using nlohmann::json;

// Lookup that treats "missing" and "null" the same, as the collector emits
// both for signals it could not read.
const json* Find(const json* obj, const char* key) {
  if (obj == nullptr || !obj->is_object()) return nullptr;
  auto it = obj->find(key);
  if (it == obj->end() || it->is_null()) return nullptr;
  return &(*it);
}

const json* FindPath(const json* obj, std::initializer_list<const char*> keys) {
  const json* cur = obj;
  for (const char* key : keys) {
    cur = Find(cur, key);
    if (cur == nullptr) return nullptr;
  }
  return cur;
}

std::optional<double> OptNumber(const json* obj, const char* key) {
  const json* v = Find(obj, key);
  if (v == nullptr || !v->is_number()) return std::nullopt;
  return v->get<double>();
}

std::optional<bool> OptBool(const json* obj, const char* key) {
  const json* v = Find(obj, key);
  if (v == nullptr || !v->is_boolean()) return std::nullopt;
  return v->get<bool>();
}

// Strings pass through; numbers are rendered (doNotTrack arrives as "1" or 1).
std::string OptString(const json* obj, const char* key) {
  const json* v = Find(obj, key);
  if (v == nullptr) return "";
  if (v->is_string()) return v->get<std::string>();
  if (v->is_number()) return util::FormatNumber(v->get<double>());
  return "";
}

// Counts and scores are ints in the record; out-of-range numbers saturate.
int ClampToInt(double v) {
  if (std::isnan(v)) return 0;
  if (v <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  if (v >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(v);
}

int OptInt(const json* obj, const char* key) {
  auto v = OptNumber(obj, key);
  return v ? ClampToInt(*v) : 0;
}

std::vector<std::string> StringArray(const json* arr) {
  std::vector<std::string> out;
  if (arr == nullptr || !arr->is_array()) return out;
  for (const auto& item : *arr) {
    if (item.is_string()) out.push_back(item.get<std::string>());
  }
  return out;
}

// Tracks the first required-field violation. Subsequent checks become no-ops
// so the reported path is the earliest one in document order.
class RequiredFields {
 public:
  const json* Object(const json* parent, const char* key, const std::string& path) {
    const json* v = Find(parent, key);
    if (v == nullptr) {
      Fail("missing required field '" + path + "'");
      return nullptr;
    }
    if (!v->is_object()) {
      Fail("field '" + path + "' must be an object");
      return nullptr;
    }
    return v;
  }

  const json* Array(const json* parent, const char* key, const std::string& path) {
    const json* v = Find(parent, key);
    if (v == nullptr) {
      Fail("missing required field '" + path + "'");
      return nullptr;
    }
    if (!v->is_array()) {
      Fail("field '" + path + "' must be an array");
      return nullptr;
    }
    return v;
  }

  std::string String(const json* parent, const char* key, const std::string& path) {
    const json* v = Find(parent, key);
    if (v == nullptr) {
      Fail("missing required field '" + path + "'");
      return "";
    }
    if (!v->is_string()) {
      Fail("field '" + path + "' must be a string");
      return "";
    }
    return v->get<std::string>();
  }

  double Number(const json* parent, const char* key, const std::string& path) {
    const json* v = Find(parent, key);
    if (v == nullptr) {
      Fail("missing required field '" + path + "'");
      return 0.0;
    }
    if (!v->is_number()) {
      Fail("field '" + path + "' must be a number");
      return 0.0;
    }
    return v->get<double>();
  }

  void Fail(const std::string& msg) {
    if (error_.empty()) error_ = msg;
  }

  bool ok() const { return error_.empty(); }
  const std::string& error() const { return error_; }

 private:
  std::string error_;
};

void ReadDeviceFacts(const json* basic, DeviceFacts* d) {
  d->user_agent = OptString(basic, "userAgent");
  d->platform = OptString(basic, "platform");
  d->language = OptString(basic, "language");
  d->timezone = OptString(basic, "timezone");
  d->timezone_offset_min = OptNumber(basic, "timezoneOffset");
  d->hardware_concurrency = OptNumber(basic, "hardwareConcurrency");
  d->device_memory_gb = OptNumber(basic, "deviceMemory");
  d->screen_width = OptNumber(basic, "screenWidth");
  d->screen_height = OptNumber(basic, "screenHeight");
  d->device_pixel_ratio = OptNumber(basic, "devicePixelRatio");
  d->color_depth = OptNumber(basic, "colorDepth");
  d->max_touch_points = OptNumber(basic, "maxTouchPoints");
  d->do_not_track = OptString(basic, "doNotTrack");
  d->cookie_enabled = OptBool(basic, "cookieEnabled");
  d->connection_type = OptString(basic, "connectionType");
  d->connection_downlink_mbps = OptNumber(basic, "connectionDownlink");
  d->connection_save_data = OptBool(basic, "connectionSaveData").value_or(false);
}

void ReadFingerprintExtras(const json* fp, const json* root, Fingerprint* f) {
  const json* adv = Find(fp, "advanced");
  f->visitor_id = OptString(adv, "visitorId");
  if (f->visitor_id.empty()) {
    f->visitor_id = OptString(FindPath(adv, {"components"}), "visitorId");
  }

  f->gpu_renderer =
      OptString(FindPath(adv, {"components", "webGlBasics", "value"}), "rendererUnmasked");
  if (f->gpu_renderer.empty()) {
    f->gpu_renderer = OptString(Find(fp, "webgl"), "renderer");
  }
  f->gpu_vendor = OptString(Find(fp, "webgl"), "vendor");
  f->canvas_hash = OptString(fp, "canvas");
  f->audio_hash = OptString(fp, "audio");

  f->fonts = StringArray(Find(fp, "fonts"));
  if (f->fonts.empty()) {
    f->fonts = StringArray(FindPath(adv, {"components", "fonts", "value"}));
  }

  const json* battery = Find(fp, "battery");
  if (auto level = OptNumber(battery, "level")) {
    BatteryState b;
    b.level = *level;
    b.charging = OptBool(battery, "charging").value_or(false);
    b.charging_time_sec = OptNumber(battery, "chargingTime");
    f->battery = b;
  }

  if (const json* media = Find(fp, "mediaDevices"); media != nullptr && media->is_object()) {
    MediaDeviceCounts m;
    m.audio_input = OptInt(media, "audioinput");
    m.video_input = OptInt(media, "videoinput");
    m.audio_output = OptInt(media, "audiooutput");
    f->media_devices = m;
  }

  f->collected_at = OptString(fp, "collectedAt");
  if (f->collected_at.empty()) f->collected_at = OptString(fp, "generatedAt");
  if (f->collected_at.empty()) f->collected_at = OptString(root, "generatedAt");
}

void ReadInferredProfile(const json* prof, RequiredFields& req, InferredProfile* p) {
  const json* device = req.Object(prof, "device", "profile.device");
  const json* parsed = req.Object(device, "parsed", "profile.device.parsed");
  p->device.parsed.os = req.String(parsed, "os", "profile.device.parsed.os");
  p->device.parsed.browser = req.String(parsed, "browser", "profile.device.parsed.browser");
  p->device.parsed.os_version = OptString(parsed, "osVersion");
  p->device.parsed.browser_version = OptString(parsed, "browserVersion");
  p->device.parsed.mobile = OptBool(parsed, "mobile").value_or(false);
  p->device.device_tier = OptString(device, "deviceTier");
  p->device.device_type = OptString(device, "deviceType");
  p->device.device_guess = OptString(device, "deviceGuess");

  const json* loc = req.Object(prof, "location", "profile.location");
  p->location.country = req.String(loc, "country", "profile.location.country");
  p->location.market = req.String(loc, "market", "profile.location.market");
  p->location.region = OptString(loc, "region");

  const json* inc = req.Object(prof, "income", "profile.income");
  p->income.bracket = req.String(inc, "bracket", "profile.income.bracket");
  p->income.estimate = req.String(inc, "estimate", "profile.income.estimate");

  const json* tech = Find(prof, "techLiteracy");
  auto score = OptNumber(tech, "score");
  // A zero score reads as "not scored".
  p->tech_literacy.score = (score && *score != 0.0) ? ClampToInt(*score) : 50;
  p->tech_literacy.level = OptString(tech, "level");

  const json* profession = Find(prof, "profession");
  p->profession.primary = OptString(profession, "primary");
  if (const json* all = Find(profession, "all"); all != nullptr && all->is_array()) {
    for (const auto& item : *all) {
      if (!item.is_object()) continue;
      ProfessionGuess g;
      g.label = OptString(&item, "label");
      g.confidence = OptNumber(&item, "confidence").value_or(0.0);
      if (!g.label.empty()) p->profession.all.push_back(g);
    }
  }

  if (const json* infs = Find(prof, "inferences"); infs != nullptr && infs->is_array()) {
    for (const auto& item : *infs) {
      if (!item.is_object()) continue;
      Inference inf;
      inf.category = OptString(&item, "category");
      inf.inference = OptString(&item, "inference");
      if (!inf.category.empty()) p->inferences.push_back(inf);
    }
  }
}

void ReadEntropy(const json* entropy, RequiredFields& req, EntropyReport* e) {
  e->total_bits = req.Number(entropy, "totalBits", "entropy.totalBits");
  const json* contribs = req.Array(entropy, "contributions", "entropy.contributions");
  if (contribs == nullptr) return;
  size_t index = 0;
  for (const auto& item : *contribs) {
    const std::string path = "entropy.contributions[" + std::to_string(index++) + "]";
    if (!item.is_object()) {
      req.Fail("field '" + path + "' must be an object");
      return;
    }
    EntropyContribution c;
    c.signal = OptString(&item, "signal");
    c.label = OptString(&item, "label");
    c.bits = req.Number(&item, "bits", path + ".bits");
    c.present = OptBool(&item, "present").value_or(false);
    e->contributions.push_back(c);
  }
}

void ReadPricing(const json* pricing, RequiredFields& req, Pricing* p) {
  p->cpm = req.Number(pricing, "cpm", "pricing.cpm");
  if (auto annual = OptNumber(pricing, "annualValue")) {
    p->annual_value = *annual;
  } else if (auto estimate = OptNumber(pricing, "annualEstimate")) {
    p->annual_value = *estimate;
  } else {
    p->annual_value = DeriveAnnualValue(p->cpm);
  }
  if (const json* factors = Find(pricing, "factors"); factors != nullptr && factors->is_array()) {
    for (const auto& item : *factors) {
      if (!item.is_object()) continue;
      PricingFactor f;
      f.label = OptString(&item, "label");
      f.value = OptString(&item, "value");
      f.effect = OptString(&item, "effect");
      p->factors.push_back(f);
    }
  }
}

std::optional<CookieReport> ReadCookies(const json* cookies) {
  if (cookies == nullptr || !cookies->is_object()) return std::nullopt;
  CookieReport c;
  c.total = OptInt(cookies, "total");
  c.tracker_count = OptInt(cookies, "trackerCount");
  c.tracker_percentage = OptNumber(cookies, "trackerPercentage");

  const json* cat = Find(cookies, "byCategory");
  c.by_category.advertising = OptInt(cat, "advertising");
  c.by_category.analytics = OptInt(cat, "analytics");
  c.by_category.social = OptInt(cat, "social");
  c.by_category.data_brokers = OptInt(cat, "data_brokers");
  c.by_category.fingerprinting = OptInt(cat, "fingerprinting");
  c.by_category.consent_management = OptInt(cat, "consent_management");
  c.by_category.unknown = OptInt(cat, "unknown");

  const json* life = Find(cookies, "lifetimes");
  c.lifetimes.session = OptInt(life, "session");
  c.lifetimes.short_lived = OptInt(life, "shortLived");
  c.lifetimes.persistent = OptInt(life, "persistent");
  c.lifetimes.zombie = OptInt(life, "zombie");

  if (const json* top = Find(cookies, "topTrackers"); top != nullptr && top->is_array()) {
    for (const auto& item : *top) {
      if (!item.is_object()) continue;
      TrackerDomain t;
      t.domain = OptString(&item, "domain");
      t.count = OptInt(&item, "count");
      t.category = OptString(&item, "category");
      c.top_trackers.push_back(t);
    }
  }
  return c;
}

std::optional<HistorySummary> ReadHistory(const json* history) {
  if (history == nullptr || !history->is_object()) return std::nullopt;
  // The collector writes {error, items: 0} when history access was denied.
  if (Find(history, "error") != nullptr) return std::nullopt;
  HistorySummary h;
  h.total_items = OptInt(history, "totalItems");
  h.unique_domains = OptInt(history, "uniqueDomains");
  if (const json* interests = Find(history, "interests");
      interests != nullptr && interests->is_array()) {
    for (const auto& item : *interests) {
      if (item.is_string()) {
        h.interests.push_back(item.get<std::string>());
      } else if (item.is_object()) {
        std::string name = OptString(&item, "interest");
        if (!name.empty()) h.interests.push_back(name);
      }
    }
  }
  if (const json* patterns = Find(history, "patterns");
      patterns != nullptr && patterns->is_object()) {
    BrowsingPatterns bp;
    bp.peak_hour = OptString(patterns, "peakHour");
    bp.estimated_sleep = OptString(patterns, "estimatedSleep");
    bp.weekend_warrior = OptBool(patterns, "isWeekendWarrior").value_or(false);
    bp.workaholic = OptBool(patterns, "isWorkaholic").value_or(false);
    h.patterns = bp;
  }
  return h;
}

void ReadExtension(const json* ext, ExtensionData* e) {
  if (ext == nullptr || !ext->is_object()) return;
  e->cookies = ReadCookies(Find(ext, "cookies"));
  e->history = ReadHistory(Find(ext, "history"));
  if (auto count = OptNumber(Find(ext, "bookmarks"), "count")) {
    e->bookmark_count = ClampToInt(*count);
  }
}

void ReadUniqueness(const json* uniq, double total_bits, Uniqueness* u) {
  *u = DeriveUniqueness(total_bits);
  if (uniq == nullptr || !uniq->is_object()) return;
  if (auto percent = OptNumber(uniq, "percent")) u->percent = *percent;
  std::string population = OptString(uniq, "populationSize");
  if (!population.empty()) u->population_size = population;
  std::string description = OptString(uniq, "description");
  if (!description.empty()) u->description = description;
}

}  // namespace

RenderResult ParseProfileRecord(const std::string& json_text, ProfileRecord* out) {
  json root = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    return RenderResult::Failure(RenderError::kInputError, "profile record is not valid JSON");
  }
  if (!root.is_object()) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "profile record must be a JSON object");
  }

  RequiredFields req;
  ProfileRecord record;

  // Exports nest the collected signals under "fingerprint"; raw collector
  // dumps put them at the top level.
  const json* fp = Find(&root, "fingerprint");
  if (fp == nullptr) fp = &root;
  if (!fp->is_object()) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "field 'fingerprint' must be an object");
  }

  record.generated_at = OptString(&root, "generatedAt");
  if (record.generated_at.empty()) record.generated_at = OptString(fp, "generatedAt");

  const json* basic = req.Object(fp, "basic", "fingerprint.basic");
  ReadDeviceFacts(basic, &record.fingerprint.basic);
  ReadFingerprintExtras(fp, &root, &record.fingerprint);

  const json* prof = req.Object(&root, "profile", "profile");
  if (prof != nullptr) ReadInferredProfile(prof, req, &record.profile);

  const json* entropy = req.Object(&root, "entropy", "entropy");
  if (entropy != nullptr) ReadEntropy(entropy, req, &record.entropy);

  const json* pricing = req.Object(&root, "pricing", "pricing");
  if (pricing != nullptr) ReadPricing(pricing, req, &record.pricing);

  if (!req.ok()) {
    return RenderResult::Failure(RenderError::kInputError, req.error());
  }

  ReadUniqueness(Find(&root, "uniqueness"), record.entropy.total_bits, &record.uniqueness);

  const json* ext = Find(&root, "extension");
  if (ext == nullptr) ext = Find(fp, "extension");
  ReadExtension(ext, &record.extension);

  *out = std::move(record);
  return RenderResult::Success();
}

RenderResult LoadProfileRecord(const std::string& path, ProfileRecord* out) {
  std::string text;
  if (!util::ReadFile(path, &text)) {
    return RenderResult::Failure(RenderError::kInputError, "cannot read " + path);
  }
  RenderResult r = ParseProfileRecord(text, out);
  if (!r.ok) {
    util::Logger::Error("[ProfileLoader] " + path + ": " + r.detail);
    return r;
  }
  util::Logger::Debug("[ProfileLoader] loaded " + path + " contributions=" +
                      std::to_string(out->entropy.contributions.size()) +
                      " cookies=" + (out->extension.cookies ? "yes" : "no"));
  return r;
}

}  // namespace dossier::profile
