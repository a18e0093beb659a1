// Repository: Dossier-render
// Component: Monologue Composer
// Purpose: Block sets for each variant, derived from the Profile Record.
// Copyright (c) 2025 Dossier

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "dossier/timeline/ProfileFacts.hpp"
#include "dossier/timeline/TimelineBuilder.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::timeline {

namespace {

using profile::ProfileRecord;
using util::FormatFixed;
using util::FormatNumber;
using util::ToLowerAscii;

const char kTimes[] = "\xC3\x97";  // U+00D7 MULTIPLICATION SIGN

const std::vector<std::string> kDesignFonts = {
    "Futura",      "Avenir",     "Avenir Next", "Gill Sans", "Helvetica Neue",
    "Open Sans",   "Proxima Nova", "Baskerville", "Didot",   "Optima"};
const std::vector<std::string> kDevFonts = {
    "Menlo",           "Monaco", "Consolas",    "Fira Code",         "Source Code Pro",
    "SF Mono",         "Courier New", "Ubuntu Mono", "DejaVu Sans Mono"};
const std::vector<std::string> kAdobeFonts = {"Myriad Pro", "Minion Pro", "Adobe Garamond",
                                              "Kozuka Gothic", "Adobe Caslon"};

// The extended cut only knew the first six of each list.
const std::vector<std::string> kExtendedDesignFonts(kDesignFonts.begin(),
                                                    kDesignFonts.begin() + 6);
const std::vector<std::string> kExtendedDevFonts(kDevFonts.begin(), kDevFonts.begin() + 6);

class BlockList {
 public:
  explicit BlockList(std::vector<Block>* out) : out_(out) {}

  void Add(std::vector<std::string> lines, Importance importance = Importance::kNormal) {
    Block b;
    b.lines = std::move(lines);
    b.importance = importance;
    out_->push_back(std::move(b));
  }

  void Held(double hold_sec, std::vector<std::string> lines) {
    Block b;
    b.lines = std::move(lines);
    b.hold_sec = hold_sec;
    out_->push_back(std::move(b));
  }

  void AddScene(Scene scene, int64_t frames) {
    Block b;
    b.scene = std::move(scene);
    b.frame_count = frames;
    out_->push_back(std::move(b));
  }

 private:
  std::vector<Block>* out_;
};

std::string Trim(const std::string& s) {
  const size_t a = s.find_first_not_of(' ');
  if (a == std::string::npos) return "";
  const size_t b = s.find_last_not_of(' ');
  return s.substr(a, b - a + 1);
}

// "name version" with no dangling space when the version is unknown.
std::string NameVersion(const std::string& name, const std::string& version) {
  return Trim(name + " " + version);
}

// Zero and absent both read as "not reported".
std::string NumOr(const std::optional<double>& v, const std::string& fallback) {
  if (!v || *v == 0.0) return fallback;
  return FormatNumber(*v);
}

std::string Percent(double ratio) {
  return FormatNumber(util::RoundHalfUp(ratio * 100.0));
}

std::string JoinLower(const std::vector<std::string>& items, size_t limit) {
  std::vector<std::string> head(items.begin(),
                                items.begin() + std::min(limit, items.size()));
  return ToLowerAscii(util::Join(head, ", "));
}

std::string ClockString(const LocalClock& t) {
  return util::PadLeft(std::to_string(t.hour), 2, '0') + ":" +
         util::PadLeft(std::to_string(t.minute), 2, '0');
}

std::string ScreenLine(const profile::DeviceFacts& d, const std::string& times) {
  return NumOr(d.screen_width, "?") + times + NumOr(d.screen_height, "?") + " @" +
         NumOr(d.device_pixel_ratio, "?") + "x.";
}

int TrackerPercent(const profile::CookieReport& c) {
  double pct = c.tracker_percentage.value_or(0.0);
  if (pct == 0.0 && c.total > 0) {
    pct = static_cast<double>(c.tracker_count) / static_cast<double>(c.total) * 100.0;
  }
  return static_cast<int>(util::RoundHalfUp(pct));
}

bool IsOneOf(const std::string& s, std::initializer_list<const char*> set) {
  for (const char* item : set) {
    if (s == item) return true;
  }
  return false;
}

std::vector<std::string> ProfessionLines(const profile::ProfessionProfile& p, size_t limit) {
  std::vector<std::string> lines;
  for (size_t i = 0; i < p.all.size() && i < limit; ++i) {
    lines.push_back(ToLowerAscii(p.all[i].label) + ". (" + Percent(p.all[i].confidence) + "%)");
  }
  return lines;
}

std::vector<std::string> FactorLines(const profile::Pricing& pricing) {
  std::vector<std::string> lines;
  for (size_t i = 0; i < pricing.factors.size() && i < 4; ++i) {
    lines.push_back(ToLowerAscii(pricing.factors[i].label) + ": " +
                    ToLowerAscii(pricing.factors[i].effect) + ".");
  }
  return lines;
}

std::vector<std::string> EntropyLines(const ProfileRecord& r) {
  return {FormatFixed(r.entropy.total_bits, 1) + " bits of entropy.",
          "unique among " + r.uniqueness.population_size + ".",
          FormatNumber(r.uniqueness.percent) + "% identifiable."};
}

std::vector<std::string> ValuationLines(const profile::Pricing& pricing) {
  return {"$" + FormatFixed(pricing.cpm, 2) + " CPM.",
          "$" + FormatFixed(pricing.annual_value, 0) + "/year."};
}

}  // namespace

// =============================================================================
// classic: fixed list, authored holds
// =============================================================================

void ComposeClassicBlocks(const ProfileRecord& r, std::vector<Block>* out) {
  BlockList blocks(out);
  const auto& d = r.fingerprint.basic;
  const auto& parsed = r.profile.device.parsed;
  const auto& loc = r.profile.location;
  const auto& inc = r.profile.income;
  const ProfileFacts facts = DeriveProfileFacts(r);

  blocks.Held(0.8, {"scanning."});

  blocks.Held(1.2, {ToLowerAscii(NameVersion(parsed.os, parsed.os_version)) + ".",
                    facts.apple_chip.empty() ? "apple hardware."
                                             : ToLowerAscii(facts.apple_chip) + ".",
                    "premium device."});

  blocks.Held(1.5, {"power savvy,", "", "=power user?"});

  // Absent cookieEnabled reads as blocked here, unlike the later cuts.
  blocks.Held(1.2, {ToLowerAscii(NameVersion(parsed.browser, parsed.browser_version)) + ".",
                    d.cookie_enabled.value_or(false) ? "cookies enabled." : "cookies blocked.",
                    facts.do_not_track ? "do-not-track: on." : "no do-not-track.",
                    "no resistance."});

  blocks.Held(1.2, {NumOr(d.hardware_concurrency, "?") + " cores.",
                    NumOr(d.device_memory_gb, "?") + "GB RAM.", ScreenLine(d, "x"),
                    facts.retina ? "retina display." : "standard display."});

  blocks.Held(1.2, {d.timezone.empty() ? "unknown timezone." : ToLowerAscii(d.timezone) + ".",
                    ToLowerAscii(loc.country) + ".", ToLowerAscii(loc.market) + " market."});

  if (d.language.rfind("en", 0) == 0 && !IsOneOf(loc.country, {"United States", "United Kingdom"})) {
    blocks.Held(1.3, {ToLowerAscii(d.language) + " speaker",
                      "in " + ToLowerAscii(loc.country) + "?", "expat? digital nomad?",
                      "target international ads."});
  }

  const std::string primary =
      r.profile.profession.primary.empty() ? "unknown" : r.profile.profession.primary;
  blocks.Held(1.0, {"fonts: " + JoinLower(r.fingerprint.fonts, 3) + ".",
                    ToLowerAscii(primary) + "."});

  blocks.Held(1.3, {ToLowerAscii(inc.bracket) + ".", "est. " + ToLowerAscii(inc.estimate) + ".",
                    "=sell premium ads?"});

  blocks.Held(1.3, EntropyLines(r));

  blocks.Held(1.2, ValuationLines(r.pricing));

  blocks.Held(0.8, {(d.connection_type.empty() ? std::string("unknown") : d.connection_type) +
                        " / " + NumOr(d.connection_downlink_mbps, "?") + " mbps.",
                    "serve rich media."});

  blocks.Held(1.2, {"visitor ID:", r.DisplayVisitorId()});

  blocks.Held(1.5, {"classification:", "advertising commodity."});

  blocks.Held(2.5, {"you are the product."});
}

// =============================================================================
// extended: classic plus form factor, battery, clock, fonts, cookies
// =============================================================================

void ComposeExtendedBlocks(const ProfileRecord& r, std::vector<Block>* out) {
  BlockList blocks(out);
  const auto& d = r.fingerprint.basic;
  const auto& parsed = r.profile.device.parsed;
  const auto& loc = r.profile.location;
  const auto& inc = r.profile.income;
  const ProfileFacts facts = DeriveProfileFacts(r);

  blocks.Held(0.7, {"scanning."});

  blocks.Held(1.0, {ToLowerAscii(NameVersion(parsed.os, parsed.os_version)) + ".",
                    facts.apple_chip.empty() ? "apple hardware."
                                             : ToLowerAscii(facts.apple_chip) + ".",
                    "premium device."});

  if (facts.has_webcam && facts.has_mic && d.max_touch_points && *d.max_touch_points == 0.0) {
    blocks.Held(1.0, {"webcam. microphone. no touch.", "=macbook pro."});
  }

  blocks.Held(1.3, {"power savvy,", "", "=power user?"});

  blocks.Held(1.2, {ToLowerAscii(NameVersion(parsed.browser, parsed.browser_version)) + ".",
                    d.cookie_enabled.value_or(false) ? "cookies: on." : "cookies: blocked.",
                    facts.do_not_track ? "do-not-track: on." : "no do-not-track.",
                    "no ad blocker detected.", "no resistance."});

  blocks.Held(1.2, {NumOr(d.hardware_concurrency, "?") + " cores. " +
                        NumOr(d.device_memory_gb, "?") + "GB RAM.",
                    ScreenLine(d, "x"),
                    NumOr(d.color_depth, "?") + "-bit color. P3 gamut. HDR.",
                    "professional-grade display."});

  if (const auto& battery = r.fingerprint.battery) {
    const std::string pct = Percent(battery->level);
    std::vector<std::string> lines = {
        "battery: " + pct + "%." + (battery->charging ? " charging." : ""),
        battery->charging ? "plugged in at desk." : "on battery. mobile?"};
    if (battery->charging && battery->charging_time_sec && *battery->charging_time_sec > 0.0) {
      lines.push_back(FormatNumber(util::RoundHalfUp(*battery->charging_time_sec / 60.0)) +
                      " minutes to full.");
    }
    blocks.Held(1.0, lines);
  }

  if (facts.local_time) {
    const int h = facts.local_time->hour;
    std::string desc;
    std::string inference;
    if (h >= 22 || h < 6) {
      desc = "late night.";
      inference = "working late. dedicated? insomniac?";
    } else if (h < 9) {
      desc = "early morning.";
      inference = "early riser. disciplined.";
    } else if (h < 17) {
      desc = "work hours.";
      inference = "browsing during work.";
    } else {
      desc = "evening.";
      inference = "after work. leisure time.";
    }
    blocks.Held(1.1, {ClockString(*facts.local_time) + " local time.", desc, inference});
  }

  blocks.Held(1.0, {ToLowerAscii(d.timezone.empty() ? "unknown" : d.timezone) + ".",
                    ToLowerAscii(loc.country) + ".", ToLowerAscii(loc.market) + " market."});

  if (d.language.rfind("en", 0) == 0 &&
      !IsOneOf(loc.country, {"United States", "United Kingdom", "Canada", "Australia"})) {
    blocks.Held(1.3, {ToLowerAscii(d.language) + " speaker",
                      "in " + ToLowerAscii(loc.country) + ".",
                      "expat? digital nomad? remote worker?", "target international ads."});
  }

  const auto dev_fonts = FilterFonts(r.fingerprint.fonts, kExtendedDevFonts);
  const auto design_fonts = FilterFonts(r.fingerprint.fonts, kExtendedDesignFonts);
  if (!dev_fonts.empty() || !design_fonts.empty()) {
    std::vector<std::string> lines;
    if (!dev_fonts.empty()) {
      lines.push_back("fonts: " + JoinLower(dev_fonts, dev_fonts.size()) + ".");
      lines.push_back("=developer.");
    }
    if (!design_fonts.empty()) {
      lines.push_back("fonts: " + JoinLower(design_fonts, 3) + ".");
      lines.push_back("=designer too.");
    }
    blocks.Held(1.1, lines);
  }

  if (!r.profile.profession.all.empty()) {
    blocks.Held(1.0, ProfessionLines(r.profile.profession, r.profile.profession.all.size()));
  }

  blocks.Held(1.5, {ToLowerAscii(inc.bracket) + ".", "est. " + ToLowerAscii(inc.estimate) + ".",
                    "", "=sell premium ads?", "tech products. SaaS. creative tools."});

  const auto& cookies = r.extension.cookies;
  if (cookies && cookies->total > 0) {
    blocks.Held(1.3, {std::to_string(cookies->total) + " cookies found.",
                      std::to_string(cookies->tracker_count) + " belong to trackers.",
                      std::to_string(TrackerPercent(*cookies)) + "% of your cookies spy on you."});

    const auto& cat = cookies->by_category;
    if (cat.advertising > 0 || cat.social > 0) {
      blocks.Held(1.3, {std::to_string(cat.advertising) + " advertising cookies.",
                        std::to_string(cat.social) + " social media cookies.",
                        std::to_string(cat.data_brokers) + " data broker cookies.",
                        "building a profile to sell."});
    }

    if (!cookies->top_trackers.empty()) {
      std::vector<std::string> lines;
      for (size_t i = 0; i < cookies->top_trackers.size() && i < 5; ++i) {
        const auto& t = cookies->top_trackers[i];
        lines.push_back(t.domain + ": " + std::to_string(t.count) + " cookies.");
      }
      blocks.Held(1.2, lines);
    }

    if (cookies->lifetimes.zombie > 0) {
      blocks.Held(1.3, {std::to_string(cookies->lifetimes.zombie) + " zombie cookies.",
                        "survive clearing.", "they never forget you."});
    }

    bool any_social = false;
    std::vector<std::string> brokers;
    for (const auto& t : cookies->top_trackers) {
      if (t.category == "social") any_social = true;
      if (t.category == "data_brokers") brokers.push_back(t.domain);
    }
    if (any_social) {
      blocks.Held(1.3, {"facebook. instagram. twitter. linkedin.",
                        "tracking you outside their platforms.",
                        "your social graph is their product."});
    }
    if (!brokers.empty()) {
      blocks.Held(1.5, {util::Join(brokers, ". ") + ".", "device graph company.",
                        "cross-device tracking.", "your phone. your laptop. your tablet.",
                        "all linked."});
    }
  }

  blocks.Held(1.2, EntropyLines(r));

  blocks.Held(1.3, {"canvas: unique.", "audio: unique.", "GPU: unique.",
                    "every signal confirms:", "one person."});

  blocks.Held(1.0, ValuationLines(r.pricing));

  if (!r.pricing.factors.empty()) blocks.Held(1.0, FactorLines(r.pricing));

  blocks.Held(1.0, {"visitor ID:", r.DisplayVisitorId()});

  blocks.Held(1.2, {"collected in 1.4 seconds.", "no permission asked."});

  blocks.Held(1.5, {"classification:", "advertising commodity."});

  blocks.Held(2.5, {"you are the product."});
}

// =============================================================================
// dossier: fully data-conditional, scared timing
// =============================================================================

namespace {

void AddDeviceDetection(const ProfileRecord& r, const ProfileFacts& f, BlockList& blocks) {
  const auto& d = r.fingerprint.basic;
  const auto& parsed = r.profile.device.parsed;
  const std::string os_line = ToLowerAscii(NameVersion(parsed.os, parsed.os_version)) + ".";

  if (f.is_apple && !f.apple_chip.empty()) {
    blocks.Add({os_line, ToLowerAscii(f.apple_chip) + ".", "apple silicon."});
    blocks.Add({"premium hardware."}, Importance::kFlash);
  } else if (f.is_apple) {
    blocks.Add({os_line, "apple. intel era."});
    blocks.Add({"aging hardware. still premium brand."}, Importance::kFlash);
  } else if (f.is_windows && !f.nvidia_gpu.empty()) {
    blocks.Add({NameVersion("windows", parsed.os_version) + ".", ToLowerAscii(f.nvidia_gpu) + "."});
    if (f.nvidia_recent) {
      blocks.Add({"gaming rig. or workstation.", "either way: disposable income."});
    } else {
      blocks.Add({"mid-range GPU.", "practical. budget-conscious."});
    }
  } else if (f.is_windows && !f.amd_gpu.empty()) {
    blocks.Add({NameVersion("windows", parsed.os_version) + ".", ToLowerAscii(f.amd_gpu) + "."});
    blocks.Add({"AMD build. value-oriented."}, Importance::kFlash);
  } else if (f.is_windows) {
    blocks.Add({NameVersion("windows", parsed.os_version) + "."});
    if (f.high_memory && f.high_cores) {
      blocks.Add({"powerful machine. workstation class."});
    } else if (!f.high_memory) {
      blocks.Add({"standard hardware.", NumOr(d.device_memory_gb, "?") + "GB RAM.",
                  "consumer tier."});
    }
  } else if (f.is_linux) {
    blocks.Add({"linux."});
    blocks.Add({"technical subject.", "privacy-conscious? or just stubborn."});
  } else if (f.is_chromeos) {
    blocks.Add({"chromebook."});
    blocks.Add({"cloud-dependent. budget hardware.", "student? or minimalist."});
  } else if (parsed.os == "Android") {
    const std::string ram = "android. " + NumOr(d.device_memory_gb, "?") + "GB RAM.";
    if (f.high_memory) {
      blocks.Add({ram, "flagship device."});
    } else {
      blocks.Add({ram, "budget device.", "emerging market?"});
    }
  } else {
    blocks.Add({os_line});
  }
}

void AddFormFactor(const ProfileRecord& r, const ProfileFacts& f, BlockList& blocks) {
  const double touch = r.fingerprint.basic.max_touch_points.value_or(0.0);
  if (!f.is_mobile && f.has_webcam && f.has_mic && touch == 0.0) {
    blocks.Add({"webcam. microphone. no touch.",
                f.is_apple ? "=laptop. probably macbook." : "=laptop."});
  } else if (!f.is_mobile && !f.has_webcam && f.has_mic) {
    blocks.Add({"no webcam. external mic.", "desktop workstation."});
  } else if (f.is_mobile) {
    if (touch > 3) {
      blocks.Add({"multi-touch. " + FormatNumber(touch) + " contact points.", "mobile device."});
    } else {
      blocks.Add({"mobile device."}, Importance::kFlash);
    }
  }
}

void AddTechLiteracy(const ProfileRecord& r, BlockList& blocks) {
  const int score = r.profile.tech_literacy.score;
  const std::string head = "tech literacy: " + std::to_string(score) + "/100.";
  if (score >= 80) {
    blocks.Add({head, "expert level."});
    blocks.Add({"knows shortcuts. skips tutorials.", "reads documentation. for fun."});
    blocks.Add({"harder to monetize.", "resistant to clickbait."}, Importance::kFlash);
  } else if (score >= 60) {
    blocks.Add({head, "above average."});
    blocks.Add({"will research before purchasing.", "serve comparison ads. reviews."});
  } else if (score >= 40) {
    blocks.Add({head, "average user."});
    blocks.Add({"standard targeting effective."}, Importance::kFlash);
  } else {
    blocks.Add({head, "below average."});
    blocks.Add({"susceptible to urgency tactics.", "\"limited time offer\" works here."});
  }
}

void AddBrowserPosture(const ProfileRecord& r, const ProfileFacts& f, BlockList& blocks) {
  const auto& parsed = r.profile.device.parsed;
  if (f.is_brave) {
    blocks.Add({"brave browser.", "privacy-focused. actively hiding."});
    blocks.Add({"still visible. still trackable.", "the fingerprint doesn't lie."},
               Importance::kLinger);
  } else if (f.is_firefox) {
    blocks.Add({"firefox.", f.do_not_track ? "do-not-track: enabled." : "no do-not-track."});
    if (f.do_not_track) {
      blocks.Add({"irony: DNT makes the fingerprint more unique.",
                  "trying to hide. standing out instead."});
    }
  } else if (f.is_safari) {
    blocks.Add({"safari.", "some built-in protections."});
    blocks.Add({"apple's privacy theater.", "enough to feel safe. not enough to be safe."});
  } else if (f.is_chrome) {
    blocks.Add({NameVersion("chrome", parsed.browser_version) + ".",
                f.cookies_enabled ? "cookies: enabled." : "cookies: blocked.",
                f.do_not_track ? "do-not-track: on." : "no do-not-track."});
    if (!f.do_not_track && f.cookies_enabled) {
      blocks.Add({"default settings. no resistance."}, Importance::kFlash);
      blocks.Add({"thinks incognito means invisible."}, Importance::kFlash);
    }
  } else {
    blocks.Add({ToLowerAscii(NameVersion(parsed.browser, parsed.browser_version)) + "."});
  }
}

void AddHardware(const ProfileRecord& r, const ProfileFacts& f, BlockList& blocks) {
  const auto& d = r.fingerprint.basic;
  std::vector<std::string> hw;
  if (d.hardware_concurrency && *d.hardware_concurrency != 0.0) {
    hw.push_back(FormatNumber(*d.hardware_concurrency) + " cores.");
  }
  if (d.device_memory_gb && *d.device_memory_gb != 0.0) {
    hw.push_back(FormatNumber(*d.device_memory_gb) + "GB RAM.");
  }
  if (!hw.empty()) blocks.Add({util::Join(hw, " ")});

  if (d.screen_width && *d.screen_width != 0.0 && d.screen_height && *d.screen_height != 0.0) {
    const double dpr = (d.device_pixel_ratio && *d.device_pixel_ratio != 0.0) ? *d.device_pixel_ratio : 1.0;
    blocks.Add({FormatNumber(*d.screen_width) + kTimes + FormatNumber(*d.screen_height) + " @" +
                FormatNumber(dpr) + "x."});
  }

  if (f.wide_color && f.retina) {
    blocks.Add({FormatNumber(*d.color_depth) + "-bit color. wide gamut. HDR.",
                "professional-grade display."});
    blocks.Add({"content creator? photographer? designer?"}, Importance::kFlash);
  } else if (f.retina) {
    blocks.Add({"retina display.", f.is_premium ? "premium screen." : "consumer retina."},
               Importance::kFlash);
  } else if (d.color_depth && *d.color_depth != 0.0) {
    blocks.Add({FormatNumber(*d.color_depth) + "-bit. standard display."}, Importance::kFlash);
  }
}

void AddBattery(const ProfileRecord& r, BlockList& blocks) {
  const auto& battery = r.fingerprint.battery;
  if (!battery) return;
  const int pct = static_cast<int>(util::RoundHalfUp(battery->level * 100.0));
  const std::string head = "battery: " + std::to_string(pct) + "%.";
  if (battery->charging) {
    blocks.Add({head + " charging.", "plugged in. stationary."});
    blocks.Add({"settled in. not going anywhere."}, Importance::kFlash);
  } else if (pct <= 20) {
    blocks.Add({head + " not charging.", "running low. will leave soon."});
    blocks.Add({"limited window. act fast."}, Importance::kFlash);
  } else if (pct <= 50) {
    blocks.Add({head + " on battery.", "mobile. or forgot the charger."});
  } else {
    blocks.Add({head, "session could be long."});
  }
}

void AddTimeOfDay(const ProfileFacts& f, BlockList& blocks) {
  if (!f.local_time) return;
  const int h = f.local_time->hour;
  const std::string head = ClockString(*f.local_time) + " local time.";
  if (h < 5) {
    blocks.Add({head, "deep night."});
    blocks.Add({"impulse control lowest between midnight and 4am.", "increase bid."},
               Importance::kLinger);
  } else if (h >= 22 || h == 5) {
    blocks.Add({head, "late night."});
    blocks.Add({"can't sleep? or won't sleep?", "late night purchases convert 40% better."},
               Importance::kLinger);
  } else if (h < 9) {
    blocks.Add({head, "early session."});
    blocks.Add({"routine browser. habitual.", "serve morning news. coffee ads."});
  } else if (h < 12) {
    blocks.Add({head, "morning. work hours."});
    blocks.Add({"should be working. procrastinating.", "receptive to distractions."});
  } else if (h < 14) {
    blocks.Add({head, "lunch break."});
    blocks.Add({"free time. browsing. shopping.", "food delivery ads? retail?"});
  } else if (h < 17) {
    blocks.Add({head, "afternoon slump."});
    blocks.Add({"attention fading. easier to convert."}, Importance::kFlash);
  } else if (h < 20) {
    blocks.Add({head, "evening."});
    blocks.Add({"decision fatigue setting in.", "emotional purchases peak now."});
  } else {
    blocks.Add({head, "late evening."});
    blocks.Add({"winding down. guard lowered."}, Importance::kFlash);
  }
}

void AddLocation(const ProfileRecord& r, BlockList& blocks) {
  const auto& d = r.fingerprint.basic;
  const auto& loc = r.profile.location;
  blocks.Add({ToLowerAscii(d.timezone.empty() ? "unknown timezone" : d.timezone) + ".",
              ToLowerAscii(loc.country) + ".", ToLowerAscii(loc.market) + " market."});

  const std::string lang = ToLowerAscii(d.language.substr(0, 2));
  const bool english_abroad =
      lang == "en" && !IsOneOf(loc.country, {"United States", "United Kingdom", "Canada",
                                             "Australia", "Ireland", "New Zealand"});
  const bool foreign_in_anglosphere =
      !d.language.empty() && lang != "en" &&
      IsOneOf(loc.country, {"United States", "United Kingdom", "Canada", "Australia"});

  if (english_abroad) {
    blocks.Add({"english speaker in " + ToLowerAscii(loc.country) + ".",
                "expatriate? remote worker? digital nomad?"});
    blocks.Add({"probably misses home.", "show airline ads. relocation services."});
  } else if (foreign_in_anglosphere) {
    blocks.Add({ToLowerAscii(d.language) + " speaker in " + ToLowerAscii(loc.country) + ".",
                "immigrant? international student?"});
    blocks.Add({"target with community services.", "language learning ads."});
  }
}

void AddFontForensics(const ProfileRecord& r, BlockList& blocks) {
  const auto& fonts = r.fingerprint.fonts;
  const auto design = FilterFonts(fonts, kDesignFonts);
  const auto dev = FilterFonts(fonts, kDevFonts);
  const auto adobe = FilterFonts(fonts, kAdobeFonts);

  if (!dev.empty() && !design.empty()) {
    blocks.Add({"developer fonts: " + JoinLower(dev, 2) + ".",
                "design fonts: " + JoinLower(design, 2) + "."});
    blocks.Add({"builds things AND makes them pretty.", "rare combination. high value."});
  } else if (!dev.empty()) {
    blocks.Add({"developer fonts detected.", JoinLower(dev, 3) + "."});
    blocks.Add({"writes code."}, Importance::kFlash);
  } else if (!design.empty()) {
    blocks.Add({"design fonts detected.", JoinLower(design, 3) + "."});
    blocks.Add({"visual professional."}, Importance::kFlash);
  } else if (!adobe.empty()) {
    blocks.Add({"adobe creative suite fonts.", "creative professional."});
  } else if (fonts.size() > 20) {
    blocks.Add({std::to_string(fonts.size()) + " fonts installed.",
                "above average. creative field?"});
  }
}

void AddIncome(const ProfileRecord& r, BlockList& blocks) {
  const auto& inc = r.profile.income;
  const std::string est = "est. " + ToLowerAscii(inc.estimate) + ".";
  if (inc.bracket == "High" || inc.bracket == "Upper-Middle") {
    blocks.Add({ToLowerAscii(inc.bracket) + " income.", est});
    blocks.Add({"premium ad inventory.", "luxury brands. SaaS. investment products."});
    blocks.Add({"could afford to say no.", "", "doesn't."}, Importance::kLinger);
  } else if (inc.bracket == "Middle") {
    blocks.Add({"middle income.", est});
    blocks.Add({"volume target.", "discount codes. subscription trials. loyalty programs."});
  } else {
    blocks.Add({"lower income bracket.", est});
    blocks.Add({"cost-sensitive.", "payday loan ads. buy-now-pay-later.",
                "predatory? effective."});
  }
}

void AddConnection(const ProfileRecord& r, BlockList& blocks) {
  const auto& d = r.fingerprint.basic;
  const std::string& type = d.connection_type;
  if (type.empty()) return;
  const double downlink = d.connection_downlink_mbps.value_or(0.0);
  if (type == "4g" && downlink > 5) {
    blocks.Add({"fast connection. " + FormatNumber(downlink) + " mbps.",
                "serve rich media. video ads. interactive."});
  } else if (type == "4g") {
    blocks.Add({type + ". " + NumOr(d.connection_downlink_mbps, "?") + " mbps."},
               Importance::kFlash);
  } else if (type == "3g" || type == "2g") {
    blocks.Add({"slow connection. " + type + ".", "text-only ads. lightweight creatives."});
    if (d.connection_save_data) {
      blocks.Add({"data saver enabled. cost-conscious."}, Importance::kFlash);
    }
  }
}

void AddCookieSurveillance(const ProfileRecord& r, BlockList& blocks) {
  const auto& cookies = r.extension.cookies;
  if (!cookies || cookies->total <= 0) return;

  blocks.Add({std::to_string(cookies->total) + " cookies found.",
              std::to_string(cookies->tracker_count) + " belong to known trackers.",
              std::to_string(TrackerPercent(*cookies)) + "% surveillance."});

  blocks.Add({"subject agreed to this.", "somewhere in a terms of service.",
              "subject didn't read it."},
             Importance::kLinger);

  const auto& cat = cookies->by_category;
  std::vector<std::string> breakdown;
  if (cat.advertising > 0) breakdown.push_back(std::to_string(cat.advertising) + " advertising.");
  if (cat.social > 0) breakdown.push_back(std::to_string(cat.social) + " social media.");
  if (cat.data_brokers > 0) {
    breakdown.push_back(std::to_string(cat.data_brokers) + " data brokers.");
  }
  if (!breakdown.empty()) blocks.Add(breakdown);

  const auto& top = cookies->top_trackers;
  if (!top.empty()) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < top.size() && i < 5; ++i) {
      lines.push_back(top[i].domain + ": " + std::to_string(top[i].count) + ".");
    }
    blocks.Add(lines);
  }

  const int zombies = cookies->lifetimes.zombie;
  if (zombies > 0) {
    blocks.Add({std::to_string(zombies) + " zombie cookies.", "survive clearing. regenerate."});
    blocks.Add({"deleted cookies last week?", "", "they came back."}, Importance::kLinger);
  }

  std::vector<std::string> social;
  std::vector<std::string> brokers;
  for (const auto& t : top) {
    if (t.category == "social") social.push_back(util::ReplaceFirst(t.domain, ".com", ""));
    if (t.category == "data_brokers") brokers.push_back(t.domain);
  }
  if (social.size() >= 2) {
    blocks.Add({util::Join(social, ". ") + ".", "tracking outside their platforms.",
                "the social graph is the product."});
  }
  if (!brokers.empty()) {
    blocks.Add({util::Join(brokers, ". ") + ".", "device graph company.",
                "phone. laptop. tablet. all linked."},
               Importance::kLinger);
  }
}

void AddEntropy(const ProfileRecord& r, BlockList& blocks) {
  const double bits = r.entropy.total_bits;
  const std::string fixed = FormatFixed(bits, 1);
  const std::string percent = FormatNumber(r.uniqueness.percent);
  if (bits > 50) {
    blocks.Add({fixed + " bits of entropy.", "extremely unique."});
    blocks.Add({"identifiable among " + r.uniqueness.population_size + ".", percent + "%."});
  } else if (bits > 30) {
    blocks.Add({fixed + " bits of entropy.", "highly unique."});
    blocks.Add({percent + "% identifiable."}, Importance::kFlash);
  } else if (bits > 15) {
    blocks.Add({fixed + " bits.", "moderately unique.",
                "combined with other signals: identifiable."});
  } else {
    blocks.Add({fixed + " bits.", "common profile.", "harder to single out. but not impossible."});
  }

  blocks.Add({"canvas: unique.", "audio: unique.", "GPU: unique.",
              "every signal confirms: one subject."});
  blocks.Add({"needle in a haystack?", "", "subject IS the needle."}, Importance::kLinger);
}

}  // namespace

void ComposeDossierBlocks(const ProfileRecord& r, std::vector<Block>* out) {
  BlockList blocks(out);
  const ProfileFacts facts = DeriveProfileFacts(r);

  blocks.Add({"scanning."});

  AddDeviceDetection(r, facts, blocks);
  AddFormFactor(r, facts, blocks);
  AddTechLiteracy(r, blocks);
  AddBrowserPosture(r, facts, blocks);
  AddHardware(r, facts, blocks);
  AddBattery(r, blocks);
  AddTimeOfDay(facts, blocks);
  AddLocation(r, blocks);
  AddFontForensics(r, blocks);

  if (!r.profile.profession.all.empty()) {
    blocks.Add(ProfessionLines(r.profile.profession, 3));
  }

  AddIncome(r, blocks);
  AddConnection(r, blocks);
  AddCookieSurveillance(r, blocks);
  AddEntropy(r, blocks);

  blocks.Add(ValuationLines(r.pricing));
  blocks.Add({"less than a coffee.", "but thousands of times a day."});
  if (!r.pricing.factors.empty()) blocks.Add(FactorLines(r.pricing));

  // Identification: the voice turns.
  blocks.Add({"subject fully profiled."}, Importance::kFlash);
  blocks.Add({"we gave it a name.", "it didn't choose it."});
  blocks.Add({"visitor ID:", r.DisplayVisitorId()});
  blocks.Add({"collected in seconds.", "no permission required."});

  // Ending: addressed to "you".
  blocks.Add({"classification:", "advertising commodity."}, Importance::kLinger);
  blocks.Add({"filed. indexed. sold.", "again and again and again."}, Importance::kLinger);
  blocks.Add({"you can close this tab.", "", "we already have what we need."},
             Importance::kLinger);
  blocks.Add({"you are the product."}, Importance::kLinger);
}

// =============================================================================
// reel: six full-frame scenes
// =============================================================================

namespace {

std::vector<IdentityRow> DeriveIdentityRows(const ProfileRecord& r) {
  const auto& d = r.fingerprint.basic;
  const auto& p = r.profile;
  std::vector<IdentityRow> rows;
  rows.push_back({"DEVICE", p.device.device_guess + " (" + p.device.device_tier + " tier)"});
  rows.push_back({"OPERATING SYSTEM",
                  NameVersion(p.device.parsed.os, p.device.parsed.os_version) + " - " +
                      NameVersion(p.device.parsed.browser, p.device.parsed.browser_version)});
  rows.push_back({"LOCATION", (p.location.region.empty() ? "" : p.location.region + ", ") +
                                  p.location.country + " (" + p.location.market + " market)"});
  rows.push_back({"INCOME ESTIMATE", p.income.bracket + " - est. " + p.income.estimate});
  if (!p.profession.primary.empty()) rows.push_back({"PROFESSION", p.profession.primary});
  rows.push_back({"TECH LITERACY", (p.tech_literacy.level.empty() ? "" : p.tech_literacy.level + " ") +
                                       "(" + std::to_string(p.tech_literacy.score) + "/100)"});
  rows.push_back({"HARDWARE", std::string(d.hardware_concurrency.value_or(0.0) >= 8
                                              ? "High-performance"
                                              : "Standard") +
                                  " machine - " +
                                  (d.device_memory_gb.value_or(0.0) >= 8 ? "power user hardware"
                                                                         : "consumer hardware")});
  rows.push_back({"CONNECTION",
                  d.connection_type == "4g"
                      ? "Fast connection - likely home/office WiFi or good mobile"
                      : (d.connection_type.empty() ? "Standard connection" : d.connection_type)});
  rows.push_back({"PRIVACY SIGNALS",
                  d.do_not_track == "1"
                      ? "Privacy-conscious (irony: DNT makes you more unique)"
                      : "Standard tracking profile - no privacy measures detected"});
  rows.push_back({"DISPLAY", d.device_pixel_ratio.value_or(0.0) >= 2
                                 ? "Retina/HiDPI display - premium device"
                                 : "Standard display"});
  return rows;
}

std::string Slice(const std::string& s, size_t begin, size_t end) {
  const std::string head = util::Utf8Prefix(s, end);
  const std::string skip = util::Utf8Prefix(head, begin);
  return head.substr(skip.size());
}

}  // namespace

void ComposeReelBlocks(const ProfileRecord& r, std::vector<Block>* out) {
  BlockList blocks(out);

  blocks.AddScene(EmergenceScene{}, 90);

  IdentityScene identity;
  if (!r.profile.inferences.empty()) {
    for (const auto& inf : r.profile.inferences) {
      identity.rows.push_back({util::ToUpperAscii(inf.category), inf.inference});
    }
  } else {
    identity.rows = DeriveIdentityRows(r);
  }
  blocks.AddScene(identity, 180);

  EntropyConstellationScene entropy;
  entropy.total_bits = r.entropy.total_bits;
  for (const auto& c : r.entropy.Present()) {
    if (entropy.bars.size() == 10) break;
    entropy.bars.push_back({c.label, c.bits});
    entropy.max_bits = std::max(entropy.max_bits, c.bits);
  }
  entropy.uniqueness_percent = r.uniqueness.percent;
  entropy.uniqueness_description = r.uniqueness.description;
  blocks.AddScene(entropy, 150);

  ValuationScene valuation;
  valuation.cpm = r.pricing.cpm;
  for (size_t i = 0; i < r.pricing.factors.size() && i < 6; ++i) {
    valuation.factors.push_back({r.pricing.factors[i].label, r.pricing.factors[i].effect});
  }
  blocks.AddScene(valuation, 135);

  const auto& d = r.fingerprint.basic;
  DataRainScene rain;
  const std::vector<std::string> candidates = {
      util::Utf8Prefix(d.user_agent, 60),
      Slice(r.fingerprint.canvas_hash, 20, 60),
      util::Utf8Prefix(r.fingerprint.gpu_renderer, 50),
      r.fingerprint.audio_hash,
      util::Utf8Prefix(util::Join(r.fingerprint.fonts, " / "), 80),
      d.timezone,
      (d.screen_width && d.screen_height)
          ? FormatNumber(*d.screen_width) + "x" + FormatNumber(*d.screen_height)
          : std::string(),
      NumOr(d.hardware_concurrency, ""),
  };
  for (const auto& c : candidates) {
    if (!c.empty()) rain.columns.push_back(c);
  }
  rain.signal_count = static_cast<int>(r.fingerprint.fonts.size());
  blocks.AddScene(rain, 90);

  blocks.AddScene(OutroScene{}, 120);
}

}  // namespace dossier::timeline
