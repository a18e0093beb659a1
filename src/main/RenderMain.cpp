// Repository: Dossier-render
// Component: dossier_render
// Purpose: Command-line entry point: profile JSON in, MP4 out.
// Copyright (c) 2025 Dossier
//
// Exit codes: 0 success, 1 usage, 2 input error, 3 encode failure,
// 4 interrupted.

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "dossier/session/RenderConfig.hpp"
#include "dossier/session/RenderSession.hpp"
#include "dossier/timeline/VariantConfig.hpp"
#include "dossier/util/Logger.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  dossier::session::RenderConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <input.json> [output.mp4] [OPTIONS]\n"
            << "\n"
            << "Renders a profile record into a narrated video.\n"
            << "\n"
            << "CONTENT:\n"
            << "  --variant NAME         classic | extended | dossier | reel (default: dossier)\n"
            << "  --no-backdrop          No network behind text blocks\n"
            << "  --world-seed N         Override the seed derived from the visitor ID\n"
            << "\n"
            << "PICTURE:\n"
            << "  --width N --height N   Frame size (default: 1920 1080)\n"
            << "  --fps N                Frame rate (default: 30)\n"
            << "  --font PATH            Display face (env DOSSIER_FONT)\n"
            << "  --mono-font PATH       Monospace face (env DOSSIER_MONO_FONT)\n"
            << "\n"
            << "ENCODING:\n"
            << "  --encoder PATH         Encoder binary (default: ffmpeg, env DOSSIER_ENCODER)\n"
            << "  --crf N                x264 quality, 0..51 (default: 18)\n"
            << "  --preset NAME          x264 preset (default: medium)\n"
            << "  --stall-timeout SEC    Give up when the encoder stops reading (default: 30)\n"
            << "\n"
            << "AUDIO:\n"
            << "  --no-audio             Deliver the silent video\n"
            << "  --sonifier CMD         Run 'CMD <silent.mp4> <out.wav>' instead of the synth\n"
            << "  --sonifier-timeout SEC Default: 300\n"
            << "  --mux-timeout SEC      Default: 60\n"
            << "\n"
            << "DIAGNOSTICS:\n"
            << "  --frame-csv PATH       Write per-frame CRC-32 fingerprints\n"
            << "  --dry-run              Print the block schedule, render nothing\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "Set DOSSIER_DEBUG=1 for encoder output and per-stage detail.\n";
}

bool ParseInt(const std::string& text, int64_t* out) {
  try {
    size_t used = 0;
    const long long v = std::stoll(text, &used);
    if (used != text.size()) return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  dossier::session::ApplyEnvironmentOverrides(&args.config);
  auto& cfg = args.config;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    auto int_flag = [&](int64_t* out) {
      if (!has_value || !ParseInt(argv[++i], out)) {
        args.error = arg + " needs an integer";
        return false;
      }
      return true;
    };
    int64_t n = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--variant" && has_value) {
      auto variant = dossier::timeline::ParseVariant(argv[++i]);
      if (!variant) {
        args.error = std::string("unknown variant: ") + argv[i];
        return args;
      }
      cfg.variant = *variant;
    } else if (arg == "--width" || arg == "--height" || arg == "--fps" || arg == "--crf") {
      if (!int_flag(&n)) return args;
      if (arg == "--width") cfg.width = static_cast<int>(n);
      else if (arg == "--height") cfg.height = static_cast<int>(n);
      else if (arg == "--fps") cfg.fps = static_cast<int>(n);
      else cfg.crf = static_cast<int>(n);
    } else if (arg == "--stall-timeout" || arg == "--sonifier-timeout" ||
               arg == "--mux-timeout") {
      if (!int_flag(&n)) return args;
      const std::chrono::milliseconds ms(n * 1000);
      if (arg == "--stall-timeout") cfg.stall_timeout = ms;
      else if (arg == "--sonifier-timeout") cfg.sonifier_timeout = ms;
      else cfg.mux_timeout = ms;
    } else if (arg == "--world-seed") {
      if (!int_flag(&n)) return args;
      cfg.world_seed = n;
    } else if (arg == "--font" && has_value) {
      cfg.display_font = argv[++i];
    } else if (arg == "--mono-font" && has_value) {
      cfg.mono_font = argv[++i];
    } else if (arg == "--encoder" && has_value) {
      cfg.encoder_path = argv[++i];
    } else if (arg == "--preset" && has_value) {
      cfg.preset = argv[++i];
    } else if (arg == "--sonifier" && has_value) {
      cfg.sonifier_command = argv[++i];
    } else if (arg == "--frame-csv" && has_value) {
      cfg.frame_csv_path = argv[++i];
    } else if (arg == "--no-audio") {
      cfg.audio = false;
    } else if (arg == "--no-backdrop") {
      cfg.backdrop = false;
    } else if (arg == "--dry-run") {
      cfg.dry_run = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "Unknown argument: " + arg;
      return args;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    args.error = "Must specify an input profile";
    return args;
  }
  if (positional.size() > 2) {
    args.error = "Too many arguments: " + positional[2];
    return args;
  }
  cfg.input_path = positional[0];
  if (positional.size() == 2) cfg.output_path = positional[1];

  args.valid = true;
  return args;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::unique_ptr<dossier::session::RenderSession> session;
  dossier::RenderResult created = dossier::session::RenderSession::Create(
      args.config, dossier::session::SessionDeps{}, &g_termination_requested, &session);
  if (!created.ok) {
    dossier::util::Logger::Error(std::string("[Render] ") +
                                 dossier::RenderErrorToString(created.error) + ": " +
                                 created.detail);
    return dossier::session::ExitCodeFor(created);
  }

  dossier::session::RenderOutcome outcome = session->Run();
  if (outcome.result.error == dossier::RenderError::kInterrupted) {
    dossier::util::Logger::Warn("[Render] interrupted; partial output removed");
  }
  return dossier::session::ExitCodeFor(outcome.result);
}
