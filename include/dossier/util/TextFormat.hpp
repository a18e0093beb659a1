// Repository: Dossier-render
// Component: Text Formatting
// Purpose: Number and string formatting used by monologue lines and overlays.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_UTIL_TEXT_FORMAT_HPP_
#define DOSSIER_UTIL_TEXT_FORMAT_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace dossier::util {

// Half-up rounding (x.5 rounds toward +inf).
double RoundHalfUp(double v);

// Fixed-point with `digits` decimals, half-up: FormatFixed(34.25, 1) == "34.3".
std::string FormatFixed(double v, int digits);

// Shortest natural rendering: 8 → "8", 0.5 → "0.5", 1.25 → "1.25".
std::string FormatNumber(double v);

// ASCII-only lowercase / uppercase; multi-byte UTF-8 sequences pass through.
std::string ToLowerAscii(const std::string& s);
std::string ToUpperAscii(const std::string& s);

std::string Join(const std::vector<std::string>& parts, const std::string& sep);

// Replaces the first occurrence only.
std::string ReplaceFirst(const std::string& s, const std::string& from, const std::string& to);

std::string PadLeft(const std::string& s, size_t width, char fill);

// Decodes UTF-8 to code points; malformed bytes map to U+FFFD.
std::vector<uint32_t> DecodeUtf8(const std::string& s);

// One code point as UTF-8; invalid values become U+FFFD.
std::string EncodeUtf8(uint32_t cp);

// Number of code points; used for per-character effects.
size_t Utf8Length(const std::string& s);

// First `count` code points.
std::string Utf8Prefix(const std::string& s, size_t count);

}  // namespace dossier::util

#endif  // DOSSIER_UTIL_TEXT_FORMAT_HPP_
