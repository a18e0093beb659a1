// Repository: Dossier-render
// Component: Atomic File Helpers
// Purpose: Temp-path naming, rename-on-success and cleanup for render artifacts.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_UTIL_ATOMIC_FILE_HPP_
#define DOSSIER_UTIL_ATOMIC_FILE_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace dossier::util {

// "<target>.partial.<pid>", in the same directory as the target so rename() stays
// on one filesystem.
std::string TempPathFor(const std::string& target_path);

// rename(temp, target). Returns false and fills *error on failure; the temp
// file is left in place so the caller can decide what to do with it.
bool CommitFile(const std::string& temp_path, const std::string& target_path,
                std::string* error);

// unlink(path); a missing file is not an error.
void DiscardFile(const std::string& path);

bool FileExists(const std::string& path);

// Size in bytes, or -1 when the file cannot be stat'ed.
int64_t FileSize(const std::string& path);

// Writes `bytes` to a temp path and renames it onto `path`.
bool WriteFileAtomically(const std::string& path, const std::vector<uint8_t>& bytes,
                         std::string* error);

bool ReadFile(const std::string& path, std::string* out);

// Unlinks the path on destruction unless Release() was called. Used to make
// sure partial encoder / mux output never survives an early return.
class ScopedFileRemover {
 public:
  explicit ScopedFileRemover(std::string path) : path_(std::move(path)) {}
  ~ScopedFileRemover() {
    if (!released_) DiscardFile(path_);
  }

  ScopedFileRemover(const ScopedFileRemover&) = delete;
  ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

  void Release() { released_ = true; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  bool released_ = false;
};

}  // namespace dossier::util

#endif  // DOSSIER_UTIL_ATOMIC_FILE_HPP_
