// Repository: Dossier-render
// Component: Atomic File Helpers
// Purpose: Temp-path naming, rename-on-success and cleanup for render artifacts.
// Copyright (c) 2025 Dossier

#include "dossier/util/AtomicFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace dossier::util {

std::string TempPathFor(const std::string& target_path) {
  return target_path + ".partial." + std::to_string(static_cast<unsigned long>(getpid()));
}

bool CommitFile(const std::string& temp_path, const std::string& target_path,
                std::string* error) {
  if (std::rename(temp_path.c_str(), target_path.c_str()) != 0) {
    if (error) {
      *error = "rename " + temp_path + " -> " + target_path + ": " + std::strerror(errno);
    }
    return false;
  }
  return true;
}

void DiscardFile(const std::string& path) {
  if (path.empty()) return;
  (void)unlink(path.c_str());
}

bool FileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

int64_t FileSize(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) return -1;
  return static_cast<int64_t>(st.st_size);
}

bool WriteFileAtomically(const std::string& path, const std::vector<uint8_t>& bytes,
                         std::string* error) {
  const std::string tmp_path = TempPathFor(path);
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!of) {
      if (error) *error = "cannot open " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    of.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    of.flush();
    if (!of) {
      if (error) *error = "short write to " + tmp_path;
      of.close();
      DiscardFile(tmp_path);
      return false;
    }
  }
  if (!CommitFile(tmp_path, path, error)) {
    DiscardFile(tmp_path);
    return false;
  }
  return true;
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  *out = buffer.str();
  return true;
}

}  // namespace dossier::util
