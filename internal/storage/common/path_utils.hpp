#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace labbook::storage::common {

inline constexpr const char* kDefaultLockFileName = "LOCKFILE";
inline constexpr const char* kTempSuffix          = ".tmp";

inline void ValidateLockFileName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("lock file name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("lock file name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("lock file name must not be a relative path component");
  }
}

inline std::filesystem::path LockFilePath(const std::filesystem::path& stage_root, const std::string& lock_file_name) {
  ValidateLockFileName(lock_file_name);
  return stage_root / lock_file_name;
}

inline std::filesystem::path TempPath(const std::filesystem::path& final_path) {
  return final_path.string() + kTempSuffix;
}

} // namespace labbook::storage::common
