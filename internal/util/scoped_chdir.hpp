#pragma once

#include <filesystem>

namespace labbook::util {

/*
  Switches the process working directory for the lifetime of the object and
  switches back on every exit path.

  The working directory is process-wide: only use this from the single thread
  that drives a stage.
*/
class ScopedChdir {
 public:
  // Throws IOError if the current directory cannot be read or `dir` cannot be entered.
  explicit ScopedChdir(const std::filesystem::path& dir);
  ~ScopedChdir();

  ScopedChdir(const ScopedChdir&)            = delete;
  ScopedChdir& operator=(const ScopedChdir&) = delete;

 private:
  std::filesystem::path previous_;
};

} // namespace labbook::util
