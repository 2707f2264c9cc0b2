#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace labbook::storage {

/*
  Read-only view of a stage's artifact root.

  "Data files" are all regular files below the root, recursively, except the
  stage's own bookkeeping files (lock file and its in-flight temp file).
*/
class ArtifactDirectory {
 public:
  ArtifactDirectory(std::filesystem::path root, std::vector<std::string> excluded_names);

  const std::filesystem::path& root() const {
    return root_;
  }

  // Relative paths in generic ('/') form, sorted bytewise. Throws IOError if
  // the root is missing or cannot be listed.
  std::vector<std::string> ListDataFiles() const;

 private:
  bool IsExcluded(const std::string& relative) const;

  std::filesystem::path    root_;
  std::vector<std::string> excluded_names_;
};

} // namespace labbook::storage
