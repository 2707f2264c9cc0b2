#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace labbook::storage {

/*
  One durable file on local disk, using Arrow IO.

  Properties:
    - atomic replace writes (tmp -> flush -> fsync -> rename -> fsync dir)
    - a reader sees the old bytes, no file, or the new bytes; never a partial write
    - fsync can be disabled for tests on tmpfs
*/
class DiskFile {
 public:
  DiskFile(std::filesystem::path path, bool fsync);

  const std::filesystem::path& path() const {
    return path_;
  }

  bool Exists() const;

  // Entire content, or nullopt when the file does not exist.
  std::optional<std::string> Read() const;

  void Write(const std::string& bytes) const;

  // Returns false when there was nothing to remove.
  bool Remove() const;

 private:
  std::filesystem::path path_;
  bool                  fsync_;
};

} // namespace labbook::storage
