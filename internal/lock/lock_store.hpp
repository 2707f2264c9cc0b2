#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/lock/lock_record.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_file.hpp"

namespace labbook::lock {

struct LockStoreOptions {
  std::string file_name = storage::common::kDefaultLockFileName;
  bool        fsync     = true;
};

/*
  A removed lock record, kept so a failed run can put it back byte for byte.
*/
struct LockSnapshot {
  std::string bytes;
  LockRecord  record;
};

/*
  Reads, writes and removes the lock record of one stage root.

  Single writer per stage root; callers serialize runs on the same stage.
*/
class LockStore {
 public:
  explicit LockStore(std::filesystem::path stage_root, LockStoreOptions options = {});

  const std::filesystem::path& stage_root() const {
    return stage_root_;
  }
  const std::filesystem::path& path() const {
    return file_.path();
  }

  bool Exists() const;

  // nullopt when no record exists. Throws util::IOError if it cannot be read
  // or parsed.
  std::optional<LockRecord> Load() const;

  // Durable before returning.
  void Save(const LockRecord& record) const;

  // Durable removal. Returns the removed bytes, or nullopt if there was no record.
  std::optional<LockSnapshot> Remove() const;

  // Writes the snapshot bytes back verbatim.
  void Restore(const LockSnapshot& snapshot) const;

  // File names inside the stage root that are not stage artifacts.
  std::vector<std::string> BookkeepingNames() const;

 private:
  std::filesystem::path stage_root_;
  LockStoreOptions      options_;
  storage::DiskFile     file_;
};

} // namespace labbook::lock
