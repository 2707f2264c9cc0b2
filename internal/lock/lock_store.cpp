#include "lock_store.hpp"

#include "internal/observability/logging.hpp"

namespace labbook::lock {

using labbook::observability::StringField;

LockStore::LockStore(std::filesystem::path stage_root, LockStoreOptions options)
    : stage_root_(std::move(stage_root)),
      options_(std::move(options)),
      file_(storage::common::LockFilePath(stage_root_, options_.file_name), options_.fsync) {
}

bool LockStore::Exists() const {
  return file_.Exists();
}

std::optional<LockRecord> LockStore::Load() const {
  auto bytes = file_.Read();
  if (!bytes) {
    return std::nullopt;
  }
  return ParseLockRecord(*bytes, path().string());
}

void LockStore::Save(const LockRecord& record) const {
  file_.Write(SerializeLockRecord(record));
  LABBOOK_LOG_INFO("lock record written", {StringField("path", path().string())});
}

std::optional<LockSnapshot> LockStore::Remove() const {
  auto bytes = file_.Read();
  if (!bytes) {
    return std::nullopt;
  }

  LockSnapshot snapshot;
  snapshot.record = ParseLockRecord(*bytes, path().string());
  snapshot.bytes  = std::move(*bytes);

  file_.Remove();
  LABBOOK_LOG_INFO("lock record removed", {StringField("path", path().string())});
  return snapshot;
}

void LockStore::Restore(const LockSnapshot& snapshot) const {
  file_.Write(snapshot.bytes);
  LABBOOK_LOG_INFO("lock record restored", {StringField("path", path().string())});
}

std::vector<std::string> LockStore::BookkeepingNames() const {
  return {options_.file_name, storage::common::TempPath(options_.file_name).string()};
}

} // namespace labbook::lock
