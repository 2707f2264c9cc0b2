#include "internal/lock/lock_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/signature/signature_computer.hpp"
#include "internal/util/errors.hpp"

namespace {

using labbook::lock::LockRecord;
using labbook::lock::LockStore;
using labbook::lock::LockStoreOptions;
using labbook::signature::SignatureComputer;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "labbook_lock_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

LockRecord MakeRecord(const std::string& seed) {
  LockRecord record;
  record.own_signature                   = SignatureComputer::Compute("own-" + seed);
  record.dependency_signatures["corpus"] = SignatureComputer::Compute("corpus-" + seed);
  return record;
}

void TestMissingRecordLoadsAsNullopt() {
  LockStore store(FreshDir("missing"));
  assert(!store.Exists());
  assert(!store.Load().has_value());
  assert(!store.Remove().has_value());
}

void TestSaveThenLoadRoundTrips() {
  const auto root = FreshDir("round_trip");
  LockStore  store(root);

  const auto record = MakeRecord("a");
  store.Save(record);

  assert(store.Exists());
  assert(store.path() == root / "LOCKFILE");
  assert(store.Load() == record);
  assert(!std::filesystem::exists(root / "LOCKFILE.tmp"));
}

void TestSaveReplacesWholeRecord() {
  LockStore store(FreshDir("replace"));
  store.Save(MakeRecord("a"));

  auto second = MakeRecord("b");
  second.dependency_signatures.clear();
  store.Save(second);

  const auto loaded = store.Load();
  assert(loaded.has_value());
  assert(loaded->dependency_signatures.empty());
  assert(*loaded == second);
}

void TestRemoveReturnsExactBytesAndRestorePutsThemBack() {
  const auto root = FreshDir("remove_restore");
  LockStore  store(root);

  // Hand-formatted content must come back byte for byte, not re-serialized.
  const auto hex      = SignatureComputer::Compute(std::string("corpus")).ToHex();
  const auto original = std::string("{\"ownSignature\":\"\",   \"dependencySignatures\":{\"corpus\":\"") + hex + "\"}}\n";
  {
    std::ofstream out(store.path(), std::ios::binary);
    out << original;
  }

  const auto snapshot = store.Remove();
  assert(snapshot.has_value());
  assert(snapshot->bytes == original);
  assert(snapshot->record.dependency_signatures.at("corpus").ToHex() == hex);
  assert(!store.Exists());

  store.Restore(*snapshot);
  assert(store.Exists());
  assert(ReadFile(store.path()) == original);
}

void TestCorruptRecordRaisesIOError() {
  const auto root = FreshDir("corrupt");
  LockStore  store(root);
  {
    std::ofstream out(store.path(), std::ios::binary);
    out << "{\"ownSignature\": \"trunc";
  }

  bool threw = false;
  try {
    (void)store.Load();
  } catch (const labbook::util::IOError&) {
    threw = true;
  }
  assert(threw && "an unreadable lock record must never be treated as valid or absent");
  assert(store.Exists());
}

void TestCustomFileNameAndNoFsync() {
  const auto       root = FreshDir("custom_name");
  LockStoreOptions options;
  options.file_name = "stage.lock";
  options.fsync     = false;

  LockStore store(root, options);
  store.Save(MakeRecord("c"));
  assert(std::filesystem::exists(root / "stage.lock"));
  assert(!std::filesystem::exists(root / "LOCKFILE"));

  const auto names = store.BookkeepingNames();
  assert(names.size() == 2);
  assert(names[0] == "stage.lock");
  assert(names[1] == "stage.lock.tmp");
}

void TestInvalidFileNameIsRejected() {
  LockStoreOptions options;
  options.file_name = "../escape";

  bool threw = false;
  try {
    LockStore store(FreshDir("invalid_name"), options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMissingRecordLoadsAsNullopt();
  TestSaveThenLoadRoundTrips();
  TestSaveReplacesWholeRecord();
  TestRemoveReturnsExactBytesAndRestorePutsThemBack();
  TestCorruptRecordRaisesIOError();
  TestCustomFileNameAndNoFsync();
  TestInvalidFileNameIsRejected();

  std::cout << "labbook_unit_lock_store: pass\n";
  return 0;
}
