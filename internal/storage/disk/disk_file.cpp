#include "disk_file.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace labbook::storage {

using namespace labbook::storage::common;
using labbook::util::IOError;

namespace {

void SyncDescriptor(int fd, const std::string& what) {
  if (::fsync(fd) != 0) {
    throw IOError("fsync " + what + ": " + std::strerror(errno));
  }
}

/*
  Make a rename or unlink inside `dir` durable.
*/
void SyncDirectory(const std::filesystem::path& dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  const int  fd     = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw IOError("open directory " + target.string() + ": " + std::strerror(errno));
  }
  const int rc    = ::fsync(fd);
  const int saved = errno;
  ::close(fd);
  if (rc != 0) {
    throw IOError("fsync directory " + target.string() + ": " + std::strerror(saved));
  }
}

} // namespace

DiskFile::DiskFile(std::filesystem::path path, bool fsync) : path_(std::move(path)), fsync_(fsync) {
}

bool DiskFile::Exists() const {
  std::error_code ec;
  const bool      exists = std::filesystem::exists(path_, ec);
  if (ec) {
    throw IOError("stat " + path_.string() + ": " + ec.message());
  }
  return exists;
}

std::optional<std::string> DiskFile::Read() const {
  if (!Exists()) {
    return std::nullopt;
  }

  const auto context = "read " + path_.string();
  auto       file    = Unwrap(arrow::io::ReadableFile::Open(path_.string()), context);
  auto       buffer  = ReadAll(file, context);
  Unwrap(file->Close(), context);
  return buffer->ToString();
}

/*
  Atomic write:
      write tmp -> flush -> fsync -> rename -> fsync dir
*/
void DiskFile::Write(const std::string& bytes) const {
  const auto tmp_path = TempPath(path_);
  const auto context  = "write " + tmp_path.string();

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()), context);
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())), context);
    Unwrap(out->Flush(), context);

    if (fsync_)
      SyncDescriptor(out->file_descriptor(), tmp_path.string());

    Unwrap(out->Close(), context);
  } catch (const IOError&) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw IOError("rename " + tmp_path.string() + " -> " + path_.string() + ": " + ec.message());
  }

  if (fsync_)
    SyncDirectory(path_.parent_path());
}

bool DiskFile::Remove() const {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path_, ec);
  if (ec) {
    throw IOError("remove " + path_.string() + ": " + ec.message());
  }

  if (removed && fsync_)
    SyncDirectory(path_.parent_path());

  return removed;
}

} // namespace labbook::storage
