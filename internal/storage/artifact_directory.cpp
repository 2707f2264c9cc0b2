#include "artifact_directory.hpp"

#include <arrow/filesystem/localfs.h>

#include <algorithm>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace labbook::storage {

using namespace labbook::storage::common;

namespace {

std::string AbsoluteBaseDir(const std::filesystem::path& root) {
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(root, ec);
  if (ec) {
    throw labbook::util::IOError("resolve " + root.string() + ": " + ec.message());
  }

  auto base = absolute.lexically_normal().generic_string();
  while (base.size() > 1 && base.back() == '/') {
    base.pop_back();
  }
  return base;
}

} // namespace

ArtifactDirectory::ArtifactDirectory(std::filesystem::path root, std::vector<std::string> excluded_names)
    : root_(std::move(root)), excluded_names_(std::move(excluded_names)) {
}

bool ArtifactDirectory::IsExcluded(const std::string& relative) const {
  // Bookkeeping files only live at the top of the stage root.
  return std::find(excluded_names_.begin(), excluded_names_.end(), relative) != excluded_names_.end();
}

std::vector<std::string> ArtifactDirectory::ListDataFiles() const {
  const auto base    = AbsoluteBaseDir(root_);
  const auto context = "list artifacts in " + base;

  arrow::fs::LocalFileSystem fs;
  arrow::fs::FileSelector    selector;
  selector.base_dir        = base;
  selector.recursive       = true;
  selector.allow_not_found = false;

  const auto infos = Unwrap(fs.GetFileInfo(selector), context);

  std::vector<std::string> files;
  files.reserve(infos.size());
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File) {
      continue;
    }

    auto relative = std::filesystem::path(info.path()).lexically_relative(base).generic_string();
    if (relative.empty() || *std::filesystem::path(relative).begin() == "..") {
      throw labbook::util::IOError(context + ": entry escapes stage root: " + info.path());
    }
    if (IsExcluded(relative)) {
      continue;
    }
    files.push_back(std::move(relative));
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace labbook::storage
