#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/signature.hpp"

namespace labbook::storage {
class ArtifactDirectory;
}

namespace labbook::signature {

/*
  Deterministic SHA-512 signatures over file sets and byte buffers.

  File sets are order-independent: paths are normalized and sorted before
  hashing. Each file is digested on its own and the combined digest covers
  (path, file digest) pairs, so adding, removing, renaming or editing a file
  changes the result.

  No side effects. Unreadable files raise util::IOError.
*/
class SignatureComputer {
 public:
  static model::Signature Compute(const std::filesystem::path& root, std::vector<std::string> relative_paths);
  static model::Signature Compute(std::string_view content);

  // Every data file currently in `directory`.
  static model::Signature ComputeDirectory(const storage::ArtifactDirectory& directory);

  // Binds a label (e.g. a sample name) into an existing signature.
  static model::Signature Combine(const model::Signature& signature, std::string_view label);
};

} // namespace labbook::signature
