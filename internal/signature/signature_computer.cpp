#include "signature_computer.hpp"

#include <arrow/io/file.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>

#include "internal/storage/artifact_directory.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace labbook::signature {

using labbook::model::Signature;
using labbook::storage::common::Unwrap;

namespace {

constexpr int64_t kReadChunkBytes = 1 << 20;

class Sha512 {
 public:
  Sha512() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha512(), nullptr) != 1) {
      throw std::runtime_error("sha512: digest init failed");
    }
  }

  void Update(const void* data, std::size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("sha512: digest update failed");
    }
  }

  void Update(std::string_view bytes) {
    Update(bytes.data(), bytes.size());
  }

  // Length-prefixed so that adjacent variable-length fields cannot alias.
  void UpdateField(std::string_view bytes) {
    std::uint8_t length[8];
    auto         n = static_cast<std::uint64_t>(bytes.size());
    for (auto& b : length) {
      b = static_cast<std::uint8_t>(n & 0xFF);
      n >>= 8;
    }
    Update(length, sizeof(length));
    Update(bytes);
  }

  Signature Finish() {
    Signature::Bytes bytes{};
    unsigned int     size = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), bytes.data(), &size) != 1 || size != Signature::kSize) {
      throw std::runtime_error("sha512: digest final failed");
    }
    return Signature(bytes);
  }

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

Signature DigestFile(const std::filesystem::path& path) {
  const auto context = "read " + path.string();
  auto       file    = Unwrap(arrow::io::ReadableFile::Open(path.string()), context);

  Sha512 sha;
  while (true) {
    auto chunk = Unwrap(file->Read(kReadChunkBytes), context);
    if (chunk->size() == 0) break;
    sha.Update(chunk->data(), static_cast<std::size_t>(chunk->size()));
  }
  Unwrap(file->Close(), context);
  return sha.Finish();
}

} // namespace

Signature SignatureComputer::Compute(const std::filesystem::path& root, std::vector<std::string> relative_paths) {
  for (auto& relative : relative_paths) {
    relative = std::filesystem::path(relative).lexically_normal().generic_string();
  }
  std::sort(relative_paths.begin(), relative_paths.end());
  relative_paths.erase(std::unique(relative_paths.begin(), relative_paths.end()), relative_paths.end());

  Sha512 combined;
  for (const auto& relative : relative_paths) {
    const auto digest = DigestFile(root / relative);
    combined.UpdateField(relative);
    combined.Update(digest.bytes().data(), digest.bytes().size());
  }
  return combined.Finish();
}

Signature SignatureComputer::Compute(std::string_view content) {
  Sha512 sha;
  sha.Update(content);
  return sha.Finish();
}

Signature SignatureComputer::ComputeDirectory(const storage::ArtifactDirectory& directory) {
  return Compute(directory.root(), directory.ListDataFiles());
}

Signature SignatureComputer::Combine(const Signature& signature, std::string_view label) {
  if (signature.empty()) {
    throw std::invalid_argument("signature: cannot bind a label to the empty signature");
  }

  Sha512 sha;
  sha.Update(signature.bytes().data(), signature.bytes().size());
  sha.UpdateField(label);
  return sha.Finish();
}

} // namespace labbook::signature
