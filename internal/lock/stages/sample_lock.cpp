#include "sample_lock.hpp"

#include <stdexcept>

#include "internal/signature/signature_computer.hpp"

namespace labbook::lock {

SampleLock::SampleLock(std::filesystem::path root, std::string sample_name, std::shared_ptr<const CorpusLock> corpus, LockStoreOptions options)
    : name_(model::StageKindName(model::StageKind::kSample)),
      root_(std::move(root)),
      sample_name_(std::move(sample_name)),
      corpus_(std::move(corpus)),
      store_(root_, std::move(options)),
      artifacts_(root_, store_.BookkeepingNames()) {
  if (sample_name_.empty()) {
    throw std::invalid_argument("sample stage requires a name");
  }
  if (!corpus_) {
    throw std::invalid_argument("sample stage requires a corpus");
  }
}

model::SignatureMap SampleLock::DependencySignatures() const {
  return LiveSignatures(Dependencies());
}

model::Signature SampleLock::Signature() const {
  const auto files = signature::SignatureComputer::ComputeDirectory(artifacts_);
  return signature::SignatureComputer::Combine(files, sample_name_);
}

bool SampleLock::IsLocked() const {
  return store_.Exists();
}

} // namespace labbook::lock
