#include "corpus_lock.hpp"

#include "internal/signature/signature_computer.hpp"

namespace labbook::lock {

CorpusLock::CorpusLock(std::filesystem::path root, LockStoreOptions options)
    : name_(model::StageKindName(model::StageKind::kCorpus)),
      root_(std::move(root)),
      store_(root_, std::move(options)),
      artifacts_(root_, store_.BookkeepingNames()) {
}

model::Signature CorpusLock::Signature() const {
  return signature::SignatureComputer::ComputeDirectory(artifacts_);
}

bool CorpusLock::IsLocked() const {
  return store_.Exists();
}

} // namespace labbook::lock
