#include "config_lock.hpp"

#include <stdexcept>

#include "internal/signature/signature_computer.hpp"

namespace labbook::lock {

ConfigLock::ConfigLock(std::filesystem::path root, std::shared_ptr<const SampleLock> sample, LockStoreOptions options)
    : name_(model::StageKindName(model::StageKind::kConfig)),
      root_(std::move(root)),
      sample_(std::move(sample)),
      store_(root_, std::move(options)),
      artifacts_(root_, store_.BookkeepingNames()) {
  if (!sample_) {
    throw std::invalid_argument("config stage requires a sample");
  }
}

model::SignatureMap ConfigLock::DependencySignatures() const {
  return LiveSignatures(Dependencies());
}

model::Signature ConfigLock::Signature() const {
  return signature::SignatureComputer::ComputeDirectory(artifacts_);
}

bool ConfigLock::IsLocked() const {
  return store_.Exists();
}

} // namespace labbook::lock
