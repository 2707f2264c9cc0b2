#include "experiment_lock.hpp"

#include <stdexcept>

namespace labbook::lock {

ExperimentLock::ExperimentLock(std::filesystem::path root, std::shared_ptr<const ConfigLock> config, std::shared_ptr<const SampleLock> sample,
                               LockStoreOptions options)
    : name_(model::StageKindName(model::StageKind::kExperiment)),
      root_(std::move(root)),
      config_(std::move(config)),
      sample_(std::move(sample)),
      store_(root_, std::move(options)) {
  if (!config_ || !sample_) {
    throw std::invalid_argument("experiment stage requires a config and a sample");
  }
}

model::SignatureMap ExperimentLock::DependencySignatures() const {
  return LiveSignatures(Dependencies());
}

bool ExperimentLock::IsLocked() const {
  return store_.Exists();
}

} // namespace labbook::lock
