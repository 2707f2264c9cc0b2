#pragma once

#include <memory>

#include "internal/lock/lock_manager.hpp"
#include "internal/lock/stages/config_lock.hpp"
#include "internal/lock/stages/sample_lock.hpp"

namespace labbook::lock {

/*
  Terminal stage. Nothing depends on an experiment, so its own signature is
  empty and its validity is defined entirely by the config and sample it ran
  against.
*/
class ExperimentLock final : public LockManager {
 public:
  ExperimentLock(std::filesystem::path root, std::shared_ptr<const ConfigLock> config, std::shared_ptr<const SampleLock> sample,
                 LockStoreOptions options = {});

  const std::string& Name() const override {
    return name_;
  }
  model::StageKind Kind() const override {
    return model::StageKind::kExperiment;
  }
  const std::filesystem::path& Root() const override {
    return root_;
  }

  std::vector<LockManagerPtr> Dependencies() const override {
    return {config_, sample_};
  }
  model::SignatureMap DependencySignatures() const override;
  model::Signature    Signature() const override {
    return {};
  }
  bool IsLocked() const override;

  const LockStore& Store() const override {
    return store_;
  }

 private:
  std::string                       name_;
  std::filesystem::path             root_;
  std::shared_ptr<const ConfigLock> config_;
  std::shared_ptr<const SampleLock> sample_;
  LockStore                         store_;
};

} // namespace labbook::lock
