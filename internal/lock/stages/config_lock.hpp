#pragma once

#include <memory>

#include "internal/lock/lock_manager.hpp"
#include "internal/lock/stages/sample_lock.hpp"
#include "internal/storage/artifact_directory.hpp"

namespace labbook::lock {

/*
  Index configuration generated from a sample. Signature covers every file the
  configuration step generated.
*/
class ConfigLock final : public LockManager {
 public:
  ConfigLock(std::filesystem::path root, std::shared_ptr<const SampleLock> sample, LockStoreOptions options = {});

  const std::string& Name() const override {
    return name_;
  }
  model::StageKind Kind() const override {
    return model::StageKind::kConfig;
  }
  const std::filesystem::path& Root() const override {
    return root_;
  }

  std::vector<LockManagerPtr> Dependencies() const override {
    return {sample_};
  }
  model::SignatureMap DependencySignatures() const override;
  model::Signature    Signature() const override;
  bool                IsLocked() const override;

  const LockStore& Store() const override {
    return store_;
  }

 private:
  std::string                       name_;
  std::filesystem::path             root_;
  std::shared_ptr<const SampleLock> sample_;
  LockStore                         store_;
  storage::ArtifactDirectory        artifacts_;
};

} // namespace labbook::lock
