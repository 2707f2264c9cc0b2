#pragma once

#include "internal/lock/lock_manager.hpp"
#include "internal/storage/artifact_directory.hpp"

namespace labbook::lock {

/*
  Root of the pipeline. Signature covers every data file in the corpus.
*/
class CorpusLock final : public LockManager {
 public:
  explicit CorpusLock(std::filesystem::path root, LockStoreOptions options = {});

  const std::string& Name() const override {
    return name_;
  }
  model::StageKind Kind() const override {
    return model::StageKind::kCorpus;
  }
  const std::filesystem::path& Root() const override {
    return root_;
  }

  std::vector<LockManagerPtr> Dependencies() const override {
    return {};
  }
  model::SignatureMap DependencySignatures() const override {
    return {};
  }
  model::Signature Signature() const override;
  bool             IsLocked() const override;

  const LockStore& Store() const override {
    return store_;
  }

 private:
  std::string                name_;
  std::filesystem::path      root_;
  LockStore                  store_;
  storage::ArtifactDirectory artifacts_;
};

} // namespace labbook::lock
