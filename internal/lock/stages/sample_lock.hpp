#pragma once

#include <memory>
#include <string>

#include "internal/lock/lock_manager.hpp"
#include "internal/lock/stages/corpus_lock.hpp"
#include "internal/storage/artifact_directory.hpp"

namespace labbook::lock {

/*
  A named sample drawn from the corpus.

  Signature covers every data file in the sample and the sample's name, so two
  samples with the same files but different names are not interchangeable.
*/
class SampleLock final : public LockManager {
 public:
  SampleLock(std::filesystem::path root, std::string sample_name, std::shared_ptr<const CorpusLock> corpus, LockStoreOptions options = {});

  const std::string& Name() const override {
    return name_;
  }
  model::StageKind Kind() const override {
    return model::StageKind::kSample;
  }
  const std::filesystem::path& Root() const override {
    return root_;
  }
  const std::string& SampleName() const {
    return sample_name_;
  }

  std::vector<LockManagerPtr> Dependencies() const override {
    return {corpus_};
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
  std::string                       sample_name_;
  std::shared_ptr<const CorpusLock> corpus_;
  LockStore                         store_;
  storage::ArtifactDirectory        artifacts_;
};

} // namespace labbook::lock
