#include "factory.hpp"

#include <chrono>

#include "internal/model/stage.hpp"
#include "internal/runtime/process_stage_work.hpp"

namespace labbook::factory {

using labbook::model::StageKind;
using labbook::model::StageKindName;

namespace {

std::unique_ptr<pipeline::StageWork> MakeWork(StageKind kind, const labbook::runtime::config::StageConfig& stage) {
  std::vector<std::string> command(stage.command().begin(), stage.command().end());
  return std::make_unique<runtime::ProcessStageWork>(std::string(StageKindName(kind)), std::move(command),
                                                     std::chrono::seconds(stage.timeout_seconds()));
}

} // namespace

std::vector<lock::LockManagerPtr> Pipeline::Stages() const {
  return {corpus, sample, config, experiment};
}

lock::LockManagerPtr Pipeline::Find(const std::string& name) const {
  for (const auto& stage : Stages()) {
    if (stage && stage->Name() == name) {
      return stage;
    }
  }
  return nullptr;
}

pipeline::StageWork* Pipeline::WorkFor(const std::string& name) const {
  const auto it = work.find(name);
  return it == work.end() ? nullptr : it->second.get();
}

lock::LockStoreOptions LockOptionsFrom(const labbook::runtime::config::RuntimeConfig& config) {
  lock::LockStoreOptions options;
  if (!config.lock().file_name().empty()) {
    options.file_name = config.lock().file_name();
  }
  options.fsync = config.lock().has_fsync() ? config.lock().fsync() : true;
  return options;
}

Pipeline Build(const labbook::runtime::config::RuntimeConfig& config) {
  const auto& stages  = config.pipeline();
  const auto  options = LockOptionsFrom(config);

  Pipeline pipeline;
  pipeline.corpus     = std::make_shared<lock::CorpusLock>(stages.corpus().root(), options);
  pipeline.sample     = std::make_shared<lock::SampleLock>(stages.sample().root(), stages.sample().name(), pipeline.corpus, options);
  pipeline.config     = std::make_shared<lock::ConfigLock>(stages.config().root(), pipeline.sample, options);
  pipeline.experiment = std::make_shared<lock::ExperimentLock>(stages.experiment().root(), pipeline.config, pipeline.sample, options);

  pipeline.work[std::string(StageKindName(StageKind::kCorpus))]     = MakeWork(StageKind::kCorpus, stages.corpus());
  pipeline.work[std::string(StageKindName(StageKind::kSample))]     = MakeWork(StageKind::kSample, stages.sample());
  pipeline.work[std::string(StageKindName(StageKind::kConfig))]     = MakeWork(StageKind::kConfig, stages.config());
  pipeline.work[std::string(StageKindName(StageKind::kExperiment))] = MakeWork(StageKind::kExperiment, stages.experiment());

  pipeline.defaults.verify_own_signature = config.lock().has_verify_own_signature() ? config.lock().verify_own_signature() : true;
  return pipeline;
}

} // namespace labbook::factory
