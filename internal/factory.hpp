#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/lock/lock_store.hpp"
#include "internal/lock/stages/config_lock.hpp"
#include "internal/lock/stages/corpus_lock.hpp"
#include "internal/lock/stages/experiment_lock.hpp"
#include "internal/lock/stages/sample_lock.hpp"
#include "internal/pipeline/stage_runner.hpp"
#include "internal/pipeline/stage_work.hpp"

namespace labbook::factory {

/*
  Pipeline

  Owns the four stage lock managers and the work that produces each stage.
  Everything here lives for the lifetime of the process.
*/
struct Pipeline {
  std::shared_ptr<const lock::CorpusLock>     corpus;
  std::shared_ptr<const lock::SampleLock>     sample;
  std::shared_ptr<const lock::ConfigLock>     config;
  std::shared_ptr<const lock::ExperimentLock> experiment;

  std::map<std::string, std::unique_ptr<pipeline::StageWork>> work;

  pipeline::RunOptions defaults;

  // Stages in dependency order.
  std::vector<lock::LockManagerPtr> Stages() const;

  // nullptr for an unknown stage name.
  lock::LockManagerPtr Find(const std::string& name) const;
  pipeline::StageWork* WorkFor(const std::string& name) const;
};

lock::LockStoreOptions LockOptionsFrom(const labbook::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the pipeline from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete stage work types.
*/
Pipeline Build(const labbook::runtime::config::RuntimeConfig& config);

} // namespace labbook::factory
