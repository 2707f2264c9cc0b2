#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/runtime/process_stage_work.hpp"
#include "internal/util/errors.hpp"

namespace {

using labbook::model::RunState;
using labbook::pipeline::StageRunner;
using labbook::runtime::config::RuntimeConfig;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "labbook_factory_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void SetStage(labbook::runtime::config::StageConfig* stage, const std::filesystem::path& root, const std::string& script) {
  stage->set_root(root.string());
  stage->add_command("sh");
  stage->add_command("-c");
  stage->add_command(script);
}

RuntimeConfig MakeConfig(const std::filesystem::path& base) {
  RuntimeConfig config;
  config.mutable_lock()->set_fsync(false);

  auto* pipeline = config.mutable_pipeline();
  SetStage(pipeline->mutable_corpus(), base / "corpus", "printf 'doc one\\ndoc two\\n' > chunk-0");
  SetStage(pipeline->mutable_sample(), base / "sample", "head -n 1 ../corpus/chunk-0 > sample-0");
  SetStage(pipeline->mutable_config(), base / "config", "printf 'term,freq\\n' > DocFreqTable.csv");
  SetStage(pipeline->mutable_experiment(), base / "experiment", "cat ../config/DocFreqTable.csv > results.csv");
  pipeline->mutable_sample()->set_name("wiki-1k");
  return config;
}

void TestLockOptionsDefaults() {
  RuntimeConfig config;
  auto          options = labbook::factory::LockOptionsFrom(config);
  assert(options.file_name == "LOCKFILE");
  assert(options.fsync);

  config.mutable_lock()->set_file_name("stage.lock");
  config.mutable_lock()->set_fsync(false);
  options = labbook::factory::LockOptionsFrom(config);
  assert(options.file_name == "stage.lock");
  assert(!options.fsync);
}

void TestBuildWiresStagesInDependencyOrder() {
  const auto base     = FreshDir("wiring");
  auto       pipeline = labbook::factory::Build(MakeConfig(base));

  const auto stages = pipeline.Stages();
  assert(stages.size() == 4);
  assert(stages[0]->Name() == "corpus");
  assert(stages[1]->Name() == "sample");
  assert(stages[2]->Name() == "config");
  assert(stages[3]->Name() == "experiment");

  assert(pipeline.sample->SampleName() == "wiki-1k");
  assert(pipeline.experiment->Dependencies().size() == 2);
  assert(pipeline.Find("config") == pipeline.config);
  assert(pipeline.Find("results") == nullptr);

  auto* work = dynamic_cast<labbook::runtime::ProcessStageWork*>(pipeline.WorkFor("corpus"));
  assert(work != nullptr);
  assert(work->command().size() == 3);
  assert(pipeline.WorkFor("results") == nullptr);

  assert(pipeline.defaults.verify_own_signature);
  assert(!pipeline.defaults.force);
}

void TestEndToEndPipelineRun() {
  const auto  base     = FreshDir("end_to_end");
  auto        pipeline = labbook::factory::Build(MakeConfig(base));
  StageRunner runner;

  for (const auto& stage : pipeline.Stages()) {
    const auto report = runner.Run(*stage, *pipeline.WorkFor(stage->Name()), pipeline.defaults);
    assert(report.state == RunState::kCommitted);
    assert(stage->IsLocked());
  }

  assert(std::filesystem::exists(base / "experiment/results.csv"));

  for (const auto& stage : pipeline.Stages()) {
    assert(runner.Run(*stage, *pipeline.WorkFor(stage->Name()), pipeline.defaults).state == RunState::kDone);
  }

  // A rebuilt corpus with new content leaves the sample stale.
  auto force  = pipeline.defaults;
  force.force = true;
  std::filesystem::remove_all(base / "corpus/chunk-0");
  labbook::runtime::ProcessStageWork rebuild("corpus", {"sh", "-c", "printf 'doc three\\n' > chunk-0"});
  (void)runner.Run(*pipeline.corpus, rebuild, force);

  bool threw = false;
  try {
    (void)runner.Run(*pipeline.sample, *pipeline.WorkFor("sample"), pipeline.defaults);
  } catch (const labbook::util::StaleDependencyError& e) {
    threw = e.dependency() == "corpus";
  }
  assert(threw);
}

} // namespace

int main() {
  TestLockOptionsDefaults();
  TestBuildWiresStagesInDependencyOrder();
  TestEndToEndPipelineRun();

  std::cout << "labbook_unit_factory: pass\n";
  return 0;
}
