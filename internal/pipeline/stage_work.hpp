#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace labbook::pipeline {

/*
  The work a stage performs, opaque to the locking protocol.

  Run() blocks until the work has finished. Failures are reported by throwing:
    util::WorkExecutionError -> the work failed; the runner rolls back
    util::StageCancelled     -> the work was interrupted; the lock stays removed
*/
class StageWork {
 public:
  virtual ~StageWork() = default;

  virtual void Run(const std::filesystem::path& stage_dir, const std::vector<std::string>& args) = 0;
};

} // namespace labbook::pipeline
