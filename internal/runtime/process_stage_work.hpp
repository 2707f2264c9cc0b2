#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/pipeline/stage_work.hpp"

namespace labbook::runtime {

/*
  Stage work backed by an external command.

  The command runs with the stage directory as its working directory and the
  run's extra arguments appended. The runner blocks until it exits.

    exit 0                 -> success
    non-zero exit          -> util::WorkExecutionError
    SIGINT / SIGTERM       -> util::StageCancelled
    timeout (if non-zero)  -> child killed, util::WorkExecutionError
*/
class ProcessStageWork final : public pipeline::StageWork {
 public:
  ProcessStageWork(std::string stage, std::vector<std::string> command, std::chrono::seconds timeout = std::chrono::seconds{0});

  void Run(const std::filesystem::path& stage_dir, const std::vector<std::string>& args) override;

  const std::vector<std::string>& command() const {
    return command_;
  }

 private:
  int Wait(int pid, const std::string& command_line) const;

  std::string              stage_;
  std::vector<std::string> command_;
  std::chrono::seconds     timeout_;
};

} // namespace labbook::runtime
