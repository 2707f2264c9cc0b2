#include "internal/runtime/process_stage_work.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using labbook::runtime::ProcessStageWork;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "labbook_process_stage_work_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestCommandRunsInsideStageDirectory() {
  const auto dir = FreshDir("runs_in_stage_dir") / "corpus";
  const auto cwd = std::filesystem::current_path();

  ProcessStageWork work("corpus", {"sh", "-c", "printf 'doc one\\n' > chunk-0"});
  work.Run(dir, {});

  assert(std::filesystem::exists(dir / "chunk-0"));
  assert(ReadFile(dir / "chunk-0") == "doc one\n");
  assert(std::filesystem::current_path() == cwd);
}

void TestExtraArgumentsAreAppended() {
  const auto dir = FreshDir("extra_args");

  ProcessStageWork work("sample", {"sh", "-c", "printf '%s,' \"$@\" > args.txt", "sample-tool"});
  work.Run(dir, {"--size", "1000"});

  assert(ReadFile(dir / "args.txt") == "--size,1000,");
}

void TestNonZeroExitIsReported() {
  const auto dir = FreshDir("non_zero_exit");
  const auto cwd = std::filesystem::current_path();

  ProcessStageWork work("config", {"sh", "-c", "exit 3"});
  bool             threw = false;
  try {
    work.Run(dir, {});
  } catch (const labbook::util::WorkExecutionError& e) {
    threw = true;
    assert(e.exit_code() == 3);
    assert(std::string(e.what()).find("exited with code 3") != std::string::npos);
  }
  assert(threw);
  assert(std::filesystem::current_path() == cwd);
}

void TestMissingExecutableIsReported() {
  const auto dir = FreshDir("missing_executable");

  ProcessStageWork work("config", {"labbook-no-such-tool"});
  bool             threw = false;
  try {
    work.Run(dir, {});
  } catch (const labbook::util::WorkExecutionError& e) {
    threw = e.exit_code() == 127;
  }
  assert(threw);
}

void TestTerminationSignalIsCancellation() {
  const auto dir = FreshDir("cancelled");

  ProcessStageWork work("experiment", {"sh", "-c", "kill -TERM $$"});
  bool             threw = false;
  try {
    work.Run(dir, {});
  } catch (const labbook::util::StageCancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestTimeoutKillsCommand() {
  const auto dir = FreshDir("timeout");

  ProcessStageWork work("experiment", {"sleep", "5"}, std::chrono::seconds(1));
  const auto       start = std::chrono::steady_clock::now();
  bool             threw = false;
  try {
    work.Run(dir, {});
  } catch (const labbook::util::WorkExecutionError& e) {
    threw = std::string(e.what()).find("timed out") != std::string::npos;
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));
}

void TestEmptyCommandIsRejected() {
  const auto dir = FreshDir("empty_command");

  ProcessStageWork work("corpus", {});
  bool             threw = false;
  try {
    work.Run(dir, {});
  } catch (const labbook::util::WorkExecutionError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCommandRunsInsideStageDirectory();
  TestExtraArgumentsAreAppended();
  TestNonZeroExitIsReported();
  TestMissingExecutableIsReported();
  TestTerminationSignalIsCancellation();
  TestTimeoutKillsCommand();
  TestEmptyCommandIsRejected();

  std::cout << "labbook_unit_process_stage_work: pass\n";
  return 0;
}
