#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/stage_runner.hpp"
#include "internal/util/errors.hpp"

using labbook::observability::StringField;

namespace {

constexpr int kExitOk           = 0;
constexpr int kExitUsage        = 1;
constexpr int kExitFatal        = 2;
constexpr int kExitVerification = 3;
constexpr int kExitWorkFailed   = 4;
constexpr int kExitCancelled    = 5;

void Usage() {
  std::cerr << "Usage:\n"
            << "  labbook --config <config.yaml> status\n"
            << "  labbook --config <config.yaml> run <corpus|sample|config|experiment> [--force] [-- args...]\n";
}

std::string DescribeVerification(const labbook::pipeline::Verification& verification, const std::string& stage) {
  using labbook::model::RunState;

  if (!verification.missing_dependency.empty()) {
    return "waiting: dependency '" + verification.missing_dependency + "' has no cached result";
  }
  switch (verification.state) {
    case RunState::kNotCached:
      return "not cached";
    case RunState::kValidCache:
      return "valid";
    case RunState::kStale:
      return labbook::pipeline::DescribeStaleness(stage, verification.mismatches);
    default:
      return std::string(labbook::model::RunStateName(verification.state));
  }
}

int Status(const labbook::factory::Pipeline& pipeline) {
  labbook::pipeline::StageRunner runner;

  int rc = kExitOk;
  for (const auto& stage : pipeline.Stages()) {
    try {
      std::cout << stage->Name() << ": " << DescribeVerification(runner.Verify(*stage), stage->Name()) << "\n";
    } catch (const labbook::util::IOError& e) {
      std::cout << stage->Name() << ": error: " << e.what() << "\n";
      rc = kExitFatal;
    }
  }
  return rc;
}

int Run(const labbook::factory::Pipeline& pipeline, const std::string& stage_name, bool force, std::vector<std::string> args) {
  if (!labbook::model::ParseStageKind(stage_name)) {
    std::cerr << "unknown stage '" << stage_name << "'\n";
    Usage();
    return kExitUsage;
  }

  const auto target = pipeline.Find(stage_name);
  auto*      work   = pipeline.WorkFor(stage_name);
  if (!target || !work) {
    std::cerr << "stage '" << stage_name << "' is not configured\n";
    return kExitFatal;
  }

  auto options  = pipeline.defaults;
  options.force = force;
  options.args  = std::move(args);

  labbook::pipeline::StageRunner runner;
  try {
    const auto report = runner.Run(*target, *work, options);
    std::cout << stage_name << ": " << labbook::model::RunStateName(report.state) << (report.executed ? "" : " (cached)") << "\n";
    return kExitOk;
  } catch (const labbook::util::NotCachedError& e) {
    std::cerr << e.what() << "\n";
    return kExitVerification;
  } catch (const labbook::util::StaleDependencyError& e) {
    std::cerr << e.what() << "\n";
    return kExitVerification;
  } catch (const labbook::util::CorruptCacheError& e) {
    std::cerr << e.what() << "\n";
    return kExitVerification;
  } catch (const labbook::util::StageCancelled& e) {
    std::cerr << e.what() << "; stage '" << stage_name << "' will re-run next time\n";
    return kExitCancelled;
  } catch (const labbook::util::WorkExecutionError& e) {
    std::cerr << e.what() << "; lock record left as before the run\n";
    return kExitWorkFailed;
  }
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> arguments(argv + 1, argv + argc);
  if (arguments.size() < 3 || arguments[0] != "--config") {
    Usage();
    return kExitUsage;
  }

  const auto& config_path = arguments[1];
  const auto& command     = arguments[2];

  bool                     force = false;
  std::string              stage_name;
  std::vector<std::string> extra_args;
  if (command == "run") {
    if (arguments.size() < 4) {
      Usage();
      return kExitUsage;
    }
    stage_name = arguments[3];
    for (size_t i = 4; i < arguments.size(); ++i) {
      if (arguments[i] == "--force") {
        force = true;
      } else if (arguments[i] == "--") {
        extra_args.assign(arguments.begin() + static_cast<std::ptrdiff_t>(i) + 1, arguments.end());
        break;
      } else {
        std::cerr << "unexpected argument '" << arguments[i] << "'\n";
        Usage();
        return kExitUsage;
      }
    }
  } else if (command != "status") {
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = labbook::config::ConfigLoader::LoadFromYaml(config_path);
    labbook::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build pipeline (dependency graph)
    // ------------------------------------------------------------
    auto pipeline = labbook::factory::Build(config);

    const int rc = command == "status" ? Status(pipeline) : Run(pipeline, stage_name, force, std::move(extra_args));
    labbook::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    LABBOOK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    labbook::observability::ShutdownLogging();
    return kExitFatal;
  }
}
