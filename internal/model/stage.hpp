#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace labbook::model {

// The pipeline is fixed: corpus -> sample -> config -> experiment,
// with experiment also depending on sample.
enum class StageKind : std::uint8_t {
  kCorpus     = 0,
  kSample     = 1,
  kConfig     = 2,
  kExperiment = 3,
};

constexpr std::string_view StageKindName(StageKind kind) {
  switch (kind) {
    case StageKind::kCorpus:
      return "corpus";
    case StageKind::kSample:
      return "sample";
    case StageKind::kConfig:
      return "config";
    case StageKind::kExperiment:
      return "experiment";
  }
  return "unknown";
}

constexpr std::optional<StageKind> ParseStageKind(std::string_view name) {
  if (name == "corpus") return StageKind::kCorpus;
  if (name == "sample") return StageKind::kSample;
  if (name == "config") return StageKind::kConfig;
  if (name == "experiment") return StageKind::kExperiment;
  return std::nullopt;
}

} // namespace labbook::model
