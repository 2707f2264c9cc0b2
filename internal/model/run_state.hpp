#pragma once

#include <cstdint>
#include <string_view>

namespace labbook::model {

enum class RunState : std::uint8_t {
  kChecking    = 0,
  kNotCached   = 1,
  kValidCache  = 2,
  kStale       = 3,
  kInvalidated = 4,
  kRunning     = 5,
  kCommitted   = 6,
  kRolledBack  = 7,
  kDone        = 8,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kDone || state == RunState::kCommitted || state == RunState::kRolledBack;
}

/*
  CHECKING -> {NOT_CACHED | VALID_CACHE | STALE}
  VALID_CACHE -> DONE
  {NOT_CACHED, STALE} -> INVALIDATED -> RUNNING -> {COMMITTED | ROLLED_BACK}

  STALE is terminal unless the run is forced; the runner decides that,
  the table only allows it.
*/
constexpr bool CanTransition(RunState from, RunState to) {
  switch (from) {
    case RunState::kChecking:
      return to == RunState::kNotCached || to == RunState::kValidCache || to == RunState::kStale;
    case RunState::kValidCache:
      return to == RunState::kDone || to == RunState::kInvalidated;
    case RunState::kNotCached:
    case RunState::kStale:
      return to == RunState::kInvalidated;
    case RunState::kInvalidated:
      return to == RunState::kRunning;
    case RunState::kRunning:
      return to == RunState::kCommitted || to == RunState::kRolledBack;
    case RunState::kCommitted:
    case RunState::kRolledBack:
    case RunState::kDone:
      return false;
  }
  return false;
}

constexpr std::string_view RunStateName(RunState state) {
  switch (state) {
    case RunState::kChecking:
      return "CHECKING";
    case RunState::kNotCached:
      return "NOT_CACHED";
    case RunState::kValidCache:
      return "VALID_CACHE";
    case RunState::kStale:
      return "STALE";
    case RunState::kInvalidated:
      return "INVALIDATED";
    case RunState::kRunning:
      return "RUNNING";
    case RunState::kCommitted:
      return "COMMITTED";
    case RunState::kRolledBack:
      return "ROLLED_BACK";
    case RunState::kDone:
      return "DONE";
  }
  return "UNKNOWN";
}

} // namespace labbook::model
