#include "internal/model/run_state.hpp"

#include <cassert>
#include <iostream>

namespace {

using labbook::model::CanTransition;
using labbook::model::IsTerminal;
using labbook::model::RunState;

static_assert(CanTransition(RunState::kChecking, RunState::kNotCached));
static_assert(CanTransition(RunState::kChecking, RunState::kValidCache));
static_assert(CanTransition(RunState::kChecking, RunState::kStale));
static_assert(CanTransition(RunState::kValidCache, RunState::kDone));
static_assert(CanTransition(RunState::kNotCached, RunState::kInvalidated));
static_assert(CanTransition(RunState::kInvalidated, RunState::kRunning));
static_assert(CanTransition(RunState::kRunning, RunState::kCommitted));
static_assert(CanTransition(RunState::kRunning, RunState::kRolledBack));

void TestWorkNeverStartsWithoutInvalidation() {
  assert(!CanTransition(RunState::kChecking, RunState::kRunning));
  assert(!CanTransition(RunState::kNotCached, RunState::kRunning));
  assert(!CanTransition(RunState::kStale, RunState::kRunning));
  assert(!CanTransition(RunState::kValidCache, RunState::kRunning));
}

void TestOutcomesAreTerminal() {
  for (auto from : {RunState::kCommitted, RunState::kRolledBack, RunState::kDone}) {
    assert(IsTerminal(from));
    for (auto to : {RunState::kChecking, RunState::kInvalidated, RunState::kRunning, RunState::kCommitted}) {
      assert(!CanTransition(from, to));
    }
  }
  assert(!IsTerminal(RunState::kRunning));
  assert(!IsTerminal(RunState::kStale));
}

void TestNoCommitWithoutRunning() {
  assert(!CanTransition(RunState::kInvalidated, RunState::kCommitted));
  assert(!CanTransition(RunState::kValidCache, RunState::kCommitted));
  assert(!CanTransition(RunState::kInvalidated, RunState::kRolledBack));
}

} // namespace

int main() {
  TestWorkNeverStartsWithoutInvalidation();
  TestOutcomesAreTerminal();
  TestNoCommitWithoutRunning();

  std::cout << "labbook_unit_run_state: pass\n";
  return 0;
}
