#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/lock/lock_manager.hpp"
#include "internal/lock/lock_record.hpp"
#include "internal/model/run_state.hpp"
#include "internal/model/signature.hpp"
#include "internal/pipeline/stage_work.hpp"

namespace labbook::pipeline {

struct DependencyMismatch {
  std::string      dependency;
  model::Signature recorded; // empty when the record has no entry
  model::Signature live;     // empty when the stage no longer declares it
};

/*
  Outcome of CHECKING. One of NOT_CACHED, VALID_CACHE or STALE.
*/
struct Verification {
  model::RunState                 state = model::RunState::kChecking;
  std::string                     missing_dependency;
  std::optional<lock::LockRecord> record;
  model::SignatureMap             live_dependencies;
  std::vector<DependencyMismatch> mismatches;
};

struct RunOptions {
  // Invalidate and run even if the cache is valid or stale.
  bool force = false;
  // On a cache hit, check the stage's own signature against its record.
  bool                     verify_own_signature = true;
  std::vector<std::string> args;
};

struct RunReport {
  std::string                     stage;
  model::RunState                 state = model::RunState::kChecking;
  std::vector<model::RunState>    trace;
  bool                            executed = false;
  std::optional<lock::LockRecord> record;
};

/*
  Drives one stage through the locking protocol:

    verify -> invalidate -> execute -> commit | rollback

  Ordering guarantees:
    - the lock record is durably removed before the work starts
    - commit or rollback is durable before Run() returns or rethrows

  Verification failures (util::NotCachedError, util::StaleDependencyError,
  util::CorruptCacheError) are thrown before anything is mutated. A failed run
  restores the previous record verbatim and rethrows the original error.
*/
class StageRunner {
 public:
  // CHECKING only. Never mutates anything.
  Verification Verify(const lock::LockManager& target) const;

  RunReport Run(const lock::LockManager& target, StageWork& work, const RunOptions& options = {}) const;

 private:
  static void Advance(RunReport& report, model::RunState next);
  static void CheckOwnSignature(const lock::LockManager& target, const lock::LockRecord& record);
  static void Rollback(const lock::LockManager& target, const std::optional<lock::LockSnapshot>& previous);
};

// Human-readable staleness diagnostic with remediation hint.
std::string DescribeStaleness(const std::string& stage, const std::vector<DependencyMismatch>& mismatches);

} // namespace labbook::pipeline
