#include "stage_runner.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace labbook::pipeline {

using labbook::model::RunState;
using labbook::model::Signature;
using labbook::observability::StringField;

namespace {

constexpr std::size_t kShortSignature = 12;

std::string Short(const Signature& signature) {
  if (signature.empty()) {
    return "<none>";
  }
  return signature.ToHex().substr(0, kShortSignature);
}

std::vector<DependencyMismatch> Compare(const model::SignatureMap& recorded, const model::SignatureMap& live) {
  std::vector<DependencyMismatch> mismatches;

  for (const auto& [name, live_signature] : live) {
    const auto it = recorded.find(name);
    if (it == recorded.end()) {
      mismatches.push_back({name, Signature{}, live_signature});
    } else if (it->second != live_signature) {
      mismatches.push_back({name, it->second, live_signature});
    }
  }
  for (const auto& [name, recorded_signature] : recorded) {
    if (live.find(name) == live.end()) {
      mismatches.push_back({name, recorded_signature, Signature{}});
    }
  }
  return mismatches;
}

} // namespace

std::string DescribeStaleness(const std::string& stage, const std::vector<DependencyMismatch>& mismatches) {
  std::ostringstream out;
  out << "stage '" << stage << "' is stale";
  for (const auto& mismatch : mismatches) {
    out << "; dependency '" << mismatch.dependency << "' changed (recorded " << Short(mismatch.recorded) << ", now " << Short(mismatch.live)
        << "): re-run stage " << mismatch.dependency << ", or force a rebuild of " << stage;
  }
  return out.str();
}

Verification StageRunner::Verify(const lock::LockManager& target) const {
  Verification verification;

  for (const auto& dependency : target.Dependencies()) {
    if (!dependency->IsLocked()) {
      verification.state              = RunState::kNotCached;
      verification.missing_dependency = dependency->Name();
      return verification;
    }
  }

  verification.live_dependencies = target.DependencySignatures();
  verification.record            = target.Store().Load();
  if (!verification.record) {
    verification.state = RunState::kNotCached;
    return verification;
  }

  verification.mismatches = Compare(verification.record->dependency_signatures, verification.live_dependencies);
  verification.state      = verification.mismatches.empty() ? RunState::kValidCache : RunState::kStale;
  return verification;
}

RunReport StageRunner::Run(const lock::LockManager& target, StageWork& work, const RunOptions& options) const {
  RunReport report;
  report.stage = target.Name();
  report.trace.push_back(RunState::kChecking);

  auto verification = Verify(target);

  if (!verification.missing_dependency.empty()) {
    Advance(report, RunState::kNotCached);
    const auto& dependency = verification.missing_dependency;
    LABBOOK_LOG_WARN("dependency not cached", {StringField("stage", target.Name()), StringField("dependency", dependency)});
    throw util::NotCachedError(target.Name(), "stage '" + target.Name() + "': dependency '" + dependency + "' has no cached result; run " +
                                                  dependency + " first");
  }

  Advance(report, verification.state);

  if (verification.state == RunState::kStale && !options.force) {
    const auto  message = DescribeStaleness(target.Name(), verification.mismatches);
    const auto& first   = verification.mismatches.front();
    LABBOOK_LOG_WARN(message, {StringField("stage", target.Name())});
    throw util::StaleDependencyError(target.Name(), first.dependency, first.recorded.ToHex(), first.live.ToHex(), message);
  }

  if (verification.state == RunState::kValidCache && !options.force) {
    if (options.verify_own_signature) {
      CheckOwnSignature(target, *verification.record);
    }
    Advance(report, RunState::kDone);
    report.record = std::move(verification.record);
    return report;
  }

  // Safety marker: from here until commit or rollback, a crash leaves the
  // stage without a lock record and the next run re-executes it.
  auto previous = target.Store().Remove();
  Advance(report, RunState::kInvalidated);

  Advance(report, RunState::kRunning);
  report.executed = true;
  try {
    work.Run(target.Root(), options.args);
  } catch (const util::StageCancelled& e) {
    LABBOOK_LOG_WARN("stage cancelled; lock record left removed", {StringField("stage", target.Name()), StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    LABBOOK_LOG_ERROR("stage work failed; rolling back", {StringField("stage", target.Name()), StringField("error", e.what())});
    Rollback(target, previous);
    Advance(report, RunState::kRolledBack);
    throw;
  } catch (...) {
    LABBOOK_LOG_ERROR("stage work failed; rolling back", {StringField("stage", target.Name())});
    Rollback(target, previous);
    Advance(report, RunState::kRolledBack);
    throw;
  }

  // The outputs were built against the dependencies seen during CHECKING.
  // If one moved underneath the run, recording the old signature makes the
  // next verification report it as stale.
  lock::LockRecord record;
  record.dependency_signatures = std::move(verification.live_dependencies);
  record.own_signature         = target.Signature();

  if (target.DependencySignatures() != record.dependency_signatures) {
    LABBOOK_LOG_WARN("dependency changed while stage was running", {StringField("stage", target.Name())});
  }

  target.Store().Save(record);
  Advance(report, RunState::kCommitted);
  report.record = std::move(record);
  return report;
}

void StageRunner::Advance(RunReport& report, RunState next) {
  if (!model::CanTransition(report.state, next)) {
    throw util::InvalidState("stage '" + report.stage + "': illegal transition " + std::string(model::RunStateName(report.state)) + " -> " +
                             std::string(model::RunStateName(next)));
  }
  report.state = next;
  report.trace.push_back(next);
  LABBOOK_LOG_INFO("stage transition", {StringField("stage", report.stage), StringField("state", model::RunStateName(next))});
}

void StageRunner::CheckOwnSignature(const lock::LockManager& target, const lock::LockRecord& record) {
  const auto live = target.Signature();
  if (live == record.own_signature) {
    return;
  }

  LABBOOK_LOG_ERROR("cached artifacts do not match lock record",
                    {StringField("stage", target.Name()), StringField("recorded", record.own_signature.ToHex()), StringField("live", live.ToHex())});
  throw util::CorruptCacheError(target.Name(), "stage '" + target.Name() + "': cached artifacts do not match lock record (recorded " +
                                                   Short(record.own_signature) + ", now " + Short(live) +
                                                   "); artifacts were modified outside the pipeline, force a rebuild of " + target.Name());
}

void StageRunner::Rollback(const lock::LockManager& target, const std::optional<lock::LockSnapshot>& previous) {
  if (!previous) {
    return;
  }

  try {
    target.Store().Restore(*previous);
  } catch (const util::IOError& e) {
    LABBOOK_LOG_ERROR("rollback failed; lock record left removed", {StringField("stage", target.Name()), StringField("error", e.what())});
    throw util::IOError("stage '" + target.Name() + "': rollback failed after stage failure: " + e.what());
  }
}

} // namespace labbook::pipeline
