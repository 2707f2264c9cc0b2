#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/lock/lock_store.hpp"
#include "internal/model/signature.hpp"
#include "internal/model/stage.hpp"

namespace labbook::lock {

class LockManager;
using LockManagerPtr = std::shared_ptr<const LockManager>;

/*
  Per-stage view of the locking protocol.

  Implementations:
    CorpusLock      -> no dependencies
    SampleLock      -> corpus
    ConfigLock      -> sample
    ExperimentLock  -> config, sample

  All operations are read-only. Signature() and DependencySignatures() are
  computed from the artifacts on disk right now, never from a lock record, and
  throw util::IOError if artifacts cannot be read. Whether a dependency is
  locked is checked by the StageRunner, not here.
*/
class LockManager {
 public:
  virtual ~LockManager() = default;

  // Stage name; also the key under which dependents record this stage.
  virtual const std::string&           Name() const = 0;
  virtual model::StageKind             Kind() const = 0;
  virtual const std::filesystem::path& Root() const = 0;

  virtual std::vector<LockManagerPtr> Dependencies() const = 0;

  // Live Signature() of every declared dependency, keyed by dependency name.
  virtual model::SignatureMap DependencySignatures() const = 0;

  // Signature of this stage's own artifacts. Empty for terminal stages.
  virtual model::Signature Signature() const = 0;

  // A lock record currently exists on disk.
  virtual bool IsLocked() const = 0;

  virtual const LockStore& Store() const = 0;
};

// Live signatures of `dependencies`, keyed by their names.
model::SignatureMap LiveSignatures(const std::vector<LockManagerPtr>& dependencies);

} // namespace labbook::lock
