#include "lock_manager.hpp"

namespace labbook::lock {

model::SignatureMap LiveSignatures(const std::vector<LockManagerPtr>& dependencies) {
  model::SignatureMap signatures;
  for (const auto& dependency : dependencies) {
    signatures.emplace(dependency->Name(), dependency->Signature());
  }
  return signatures;
}

} // namespace labbook::lock
