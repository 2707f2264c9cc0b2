#pragma once

#include <string>

#include "internal/model/signature.hpp"
#include "labbook/lock/v1.hpp"

namespace labbook::lock {

/*
  Persisted proof that a stage was produced from a given set of dependency
  signatures. Records are never edited in place: they are written whole,
  removed, or restored from a snapshot.
*/
struct LockRecord {
  model::Signature    own_signature;
  model::SignatureMap dependency_signatures;

  bool operator==(const LockRecord& other) const = default;
};

labbook::lock::v1::LockRecord ToProto(const LockRecord& record);

// Throws std::invalid_argument if a signature is not valid hex.
LockRecord FromProto(const labbook::lock::v1::LockRecord& proto);

// JSON mapping of labbook.lock.v1.LockRecord, always including ownSignature.
std::string SerializeLockRecord(const LockRecord& record);

// `source` names the file in error messages. Throws util::IOError on any
// malformed content.
LockRecord ParseLockRecord(const std::string& json, const std::string& source);

} // namespace labbook::lock
